#include "data/data_map.hpp"
#include "data/data_config.hpp"
#include "data/data_error.hpp"
#include "crypto/chunk_cipher.hpp"
#include "utils/byte_codec.hpp"
#include <algorithm>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace autonomi {
namespace data {

namespace {

constexpr char kMagic[4] = {'A', 'D', 'M', 'P'};
// Caps the up-front reservation for counts read off the wire
constexpr uint32_t kMaxReserve = 4096;

void write_name(std::ostream& output, const XorName& name) {
  utils::write_bytes(output, name.data(), XorName::SIZE);
}

XorName read_name(std::istream& input) {
  std::array<uint8_t, XorName::SIZE> bytes;
  utils::read_bytes(input, bytes.data(), bytes.size());
  return XorName(bytes);
}

} // namespace

//==============================================
// CONSTRUCTION
//==============================================

DataMap DataMap::build(std::vector<ChunkInfo> chunks, uint32_t level) {
  DataMap map(level, std::move(chunks));
  map.validate();
  return map;
}

void DataMap::validate() const {
  if (chunks_.size() < kMinChunks) {
    throw MalformedDataMapError("expected at least " + std::to_string(kMinChunks) +
                                " chunks, found " + std::to_string(chunks_.size()));
  }

  for (std::size_t i = 0; i < chunks_.size(); ++i) {
    const auto& info = chunks_[i];
    if (info.index != i) {
      throw MalformedDataMapError("chunk index " + std::to_string(info.index) +
                                  " at position " + std::to_string(i));
    }
    if (info.dst_size != crypto::ChunkCipher::encryptedSize(info.src_size)) {
      throw MalformedDataMapError("encrypted size " + std::to_string(info.dst_size) +
                                  " inconsistent with original size " + std::to_string(info.src_size) +
                                  " for chunk " + std::to_string(i));
    }
  }
}

//==============================================
// QUERIES
//==============================================

uint64_t DataMap::content_size() const {
  uint64_t total = 0;
  for (const auto& info : chunks_) {
    total += info.src_size;
  }
  return total;
}

std::vector<Address> DataMap::addresses() const {
  std::vector<Address> result;
  result.reserve(chunks_.size());
  for (const auto& info : chunks_) {
    result.push_back(info.dst_hash);
  }
  return result;
}

//==============================================
// SERIALIZATION
//==============================================

void DataMap::serialize(std::ostream& output) const {
  utils::write_bytes(output, kMagic, sizeof(kMagic));
  utils::write_uint<uint8_t>(output, FORMAT_VERSION);
  utils::write_uint<uint32_t>(output, level_);
  utils::write_uint<uint32_t>(output, static_cast<uint32_t>(chunks_.size()));

  for (const auto& info : chunks_) {
    utils::write_uint<uint32_t>(output, info.index);
    utils::write_uint<uint64_t>(output, info.src_size);
    utils::write_uint<uint64_t>(output, info.dst_size);
    write_name(output, info.src_hash);
    write_name(output, info.dst_hash);
  }
}

Bytes DataMap::to_bytes() const {
  std::stringstream output;
  serialize(output);
  const std::string data = output.str();
  return Bytes(data.begin(), data.end());
}

DataMap DataMap::deserialize(std::istream& input) {
  try {
    char magic[sizeof(kMagic)];
    utils::read_bytes(input, magic, sizeof(magic));
    if (!std::equal(std::begin(magic), std::end(magic), std::begin(kMagic))) {
      throw MalformedDataMapError("bad magic");
    }

    const auto version = utils::read_uint<uint8_t>(input);
    if (version != FORMAT_VERSION) {
      throw MalformedDataMapError("unsupported format version " + std::to_string(version));
    }

    const auto level = utils::read_uint<uint32_t>(input);
    const auto count = utils::read_uint<uint32_t>(input);

    std::vector<ChunkInfo> chunks;
    chunks.reserve(std::min(count, kMaxReserve));
    for (uint32_t i = 0; i < count; ++i) {
      ChunkInfo info;
      info.index = utils::read_uint<uint32_t>(input);
      info.src_size = utils::read_uint<uint64_t>(input);
      info.dst_size = utils::read_uint<uint64_t>(input);
      info.src_hash = read_name(input);
      info.dst_hash = read_name(input);
      chunks.push_back(info);
    }

    return build(std::move(chunks), level);
  }
  catch (const utils::CodecError& e) {
    BOOST_LOG_TRIVIAL(error) << "Data map: Truncated data map: " << e.what();
    throw MalformedDataMapError("truncated input");
  }
}

DataMap DataMap::from_bytes(const Bytes& bytes) {
  std::stringstream input(std::string(bytes.begin(), bytes.end()));
  DataMap map = deserialize(input);
  if (!utils::at_end(input)) {
    throw MalformedDataMapError("trailing bytes after descriptor list");
  }
  return map;
}

} // namespace data
} // namespace autonomi
