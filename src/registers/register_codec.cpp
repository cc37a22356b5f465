#include "registers/register_codec.hpp"
#include "utils/byte_codec.hpp"
#include <algorithm>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace autonomi {
namespace registers {

namespace {

constexpr char kMagic[4] = {'A', 'R', 'E', 'G'};
// Caps up-front reservations for counts read off the wire
constexpr uint32_t kMaxReserve = 4096;
constexpr uint32_t kMaxFieldSize = 16 * 1024 * 1024;

void write_field(std::ostream& output, const Bytes& field) {
  utils::write_uint<uint32_t>(output, static_cast<uint32_t>(field.size()));
  utils::write_bytes(output, field.data(), field.size());
}

Bytes read_field(std::istream& input) {
  const auto size = utils::read_uint<uint32_t>(input);
  if (size > kMaxFieldSize) {
    throw RegisterError("Malformed register: field of " + std::to_string(size) + " bytes");
  }
  Bytes field(size);
  utils::read_bytes(input, field.data(), field.size());
  return field;
}

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
// ENCODING
//==============================================

Bytes encode_register(const Register& reg) {
  std::stringstream output;
  utils::write_bytes(output, kMagic, sizeof(kMagic));
  utils::write_uint<uint8_t>(output, kRegisterFormatVersion);

  write_field(output, reg.address().owner);
  write_name(output, reg.address().meta);

  utils::write_uint<uint32_t>(output, static_cast<uint32_t>(reg.writers().size()));
  for (const auto& writer : reg.writers()) {
    write_field(output, writer);
  }

  const auto entries = reg.entries();
  utils::write_uint<uint32_t>(output, static_cast<uint32_t>(entries.size()));
  for (const auto& item : entries) {
    const RegisterEntry& entry = item.second;
    write_field(output, entry.author);
    write_field(output, entry.payload);
    utils::write_uint<uint32_t>(output, static_cast<uint32_t>(entry.parents.size()));
    for (const auto& parent : entry.parents) {
      write_name(output, parent);
    }
    write_field(output, entry.signature);
  }

  const std::string data = output.str();
  return Bytes(data.begin(), data.end());
}

//==============================================
// DECODING
//==============================================

Register decode_register(const Bytes& bytes) {
  std::stringstream input(std::string(bytes.begin(), bytes.end()));

  try {
    char magic[sizeof(kMagic)];
    utils::read_bytes(input, magic, sizeof(magic));
    if (!std::equal(std::begin(magic), std::end(magic), std::begin(kMagic))) {
      throw RegisterError("Malformed register: bad magic");
    }

    const auto version = utils::read_uint<uint8_t>(input);
    if (version != kRegisterFormatVersion) {
      throw RegisterError("Malformed register: unsupported format version " + std::to_string(version));
    }

    RegisterAddress address;
    address.owner = read_field(input);
    address.meta = read_name(input);

    std::set<PublicKey> writers;
    const auto writer_count = utils::read_uint<uint32_t>(input);
    for (uint32_t i = 0; i < writer_count; ++i) {
      writers.insert(read_field(input));
    }

    const auto entry_count = utils::read_uint<uint32_t>(input);
    std::vector<RegisterEntry> entries;
    entries.reserve(std::min(entry_count, kMaxReserve));
    for (uint32_t i = 0; i < entry_count; ++i) {
      RegisterEntry entry;
      entry.author = read_field(input);
      entry.payload = read_field(input);
      const auto parent_count = utils::read_uint<uint32_t>(input);
      for (uint32_t p = 0; p < parent_count; ++p) {
        entry.parents.insert(read_name(input));
      }
      entry.signature = read_field(input);
      entries.push_back(std::move(entry));
    }

    if (!utils::at_end(input)) {
      throw RegisterError("Malformed register: trailing bytes");
    }

    Register reg(std::move(address), std::move(writers));
    reg.merge(entries);
    return reg;
  }
  catch (const utils::CodecError& e) {
    BOOST_LOG_TRIVIAL(error) << "Register codec: Truncated register: " << e.what();
    throw RegisterError("Malformed register: truncated input");
  }
}

} // namespace registers
} // namespace autonomi
