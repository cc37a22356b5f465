#include "data/chunker.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>
#include <boost/log/trivial.hpp>

namespace autonomi {
namespace data {

//==============================================
// CONSTRUCTOR
//==============================================

Chunker::Chunker(const SelfEncryptionConfig& config)
  : config_(config) {
  if (config_.min_chunk_size == 0) {
    throw std::invalid_argument("Chunker: min_chunk_size must be at least 1");
  }
  if (config_.max_chunk_size < kMinMaxChunkSize) {
    throw std::invalid_argument("Chunker: max_chunk_size must be at least " + std::to_string(kMinMaxChunkSize));
  }
  // The penultimate chunk gives min_chunk_size bytes to a short last chunk
  // and must keep at least that many itself
  if (config_.min_chunk_size > config_.max_chunk_size / 2) {
    throw std::invalid_argument("Chunker: min_chunk_size exceeds half of max_chunk_size");
  }
}

//==============================================
// LAYOUT QUERIES
//==============================================

std::size_t Chunker::chunk_count(uint64_t content_size) const {
  if (is_small(content_size)) {
    return kMinChunks;
  }
  const uint64_t max = config_.max_chunk_size;
  return static_cast<std::size_t>(content_size / max + (content_size % max != 0 ? 1 : 0));
}

uint64_t Chunker::chunk_size(uint64_t content_size, std::size_t index) const {
  if (is_small(content_size)) {
    const uint64_t third = content_size / kMinChunks;
    return index + 1 < kMinChunks ? third : content_size - (kMinChunks - 1) * third;
  }

  const std::size_t count = chunk_count(content_size);
  const uint64_t max = config_.max_chunk_size;
  const uint64_t min = config_.min_chunk_size;
  const uint64_t remainder = content_size % max;

  if (remainder == 0 || index + 2 < count) {
    return max;
  }
  // The last chunk borrows from the penultimate one when it would be too small
  if (index + 2 == count) {
    return remainder < min ? max - min : max;
  }
  return remainder < min ? min + remainder : remainder;
}

uint64_t Chunker::chunk_start(uint64_t content_size, std::size_t index) const {
  if (is_small(content_size)) {
    return index * (content_size / kMinChunks);
  }

  const std::size_t count = chunk_count(content_size);
  const uint64_t max = config_.max_chunk_size;
  const uint64_t min = config_.min_chunk_size;
  const uint64_t remainder = content_size % max;

  if (index + 1 == count && remainder != 0 && remainder < min) {
    return (count - 2) * max + (max - min);
  }
  return index * max;
}

//==============================================
// SPLITTING
//==============================================

std::vector<Bytes> Chunker::split(const Bytes& content) const {
  const uint64_t size = content.size();
  const std::size_t count = chunk_count(size);

  std::vector<Bytes> chunks;
  chunks.reserve(count);

  for (std::size_t i = 0; i < count; ++i) {
    const auto start = static_cast<std::ptrdiff_t>(chunk_start(size, i));
    const auto length = static_cast<std::ptrdiff_t>(chunk_size(size, i));
    chunks.emplace_back(content.begin() + start, content.begin() + start + length);
  }

  BOOST_LOG_TRIVIAL(debug) << "Chunker: Split " << size << " bytes into " << count << " chunks";
  return chunks;
}

} // namespace data
} // namespace autonomi
