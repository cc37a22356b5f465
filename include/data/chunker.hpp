#ifndef AUTONOMI_DATA_CHUNKER_HPP
#define AUTONOMI_DATA_CHUNKER_HPP

#include <cstdint>
#include <vector>
#include "data/data_config.hpp"
#include "data/types.hpp"

namespace autonomi {
namespace data {

/**
 * Splits content into at least kMinChunks deterministic pieces.
 *
 * Content below 3 * max_chunk_size always becomes exactly three chunks of
 * size/3, size/3 and the remainder, so inputs shorter than three bytes give
 * zero-length chunks instead of an error. Larger content is cut into
 * max_chunk_size pieces with the remainder last; min_chunk_size may be at
 * most half of max_chunk_size.
 */
class Chunker {
public:
  // ---- CONSTRUCTOR ----
  // Throws std::invalid_argument on sizes the neighbor-key scheme cannot use
  explicit Chunker(const SelfEncryptionConfig& config);


  // ---- SPLITTING ----
  std::vector<Bytes> split(const Bytes& content) const;


  // ---- LAYOUT QUERIES ----
  std::size_t chunk_count(uint64_t content_size) const;
  uint64_t chunk_size(uint64_t content_size, std::size_t index) const;
  uint64_t chunk_start(uint64_t content_size, std::size_t index) const;

  const SelfEncryptionConfig& config() const { return config_; }

private:
  SelfEncryptionConfig config_;

  bool is_small(uint64_t content_size) const {
    return content_size < kMinChunks * static_cast<uint64_t>(config_.max_chunk_size);
  }
};

} // namespace data
} // namespace autonomi

#endif // AUTONOMI_DATA_CHUNKER_HPP
