#ifndef AUTONOMI_DATA_CONFIG_HPP
#define AUTONOMI_DATA_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace autonomi {
namespace data {

// Neighbor-key scheme needs at least this many chunks
constexpr std::size_t kMinChunks = 3;
// Smallest max_chunk_size for which a minimal data map fits in one chunk
constexpr std::size_t kMinMaxChunkSize = 1024;

struct SelfEncryptionConfig {
  std::size_t min_chunk_size = 1;
  std::size_t max_chunk_size = 1024 * 1024;
  // Upper bound on nested data map levels accepted when resolving
  uint32_t max_data_map_depth = 16;
};

struct RetryConfig {
  uint32_t max_retries = 3;
  uint32_t initial_backoff_ms = 50;
  uint32_t backoff_multiplier = 2;
};

} // namespace data
} // namespace autonomi

#endif // AUTONOMI_DATA_CONFIG_HPP
