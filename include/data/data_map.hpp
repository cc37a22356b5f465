#ifndef AUTONOMI_DATA_MAP_HPP
#define AUTONOMI_DATA_MAP_HPP

#include <cstdint>
#include <istream>
#include <ostream>
#include <utility>
#include <vector>
#include "data/types.hpp"

namespace autonomi {
namespace data {

// Descriptor of one self-encrypted chunk
struct ChunkInfo {
  uint32_t index = 0;
  Address dst_hash;       // network address: hash of the encrypted bytes
  Address src_hash;       // hash of the raw bytes, feeds neighbor keys
  uint64_t src_size = 0;
  uint64_t dst_size = 0;

  bool operator==(const ChunkInfo& other) const {
    return index == other.index && dst_hash == other.dst_hash && src_hash == other.src_hash
        && src_size == other.src_size && dst_size == other.dst_size;
  }
  bool operator!=(const ChunkInfo& other) const { return !(*this == other); }
};

/**
 * Ordered chunk index for one logical object.
 *
 * level 0 maps describe user content. A map of level k > 0 describes the
 * serialized bytes of a level k-1 map; this is how oversized maps are
 * shrunk until the root fits in one chunk.
 *
 * Wire format (big endian):
 *   magic "ADMP" | version u8 | level u32 | count u32 |
 *   count * (index u32 | src_size u64 | dst_size u64 | src_hash[32] | dst_hash[32])
 */
class DataMap {
public:
  static constexpr uint8_t FORMAT_VERSION = 1;
  static constexpr std::size_t HEADER_SIZE = 4 + 1 + 4 + 4;
  static constexpr std::size_t ENTRY_SIZE = 4 + 8 + 8 + XorName::SIZE * 2;

  DataMap() = default;

  // ---- CONSTRUCTION ----
  // Validates the descriptor list; throws MalformedDataMapError
  static DataMap build(std::vector<ChunkInfo> chunks, uint32_t level = 0);


  // ---- QUERIES ----
  uint32_t level() const { return level_; }
  bool has_child() const { return level_ > 0; }
  const std::vector<ChunkInfo>& chunks() const { return chunks_; }
  std::size_t size() const { return chunks_.size(); }
  // Size of the content this map reconstructs
  uint64_t content_size() const;
  std::vector<Address> addresses() const;


  // ---- SERIALIZATION ----
  void serialize(std::ostream& output) const;
  Bytes to_bytes() const;
  std::size_t serialized_size() const { return HEADER_SIZE + ENTRY_SIZE * chunks_.size(); }
  static DataMap deserialize(std::istream& input);
  static DataMap from_bytes(const Bytes& bytes);

  bool operator==(const DataMap& other) const {
    return level_ == other.level_ && chunks_ == other.chunks_;
  }
  bool operator!=(const DataMap& other) const { return !(*this == other); }

private:
  DataMap(uint32_t level, std::vector<ChunkInfo> chunks)
    : level_(level), chunks_(std::move(chunks)) {}

  // Checks count, index order and size consistency
  void validate() const;

  uint32_t level_ = 0;
  std::vector<ChunkInfo> chunks_;
};

} // namespace data
} // namespace autonomi

#endif // AUTONOMI_DATA_MAP_HPP
