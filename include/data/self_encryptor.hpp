#ifndef AUTONOMI_DATA_SELF_ENCRYPTOR_HPP
#define AUTONOMI_DATA_SELF_ENCRYPTOR_HPP

#include <array>
#include <cstdint>
#include <vector>
#include "data/chunker.hpp"
#include "data/data_config.hpp"
#include "data/data_map.hpp"
#include "data/types.hpp"
#include "crypto/chunk_cipher.hpp"
#include "utils/task_pool.hpp"

namespace autonomi {
namespace data {

struct EncryptedChunk {
  Address address;
  Bytes content;
};

// Root map plus every chunk that must be stored for it, map levels included
struct EncryptionResult {
  DataMap data_map;
  std::vector<EncryptedChunk> chunks;
};

// Per-chunk key material; derived on demand and never stored
struct EncryptionKeySet {
  std::array<uint8_t, crypto::ChunkCipher::KEY_SIZE> key{};
  std::array<uint8_t, crypto::ChunkCipher::IV_SIZE> iv{};
  std::array<uint8_t, XorName::SIZE> pad{};
};

/**
 * Encrypts chunks with keys taken from their neighbors' content hashes.
 *
 * For chunk i of n (indices wrap): key = src_hash[i+1], iv = first 16 bytes
 * of src_hash[i-1], pad = src_hash[i+2]. The chunk is AES-256-CBC encrypted
 * and the ciphertext XORed with the repeated pad. Identical content at
 * identical boundaries therefore always yields identical addresses.
 */
class SelfEncryptor {
public:
  // ---- CONSTRUCTOR ----
  SelfEncryptor(const SelfEncryptionConfig& config, utils::TaskPool& pool);


  // ---- ENCRYPTION ----
  // Chunks, encrypts and packs content down to a root map that fits one chunk
  EncryptionResult encrypt(const Bytes& content) const;
  // Encrypts already split chunks into a map of the given level
  EncryptionResult encrypt_chunks(const std::vector<Bytes>& raw_chunks, uint32_t level = 0) const;
  // Wraps the map in further levels while its serialized form exceeds max_chunk_size
  EncryptionResult pack(EncryptionResult result) const;


  // ---- KEY DERIVATION AND CHUNK CRYPTO ----
  static EncryptionKeySet derive_keys(const std::vector<Address>& src_hashes, std::size_t index);
  static EncryptionKeySet derive_keys(const DataMap& data_map, std::size_t index);
  static Bytes encrypt_chunk(const Bytes& raw, const EncryptionKeySet& keys);
  // Verifies address, decrypts and verifies the content hash; throws CorruptChunkError
  static Bytes decrypt_chunk(const DataMap& data_map, std::size_t index, const Bytes& encrypted);


  // ---- GETTERS ----
  const Chunker& chunker() const { return chunker_; }

private:
  Chunker chunker_;
  utils::TaskPool& pool_;

  static EncryptionKeySet derive_keys(const Address& previous, const Address& next, const Address& after_next);
  static void apply_pad(Bytes& data, const EncryptionKeySet& keys);
};

} // namespace data
} // namespace autonomi

#endif // AUTONOMI_DATA_SELF_ENCRYPTOR_HPP
