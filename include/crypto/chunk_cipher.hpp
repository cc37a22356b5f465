#ifndef AUTONOMI_CHUNK_CIPHER_HPP
#define AUTONOMI_CHUNK_CIPHER_HPP

#include <vector>
#include <memory>
#include <array>
#include <cstdint>
#include "crypto_error.hpp"

namespace autonomi::crypto {

// Forward declaration for OpenSSL cipher context
struct CipherContext;

// AES-256-CBC over whole in-memory chunks
class ChunkCipher {
public:

  static constexpr size_t KEY_SIZE = 32;     // 256 bits for AES-256
  static constexpr size_t IV_SIZE = 16;      // 128 bits for CBC mode
  static constexpr size_t BLOCK_SIZE = 16;   // AES block size

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ChunkCipher();
  ~ChunkCipher();

  ChunkCipher(const ChunkCipher&) = delete;
  ChunkCipher& operator=(const ChunkCipher&) = delete;


  // ---- INITIALIZATION ----
  // Sets key and IV; both must match KEY_SIZE and IV_SIZE
  void initialize(const uint8_t* key, size_t key_len, const uint8_t* iv, size_t iv_len);
  void initialize(const std::vector<uint8_t>& key, const std::vector<uint8_t>& iv);


  // ---- ENCRYPTION/DECRYPTION OPERATIONS ----
  std::vector<uint8_t> encrypt(const std::vector<uint8_t>& plaintext);
  std::vector<uint8_t> decrypt(const std::vector<uint8_t>& ciphertext);


  // ---- GETTERS ----
  // Size of the ciphertext produced for a plaintext of the given size
  static size_t encryptedSize(size_t plaintext_size) {
    return (plaintext_size / BLOCK_SIZE + 1) * BLOCK_SIZE;
  }

private:
  // ---- PARAMETERS ----
  std::array<uint8_t, KEY_SIZE> key_{};
  std::array<uint8_t, IV_SIZE> iv_{};
  std::unique_ptr<CipherContext> context_;
  bool is_initialized_ = false;
  static constexpr size_t BUFFER_SIZE = 8192;


  // ---- INITIALIZATION ----
  // Initializes cipher context
  void initializeCipher(bool encrypting);


  // ---- BUFFER PROCESSING - ENCRYPTION/DECRYPTION ----
  // Runs the whole input through the cipher in BUFFER_SIZE blocks
  std::vector<uint8_t> processBuffer(const std::vector<uint8_t>& input, bool encrypting);
  // Encrypts or decrypts a single block of data using the configured cipher
  size_t processDataBlock(const uint8_t* inbuf, size_t bytes_read, uint8_t* outbuf,
                          bool encrypting);
  // Handles the final block with padding in encryption/decryption operations
  void processFinalBlock(uint8_t* outbuf, int& outlen, bool encrypting);
};

} // namespace autonomi::crypto

#endif // AUTONOMI_CHUNK_CIPHER_HPP
