#ifndef AUTONOMI_CRYPTO_HASHER_HPP
#define AUTONOMI_CRYPTO_HASHER_HPP

#include <array>
#include <cstdint>
#include <memory>
#include <vector>
#include "crypto_error.hpp"

namespace autonomi::crypto {

// Forward declaration for OpenSSL digest context
struct DigestContext;

// Incremental SHA3-256 digest over one or more buffers
class Hasher {
public:
  static constexpr size_t DIGEST_SIZE = 32;
  using Digest = std::array<uint8_t, DIGEST_SIZE>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Hasher();
  ~Hasher();

  Hasher(const Hasher&) = delete;
  Hasher& operator=(const Hasher&) = delete;


  // ---- DIGEST OPERATIONS ----
  // Feeds data into the running digest
  Hasher& update(const uint8_t* data, size_t length);
  Hasher& update(const std::vector<uint8_t>& data);
  // Completes the digest and resets the context for reuse
  Digest finalize();

  // One-shot digest of a buffer
  static Digest sha3_256(const std::vector<uint8_t>& data);
  static Digest sha3_256(const uint8_t* data, size_t length);

private:
  // ---- PARAMETERS ----
  std::unique_ptr<DigestContext> context_;
  bool started_ = false;

  // Initializes the digest context for a new message
  void begin();
};

} // namespace autonomi::crypto

#endif // AUTONOMI_CRYPTO_HASHER_HPP
