#ifndef AUTONOMI_CRYPTO_SIGNING_KEY_HPP
#define AUTONOMI_CRYPTO_SIGNING_KEY_HPP

#include <cstdint>
#include <memory>
#include <vector>
#include "crypto_error.hpp"

namespace autonomi::crypto {

// Forward declaration for OpenSSL key handle
struct KeyHandle;

// Fills a buffer of the given size from the OpenSSL CSPRNG
std::vector<uint8_t> random_bytes(size_t size);

/**
 * Ed25519 key pair used to sign register entries.
 * Owns the private key; public keys travel as raw 32-byte strings.
 */
class SigningKey {
public:
  static constexpr size_t PUBLIC_KEY_SIZE = 32;
  static constexpr size_t SEED_SIZE = 32;
  static constexpr size_t SIGNATURE_SIZE = 64;

  // ---- CONSTRUCTION ----
  // Creates a fresh random key pair
  static SigningKey generate();
  // Recreates a key pair from a 32-byte seed
  static SigningKey from_seed(const std::vector<uint8_t>& seed);

  SigningKey(SigningKey&& other) noexcept;
  SigningKey& operator=(SigningKey&& other) noexcept;
  ~SigningKey();


  // ---- KEY OPERATIONS ----
  const std::vector<uint8_t>& public_key() const { return public_key_; }
  std::vector<uint8_t> sign(const uint8_t* message, size_t length) const;
  std::vector<uint8_t> sign(const std::vector<uint8_t>& message) const;

  // Checks a signature against a raw public key; false on any mismatch
  static bool verify(const std::vector<uint8_t>& public_key,
                     const uint8_t* message, size_t length,
                     const std::vector<uint8_t>& signature);

private:
  explicit SigningKey(std::unique_ptr<KeyHandle> handle);

  std::unique_ptr<KeyHandle> handle_;
  std::vector<uint8_t> public_key_;
};

} // namespace autonomi::crypto

#endif // AUTONOMI_CRYPTO_SIGNING_KEY_HPP
