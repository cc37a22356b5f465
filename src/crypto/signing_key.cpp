#include "crypto/signing_key.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <openssl/rand.h>
#include <boost/log/trivial.hpp>

namespace autonomi::crypto {

//=================================================
// RAII WRAPPERS FOR OPENSSL KEY AND SIGN CONTEXTS
//=================================================

struct KeyHandle {
  EVP_PKEY* key = nullptr;

  explicit KeyHandle(EVP_PKEY* k) : key(k) {
    if (!key) {
      throw InitializationError("Signing key: Failed to create Ed25519 key");
    }
  }

  ~KeyHandle() {
    if (key) {
      EVP_PKEY_free(key);
    }
  }

  EVP_PKEY* get() { return key; }
};

namespace {

struct SignContext {
  EVP_MD_CTX* ctx = nullptr;

  SignContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw InitializationError("Signing key: Failed to create signature context");
    }
  }

  ~SignContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  EVP_MD_CTX* get() { return ctx; }
};

std::vector<uint8_t> extract_public_key(EVP_PKEY* key) {
  std::vector<uint8_t> public_key(SigningKey::PUBLIC_KEY_SIZE);
  size_t len = public_key.size();
  if (!EVP_PKEY_get_raw_public_key(key, public_key.data(), &len) || len != SigningKey::PUBLIC_KEY_SIZE) {
    throw InitializationError("Signing key: Failed to extract public key");
  }
  return public_key;
}

} // namespace

//==============================================
// RANDOMNESS
//==============================================

std::vector<uint8_t> random_bytes(size_t size) {
  std::vector<uint8_t> bytes(size);
  if (size > 0 && RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    throw CryptoError("Failed to generate random bytes");
  }
  return bytes;
}

//==============================================
// CONSTRUCTION
//==============================================

SigningKey::SigningKey(std::unique_ptr<KeyHandle> handle)
  : handle_(std::move(handle))
  , public_key_(extract_public_key(handle_->get())) {}

SigningKey::SigningKey(SigningKey&& other) noexcept = default;
SigningKey& SigningKey::operator=(SigningKey&& other) noexcept = default;
SigningKey::~SigningKey() = default;

SigningKey SigningKey::generate() {
  return from_seed(random_bytes(SEED_SIZE));
}

SigningKey SigningKey::from_seed(const std::vector<uint8_t>& seed) {
  if (seed.size() != SEED_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Signing key: Invalid seed size: " << seed.size() << " bytes (expected " << SEED_SIZE << " bytes)";
    throw InitializationError("Invalid signing key seed size");
  }

  EVP_PKEY* key = EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed.data(), seed.size());
  return SigningKey(std::make_unique<KeyHandle>(key));
}

//==============================================
// SIGN AND VERIFY
//==============================================

std::vector<uint8_t> SigningKey::sign(const uint8_t* message, size_t length) const {
  SignContext context;

  if (!EVP_DigestSignInit(context.get(), nullptr, nullptr, nullptr, handle_->get())) {
    throw SignatureError("Signing key: Failed to initialize signing");
  }

  std::vector<uint8_t> signature(SIGNATURE_SIZE);
  size_t sig_len = signature.size();
  if (!EVP_DigestSign(context.get(), signature.data(), &sig_len, message, length)) {
    throw SignatureError("Signing key: Failed to sign message");
  }
  signature.resize(sig_len);
  return signature;
}

std::vector<uint8_t> SigningKey::sign(const std::vector<uint8_t>& message) const {
  return sign(message.data(), message.size());
}

bool SigningKey::verify(const std::vector<uint8_t>& public_key,
                        const uint8_t* message, size_t length,
                        const std::vector<uint8_t>& signature) {
  if (public_key.size() != PUBLIC_KEY_SIZE || signature.size() != SIGNATURE_SIZE) {
    return false;
  }

  EVP_PKEY* raw = EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, public_key.data(), public_key.size());
  if (!raw) {
    ERR_clear_error();
    return false;
  }
  KeyHandle key(raw);
  SignContext context;

  if (!EVP_DigestVerifyInit(context.get(), nullptr, nullptr, nullptr, key.get())) {
    ERR_clear_error();
    return false;
  }

  bool valid = EVP_DigestVerify(context.get(), signature.data(), signature.size(), message, length) == 1;
  if (!valid) {
    ERR_clear_error();
  }
  return valid;
}

} // namespace autonomi::crypto
