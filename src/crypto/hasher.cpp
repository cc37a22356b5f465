#include "crypto/hasher.hpp"
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>

namespace autonomi::crypto {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw InitializationError("Hasher: Failed to create digest context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  EVP_MD_CTX* get() { return ctx; }
};

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Hasher::Hasher()
  : context_(std::make_unique<DigestContext>()) {}

Hasher::~Hasher() = default;

//==============================================
// DIGEST OPERATIONS
//==============================================

void Hasher::begin() {
  if (!EVP_DigestInit_ex(context_->get(), EVP_sha3_256(), nullptr)) {
    BOOST_LOG_TRIVIAL(error) << "Hasher: Failed to initialize SHA3-256 context";
    throw InitializationError("Hasher: Failed to initialize digest");
  }
  started_ = true;
}

Hasher& Hasher::update(const uint8_t* data, size_t length) {
  if (!started_) {
    begin();
  }
  if (length > 0 && !EVP_DigestUpdate(context_->get(), data, length)) {
    throw CryptoError("Hasher: Failed to update digest");
  }
  return *this;
}

Hasher& Hasher::update(const std::vector<uint8_t>& data) {
  return update(data.data(), data.size());
}

Hasher::Digest Hasher::finalize() {
  if (!started_) {
    begin();
  }

  Digest digest{};
  unsigned int digest_len = 0;
  if (!EVP_DigestFinal_ex(context_->get(), digest.data(), &digest_len) || digest_len != DIGEST_SIZE) {
    started_ = false;
    throw CryptoError("Hasher: Failed to finalize digest");
  }

  started_ = false;
  return digest;
}

Hasher::Digest Hasher::sha3_256(const std::vector<uint8_t>& data) {
  return sha3_256(data.data(), data.size());
}

Hasher::Digest Hasher::sha3_256(const uint8_t* data, size_t length) {
  Hasher hasher;
  return hasher.update(data, length).finalize();
}

} // namespace autonomi::crypto
