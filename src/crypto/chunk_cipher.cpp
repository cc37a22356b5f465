#include "crypto/chunk_cipher.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace autonomi::crypto {

//=================================================
// RAII WRAPPER TO MANAGE CIPHER CONTEXT LIFECYCLE
//=================================================

struct CipherContext {
  EVP_CIPHER_CTX* ctx = nullptr;

  // Initialize new cipher context
  CipherContext() {
    ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
      throw InitializationError("Chunk cipher: Failed to create cipher context");
    }
  }

  // Free cipher context when object is destroyed
  ~CipherContext() {
    if (ctx) {
      EVP_CIPHER_CTX_free(ctx);
    }
  }

  EVP_CIPHER_CTX* get() { return ctx; }
};

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ChunkCipher::ChunkCipher()
  : context_(std::make_unique<CipherContext>()) {}

ChunkCipher::~ChunkCipher() = default;

//==============================================
// CIPHER INITIALIZATION
//==============================================

void ChunkCipher::initialize(const uint8_t* key, size_t key_len, const uint8_t* iv, size_t iv_len) {
  if (key_len != KEY_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Chunk cipher: Invalid key size: " << key_len << " bytes (expected " << KEY_SIZE << " bytes)";
    throw InitializationError("Invalid key size");
  }
  if (iv_len != IV_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Chunk cipher: Invalid IV size: " << iv_len << " bytes (expected " << IV_SIZE << " bytes)";
    throw InitializationError("Invalid IV size");
  }

  std::copy(key, key + KEY_SIZE, key_.begin());
  std::copy(iv, iv + IV_SIZE, iv_.begin());
  is_initialized_ = true;
}

void ChunkCipher::initialize(const std::vector<uint8_t>& key, const std::vector<uint8_t>& iv) {
  initialize(key.data(), key.size(), iv.data(), iv.size());
}

void ChunkCipher::initializeCipher(bool encrypting) {
  if (!is_initialized_) {
    throw InitializationError("Chunk cipher: ChunkCipher not initialized");
  }

  // Reset the context state
  EVP_CIPHER_CTX_reset(context_->get());

  const EVP_CIPHER* cipher = EVP_aes_256_cbc();
  if (encrypting) {
    if (!EVP_EncryptInit_ex(context_->get(), cipher, nullptr, key_.data(), iv_.data())) {
      throw EncryptionError("Chunk cipher: Failed to initialize encryption context");
    }
  } else {
    if (!EVP_DecryptInit_ex(context_->get(), cipher, nullptr, key_.data(), iv_.data())) {
      throw DecryptionError("Chunk cipher: Failed to initialize decryption context");
    }
  }
}

//==============================================
// BUFFER PROCESSING - ENCRYPTION/DECRYPTION
//==============================================

std::vector<uint8_t> ChunkCipher::processBuffer(const std::vector<uint8_t>& input, bool encrypting) {
  initializeCipher(encrypting);

  std::vector<uint8_t> output;
  output.reserve(input.size() + BLOCK_SIZE);
  std::array<uint8_t, BUFFER_SIZE + EVP_MAX_BLOCK_LENGTH> outbuf;
  size_t block_count = 0;

  // Process the input in BUFFER_SIZE pieces
  for (size_t offset = 0; offset < input.size(); offset += BUFFER_SIZE) {
    size_t bytes_read = std::min(BUFFER_SIZE, input.size() - offset);
    auto outlen = processDataBlock(input.data() + offset, bytes_read, outbuf.data(), encrypting);
    output.insert(output.end(), outbuf.begin(), outbuf.begin() + outlen);
    block_count++;
  }

  // Process final block with padding
  int final_outlen = 0;
  processFinalBlock(outbuf.data(), final_outlen, encrypting);
  output.insert(output.end(), outbuf.begin(), outbuf.begin() + final_outlen);

  BOOST_LOG_TRIVIAL(trace) << "Chunk cipher: Completed " << (encrypting ? "encryption" : "decryption")
                           << ": " << input.size() << " -> " << output.size()
                           << " bytes in " << block_count << " blocks";
  return output;
}

size_t ChunkCipher::processDataBlock(const uint8_t* inbuf, size_t bytes_read, uint8_t* outbuf,
                                     bool encrypting) {
  int outlen = 0;
  if (encrypting) {
    if (!EVP_EncryptUpdate(context_->get(), outbuf, &outlen,
                           inbuf, static_cast<int>(bytes_read))) {
      throw EncryptionError("Chunk cipher: Failed to encrypt data block");
    }
  } else {
    if (!EVP_DecryptUpdate(context_->get(), outbuf, &outlen,
                           inbuf, static_cast<int>(bytes_read))) {
      throw DecryptionError("Chunk cipher: Failed to decrypt data block");
    }
  }
  return static_cast<size_t>(outlen);
}

void ChunkCipher::processFinalBlock(uint8_t* outbuf, int& outlen, bool encrypting) {
  if (encrypting) {
    if (!EVP_EncryptFinal_ex(context_->get(), outbuf, &outlen)) {
      throw EncryptionError("Chunk cipher: Failed to finalize encryption");
    }
  } else {
    // Bad padding lands here when the ciphertext or key is wrong
    if (!EVP_DecryptFinal_ex(context_->get(), outbuf, &outlen)) {
      ERR_clear_error();
      throw DecryptionError("Chunk cipher: Failed to finalize decryption");
    }
  }
}

//==============================================
// ENCRYPTION/DECRYPTION OPERATIONS
//==============================================

std::vector<uint8_t> ChunkCipher::encrypt(const std::vector<uint8_t>& plaintext) {
  return processBuffer(plaintext, true);
}

std::vector<uint8_t> ChunkCipher::decrypt(const std::vector<uint8_t>& ciphertext) {
  if (ciphertext.empty() || ciphertext.size() % BLOCK_SIZE != 0) {
    throw DecryptionError("Chunk cipher: Ciphertext is not a whole number of blocks");
  }
  return processBuffer(ciphertext, false);
}

} // namespace autonomi::crypto
