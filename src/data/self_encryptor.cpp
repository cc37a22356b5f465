#include "data/self_encryptor.hpp"
#include "data/data_error.hpp"
#include "crypto/crypto_error.hpp"
#include <algorithm>
#include <future>
#include <boost/log/trivial.hpp>

namespace autonomi {
namespace data {

//==============================================
// CONSTRUCTOR
//==============================================

SelfEncryptor::SelfEncryptor(const SelfEncryptionConfig& config, utils::TaskPool& pool)
  : chunker_(config)
  , pool_(pool) {}

//==============================================
// KEY DERIVATION
//==============================================

EncryptionKeySet SelfEncryptor::derive_keys(const Address& previous, const Address& next,
                                            const Address& after_next) {
  EncryptionKeySet keys;
  std::copy(next.bytes().begin(), next.bytes().end(), keys.key.begin());
  std::copy(previous.bytes().begin(), previous.bytes().begin() + keys.iv.size(), keys.iv.begin());
  std::copy(after_next.bytes().begin(), after_next.bytes().end(), keys.pad.begin());
  return keys;
}

EncryptionKeySet SelfEncryptor::derive_keys(const std::vector<Address>& src_hashes, std::size_t index) {
  const std::size_t n = src_hashes.size();
  return derive_keys(src_hashes[(index + n - 1) % n],
                     src_hashes[(index + 1) % n],
                     src_hashes[(index + 2) % n]);
}

EncryptionKeySet SelfEncryptor::derive_keys(const DataMap& data_map, std::size_t index) {
  const auto& chunks = data_map.chunks();
  const std::size_t n = chunks.size();
  return derive_keys(chunks[(index + n - 1) % n].src_hash,
                     chunks[(index + 1) % n].src_hash,
                     chunks[(index + 2) % n].src_hash);
}

//==============================================
// CHUNK ENCRYPTION/DECRYPTION
//==============================================

void SelfEncryptor::apply_pad(Bytes& data, const EncryptionKeySet& keys) {
  for (std::size_t i = 0; i < data.size(); ++i) {
    data[i] ^= keys.pad[i % keys.pad.size()];
  }
}

Bytes SelfEncryptor::encrypt_chunk(const Bytes& raw, const EncryptionKeySet& keys) {
  crypto::ChunkCipher cipher;
  cipher.initialize(keys.key.data(), keys.key.size(), keys.iv.data(), keys.iv.size());

  Bytes encrypted = cipher.encrypt(raw);
  apply_pad(encrypted, keys);
  return encrypted;
}

Bytes SelfEncryptor::decrypt_chunk(const DataMap& data_map, std::size_t index, const Bytes& encrypted) {
  const ChunkInfo& info = data_map.chunks().at(index);

  if (encrypted.size() != info.dst_size) {
    throw CorruptChunkError("encrypted size " + std::to_string(encrypted.size()) +
                            " does not match data map (" + std::to_string(info.dst_size) + ")", info.dst_hash);
  }
  if (XorName::from_content(encrypted) != info.dst_hash) {
    throw CorruptChunkError("content does not hash to its address", info.dst_hash);
  }

  const EncryptionKeySet keys = derive_keys(data_map, index);
  Bytes unpadded = encrypted;
  apply_pad(unpadded, keys);

  Bytes raw;
  try {
    crypto::ChunkCipher cipher;
    cipher.initialize(keys.key.data(), keys.key.size(), keys.iv.data(), keys.iv.size());
    raw = cipher.decrypt(unpadded);
  }
  catch (const crypto::DecryptionError& e) {
    BOOST_LOG_TRIVIAL(error) << "Self encryptor: Decryption failed for chunk " << index << ": " << e.what();
    throw CorruptChunkError("decryption failed", info.dst_hash);
  }

  if (raw.size() != info.src_size || XorName::from_content(raw) != info.src_hash) {
    throw CorruptChunkError("decrypted content does not match recorded hash", info.dst_hash);
  }
  return raw;
}

//==============================================
// ENCRYPTION
//==============================================

EncryptionResult SelfEncryptor::encrypt_chunks(const std::vector<Bytes>& raw_chunks, uint32_t level) const {
  const std::size_t n = raw_chunks.size();
  if (n < kMinChunks) {
    throw std::invalid_argument("Self encryptor: need at least " + std::to_string(kMinChunks) + " chunks");
  }

  // Hash pre-pass; every key depends on neighbor hashes
  std::vector<std::future<Address>> hash_futures;
  hash_futures.reserve(n);
  for (const auto& chunk : raw_chunks) {
    hash_futures.push_back(pool_.submit([&chunk]() { return XorName::from_content(chunk); }));
  }
  const std::vector<Address> src_hashes = utils::wait_all(hash_futures);

  std::vector<std::future<Bytes>> encrypt_futures;
  encrypt_futures.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    encrypt_futures.push_back(pool_.submit([&raw_chunks, &src_hashes, i]() {
      return encrypt_chunk(raw_chunks[i], derive_keys(src_hashes, i));
    }));
  }
  std::vector<Bytes> encrypted = utils::wait_all(encrypt_futures);

  EncryptionResult result;
  std::vector<ChunkInfo> infos;
  infos.reserve(n);
  result.chunks.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    ChunkInfo info;
    info.index = static_cast<uint32_t>(i);
    info.src_hash = src_hashes[i];
    info.src_size = raw_chunks[i].size();
    info.dst_size = encrypted[i].size();
    info.dst_hash = XorName::from_content(encrypted[i]);
    infos.push_back(info);
    result.chunks.push_back(EncryptedChunk{info.dst_hash, std::move(encrypted[i])});
  }
  result.data_map = DataMap::build(std::move(infos), level);

  BOOST_LOG_TRIVIAL(debug) << "Self encryptor: Encrypted " << n << " chunks at level " << level;
  return result;
}

EncryptionResult SelfEncryptor::pack(EncryptionResult result) const {
  const std::size_t limit = chunker_.config().max_chunk_size;

  while (result.data_map.serialized_size() > limit) {
    const uint32_t next_level = result.data_map.level() + 1;
    const Bytes serialized = result.data_map.to_bytes();

    BOOST_LOG_TRIVIAL(debug) << "Self encryptor: Data map of " << serialized.size()
                             << " bytes exceeds " << limit << ", wrapping at level " << next_level;

    EncryptionResult wrapped = encrypt_chunks(chunker_.split(serialized), next_level);
    for (auto& chunk : wrapped.chunks) {
      result.chunks.push_back(std::move(chunk));
    }
    result.data_map = std::move(wrapped.data_map);
  }
  return result;
}

EncryptionResult SelfEncryptor::encrypt(const Bytes& content) const {
  BOOST_LOG_TRIVIAL(info) << "Self encryptor: Encrypting " << content.size() << " bytes";

  EncryptionResult result = pack(encrypt_chunks(chunker_.split(content)));

  BOOST_LOG_TRIVIAL(info) << "Self encryptor: Produced " << result.chunks.size()
                          << " chunks, root data map level " << result.data_map.level();
  return result;
}

} // namespace data
} // namespace autonomi
