#include <gtest/gtest.h>
#include <algorithm>
#include <set>
#include "data/data_error.hpp"
#include "data/self_encryptor.hpp"
#include "test_utils.hpp"

using namespace autonomi;
using namespace autonomi::data;

class SelfEncryptorTest : public ::testing::Test {
protected:
  SelfEncryptionConfig config;
  std::unique_ptr<utils::TaskPool> pool;
  std::unique_ptr<SelfEncryptor> encryptor;

  void SetUp() override {
    init_logging();
    config.max_chunk_size = 1024;
    pool = std::make_unique<utils::TaskPool>(4);
    encryptor = std::make_unique<SelfEncryptor>(config, *pool);
  }

  // Decrypts a level 0 result chunk by chunk
  static Bytes decrypt_all(const EncryptionResult& result) {
    Bytes content;
    for (std::size_t i = 0; i < result.data_map.size(); ++i) {
      Bytes raw = SelfEncryptor::decrypt_chunk(result.data_map, i, result.chunks[i].content);
      content.insert(content.end(), raw.begin(), raw.end());
    }
    return content;
  }
};

TEST_F(SelfEncryptorTest, EncryptDecryptRoundTrip) {
  const Bytes content = make_content(3000);
  const EncryptionResult result = encryptor->encrypt(content);

  ASSERT_EQ(result.data_map.level(), 0u);
  ASSERT_EQ(result.chunks.size(), 3u);
  EXPECT_EQ(decrypt_all(result), content);
}

TEST_F(SelfEncryptorTest, AddressIsHashOfCiphertext) {
  const EncryptionResult result = encryptor->encrypt(make_content(2000));

  for (std::size_t i = 0; i < result.chunks.size(); ++i) {
    const auto& info = result.data_map.chunks()[i];
    EXPECT_EQ(result.chunks[i].address, XorName::from_content(result.chunks[i].content));
    EXPECT_EQ(info.dst_hash, result.chunks[i].address);
    EXPECT_EQ(info.dst_size, result.chunks[i].content.size());
  }
}

TEST_F(SelfEncryptorTest, EncryptionIsDeterministic) {
  const Bytes content = make_content(7000);
  const EncryptionResult first = encryptor->encrypt(content);
  const EncryptionResult second = encryptor->encrypt(content);

  EXPECT_EQ(first.data_map, second.data_map);
  EXPECT_EQ(first.data_map.to_bytes(), second.data_map.to_bytes());
}

TEST_F(SelfEncryptorTest, KeysComeFromNeighbourHashes) {
  std::vector<Address> hashes;
  for (uint32_t seed = 1; seed <= 4; ++seed) {
    hashes.push_back(XorName::from_content(make_content(10, seed)));
  }

  const EncryptionKeySet keys = SelfEncryptor::derive_keys(hashes, 0);
  EXPECT_TRUE(std::equal(keys.key.begin(), keys.key.end(), hashes[1].bytes().begin()));
  EXPECT_TRUE(std::equal(keys.iv.begin(), keys.iv.end(), hashes[3].bytes().begin()));
  EXPECT_TRUE(std::equal(keys.pad.begin(), keys.pad.end(), hashes[2].bytes().begin()));

  // Indices wrap around the end
  const EncryptionKeySet last = SelfEncryptor::derive_keys(hashes, 3);
  EXPECT_TRUE(std::equal(last.key.begin(), last.key.end(), hashes[0].bytes().begin()));
  EXPECT_TRUE(std::equal(last.pad.begin(), last.pad.end(), hashes[1].bytes().begin()));
}

TEST_F(SelfEncryptorTest, SingleByteRoundTrips) {
  const EncryptionResult result = encryptor->encrypt(Bytes{0x07});

  ASSERT_EQ(result.chunks.size(), 3u);
  EXPECT_EQ(result.data_map.content_size(), 1u);
  EXPECT_EQ(result.data_map.chunks()[0].src_size, 0u);
  EXPECT_EQ(decrypt_all(result), Bytes{0x07});
}

TEST_F(SelfEncryptorTest, EmptyInputRoundTrips) {
  const EncryptionResult result = encryptor->encrypt(Bytes());

  ASSERT_EQ(result.data_map.size(), 3u);
  EXPECT_EQ(result.data_map.content_size(), 0u);
  EXPECT_TRUE(decrypt_all(result).empty());

  const std::vector<Address> addresses = result.data_map.addresses();
  const std::set<Address> distinct(addresses.begin(), addresses.end());
  EXPECT_EQ(distinct.size(), 1u) << "Identical empty chunks should collapse to one address";
}

TEST_F(SelfEncryptorTest, BitFlipIsDetected) {
  const EncryptionResult result = encryptor->encrypt(make_content(3000));

  for (std::size_t i = 0; i < result.chunks.size(); ++i) {
    Bytes tampered = result.chunks[i].content;
    tampered[tampered.size() / 2] ^= 0x10;
    EXPECT_THROW(SelfEncryptor::decrypt_chunk(result.data_map, i, tampered), CorruptChunkError)
      << "Chunk " << i;
  }
}

TEST_F(SelfEncryptorTest, TruncatedChunkIsCorrupt) {
  const EncryptionResult result = encryptor->encrypt(make_content(3000));
  Bytes truncated = result.chunks[0].content;
  truncated.resize(truncated.size() - 16);
  EXPECT_THROW(SelfEncryptor::decrypt_chunk(result.data_map, 0, truncated), CorruptChunkError);
}

TEST_F(SelfEncryptorTest, LargeMapIsPackedIntoLevels) {
  const Bytes content = make_content(40 * 1024);
  const EncryptionResult result = encryptor->encrypt(content);

  EXPECT_GE(result.data_map.level(), 1u);
  EXPECT_LE(result.data_map.serialized_size(), config.max_chunk_size);
  // 40 level 0 chunks plus the chunks of every wrapping level
  EXPECT_GT(result.chunks.size(), 40u);
}

TEST_F(SelfEncryptorTest, RejectsTooFewChunks) {
  EXPECT_THROW(encryptor->encrypt_chunks({Bytes(1, 1), Bytes(1, 2)}), std::invalid_argument);
}
