#include <gtest/gtest.h>
#include "data/data_error.hpp"
#include "data/data_map.hpp"
#include "crypto/chunk_cipher.hpp"
#include "test_utils.hpp"

using namespace autonomi;
using namespace autonomi::data;

class DataMapTest : public ::testing::Test {
protected:
  std::vector<ChunkInfo> infos;

  void SetUp() override {
    init_logging();
    for (uint32_t i = 0; i < 3; ++i) {
      ChunkInfo info;
      info.index = i;
      info.src_size = 100 + i;
      info.dst_size = crypto::ChunkCipher::encryptedSize(info.src_size);
      info.src_hash = XorName::from_content(make_content(8, i + 1));
      info.dst_hash = XorName::from_content(make_content(8, i + 100));
      infos.push_back(info);
    }
  }

  void expect_malformed(const Bytes& bytes, const std::string& what) {
    EXPECT_THROW(DataMap::from_bytes(bytes), MalformedDataMapError) << what;
  }
};

TEST_F(DataMapTest, SerializeRoundTrip) {
  const DataMap map = DataMap::build(infos, 2);
  const Bytes bytes = map.to_bytes();

  ASSERT_EQ(bytes.size(), map.serialized_size());
  ASSERT_EQ(bytes.size(), DataMap::HEADER_SIZE + 3 * DataMap::ENTRY_SIZE);

  const DataMap decoded = DataMap::from_bytes(bytes);
  EXPECT_EQ(decoded, map);
  EXPECT_EQ(decoded.level(), 2u);
  EXPECT_TRUE(decoded.has_child());
  EXPECT_EQ(decoded.content_size(), 303u);
}

TEST_F(DataMapTest, HeaderLayout) {
  const Bytes bytes = DataMap::build(infos, 1).to_bytes();

  EXPECT_EQ(std::string(bytes.begin(), bytes.begin() + 4), "ADMP");
  EXPECT_EQ(bytes[4], DataMap::FORMAT_VERSION);
  // level and count are big-endian u32
  EXPECT_EQ(Bytes(bytes.begin() + 5, bytes.begin() + 9), (Bytes{0, 0, 0, 1}));
  EXPECT_EQ(Bytes(bytes.begin() + 9, bytes.begin() + 13), (Bytes{0, 0, 0, 3}));
}

TEST_F(DataMapTest, BuildValidatesDescriptors) {
  EXPECT_THROW(DataMap::build({infos[0], infos[1]}), MalformedDataMapError);

  auto reordered = infos;
  std::swap(reordered[0], reordered[1]);
  EXPECT_THROW(DataMap::build(reordered), MalformedDataMapError);

  auto bad_size = infos;
  bad_size[2].dst_size += 1;
  EXPECT_THROW(DataMap::build(bad_size), MalformedDataMapError);
}

TEST_F(DataMapTest, MalformedInputs) {
  const Bytes valid = DataMap::build(infos).to_bytes();

  Bytes bad_magic = valid;
  bad_magic[0] = 'X';
  expect_malformed(bad_magic, "bad magic");

  Bytes bad_version = valid;
  bad_version[4] = 99;
  expect_malformed(bad_version, "unknown version");

  expect_malformed(Bytes(valid.begin(), valid.end() - 1), "truncated entry");
  expect_malformed(Bytes(valid.begin(), valid.begin() + 7), "truncated header");
  expect_malformed(Bytes(), "empty input");

  Bytes trailing = valid;
  trailing.push_back(0);
  expect_malformed(trailing, "trailing byte");

  Bytes huge_count = valid;
  huge_count[9] = 0xff;
  expect_malformed(huge_count, "count larger than payload");
}

TEST_F(DataMapTest, AddressesFollowIndexOrder) {
  const DataMap map = DataMap::build(infos);
  const auto addresses = map.addresses();
  ASSERT_EQ(addresses.size(), 3u);
  for (std::size_t i = 0; i < 3; ++i) {
    EXPECT_EQ(addresses[i], infos[i].dst_hash);
  }
}
