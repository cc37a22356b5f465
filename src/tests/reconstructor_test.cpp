#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include "data/data_error.hpp"
#include "data/reconstructor.hpp"
#include "data/self_encryptor.hpp"
#include "test_utils.hpp"

using namespace autonomi;
using namespace autonomi::data;

class ReconstructorTest : public ::testing::Test {
protected:
  SelfEncryptionConfig config;
  RetryConfig retry;
  std::unique_ptr<utils::TaskPool> pool;
  std::unique_ptr<SelfEncryptor> encryptor;
  std::unique_ptr<Reconstructor> reconstructor;

  std::mutex mutex;
  std::map<Address, Bytes> network;
  std::map<Address, int> fetch_counts;
  // Transient failures still to be served per address
  std::map<Address, int> failures_left;

  void SetUp() override {
    init_logging();
    config.max_chunk_size = 1024;
    retry.initial_backoff_ms = 1;
    pool = std::make_unique<utils::TaskPool>(4);
    encryptor = std::make_unique<SelfEncryptor>(config, *pool);
    reconstructor = std::make_unique<Reconstructor>(config, retry, *pool);
  }

  DataMap store(const Bytes& content) {
    EncryptionResult result = encryptor->encrypt(content);
    for (auto& chunk : result.chunks) {
      network[chunk.address] = chunk.content;
    }
    return result.data_map;
  }

  FetchFn fetcher() {
    return [this](const Address& address) {
      std::lock_guard<std::mutex> lock(mutex);
      ++fetch_counts[address];
      if (failures_left[address] > 0) {
        --failures_left[address];
        throw NetworkTransientError("simulated timeout", address);
      }
      auto it = network.find(address);
      if (it == network.end()) {
        throw NotFoundError(address);
      }
      return it->second;
    };
  }
};

TEST_F(ReconstructorTest, RoundTripSizes) {
  for (std::size_t size : {0u, 1u, 2u, 3u, 1000u, 3072u, 10000u, 50000u}) {
    const Bytes content = make_content(size, static_cast<uint32_t>(size));
    const DataMap map = store(content);
    EXPECT_EQ(reconstructor->get(map, fetcher()), content) << "size " << size;
  }
}

TEST_F(ReconstructorTest, NestedMapsResolveToRoot) {
  const Bytes content = make_content(40 * 1024);
  const DataMap map = store(content);
  ASSERT_GE(map.level(), 1u);

  const DataMap root = reconstructor->resolve_root(map, fetcher());
  EXPECT_EQ(root.level(), 0u);
  EXPECT_EQ(root.content_size(), content.size());
  EXPECT_EQ(reconstructor->get(map, fetcher()), content);
}

TEST_F(ReconstructorTest, GetByDataMapAddress) {
  const Bytes content = make_content(5000);
  const Bytes serialized = store(content).to_bytes();
  const Address address = XorName::from_content(serialized);
  network[address] = serialized;

  EXPECT_EQ(reconstructor->get(address, fetcher()), content);

  network[address][0] ^= 0x01;
  EXPECT_THROW(reconstructor->get(address, fetcher()), CorruptChunkError);
}

TEST_F(ReconstructorTest, BitFlipFailsWithCorruption) {
  const DataMap map = store(make_content(3000));
  const Address target = map.chunks()[1].dst_hash;
  network[target][5] ^= 0x80;

  try {
    reconstructor->get(map, fetcher());
    FAIL() << "Expected CorruptChunkError";
  }
  catch (const CorruptChunkError& e) {
    ASSERT_TRUE(e.address().has_value());
    EXPECT_EQ(*e.address(), target);
  }
}

TEST_F(ReconstructorTest, MissingChunkNamesAddress) {
  const DataMap map = store(make_content(3000));
  const Address missing = map.chunks()[2].dst_hash;
  network.erase(missing);

  try {
    reconstructor->get(map, fetcher());
    FAIL() << "Expected NotFoundError";
  }
  catch (const NotFoundError& e) {
    ASSERT_TRUE(e.address().has_value());
    EXPECT_EQ(*e.address(), missing);
  }
}

TEST_F(ReconstructorTest, TransientFailuresAreRetried) {
  const Bytes content = make_content(3000);
  const DataMap map = store(content);
  for (const auto& address : map.addresses()) {
    failures_left[address] = 2;
  }

  EXPECT_EQ(reconstructor->get(map, fetcher()), content);
  for (const auto& address : map.addresses()) {
    EXPECT_EQ(fetch_counts[address], 3);
  }
}

TEST_F(ReconstructorTest, RetriesAreBounded) {
  const DataMap map = store(make_content(3000));
  const Address flaky = map.chunks()[0].dst_hash;
  failures_left[flaky] = 100;

  EXPECT_THROW(reconstructor->get(map, fetcher()), NetworkTransientError);
  EXPECT_EQ(fetch_counts[flaky], static_cast<int>(retry.max_retries) + 1);
}

TEST_F(ReconstructorTest, MissingChunkInterruptsSiblingBackoff) {
  retry.max_retries = 5;
  retry.initial_backoff_ms = 200;
  Reconstructor slow(config, retry, *pool);

  const DataMap map = store(make_content(3000));
  const Address missing = map.chunks()[0].dst_hash;
  network.erase(missing);
  for (std::size_t i = 1; i < map.size(); ++i) {
    failures_left[map.chunks()[i].dst_hash] = 1000;
  }

  const auto started = std::chrono::steady_clock::now();
  try {
    slow.get(map, fetcher());
    FAIL() << "Expected NotFoundError";
  }
  catch (const NotFoundError& e) {
    ASSERT_TRUE(e.address().has_value());
    EXPECT_EQ(*e.address(), missing);
  }
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now() - started);

  EXPECT_LT(elapsed.count(), 1000);
  for (std::size_t i = 1; i < map.size(); ++i) {
    EXPECT_LE(fetch_counts[map.chunks()[i].dst_hash], 2);
  }
}

TEST_F(ReconstructorTest, DuplicateAddressesFetchedOnce) {
  const DataMap map = store(Bytes());
  ASSERT_EQ(map.size(), 3u);

  EXPECT_TRUE(reconstructor->get(map, fetcher()).empty());
  EXPECT_EQ(fetch_counts.size(), 1u);
  EXPECT_EQ(fetch_counts.begin()->second, 1);
}

TEST_F(ReconstructorTest, CancelledOperationReturnsNothing) {
  const DataMap map = store(make_content(3000));
  utils::CancellationToken cancel;
  cancel.cancel();

  EXPECT_THROW(reconstructor->get(map, fetcher(), cancel), OperationCancelledError);
  EXPECT_TRUE(fetch_counts.empty());
}

TEST_F(ReconstructorTest, RangeFetchesOnlyCoveringChunks) {
  const Bytes content = make_content(10 * 1024);
  const DataMap map = store(content);
  ASSERT_EQ(map.size(), 10u);

  const Bytes range = reconstructor->get_range(map, 2000, 1500, fetcher());
  EXPECT_EQ(range, Bytes(content.begin() + 2000, content.begin() + 3500));
  EXPECT_EQ(fetch_counts.size(), 3u);

  EXPECT_EQ(reconstructor->get_range(map, 10 * 1024 - 10, 100, fetcher()),
            Bytes(content.end() - 10, content.end()));
  EXPECT_TRUE(reconstructor->get_range(map, 20000, 10, fetcher()).empty());
  EXPECT_TRUE(reconstructor->get_range(map, 0, 0, fetcher()).empty());
}

TEST_F(ReconstructorTest, DepthBoundIsEnforced) {
  SelfEncryptionConfig shallow = config;
  shallow.max_data_map_depth = 1;
  Reconstructor bounded(shallow, retry, *pool);

  const DataMap level_zero = store(make_content(3000));
  EncryptionResult wrapped = encryptor->encrypt_chunks(encryptor->chunker().split(level_zero.to_bytes()), 5);
  for (auto& chunk : wrapped.chunks) {
    network[chunk.address] = chunk.content;
  }

  EXPECT_THROW(bounded.get(wrapped.data_map, fetcher()), MalformedDataMapError);
  // Within the bound the level gap is still rejected
  EXPECT_THROW(reconstructor->get(wrapped.data_map, fetcher()), MalformedDataMapError);
}
