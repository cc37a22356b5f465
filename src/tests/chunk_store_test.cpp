#include <gtest/gtest.h>
#include <filesystem>
#include <thread>
#include "data/data_error.hpp"
#include "payment/local_ledger.hpp"
#include "store/disk_chunk_store.hpp"
#include "store/memory_chunk_store.hpp"
#include "test_utils.hpp"

using namespace autonomi;
using namespace autonomi::store;

class MemoryChunkStoreTest : public ::testing::Test {
protected:
  MemoryChunkStore store;
  payment::PaymentProof proof;

  void SetUp() override {
    init_logging();
  }
};

TEST_F(MemoryChunkStoreTest, PutGetHas) {
  const Bytes content = make_content(500);
  const Address address = XorName::from_content(content);

  EXPECT_FALSE(store.has(address));
  store.put(address, content, proof);
  EXPECT_TRUE(store.has(address));
  EXPECT_EQ(store.get(address), content);
}

TEST_F(MemoryChunkStoreTest, PutIsIdempotent) {
  const Bytes content = make_content(500);
  const Address address = XorName::from_content(content);

  store.put(address, content, proof);
  EXPECT_NO_THROW(store.put(address, content, proof));
  EXPECT_EQ(store.size(), 1u);
  EXPECT_EQ(store.total_bytes(), 500u);
}

TEST_F(MemoryChunkStoreTest, RejectsContentNotMatchingAddress) {
  const Bytes content = make_content(500);
  const Address wrong = XorName::from_content(make_content(500, 7));
  EXPECT_THROW(store.put(wrong, content, proof), data::CorruptChunkError);
  EXPECT_FALSE(store.has(wrong));
}

TEST_F(MemoryChunkStoreTest, MissingChunkNotFound) {
  const Address address = XorName::from_content(make_content(10));
  EXPECT_THROW(store.get(address), data::NotFoundError);
  EXPECT_FALSE(store.remove(address));
}

TEST_F(MemoryChunkStoreTest, VerifierGatesPuts) {
  payment::LocalLedger ledger(1000, 10);
  MemoryChunkStore gated(&ledger);

  const Bytes content = make_content(100);
  const Address address = XorName::from_content(content);

  EXPECT_THROW(gated.put(address, content, payment::PaymentProof()), data::PaymentRejectedError);
  EXPECT_FALSE(gated.has(address));

  const auto paid = ledger.proof(ledger.quote({address}));
  gated.put(address, content, paid);
  EXPECT_TRUE(gated.has(address));
  // A second put of the same address is free and does not touch the proof
  EXPECT_NO_THROW(gated.put(address, content, paid));
}

TEST_F(MemoryChunkStoreTest, ConcurrentPutsOfSameAddress) {
  payment::LocalLedger ledger(1000, 10);
  MemoryChunkStore gated(&ledger);
  const Bytes content = make_content(100);
  const Address address = XorName::from_content(content);
  const auto paid = ledger.proof(ledger.quote({address}));

  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&]() { EXPECT_NO_THROW(gated.put(address, content, paid)); });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(gated.size(), 1u);
}

class DiskChunkStoreTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::unique_ptr<DiskChunkStore> store;
  payment::PaymentProof proof;

  void SetUp() override {
    init_logging();
    test_dir = make_temp_dir("disk_chunk_store_test");
    store = std::make_unique<DiskChunkStore>(test_dir.string());
    ASSERT_NE(store, nullptr);
  }

  void TearDown() override {
    store.reset();
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  Address put_content(const Bytes& content) {
    const Address address = XorName::from_content(content);
    store->put(address, content, proof);
    return address;
  }
};

TEST_F(DiskChunkStoreTest, PutGetHas) {
  const Bytes content = make_content(4096);
  const Address address = put_content(content);

  ASSERT_TRUE(store->has(address));
  EXPECT_EQ(store->get(address), content);
  EXPECT_EQ(store->get_file_size(address), 4096u);
}

TEST_F(DiskChunkStoreTest, UsesContentAddressedLayout) {
  const Address address = put_content(make_content(100));
  const std::string hex = address.to_hex();

  const auto expected = test_dir / hex.substr(0, 2) / hex.substr(2, 2) / hex.substr(4, 2) / hex.substr(6);
  EXPECT_TRUE(std::filesystem::exists(expected)) << expected;
}

TEST_F(DiskChunkStoreTest, EmptyChunk) {
  const Address address = put_content(Bytes());
  EXPECT_TRUE(store->get(address).empty());
}

TEST_F(DiskChunkStoreTest, PutIsIdempotent) {
  const Bytes content = make_content(100);
  const Address address = put_content(content);
  EXPECT_NO_THROW(store->put(address, content, proof));
  EXPECT_EQ(store->get(address), content);
}

TEST_F(DiskChunkStoreTest, RejectsContentNotMatchingAddress) {
  const Address wrong = XorName::from_content(make_content(10, 3));
  EXPECT_THROW(store->put(wrong, make_content(10), proof), data::CorruptChunkError);
  EXPECT_FALSE(store->has(wrong));
}

TEST_F(DiskChunkStoreTest, RemoveCleansUpDirectories) {
  const Address address = put_content(make_content(100));
  store->remove(address);

  EXPECT_FALSE(store->has(address));
  EXPECT_TRUE(std::filesystem::is_empty(test_dir));
  EXPECT_THROW(store->remove(address), data::NotFoundError);
}

TEST_F(DiskChunkStoreTest, RemoveKeepsBaseGivenWithTrailingSlash) {
  store = std::make_unique<DiskChunkStore>(test_dir.string() + "/");
  const Address address = put_content(make_content(100));
  store->remove(address);

  EXPECT_TRUE(std::filesystem::exists(test_dir));
  EXPECT_TRUE(std::filesystem::is_empty(test_dir));
}

TEST_F(DiskChunkStoreTest, ClearRemovesEverything) {
  const Address first = put_content(make_content(100, 1));
  const Address second = put_content(make_content(100, 2));
  store->clear();

  EXPECT_FALSE(store->has(first));
  EXPECT_FALSE(store->has(second));
  EXPECT_THROW(store->get(first), data::NotFoundError);
  EXPECT_TRUE(std::filesystem::exists(test_dir));
}
