#include <gtest/gtest.h>
#include <numeric>
#include "data/chunker.hpp"
#include "test_utils.hpp"

using namespace autonomi;
using namespace autonomi::data;

class ChunkerTest : public ::testing::Test {
protected:
  SelfEncryptionConfig config;

  void SetUp() override {
    init_logging();
    config.max_chunk_size = 1024;
  }

  // Checks the split covers the content exactly, in order
  static void expect_exact_cover(const Bytes& content, const std::vector<Bytes>& chunks) {
    Bytes joined;
    for (const auto& chunk : chunks) {
      joined.insert(joined.end(), chunk.begin(), chunk.end());
    }
    EXPECT_EQ(joined, content) << "Chunks do not reassemble the content";
  }
};

TEST_F(ChunkerTest, EmptyInputYieldsThreeEmptyChunks) {
  Chunker chunker(config);
  auto chunks = chunker.split(Bytes());

  ASSERT_EQ(chunks.size(), kMinChunks);
  for (const auto& chunk : chunks) {
    EXPECT_TRUE(chunk.empty());
  }
}

TEST_F(ChunkerTest, TinyInputsKeepMinimumChunkCount) {
  Chunker chunker(config);

  for (std::size_t size : {1u, 2u, 3u, 5u}) {
    const Bytes content = make_content(size);
    auto chunks = chunker.split(content);
    ASSERT_EQ(chunks.size(), kMinChunks) << "size " << size;
    expect_exact_cover(content, chunks);
  }
}

TEST_F(ChunkerTest, SmallInputSplitsIntoThirds) {
  Chunker chunker(config);
  const Bytes content = make_content(1000);
  auto chunks = chunker.split(content);

  ASSERT_EQ(chunks.size(), 3u);
  EXPECT_EQ(chunks[0].size(), 333u);
  EXPECT_EQ(chunks[1].size(), 333u);
  EXPECT_EQ(chunks[2].size(), 334u);
  expect_exact_cover(content, chunks);
}

TEST_F(ChunkerTest, LargeInputUsesMaxChunkSize) {
  Chunker chunker(config);
  const Bytes content = make_content(10 * 1024 + 100);
  auto chunks = chunker.split(content);

  ASSERT_EQ(chunks.size(), 11u);
  for (std::size_t i = 0; i + 1 < chunks.size(); ++i) {
    EXPECT_EQ(chunks[i].size(), 1024u);
  }
  EXPECT_EQ(chunks.back().size(), 100u);
  expect_exact_cover(content, chunks);
}

TEST_F(ChunkerTest, ShortRemainderBorrowsFromPenultimateChunk) {
  config.min_chunk_size = 64;
  Chunker chunker(config);
  const Bytes content = make_content(4 * 1024 + 10);
  auto chunks = chunker.split(content);

  ASSERT_EQ(chunks.size(), 5u);
  EXPECT_EQ(chunks[3].size(), 1024u - 64u);
  EXPECT_EQ(chunks[4].size(), 74u);
  expect_exact_cover(content, chunks);
}

TEST_F(ChunkerTest, LayoutQueriesAgreeWithSplit) {
  config.min_chunk_size = 64;
  Chunker chunker(config);

  for (std::size_t size : {0u, 2u, 1000u, 3072u, 4106u, 8192u}) {
    const Bytes content = make_content(size);
    auto chunks = chunker.split(content);
    ASSERT_EQ(chunks.size(), chunker.chunk_count(size));

    uint64_t start = 0;
    for (std::size_t i = 0; i < chunks.size(); ++i) {
      EXPECT_EQ(chunker.chunk_start(size, i), start) << "size " << size << " chunk " << i;
      EXPECT_EQ(chunker.chunk_size(size, i), chunks[i].size()) << "size " << size << " chunk " << i;
      start += chunks[i].size();
    }
  }
}

TEST_F(ChunkerTest, SplitIsDeterministic) {
  Chunker chunker(config);
  const Bytes content = make_content(5000);
  EXPECT_EQ(chunker.split(content), chunker.split(content));
}

TEST_F(ChunkerTest, RejectsUnusableConfig) {
  SelfEncryptionConfig tiny;
  tiny.max_chunk_size = 512;
  EXPECT_THROW(Chunker{tiny}, std::invalid_argument);

  SelfEncryptionConfig zero_min;
  zero_min.min_chunk_size = 0;
  EXPECT_THROW(Chunker{zero_min}, std::invalid_argument);

  SelfEncryptionConfig large_min;
  large_min.max_chunk_size = 1024;
  large_min.min_chunk_size = 1000;
  EXPECT_THROW(Chunker{large_min}, std::invalid_argument);

  large_min.min_chunk_size = 1024;
  EXPECT_THROW(Chunker{large_min}, std::invalid_argument);
}

TEST_F(ChunkerTest, BorrowingKeepsBothTailChunksAboveMinimum) {
  config.min_chunk_size = 512;
  Chunker chunker(config);

  for (std::size_t size : {3082u, 3100u, 3583u, 4096u + 1u}) {
    const Bytes content = make_content(size);
    auto chunks = chunker.split(content);
    ASSERT_GE(chunks.size(), 3u);
    for (std::size_t i = 0; i < chunks.size(); ++i) {
      EXPECT_GE(chunks[i].size(), 512u) << "size " << size << " chunk " << i;
      EXPECT_LE(chunks[i].size(), 1024u) << "size " << size << " chunk " << i;
    }
    expect_exact_cover(content, chunks);
  }
}
