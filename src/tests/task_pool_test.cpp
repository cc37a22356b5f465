#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include "utils/task_pool.hpp"

using namespace autonomi::utils;

TEST(TaskPoolTest, RunsTasksAndReturnsResults) {
  TaskPool pool(4);
  EXPECT_EQ(pool.size(), 4u);

  std::vector<std::future<int>> futures;
  for (int i = 0; i < 100; ++i) {
    futures.push_back(pool.submit([i]() { return i * i; }));
  }

  const std::vector<int> results = wait_all(futures);
  ASSERT_EQ(results.size(), 100u);
  for (int i = 0; i < 100; ++i) {
    EXPECT_EQ(results[i], i * i);
  }
}

TEST(TaskPoolTest, WaitAllFinishesEveryTaskBeforeRethrowing) {
  TaskPool pool(2);
  std::atomic<int> finished{0};

  std::vector<std::future<void>> futures;
  futures.push_back(pool.submit([]() { throw std::runtime_error("first task failed"); }));
  for (int i = 0; i < 10; ++i) {
    futures.push_back(pool.submit([&finished]() { ++finished; }));
  }

  EXPECT_THROW(wait_all(futures), std::runtime_error);
  EXPECT_EQ(finished.load(), 10);
}

TEST(CancellationTokenTest, CopiesShareState) {
  CancellationToken token;
  const CancellationToken copy = token;
  EXPECT_FALSE(copy.is_cancelled());

  copy.cancel();
  EXPECT_TRUE(token.is_cancelled());
}

TEST(CancellationTokenTest, SleepEndsEarlyOnCancel) {
  TaskPool pool(1);
  CancellationToken idle;
  CancellationToken abort;

  auto sleeper = pool.submit([idle, abort]() {
    return sleep_unless_cancelled(std::chrono::milliseconds(5000), idle, abort);
  });

  const auto started = std::chrono::steady_clock::now();
  abort.cancel();
  EXPECT_FALSE(sleeper.get());
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(1000));

  EXPECT_TRUE(sleep_unless_cancelled(std::chrono::milliseconds(5), CancellationToken(), CancellationToken()));
}
