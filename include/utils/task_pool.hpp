#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <thread>
#include <type_traits>
#include <vector>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

namespace autonomi {
namespace utils {

// Shared flag that lets a caller abort an in-flight operation
class CancellationToken {
public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() const { flag_->store(true); }
  bool is_cancelled() const { return flag_->load(); }

private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

// Sleeps for duration in short slices. Returns false as soon as either
// token is cancelled, true once the full duration has passed
inline bool sleep_unless_cancelled(std::chrono::milliseconds duration, const CancellationToken& first,
                                   const CancellationToken& second) {
  const std::chrono::steady_clock::duration slice = std::chrono::milliseconds(10);
  const auto deadline = std::chrono::steady_clock::now() + duration;

  while (!first.is_cancelled() && !second.is_cancelled()) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return true;
    }
    std::this_thread::sleep_for(std::min(slice, deadline - now));
  }
  return false;
}

class TaskPool {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit TaskPool(std::size_t threads);
  ~TaskPool();

  TaskPool(const TaskPool&) = delete;
  TaskPool& operator=(const TaskPool&) = delete;


  // ---- TASK SUBMISSION ----
  // Queues fn on the pool; exceptions surface through the future
  template <typename Fn>
  auto submit(Fn&& fn) -> std::future<std::invoke_result_t<std::decay_t<Fn>>> {
    using Result = std::invoke_result_t<std::decay_t<Fn>>;
    auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
    auto future = task->get_future();
    boost::asio::post(pool_, [task]() { (*task)(); });
    return future;
  }

  std::size_t size() const { return threads_; }

private:
  // ---- PARAMETERS ----
  std::size_t threads_;
  boost::asio::thread_pool pool_;
};

// Waits for every future before returning so no task outlives the caller's
// stack, then rethrows the first failure in submission order
template <typename T>
std::vector<T> wait_all(std::vector<std::future<T>>& futures) {
  for (auto& future : futures) {
    future.wait();
  }

  std::vector<T> results;
  results.reserve(futures.size());
  for (auto& future : futures) {
    results.push_back(future.get());
  }
  return results;
}

inline void wait_all(std::vector<std::future<void>>& futures) {
  for (auto& future : futures) {
    future.wait();
  }
  for (auto& future : futures) {
    future.get();
  }
}

} // namespace utils
} // namespace autonomi
