#include "utils/task_pool.hpp"
#include <boost/log/trivial.hpp>

namespace autonomi {
namespace utils {

TaskPool::TaskPool(std::size_t threads)
  : threads_(threads == 0 ? 1 : threads)
  , pool_(threads_) {
  BOOST_LOG_TRIVIAL(debug) << "Task pool: Started with " << threads_ << " worker threads";
}

TaskPool::~TaskPool() {
  pool_.join();
  BOOST_LOG_TRIVIAL(debug) << "Task pool: Worker threads joined";
}

} // namespace utils
} // namespace autonomi
