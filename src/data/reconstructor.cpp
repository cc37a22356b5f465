#include "data/reconstructor.hpp"
#include "data/data_error.hpp"
#include "data/self_encryptor.hpp"
#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <map>
#include <boost/log/trivial.hpp>

namespace autonomi {
namespace data {

namespace {

// Joins every task, then rethrows the first real failure; cancellations
// caused by that failure only surface when nothing else went wrong
template <typename T>
std::vector<T> join_tasks(std::vector<std::future<T>>& futures) {
  for (auto& future : futures) {
    future.wait();
  }

  std::vector<T> results;
  results.reserve(futures.size());
  std::exception_ptr first_error;
  std::exception_ptr first_cancel;

  for (auto& future : futures) {
    try {
      results.push_back(future.get());
    }
    catch (const OperationCancelledError&) {
      if (!first_cancel) first_cancel = std::current_exception();
    }
    catch (const std::exception&) {
      if (!first_error) first_error = std::current_exception();
    }
  }

  if (first_error) std::rethrow_exception(first_error);
  if (first_cancel) std::rethrow_exception(first_cancel);
  return results;
}

Bytes concatenate(const std::vector<Bytes>& chunks) {
  std::size_t total = 0;
  for (const auto& chunk : chunks) {
    total += chunk.size();
  }

  Bytes content;
  content.reserve(total);
  for (const auto& chunk : chunks) {
    content.insert(content.end(), chunk.begin(), chunk.end());
  }
  return content;
}

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

Reconstructor::Reconstructor(const SelfEncryptionConfig& config, const RetryConfig& retry, utils::TaskPool& pool)
  : config_(config)
  , retry_(retry)
  , pool_(pool) {}

//==============================================
// CHUNK PROCESSING
//==============================================

Bytes Reconstructor::fetch_with_retry(const Address& address, const FetchFn& fetch,
                                      const utils::CancellationToken& cancel,
                                      const utils::CancellationToken& abort) const {
  uint64_t backoff_ms = retry_.initial_backoff_ms;

  for (uint32_t attempt = 0; ; ++attempt) {
    if (cancel.is_cancelled() || abort.is_cancelled()) {
      throw OperationCancelledError("Fetch of " + address.short_hex());
    }

    try {
      return fetch(address);
    }
    catch (const NetworkTransientError& e) {
      if (attempt >= retry_.max_retries) {
        BOOST_LOG_TRIVIAL(error) << "Reconstructor: Giving up on " << address.short_hex()
                                 << " after " << attempt + 1 << " attempts: " << e.what();
        throw NetworkTransientError("retries exhausted after " + std::to_string(attempt + 1) + " attempts", address);
      }
      BOOST_LOG_TRIVIAL(warning) << "Reconstructor: Transient failure fetching " << address.short_hex()
                                 << ", retrying in " << backoff_ms << " ms";
      utils::sleep_unless_cancelled(std::chrono::milliseconds(backoff_ms), cancel, abort);
      backoff_ms *= retry_.backoff_multiplier;
    }
  }
}

std::vector<Bytes> Reconstructor::fetch_and_decrypt(const DataMap& data_map,
                                                    const std::vector<std::size_t>& indices,
                                                    const FetchFn& fetch,
                                                    const utils::CancellationToken& cancel) const {
  // Collapse duplicate addresses so each is fetched once per operation
  std::map<Address, Bytes> fetched;
  for (std::size_t index : indices) {
    fetched.emplace(data_map.chunks().at(index).dst_hash, Bytes());
  }

  // The first failed fetch trips this token so siblings stop retrying
  utils::CancellationToken abort;

  std::vector<std::future<Bytes>> fetch_futures;
  fetch_futures.reserve(fetched.size());
  for (const auto& entry : fetched) {
    const Address& address = entry.first;
    fetch_futures.push_back(pool_.submit([this, &address, &fetch, &cancel, abort]() {
      if (abort.is_cancelled()) {
        throw OperationCancelledError("Fetch of " + address.short_hex());
      }
      try {
        return fetch_with_retry(address, fetch, cancel, abort);
      }
      catch (const OperationCancelledError&) {
        throw;
      }
      catch (const std::exception&) {
        abort.cancel();
        throw;
      }
    }));
  }

  std::vector<Bytes> contents = join_tasks(fetch_futures);
  std::size_t position = 0;
  for (auto& entry : fetched) {
    entry.second = std::move(contents[position++]);
  }

  std::vector<std::future<Bytes>> decrypt_futures;
  decrypt_futures.reserve(indices.size());
  for (std::size_t index : indices) {
    const Bytes& encrypted = fetched.at(data_map.chunks()[index].dst_hash);
    decrypt_futures.push_back(pool_.submit([&data_map, &encrypted, index]() {
      return SelfEncryptor::decrypt_chunk(data_map, index, encrypted);
    }));
  }
  return join_tasks(decrypt_futures);
}

//==============================================
// DATA MAP RESOLUTION
//==============================================

std::vector<Bytes> Reconstructor::resolve(const DataMap& data_map, const FetchFn& fetch,
                                          const utils::CancellationToken& cancel) const {
  std::vector<std::size_t> indices(data_map.size());
  for (std::size_t i = 0; i < indices.size(); ++i) {
    indices[i] = i;
  }
  return fetch_and_decrypt(data_map, indices, fetch, cancel);
}

DataMap Reconstructor::resolve_root(const DataMap& data_map, const FetchFn& fetch,
                                    const utils::CancellationToken& cancel) const {
  if (data_map.level() > config_.max_data_map_depth) {
    throw MalformedDataMapError("level " + std::to_string(data_map.level()) +
                                " exceeds maximum depth " + std::to_string(config_.max_data_map_depth));
  }

  DataMap current = data_map;
  while (current.has_child()) {
    BOOST_LOG_TRIVIAL(debug) << "Reconstructor: Resolving data map level " << current.level()
                             << " with " << current.size() << " chunks";

    DataMap next = DataMap::from_bytes(concatenate(resolve(current, fetch, cancel)));
    if (next.level() + 1 != current.level()) {
      throw MalformedDataMapError("nested map at level " + std::to_string(next.level()) +
                                  " below level " + std::to_string(current.level()));
    }
    current = std::move(next);
  }
  return current;
}

//==============================================
// RETRIEVAL
//==============================================

Bytes Reconstructor::get(const DataMap& data_map, const FetchFn& fetch,
                         const utils::CancellationToken& cancel) const {
  BOOST_LOG_TRIVIAL(info) << "Reconstructor: Retrieving content from data map with "
                          << data_map.size() << " chunks at level " << data_map.level();

  const DataMap root = resolve_root(data_map, fetch, cancel);
  Bytes content = concatenate(resolve(root, fetch, cancel));

  BOOST_LOG_TRIVIAL(info) << "Reconstructor: Reconstructed " << content.size() << " bytes";
  return content;
}

Bytes Reconstructor::get(const Address& data_map_address, const FetchFn& fetch,
                         const utils::CancellationToken& cancel) const {
  BOOST_LOG_TRIVIAL(info) << "Reconstructor: Retrieving data map chunk " << data_map_address.short_hex();

  const Bytes serialized = fetch_with_retry(data_map_address, fetch, cancel, utils::CancellationToken());
  if (XorName::from_content(serialized) != data_map_address) {
    throw CorruptChunkError("data map chunk does not hash to its address", data_map_address);
  }
  return get(DataMap::from_bytes(serialized), fetch, cancel);
}

Bytes Reconstructor::get_range(const DataMap& data_map, uint64_t offset, uint64_t length,
                               const FetchFn& fetch, const utils::CancellationToken& cancel) const {
  const DataMap root = resolve_root(data_map, fetch, cancel);
  const uint64_t size = root.content_size();
  if (offset >= size || length == 0) {
    return Bytes();
  }
  const uint64_t end = std::min(size, offset + std::min(length, size - offset));

  std::vector<std::size_t> indices;
  std::vector<uint64_t> starts;
  uint64_t start = 0;
  for (const auto& info : root.chunks()) {
    const uint64_t chunk_end = start + info.src_size;
    if (chunk_end > offset && start < end) {
      indices.push_back(info.index);
      starts.push_back(start);
    }
    start = chunk_end;
  }

  BOOST_LOG_TRIVIAL(debug) << "Reconstructor: Range [" << offset << ", " << end << ") spans "
                           << indices.size() << " chunks";

  const std::vector<Bytes> chunks = fetch_and_decrypt(root, indices, fetch, cancel);

  Bytes content;
  content.reserve(end - offset);
  for (std::size_t i = 0; i < chunks.size(); ++i) {
    const uint64_t from = std::max(offset, starts[i]) - starts[i];
    const uint64_t to = std::min(end, starts[i] + chunks[i].size()) - starts[i];
    content.insert(content.end(), chunks[i].begin() + from, chunks[i].begin() + to);
  }
  return content;
}

} // namespace data
} // namespace autonomi
