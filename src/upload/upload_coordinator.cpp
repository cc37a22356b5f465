#include "upload/upload_coordinator.hpp"
#include "data/data_error.hpp"
#include <chrono>
#include <exception>
#include <future>
#include <map>
#include <string>
#include <utility>
#include <boost/log/trivial.hpp>

namespace autonomi {
namespace upload {

//==============================================
// CONSTRUCTOR
//==============================================

UploadCoordinator::UploadCoordinator(store::ChunkStore& store, const data::RetryConfig& retry,
                                     utils::TaskPool& pool)
  : store_(store)
  , retry_(retry)
  , pool_(pool) {}

//==============================================
// UPLOAD
//==============================================

std::size_t UploadCoordinator::put_with_retry(const data::EncryptedChunk& chunk,
                                              const payment::PaymentProof& proof,
                                              const utils::CancellationToken& cancel,
                                              const utils::CancellationToken& abort) const {
  uint64_t backoff_ms = retry_.initial_backoff_ms;

  for (uint32_t attempt = 0; ; ++attempt) {
    if (cancel.is_cancelled() || abort.is_cancelled()) {
      throw data::OperationCancelledError("Put of " + chunk.address.short_hex());
    }

    try {
      store_.put(chunk.address, chunk.content, proof);
      return attempt;
    }
    catch (const data::NetworkTransientError& e) {
      if (attempt >= retry_.max_retries) {
        BOOST_LOG_TRIVIAL(error) << "Upload: Giving up on " << chunk.address.short_hex()
                                 << " after " << attempt + 1 << " attempts: " << e.what();
        throw data::NetworkTransientError("retries exhausted after " + std::to_string(attempt + 1) + " attempts",
                                          chunk.address);
      }
      BOOST_LOG_TRIVIAL(warning) << "Upload: Transient failure storing " << chunk.address.short_hex()
                                 << ", retrying in " << backoff_ms << " ms";
      // A rejection elsewhere in the batch cuts the backoff short
      utils::sleep_unless_cancelled(std::chrono::milliseconds(backoff_ms), cancel, abort);
      backoff_ms *= retry_.backoff_multiplier;
    }
  }
}

UploadSummary UploadCoordinator::upload(const std::vector<data::EncryptedChunk>& chunks,
                                        const payment::PaymentProof& proof,
                                        const utils::CancellationToken& cancel) const {
  UploadSummary summary;

  std::map<Address, const data::EncryptedChunk*> distinct;
  for (const auto& chunk : chunks) {
    if (!distinct.emplace(chunk.address, &chunk).second) {
      ++summary.duplicates;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Upload: Storing " << distinct.size() << " distinct chunks ("
                          << summary.duplicates << " duplicates skipped)";

  // Payment rejection trips this token so queued and backing-off puts stop early
  utils::CancellationToken abort;

  std::vector<std::future<std::size_t>> futures;
  futures.reserve(distinct.size());
  for (const auto& entry : distinct) {
    const data::EncryptedChunk& chunk = *entry.second;
    futures.push_back(pool_.submit([this, &chunk, &proof, &cancel, abort]() -> std::size_t {
      if (abort.is_cancelled()) {
        throw data::OperationCancelledError("Put of " + chunk.address.short_hex());
      }
      try {
        return put_with_retry(chunk, proof, cancel, abort);
      }
      catch (const data::PaymentRejectedError&) {
        abort.cancel();
        throw;
      }
    }));
  }

  for (auto& future : futures) {
    future.wait();
  }

  std::exception_ptr rejection;
  std::exception_ptr cancellation;
  std::vector<data::UploadError::Failure> failures;

  auto it = distinct.begin();
  for (auto& future : futures) {
    const Address& address = (it++)->first;
    try {
      summary.retries += future.get();
      summary.addresses.push_back(address);
      ++summary.stored;
    }
    catch (const data::PaymentRejectedError&) {
      if (!rejection) rejection = std::current_exception();
    }
    catch (const data::OperationCancelledError&) {
      if (!cancellation) cancellation = std::current_exception();
    }
    catch (const std::exception& e) {
      failures.emplace_back(address, e.what());
    }
  }

  if (rejection) {
    BOOST_LOG_TRIVIAL(error) << "Upload: Payment rejected, remaining puts cancelled";
    std::rethrow_exception(rejection);
  }
  if (!failures.empty()) {
    BOOST_LOG_TRIVIAL(error) << "Upload: " << failures.size() << " of " << distinct.size() << " chunks failed";
    throw data::UploadError(std::move(failures));
  }
  if (cancellation) {
    std::rethrow_exception(cancellation);
  }

  BOOST_LOG_TRIVIAL(info) << "Upload: Stored " << summary.stored << " chunks with "
                          << summary.retries << " retries";
  return summary;
}

} // namespace upload
} // namespace autonomi
