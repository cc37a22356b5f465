#ifndef AUTONOMI_UPLOAD_COORDINATOR_HPP
#define AUTONOMI_UPLOAD_COORDINATOR_HPP

#include <cstddef>
#include <cstdint>
#include <vector>
#include "data/data_config.hpp"
#include "data/self_encryptor.hpp"
#include "payment/payment.hpp"
#include "store/chunk_store.hpp"
#include "utils/task_pool.hpp"

namespace autonomi {
namespace upload {

struct UploadSummary {
  // Distinct addresses put to the store
  std::size_t stored = 0;
  // Input chunks collapsed onto an address already in the batch
  std::size_t duplicates = 0;
  // Transient failures that were retried
  std::size_t retries = 0;
  std::vector<Address> addresses;
};

/**
 * Puts a batch of encrypted chunks to a ChunkStore in parallel.
 *
 * Transient failures are retried per address with their own backoff.
 * A payment rejection cancels the remaining puts and is rethrown as is.
 * Any other failure is recorded and reported together in an UploadError
 * once every task has finished.
 */
class UploadCoordinator {
public:
  // ---- CONSTRUCTOR ----
  UploadCoordinator(store::ChunkStore& store, const data::RetryConfig& retry, utils::TaskPool& pool);


  // ---- UPLOAD ----
  UploadSummary upload(const std::vector<data::EncryptedChunk>& chunks,
                       const payment::PaymentProof& proof,
                       const utils::CancellationToken& cancel = utils::CancellationToken()) const;

private:
  // ---- PARAMETERS ----
  store::ChunkStore& store_;
  data::RetryConfig retry_;
  utils::TaskPool& pool_;

  // Returns the number of retries spent on this chunk. Throws
  // OperationCancelledError once either token is cancelled
  std::size_t put_with_retry(const data::EncryptedChunk& chunk, const payment::PaymentProof& proof,
                             const utils::CancellationToken& cancel,
                             const utils::CancellationToken& abort) const;
};

} // namespace upload
} // namespace autonomi

#endif // AUTONOMI_UPLOAD_COORDINATOR_HPP
