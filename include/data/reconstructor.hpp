#ifndef AUTONOMI_DATA_RECONSTRUCTOR_HPP
#define AUTONOMI_DATA_RECONSTRUCTOR_HPP

#include <cstdint>
#include <functional>
#include <vector>
#include "data/data_config.hpp"
#include "data/data_map.hpp"
#include "data/types.hpp"
#include "utils/task_pool.hpp"

namespace autonomi {
namespace data {

// Returns the encrypted bytes stored at an address.
// Throws NotFoundError or NetworkTransientError.
using FetchFn = std::function<Bytes(const Address&)>;

class Reconstructor {
public:
  // ---- CONSTRUCTOR ----
  Reconstructor(const SelfEncryptionConfig& config, const RetryConfig& retry, utils::TaskPool& pool);


  // ---- RETRIEVAL ----
  // Follows nested maps, fetches, verifies and joins every chunk
  Bytes get(const DataMap& data_map, const FetchFn& fetch,
            const utils::CancellationToken& cancel = utils::CancellationToken()) const;
  // Same, starting from the address of a stored root data map
  Bytes get(const Address& data_map_address, const FetchFn& fetch,
            const utils::CancellationToken& cancel = utils::CancellationToken()) const;
  // Fetches only the chunks covering [offset, offset + length)
  Bytes get_range(const DataMap& data_map, uint64_t offset, uint64_t length, const FetchFn& fetch,
                  const utils::CancellationToken& cancel = utils::CancellationToken()) const;


  // ---- DATA MAP RESOLUTION ----
  // Descends from any level to the level 0 map, one level per step
  DataMap resolve_root(const DataMap& data_map, const FetchFn& fetch,
                       const utils::CancellationToken& cancel = utils::CancellationToken()) const;
  // Raw chunks of a map in index order
  std::vector<Bytes> resolve(const DataMap& data_map, const FetchFn& fetch,
                             const utils::CancellationToken& cancel = utils::CancellationToken()) const;

private:
  // ---- PARAMETERS ----
  SelfEncryptionConfig config_;
  RetryConfig retry_;
  utils::TaskPool& pool_;


  // ---- CHUNK PROCESSING ----
  // Fetches each distinct address once, then decrypts the requested indices
  std::vector<Bytes> fetch_and_decrypt(const DataMap& data_map, const std::vector<std::size_t>& indices,
                                       const FetchFn& fetch, const utils::CancellationToken& cancel) const;
  // Retries transient failures with exponential backoff until either token
  // is cancelled
  Bytes fetch_with_retry(const Address& address, const FetchFn& fetch,
                         const utils::CancellationToken& cancel,
                         const utils::CancellationToken& abort) const;
};

} // namespace data
} // namespace autonomi

#endif // AUTONOMI_DATA_RECONSTRUCTOR_HPP
