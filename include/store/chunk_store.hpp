#ifndef AUTONOMI_STORE_CHUNK_STORE_HPP
#define AUTONOMI_STORE_CHUNK_STORE_HPP

#include "data/types.hpp"
#include "payment/payment.hpp"

namespace autonomi {
namespace store {

/**
 * Content-addressed chunk storage, local or remote.
 *
 * put is idempotent: an address already present succeeds without rewriting
 * or charging. Errors use the data::ChunkError hierarchy:
 *   put: NetworkTransientError, PaymentRejectedError,
 *        CorruptChunkError (content does not hash to the address)
 *   get: NotFoundError, NetworkTransientError
 */
class ChunkStore {
public:
  virtual ~ChunkStore() = default;

  virtual void put(const Address& address, const Bytes& content, const payment::PaymentProof& proof) = 0;
  virtual Bytes get(const Address& address) = 0;
  virtual bool has(const Address& address) = 0;
};

} // namespace store
} // namespace autonomi

#endif // AUTONOMI_STORE_CHUNK_STORE_HPP
