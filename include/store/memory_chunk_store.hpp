#pragma once

#include <map>
#include <mutex>
#include "store/chunk_store.hpp"

namespace autonomi {
namespace store {

class MemoryChunkStore : public ChunkStore {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Without a verifier every put is accepted regardless of proof
  explicit MemoryChunkStore(payment::PaymentVerifier* verifier = nullptr);


  // ---- CORE STORAGE OPERATIONS ----
  void put(const Address& address, const Bytes& content, const payment::PaymentProof& proof) override;
  Bytes get(const Address& address) override;
  bool has(const Address& address) override;
  // Removes a chunk; returns false when it was absent
  bool remove(const Address& address);
  void clear();


  // ---- QUERY OPERATIONS ----
  std::size_t size() const;
  std::size_t total_bytes() const;

private:
  // ---- PARAMETERS ----
  payment::PaymentVerifier* verifier_;
  mutable std::mutex mutex_;
  std::map<Address, Bytes> chunks_;
};

} // namespace store
} // namespace autonomi
