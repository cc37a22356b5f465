#include "store/memory_chunk_store.hpp"
#include "data/data_error.hpp"
#include <boost/log/trivial.hpp>

namespace autonomi {
namespace store {

MemoryChunkStore::MemoryChunkStore(payment::PaymentVerifier* verifier)
  : verifier_(verifier) {}

//==============================================
// CORE STORAGE OPERATIONS
//==============================================

void MemoryChunkStore::put(const Address& address, const Bytes& content, const payment::PaymentProof& proof) {
  const bool matches = XorName::from_content(content) == address;

  std::lock_guard<std::mutex> lock(mutex_);
  if (chunks_.count(address) > 0) {
    BOOST_LOG_TRIVIAL(debug) << "Memory store: Chunk " << address.short_hex() << " already present";
    return;
  }

  if (!matches) {
    BOOST_LOG_TRIVIAL(error) << "Memory store: Content does not hash to " << address.short_hex();
    throw data::CorruptChunkError("content does not hash to its address", address);
  }

  if (verifier_) {
    verifier_->verify(proof, address);
  }

  chunks_.emplace(address, content);
  BOOST_LOG_TRIVIAL(debug) << "Memory store: Stored " << content.size() << " bytes at " << address.short_hex();
}

Bytes MemoryChunkStore::get(const Address& address) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = chunks_.find(address);
  if (it == chunks_.end()) {
    throw data::NotFoundError(address);
  }
  return it->second;
}

bool MemoryChunkStore::has(const Address& address) {
  std::lock_guard<std::mutex> lock(mutex_);
  return chunks_.count(address) > 0;
}

bool MemoryChunkStore::remove(const Address& address) {
  std::lock_guard<std::mutex> lock(mutex_);
  return chunks_.erase(address) > 0;
}

void MemoryChunkStore::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  chunks_.clear();
}

//==============================================
// QUERY OPERATIONS
//==============================================

std::size_t MemoryChunkStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chunks_.size();
}

std::size_t MemoryChunkStore::total_bytes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t total = 0;
  for (const auto& entry : chunks_) {
    total += entry.second.size();
  }
  return total;
}

} // namespace store
} // namespace autonomi
