#ifndef AUTONOMI_CLIENT_HPP
#define AUTONOMI_CLIENT_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <vector>
#include "client/client_config.hpp"
#include "data/reconstructor.hpp"
#include "data/self_encryptor.hpp"
#include "payment/payment.hpp"
#include "registers/register_store.hpp"
#include "store/chunk_store.hpp"
#include "upload/upload_coordinator.hpp"
#include "utils/task_pool.hpp"

namespace autonomi {
namespace client {

/**
 * Entry point for storing and retrieving data and for working with registers.
 *
 * Public data stores its root data map as a chunk of its own and is retrieved
 * by that chunk's address. Private data hands the data map back to the caller.
 * Only chunks the store does not already hold are quoted and paid for.
 */
class Client {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Throws ConfigError on an invalid configuration
  Client(const ClientConfig& config,
         store::ChunkStore& chunk_store,
         registers::RegisterStore& register_store,
         payment::PaymentCollaborator& payment);

  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;


  // ---- DATA ----
  Address store(const Bytes& content, const utils::CancellationToken& cancel = utils::CancellationToken());
  data::DataMap store_private(const Bytes& content,
                              const utils::CancellationToken& cancel = utils::CancellationToken());
  Bytes retrieve(const data::DataMap& data_map,
                 const utils::CancellationToken& cancel = utils::CancellationToken()) const;
  Bytes retrieve(const Address& address,
                 const utils::CancellationToken& cancel = utils::CancellationToken()) const;
  Bytes retrieve_range(const data::DataMap& data_map, uint64_t offset, uint64_t length,
                       const utils::CancellationToken& cancel = utils::CancellationToken()) const;
  // Price of storing content publicly, counting only chunks not yet stored
  uint64_t cost(const Bytes& content);


  // ---- REGISTERS ----
  registers::RegisterAddress register_create(const crypto::SigningKey& owner, const XorName& meta,
                                             std::set<registers::PublicKey> writers = {});
  registers::EntryHash register_write(const registers::RegisterAddress& address, const Bytes& payload,
                                      const std::set<registers::EntryHash>& parents,
                                      const crypto::SigningKey& signer);
  std::vector<registers::RegisterEntry> register_read(const registers::RegisterAddress& address);
  void register_merge(const registers::RegisterAddress& address, const registers::Register& remote);
  registers::Register register_get(const registers::RegisterAddress& address);


  // ---- GETTERS ----
  const ClientConfig& config() const { return config_; }

private:
  // ---- PARAMETERS ----
  ClientConfig config_;
  store::ChunkStore& chunk_store_;
  registers::RegisterStore& register_store_;
  payment::PaymentCollaborator& payment_;

  utils::TaskPool pool_;
  data::SelfEncryptor encryptor_;
  data::Reconstructor reconstructor_;
  upload::UploadCoordinator coordinator_;

  std::mutex replicas_mutex_;
  std::map<XorName, std::shared_ptr<registers::Register>> replicas_;


  // ---- HELPERS ----
  data::FetchFn fetcher() const;
  // Chunks the store does not hold yet, one per address
  std::vector<data::EncryptedChunk> missing_chunks(const std::vector<data::EncryptedChunk>& chunks);
  upload::UploadSummary upload_chunks(const std::vector<data::EncryptedChunk>& chunks,
                                      const utils::CancellationToken& cancel);
  std::vector<data::EncryptedChunk> public_chunks(const data::EncryptionResult& result) const;
  // Local replica, loaded from the register store on first use
  std::shared_ptr<registers::Register> replica(const registers::RegisterAddress& address);
  // Pushes the replica to the store and folds the merged view back in
  void sync(registers::Register& reg);
};

} // namespace client
} // namespace autonomi

#endif // AUTONOMI_CLIENT_HPP
