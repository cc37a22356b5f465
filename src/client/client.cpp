#include "client/client.hpp"
#include "data/data_error.hpp"
#include <boost/log/trivial.hpp>

namespace autonomi {
namespace client {

namespace {

const ClientConfig& validated(const ClientConfig& config) {
  config.validate();
  return config;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Client::Client(const ClientConfig& config,
               store::ChunkStore& chunk_store,
               registers::RegisterStore& register_store,
               payment::PaymentCollaborator& payment)
  : config_(validated(config))
  , chunk_store_(chunk_store)
  , register_store_(register_store)
  , payment_(payment)
  , pool_(config_.worker_threads)
  , encryptor_(config_.self_encryption, pool_)
  , reconstructor_(config_.self_encryption, config_.retry, pool_)
  , coordinator_(chunk_store_, config_.retry, pool_) {
  BOOST_LOG_TRIVIAL(info) << "Client: Initialized with " << config_.worker_threads << " workers, max chunk size "
                          << config_.self_encryption.max_chunk_size;
}

//==============================================
// HELPERS
//==============================================

data::FetchFn Client::fetcher() const {
  store::ChunkStore& chunks = chunk_store_;
  return [&chunks](const Address& address) { return chunks.get(address); };
}

std::vector<data::EncryptedChunk> Client::missing_chunks(const std::vector<data::EncryptedChunk>& chunks) {
  std::map<Address, const data::EncryptedChunk*> distinct;
  for (const auto& chunk : chunks) {
    distinct.emplace(chunk.address, &chunk);
  }

  std::vector<data::EncryptedChunk> missing;
  for (const auto& entry : distinct) {
    if (!chunk_store_.has(entry.first)) {
      missing.push_back(*entry.second);
    }
  }
  return missing;
}

upload::UploadSummary Client::upload_chunks(const std::vector<data::EncryptedChunk>& chunks,
                                            const utils::CancellationToken& cancel) {
  const std::vector<data::EncryptedChunk> missing = missing_chunks(chunks);
  if (missing.empty()) {
    BOOST_LOG_TRIVIAL(info) << "Client: All " << chunks.size() << " chunks already stored, nothing to pay";
    return upload::UploadSummary();
  }

  std::vector<Address> addresses;
  addresses.reserve(missing.size());
  for (const auto& chunk : missing) {
    addresses.push_back(chunk.address);
  }

  const payment::StoreQuote quote = payment_.quote(addresses);
  BOOST_LOG_TRIVIAL(info) << "Client: Paying " << quote.amount << " for " << addresses.size() << " chunks";
  const payment::PaymentProof proof = payment_.proof(quote);

  return coordinator_.upload(missing, proof, cancel);
}

std::vector<data::EncryptedChunk> Client::public_chunks(const data::EncryptionResult& result) const {
  std::vector<data::EncryptedChunk> chunks = result.chunks;
  Bytes serialized = result.data_map.to_bytes();
  const Address address = XorName::from_content(serialized);
  chunks.push_back(data::EncryptedChunk{address, std::move(serialized)});
  return chunks;
}

//==============================================
// DATA
//==============================================

data::DataMap Client::store_private(const Bytes& content, const utils::CancellationToken& cancel) {
  BOOST_LOG_TRIVIAL(info) << "Client: Storing " << content.size() << " bytes privately";

  data::EncryptionResult result = encryptor_.encrypt(content);
  upload_chunks(result.chunks, cancel);
  return result.data_map;
}

Address Client::store(const Bytes& content, const utils::CancellationToken& cancel) {
  BOOST_LOG_TRIVIAL(info) << "Client: Storing " << content.size() << " bytes publicly";

  const data::EncryptionResult result = encryptor_.encrypt(content);
  const std::vector<data::EncryptedChunk> chunks = public_chunks(result);
  upload_chunks(chunks, cancel);

  BOOST_LOG_TRIVIAL(info) << "Client: Public data map stored at " << chunks.back().address.short_hex();
  return chunks.back().address;
}

Bytes Client::retrieve(const data::DataMap& data_map, const utils::CancellationToken& cancel) const {
  return reconstructor_.get(data_map, fetcher(), cancel);
}

Bytes Client::retrieve(const Address& address, const utils::CancellationToken& cancel) const {
  return reconstructor_.get(address, fetcher(), cancel);
}

Bytes Client::retrieve_range(const data::DataMap& data_map, uint64_t offset, uint64_t length,
                             const utils::CancellationToken& cancel) const {
  return reconstructor_.get_range(data_map, offset, length, fetcher(), cancel);
}

uint64_t Client::cost(const Bytes& content) {
  const std::vector<data::EncryptedChunk> missing = missing_chunks(public_chunks(encryptor_.encrypt(content)));
  if (missing.empty()) {
    return 0;
  }

  std::vector<Address> addresses;
  addresses.reserve(missing.size());
  for (const auto& chunk : missing) {
    addresses.push_back(chunk.address);
  }
  return payment_.quote(addresses).amount;
}

//==============================================
// REGISTERS
//==============================================

std::shared_ptr<registers::Register> Client::replica(const registers::RegisterAddress& address) {
  const XorName key = address.xorname();

  std::lock_guard<std::mutex> lock(replicas_mutex_);
  auto it = replicas_.find(key);
  if (it != replicas_.end()) {
    return it->second;
  }

  auto loaded = std::make_shared<registers::Register>(register_store_.get(address));
  replicas_.emplace(key, loaded);
  return loaded;
}

void Client::sync(registers::Register& reg) {
  reg.merge(register_store_.put(reg));
}

registers::RegisterAddress Client::register_create(const crypto::SigningKey& owner, const XorName& meta,
                                                   std::set<registers::PublicKey> writers) {
  registers::RegisterAddress address{owner.public_key(), meta};
  const XorName key = address.xorname();
  BOOST_LOG_TRIVIAL(info) << "Client: Creating register " << key.short_hex();

  auto created = std::make_shared<registers::Register>(address, std::move(writers));
  // An existing register with the same address is adopted rather than replaced
  auto stored = std::make_shared<registers::Register>(register_store_.put(*created));

  std::lock_guard<std::mutex> lock(replicas_mutex_);
  replicas_[key] = stored;
  return address;
}

registers::EntryHash Client::register_write(const registers::RegisterAddress& address, const Bytes& payload,
                                            const std::set<registers::EntryHash>& parents,
                                            const crypto::SigningKey& signer) {
  auto reg = replica(address);
  const registers::EntryHash hash = reg->write(payload, parents, signer);
  sync(*reg);
  return hash;
}

std::vector<registers::RegisterEntry> Client::register_read(const registers::RegisterAddress& address) {
  auto reg = replica(address);
  reg->merge(register_store_.get(address));
  return reg->read();
}

void Client::register_merge(const registers::RegisterAddress& address, const registers::Register& remote) {
  auto reg = replica(address);
  reg->merge(remote);
  sync(*reg);
}

registers::Register Client::register_get(const registers::RegisterAddress& address) {
  auto reg = replica(address);
  reg->merge(register_store_.get(address));
  return *reg;
}

} // namespace client
} // namespace autonomi
