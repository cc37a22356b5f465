#pragma once

#include <string>
#include <filesystem>
#include <cstdint>
#include <stdexcept>
#include "store/chunk_store.hpp"

namespace autonomi {
namespace store {

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

// Chunk store backed by a content-addressed directory tree:
// {base_path}/{hex[0:2]}/{hex[2:4]}/{hex[4:6]}/{remaining_hex}
class DiskChunkStore : public ChunkStore {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit DiskChunkStore(const std::string& base_path,
                          payment::PaymentVerifier* verifier = nullptr);


  // ---- CORE STORAGE OPERATIONS ----
  void put(const Address& address, const Bytes& content, const payment::PaymentProof& proof) override;
  Bytes get(const Address& address) override;
  bool has(const Address& address) override;
  // Removes a chunk and any directories left empty
  void remove(const Address& address);
  // Removes all stored chunks and reset store
  void clear();


  // ---- QUERY OPERATIONS ----
  // Returns the size of the stored chunk in bytes
  std::uintmax_t get_file_size(const Address& address) const;
  const std::filesystem::path& base_path() const { return base_path_; }

private:
  // ---- PARAMETERS ----
  // Root path for all stored chunks
  std::filesystem::path base_path_;
  payment::PaymentVerifier* verifier_;


  // ---- CAS STORAGE SUPPORT ----
  std::filesystem::path get_path_for_address(const Address& address) const;
  // Ensures directory exists, create if needed
  void check_directory_exists(const std::filesystem::path& path) const;
};

} // namespace store
} // namespace autonomi
