#include "store/disk_chunk_store.hpp"
#include "data/data_error.hpp"
#include <fstream>
#include <system_error>
#include <boost/log/trivial.hpp>
#include "crypto/signing_key.hpp"

namespace autonomi {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

// Initialize store with base directory path and ensure it exists
DiskChunkStore::DiskChunkStore(const std::string& base_path, payment::PaymentVerifier* verifier)
  : base_path_(base_path)
  , verifier_(verifier) {
  BOOST_LOG_TRIVIAL(info) << "Disk store: Initializing store with base path: " << base_path;
  check_directory_exists(base_path_);

  // Canonical form so the cleanup in remove() recognizes the base directory
  std::error_code ec;
  base_path_ = std::filesystem::canonical(base_path_, ec);
  if (ec) {
    throw StoreError("Disk store: Cannot resolve base path " + base_path + ": " + ec.message());
  }
}

//==============================================
// CORE STORAGE OPERATIONS
//==============================================

void DiskChunkStore::put(const Address& address, const Bytes& content, const payment::PaymentProof& proof) {
  std::filesystem::path file_path = get_path_for_address(address);

  // Content addressing makes a second write of the same address pointless
  if (std::filesystem::exists(file_path)) {
    BOOST_LOG_TRIVIAL(debug) << "Disk store: Chunk already present: " << address.short_hex();
    return;
  }

  if (XorName::from_content(content) != address) {
    BOOST_LOG_TRIVIAL(error) << "Disk store: Content does not hash to " << address.short_hex();
    throw data::CorruptChunkError("content does not hash to its address", address);
  }

  if (verifier_) {
    verifier_->verify(proof, address);
  }

  check_directory_exists(file_path.parent_path());

  // Write beside the target, then rename so readers never see a partial chunk
  std::filesystem::path temp_path = file_path;
  temp_path += ".tmp-" + XorName::from_content(crypto::random_bytes(16)).short_hex();

  {
    std::ofstream file(temp_path, std::ios::binary);
    if (!file) {
      throw StoreError("Disk store: Failed to create file: " + temp_path.string());
    }
    file.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
    if (!file) {
      throw StoreError("Disk store: Failed to write file: " + temp_path.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, file_path, ec);
  if (ec) {
    std::filesystem::remove(temp_path, ec);
    throw StoreError("Disk store: Failed to commit chunk: " + file_path.string());
  }

  BOOST_LOG_TRIVIAL(debug) << "Disk store: Stored " << content.size() << " bytes at " << file_path.string();
}

Bytes DiskChunkStore::get(const Address& address) {
  std::filesystem::path file_path = get_path_for_address(address);
  if (!std::filesystem::exists(file_path)) {
    throw data::NotFoundError(address);
  }

  // Open file in binary mode to handle all content correctly
  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    throw StoreError("Disk store: Failed to open file: " + file_path.string());
  }

  Bytes content(static_cast<std::size_t>(std::filesystem::file_size(file_path)));
  if (!content.empty() && !file.read(reinterpret_cast<char*>(content.data()), static_cast<std::streamsize>(content.size()))) {
    throw StoreError("Disk store: Failed to read file: " + file_path.string());
  }

  BOOST_LOG_TRIVIAL(debug) << "Disk store: Read " << content.size() << " bytes for " << address.short_hex();
  return content;
}

bool DiskChunkStore::has(const Address& address) {
  return std::filesystem::exists(get_path_for_address(address));
}

void DiskChunkStore::remove(const Address& address) {
  BOOST_LOG_TRIVIAL(info) << "Disk store: Removing chunk: " << address.short_hex();

  std::filesystem::path file_path = get_path_for_address(address);
  if (!std::filesystem::remove(file_path)) {
    BOOST_LOG_TRIVIAL(error) << "Disk store: Failed to remove chunk: " << address.short_hex();
    throw data::NotFoundError(address);
  }

  // Clean up empty parent directories up to base_path_
  auto current = file_path.parent_path();
  while (current != base_path_ && std::filesystem::is_empty(current)) {
    std::filesystem::remove(current);
    current = current.parent_path();
  }
}

void DiskChunkStore::clear() {
  BOOST_LOG_TRIVIAL(info) << "Disk store: Clearing entire store at: " << base_path_;
  std::filesystem::remove_all(base_path_);
  check_directory_exists(base_path_);
}

//==============================================
// QUERY OPERATIONS
//==============================================

std::uintmax_t DiskChunkStore::get_file_size(const Address& address) const {
  std::filesystem::path file_path = get_path_for_address(address);
  if (!std::filesystem::exists(file_path)) {
    throw data::NotFoundError(address);
  }
  return std::filesystem::file_size(file_path);
}

//==============================================
// CAS STORAGE SUPPORT
//==============================================

std::filesystem::path DiskChunkStore::get_path_for_address(const Address& address) const {
  const std::string hex = address.to_hex();
  std::filesystem::path path = base_path_;

  for (size_t i = 0; i < 6; i += 2) {
    path /= hex.substr(i, 2);
  }

  path /= hex.substr(6);
  return path;
}

void DiskChunkStore::check_directory_exists(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

} // namespace store
} // namespace autonomi
