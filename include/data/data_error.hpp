#ifndef AUTONOMI_DATA_ERROR_HPP
#define AUTONOMI_DATA_ERROR_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "data/types.hpp"

namespace autonomi {
namespace data {

class DataError : public std::runtime_error {
public:
  explicit DataError(const std::string& message) : std::runtime_error(message) {}
};

// Failure attributed to one chunk address so callers can retry selectively
class ChunkError : public DataError {
public:
  ChunkError(const std::string& message, std::optional<Address> address)
    : DataError(address ? message + " [" + address->to_hex() + "]" : message)
    , address_(std::move(address)) {}

  const std::optional<Address>& address() const { return address_; }

private:
  std::optional<Address> address_;
};

// Address absent on the network
class NotFoundError : public ChunkError {
public:
  explicit NotFoundError(const Address& address)
    : ChunkError("Chunk not found", address) {}
};

// Content does not hash to what the data map or address promises
class CorruptChunkError : public ChunkError {
public:
  CorruptChunkError(const std::string& reason, const Address& address)
    : ChunkError("Corrupt chunk: " + reason, address) {}
};

// Timeout or connection failure; retried with bounded backoff
class NetworkTransientError : public ChunkError {
public:
  NetworkTransientError(const std::string& reason, std::optional<Address> address = std::nullopt)
    : ChunkError("Transient network failure: " + reason, std::move(address)) {}
};

// Payment proof refused; never retried
class PaymentRejectedError : public ChunkError {
public:
  PaymentRejectedError(const std::string& reason, std::optional<Address> address = std::nullopt)
    : ChunkError("Payment rejected: " + reason, std::move(address)) {}
};

class MalformedDataMapError : public DataError {
public:
  explicit MalformedDataMapError(const std::string& reason)
    : DataError("Malformed data map: " + reason) {}
};

class OperationCancelledError : public DataError {
public:
  explicit OperationCancelledError(const std::string& operation)
    : DataError(operation + " cancelled") {}
};

// Per-address failures left over after every upload task finished
class UploadError : public DataError {
public:
  using Failure = std::pair<Address, std::string>;

  explicit UploadError(std::vector<Failure> failures)
    : DataError("Upload failed for " + std::to_string(failures.size()) + " chunk(s)")
    , failures_(std::move(failures)) {}

  const std::vector<Failure>& failures() const { return failures_; }

private:
  std::vector<Failure> failures_;
};

} // namespace data
} // namespace autonomi

#endif // AUTONOMI_DATA_ERROR_HPP
