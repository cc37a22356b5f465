#ifndef AUTONOMI_REGISTER_ERROR_HPP
#define AUTONOMI_REGISTER_ERROR_HPP

#include <stdexcept>
#include <string>
#include "data/types.hpp"

namespace autonomi {
namespace registers {

class RegisterError : public std::runtime_error {
public:
  explicit RegisterError(const std::string& message) : std::runtime_error(message) {}
};

// Write or remote entry cites a parent this replica has never seen
class MissingParentError : public RegisterError {
public:
  explicit MissingParentError(const XorName& parent)
    : RegisterError("Missing parent entry " + parent.to_hex())
    , parent_(parent) {}

  const XorName& parent() const { return parent_; }

private:
  XorName parent_;
};

// Author is neither the owner nor a listed writer
class PermissionDeniedError : public RegisterError {
public:
  explicit PermissionDeniedError(const std::string& reason)
    : RegisterError("Permission denied: " + reason) {}
};

class InvalidSignatureError : public RegisterError {
public:
  explicit InvalidSignatureError(const XorName& entry)
    : RegisterError("Invalid signature on entry " + entry.to_hex()) {}
};

} // namespace registers
} // namespace autonomi

#endif // AUTONOMI_REGISTER_ERROR_HPP
