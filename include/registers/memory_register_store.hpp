#pragma once

#include <map>
#include <memory>
#include <mutex>
#include "registers/register_store.hpp"

namespace autonomi {
namespace registers {

// Keeps replicas keyed by address xorname. Deltas travel through the
// register codec so stored state never aliases the caller's objects
class MemoryRegisterStore : public RegisterStore {
public:
  Register put(const Register& delta) override;
  Register get(const RegisterAddress& address) override;
  bool has(const RegisterAddress& address) override;

  std::size_t size() const;

private:
  mutable std::mutex mutex_;
  std::map<XorName, std::unique_ptr<Register>> registers_;
};

} // namespace registers
} // namespace autonomi
