#ifndef AUTONOMI_REGISTER_STORE_HPP
#define AUTONOMI_REGISTER_STORE_HPP

#include "registers/register.hpp"

namespace autonomi {
namespace registers {

// Network side of registers. put merges a delta into the stored replica
// and returns the merged view; get throws data::NotFoundError
class RegisterStore {
public:
  virtual ~RegisterStore() = default;

  virtual Register put(const Register& delta) = 0;
  virtual Register get(const RegisterAddress& address) = 0;
  virtual bool has(const RegisterAddress& address) = 0;
};

} // namespace registers
} // namespace autonomi

#endif // AUTONOMI_REGISTER_STORE_HPP
