#include "registers/memory_register_store.hpp"
#include "registers/register_codec.hpp"
#include "data/data_error.hpp"
#include <boost/log/trivial.hpp>

namespace autonomi {
namespace registers {

Register MemoryRegisterStore::put(const Register& delta) {
  Register received = decode_register(encode_register(delta));
  const XorName key = received.address().xorname();

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = registers_.find(key);
  if (it == registers_.end()) {
    BOOST_LOG_TRIVIAL(info) << "Register store: Creating register " << key.short_hex()
                            << " with " << received.size() << " entries";
    it = registers_.emplace(key, std::make_unique<Register>(received)).first;
  }
  else {
    it->second->merge(received);
    BOOST_LOG_TRIVIAL(debug) << "Register store: Merged delta into " << key.short_hex()
                             << ", now " << it->second->size() << " entries";
  }
  return *it->second;
}

Register MemoryRegisterStore::get(const RegisterAddress& address) {
  const XorName key = address.xorname();

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = registers_.find(key);
  if (it == registers_.end()) {
    throw data::NotFoundError(key);
  }
  return *it->second;
}

bool MemoryRegisterStore::has(const RegisterAddress& address) {
  std::lock_guard<std::mutex> lock(mutex_);
  return registers_.count(address.xorname()) > 0;
}

std::size_t MemoryRegisterStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return registers_.size();
}

} // namespace registers
} // namespace autonomi
