#include "registers/register.hpp"
#include <boost/log/trivial.hpp>

namespace autonomi {
namespace registers {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Register::Register(RegisterAddress address, std::set<PublicKey> writers)
  : address_(std::move(address))
  , writers_(std::move(writers)) {}

Register::Register(const Register& other) {
  std::lock_guard<std::mutex> lock(other.mutex_);
  address_ = other.address_;
  writers_ = other.writers_;
  entries_ = other.entries_;
}

Register& Register::operator=(const Register& other) {
  if (this != &other) {
    std::scoped_lock lock(mutex_, other.mutex_);
    address_ = other.address_;
    writers_ = other.writers_;
    entries_ = other.entries_;
  }
  return *this;
}

//==============================================
// ADMISSION
//==============================================

bool Register::can_write(const PublicKey& key) const {
  return key == address_.owner || writers_.count(key) > 0;
}

EntryHash Register::check_entry(const RegisterEntry& entry) const {
  const EntryHash hash = entry.hash();

  if (!can_write(entry.author)) {
    BOOST_LOG_TRIVIAL(warning) << "Register: Rejecting entry " << hash.short_hex() << " from unlisted author";
    throw PermissionDeniedError("author of entry " + hash.short_hex() + " may not write to register " +
                                address_.xorname().short_hex());
  }
  if (!entry.verify_signature()) {
    BOOST_LOG_TRIVIAL(warning) << "Register: Rejecting entry " << hash.short_hex() << " with bad signature";
    throw InvalidSignatureError(hash);
  }
  return hash;
}

std::map<EntryHash, RegisterEntry> Register::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_;
}

//==============================================
// MUTATION
//==============================================

EntryHash Register::write(const Bytes& payload, const std::set<EntryHash>& parents,
                          const crypto::SigningKey& signer) {
  if (!can_write(signer.public_key())) {
    throw PermissionDeniedError("signer may not write to register " + address_.xorname().short_hex());
  }

  RegisterEntry entry = RegisterEntry::create(payload, parents, signer);
  const EntryHash hash = entry.hash();

  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& parent : parents) {
    if (entries_.count(parent) == 0) {
      BOOST_LOG_TRIVIAL(warning) << "Register: Write rejected, parent " << parent.short_hex() << " unknown";
      throw MissingParentError(parent);
    }
  }

  entries_.emplace(hash, std::move(entry));
  BOOST_LOG_TRIVIAL(debug) << "Register: Admitted entry " << hash.short_hex() << " with "
                           << parents.size() << " parents";
  return hash;
}

void Register::merge(const Register& other) {
  if (this == &other) {
    return;
  }
  if (other.address_ != address_ || other.writers_ != writers_) {
    throw RegisterError("Cannot merge register " + other.address_.xorname().short_hex() +
                        " into " + address_.xorname().short_hex());
  }

  const auto remote = other.snapshot();
  std::vector<RegisterEntry> batch;
  batch.reserve(remote.size());
  for (const auto& entry : remote) {
    batch.push_back(entry.second);
  }
  merge(batch);
}

void Register::merge(const std::vector<RegisterEntry>& entries) {
  // Signature checks are the expensive part and need no lock
  std::map<EntryHash, const RegisterEntry*> batch;
  for (const auto& entry : entries) {
    batch.emplace(check_entry(entry), &entry);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& item : batch) {
    for (const auto& parent : item.second->parents) {
      if (entries_.count(parent) == 0 && batch.count(parent) == 0) {
        BOOST_LOG_TRIVIAL(warning) << "Register: Merge rejected, entry " << item.first.short_hex()
                                   << " cites unknown parent " << parent.short_hex();
        throw MissingParentError(parent);
      }
    }
  }

  std::size_t admitted = 0;
  for (const auto& item : batch) {
    if (entries_.emplace(item.first, *item.second).second) {
      ++admitted;
    }
  }
  BOOST_LOG_TRIVIAL(debug) << "Register: Merged " << admitted << " new entries, "
                           << entries_.size() << " total";
}

//==============================================
// QUERIES
//==============================================

std::set<EntryHash> Register::tips_locked() const {
  std::set<EntryHash> referenced;
  for (const auto& entry : entries_) {
    referenced.insert(entry.second.parents.begin(), entry.second.parents.end());
  }

  std::set<EntryHash> tips;
  for (const auto& entry : entries_) {
    if (referenced.count(entry.first) == 0) {
      tips.insert(entry.first);
    }
  }
  return tips;
}

std::set<EntryHash> Register::tips() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tips_locked();
}

std::vector<RegisterEntry> Register::read() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<RegisterEntry> result;
  for (const auto& hash : tips_locked()) {
    result.push_back(entries_.at(hash));
  }
  return result;
}

RegisterEntry Register::get(const EntryHash& hash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(hash);
  if (it == entries_.end()) {
    throw RegisterError("Entry " + hash.to_hex() + " not in register");
  }
  return it->second;
}

bool Register::contains(const EntryHash& hash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.count(hash) > 0;
}

std::size_t Register::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

std::vector<std::pair<EntryHash, RegisterEntry>> Register::entries() const {
  const auto arena = snapshot();

  // Kahn's algorithm; the ready set is ordered so output is deterministic
  std::map<EntryHash, std::size_t> pending;
  std::map<EntryHash, std::vector<EntryHash>> children;
  std::set<EntryHash> ready;
  for (const auto& entry : arena) {
    pending[entry.first] = entry.second.parents.size();
    for (const auto& parent : entry.second.parents) {
      children[parent].push_back(entry.first);
    }
    if (entry.second.parents.empty()) {
      ready.insert(entry.first);
    }
  }

  std::vector<std::pair<EntryHash, RegisterEntry>> ordered;
  ordered.reserve(arena.size());
  while (!ready.empty()) {
    const EntryHash hash = *ready.begin();
    ready.erase(ready.begin());
    ordered.emplace_back(hash, arena.at(hash));

    for (const auto& child : children[hash]) {
      if (--pending[child] == 0) {
        ready.insert(child);
      }
    }
  }
  return ordered;
}

} // namespace registers
} // namespace autonomi
