#ifndef AUTONOMI_REGISTER_HPP
#define AUTONOMI_REGISTER_HPP

#include <map>
#include <mutex>
#include <set>
#include <utility>
#include <vector>
#include "registers/entry.hpp"
#include "registers/register_error.hpp"

namespace autonomi {
namespace registers {

/**
 * Hash-linked DAG of signed entries for one register address.
 *
 * Entries live in an arena keyed by their hash; parents are hash references
 * that must already be present, so the graph never dangles. The observable
 * value is the tip set (entries nothing points at), which is left multi-valued
 * under concurrent writes.
 *
 * Admission (parent check plus insert) is serialized per instance.
 */
class Register {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Writers other than the owner may be listed up front
  explicit Register(RegisterAddress address, std::set<PublicKey> writers = {});

  Register(const Register& other);
  Register& operator=(const Register& other);


  // ---- MUTATION ----
  // Appends a signed entry; returns its hash. Throws MissingParentError or
  // PermissionDeniedError without modifying the register
  EntryHash write(const Bytes& payload, const std::set<EntryHash>& parents, const crypto::SigningKey& signer);
  // Union with a remote view. The whole view is validated first; a bad
  // view throws and leaves this replica unchanged
  void merge(const Register& other);
  // Same for a loose batch of entries in any order
  void merge(const std::vector<RegisterEntry>& entries);


  // ---- QUERIES ----
  // Tip entries ordered by hash
  std::vector<RegisterEntry> read() const;
  std::set<EntryHash> tips() const;
  // Throws RegisterError when the hash is unknown
  RegisterEntry get(const EntryHash& hash) const;
  bool contains(const EntryHash& hash) const;
  // Parents before children, ties broken by hash
  std::vector<std::pair<EntryHash, RegisterEntry>> entries() const;
  std::size_t size() const;


  // ---- GETTERS ----
  const RegisterAddress& address() const { return address_; }
  const std::set<PublicKey>& writers() const { return writers_; }
  bool can_write(const PublicKey& key) const;

private:
  // ---- PARAMETERS ----
  RegisterAddress address_;
  std::set<PublicKey> writers_;
  mutable std::mutex mutex_;
  std::map<EntryHash, RegisterEntry> entries_;


  // ---- ADMISSION ----
  // Checks signature and permission; returns the entry hash
  EntryHash check_entry(const RegisterEntry& entry) const;
  std::map<EntryHash, RegisterEntry> snapshot() const;
  std::set<EntryHash> tips_locked() const;
};

} // namespace registers
} // namespace autonomi

#endif // AUTONOMI_REGISTER_HPP
