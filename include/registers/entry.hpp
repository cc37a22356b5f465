#ifndef AUTONOMI_REGISTER_ENTRY_HPP
#define AUTONOMI_REGISTER_ENTRY_HPP

#include <set>
#include <vector>
#include "data/types.hpp"
#include "crypto/signing_key.hpp"

namespace autonomi {
namespace registers {

using EntryHash = XorName;
// Raw 32-byte Ed25519 public key
using PublicKey = Bytes;

// Owner-scoped register key
struct RegisterAddress {
  PublicKey owner;
  XorName meta;

  // SHA3-256 over owner || meta; key used by register stores
  XorName xorname() const;

  bool operator==(const RegisterAddress& other) const { return owner == other.owner && meta == other.meta; }
  bool operator!=(const RegisterAddress& other) const { return !(*this == other); }
  bool operator<(const RegisterAddress& other) const {
    return owner != other.owner ? owner < other.owner : meta < other.meta;
  }
};

// Immutable DAG node; parents are hash references into the same register
struct RegisterEntry {
  Bytes payload;
  std::set<EntryHash> parents;
  PublicKey author;
  Bytes signature;

  // Signs payload and parents with the signer's key
  static RegisterEntry create(const Bytes& payload, const std::set<EntryHash>& parents,
                              const crypto::SigningKey& signer);

  // Covers author, payload and parents but not the signature
  EntryHash hash() const;
  bool verify_signature() const;

  bool operator==(const RegisterEntry& other) const {
    return payload == other.payload && parents == other.parents &&
           author == other.author && signature == other.signature;
  }
};

} // namespace registers
} // namespace autonomi

#endif // AUTONOMI_REGISTER_ENTRY_HPP
