#include "registers/entry.hpp"
#include "crypto/hasher.hpp"
#include <boost/endian/conversion.hpp>

namespace autonomi {
namespace registers {

namespace {

template <typename T>
void update_uint(crypto::Hasher& hasher, T value) {
  const T network_value = boost::endian::native_to_big(value);
  hasher.update(reinterpret_cast<const uint8_t*>(&network_value), sizeof(network_value));
}

} // namespace

XorName RegisterAddress::xorname() const {
  crypto::Hasher hasher;
  hasher.update(owner);
  hasher.update(meta.data(), XorName::SIZE);
  return XorName(hasher.finalize());
}

//==============================================
// ENTRY CREATION AND VERIFICATION
//==============================================

RegisterEntry RegisterEntry::create(const Bytes& payload, const std::set<EntryHash>& parents,
                                    const crypto::SigningKey& signer) {
  RegisterEntry entry;
  entry.payload = payload;
  entry.parents = parents;
  entry.author = signer.public_key();

  const EntryHash digest = entry.hash();
  entry.signature = signer.sign(digest.data(), XorName::SIZE);
  return entry;
}

EntryHash RegisterEntry::hash() const {
  crypto::Hasher hasher;

  update_uint<uint32_t>(hasher, static_cast<uint32_t>(author.size()));
  hasher.update(author);
  update_uint<uint64_t>(hasher, static_cast<uint64_t>(payload.size()));
  hasher.update(payload);

  // std::set iterates in sorted order so the digest is independent of insertion order
  update_uint<uint32_t>(hasher, static_cast<uint32_t>(parents.size()));
  for (const auto& parent : parents) {
    hasher.update(parent.data(), XorName::SIZE);
  }
  return XorName(hasher.finalize());
}

bool RegisterEntry::verify_signature() const {
  const EntryHash digest = hash();
  return crypto::SigningKey::verify(author, digest.data(), XorName::SIZE, signature);
}

} // namespace registers
} // namespace autonomi
