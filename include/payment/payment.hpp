#ifndef AUTONOMI_PAYMENT_HPP
#define AUTONOMI_PAYMENT_HPP

#include <cstdint>
#include <utility>
#include <vector>
#include "data/types.hpp"

namespace autonomi {
namespace payment {

// Price for storing a batch of addresses, in nanos
struct StoreQuote {
  std::vector<Address> addresses;
  uint64_t price_per_chunk = 0;
  uint64_t amount = 0;
};

// Opaque token proving a quote has been paid; bound to the quoted batch
class PaymentProof {
public:
  PaymentProof() = default;
  explicit PaymentProof(Bytes token) : token_(std::move(token)) {}

  const Bytes& token() const { return token_; }
  bool empty() const { return token_.empty(); }

private:
  Bytes token_;
};

// Client side of the payment protocol
class PaymentCollaborator {
public:
  virtual ~PaymentCollaborator() = default;

  virtual StoreQuote quote(const std::vector<Address>& addresses) = 0;
  // Pays a quote; throws data::PaymentRejectedError when payment is refused
  virtual PaymentProof proof(const StoreQuote& quote) = 0;
};

// Store side: checks a proof covers an address before accepting a put
class PaymentVerifier {
public:
  virtual ~PaymentVerifier() = default;

  // Throws data::PaymentRejectedError naming the address
  virtual void verify(const PaymentProof& proof, const Address& address) = 0;
};

} // namespace payment
} // namespace autonomi

#endif // AUTONOMI_PAYMENT_HPP
