#ifndef AUTONOMI_PAYMENT_LOCAL_LEDGER_HPP
#define AUTONOMI_PAYMENT_LOCAL_LEDGER_HPP

#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <vector>
#include "payment/payment.hpp"

namespace autonomi {
namespace payment {

/**
 * In-process ledger acting as both payer and verifier.
 *
 * Quotes charge price_per_chunk for every address in the batch. Paying a
 * quote debits the balance and issues a random token bound to the batch;
 * each (token, address) pair verifies exactly once.
 */
class LocalLedger : public PaymentCollaborator, public PaymentVerifier {
public:
  // ---- CONSTRUCTOR ----
  LocalLedger(uint64_t balance, uint64_t price_per_chunk);


  // ---- PAYMENT COLLABORATOR ----
  StoreQuote quote(const std::vector<Address>& addresses) override;
  PaymentProof proof(const StoreQuote& quote) override;


  // ---- PAYMENT VERIFIER ----
  void verify(const PaymentProof& proof, const Address& address) override;


  // ---- QUERIES ----
  uint64_t balance() const;
  uint64_t spent() const;
  // Number of addresses paid for but not yet consumed under this proof
  std::size_t outstanding(const PaymentProof& proof) const;

private:
  // ---- PARAMETERS ----
  mutable std::mutex mutex_;
  uint64_t balance_;
  uint64_t spent_ = 0;
  uint64_t price_per_chunk_;
  std::map<Bytes, std::set<Address>> unspent_;
};

} // namespace payment
} // namespace autonomi

#endif // AUTONOMI_PAYMENT_LOCAL_LEDGER_HPP
