#include "payment/local_ledger.hpp"
#include "crypto/signing_key.hpp"
#include "data/data_error.hpp"
#include <boost/log/trivial.hpp>

namespace autonomi {
namespace payment {

namespace {
constexpr std::size_t kTokenSize = 32;
}

LocalLedger::LocalLedger(uint64_t balance, uint64_t price_per_chunk)
  : balance_(balance)
  , price_per_chunk_(price_per_chunk) {
  BOOST_LOG_TRIVIAL(info) << "Local ledger: Opened with balance " << balance_
                          << " and price per chunk " << price_per_chunk_;
}

//==============================================
// PAYMENT COLLABORATOR
//==============================================

StoreQuote LocalLedger::quote(const std::vector<Address>& addresses) {
  std::set<Address> distinct(addresses.begin(), addresses.end());

  StoreQuote quote;
  quote.addresses.assign(distinct.begin(), distinct.end());
  quote.price_per_chunk = price_per_chunk_;
  quote.amount = price_per_chunk_ * quote.addresses.size();

  BOOST_LOG_TRIVIAL(debug) << "Local ledger: Quoted " << quote.amount << " for "
                           << quote.addresses.size() << " addresses";
  return quote;
}

PaymentProof LocalLedger::proof(const StoreQuote& quote) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (quote.price_per_chunk != price_per_chunk_ ||
      quote.amount != quote.price_per_chunk * quote.addresses.size()) {
    BOOST_LOG_TRIVIAL(error) << "Local ledger: Quote does not match current pricing";
    throw data::PaymentRejectedError("stale or altered quote");
  }
  if (quote.amount > balance_) {
    BOOST_LOG_TRIVIAL(error) << "Local ledger: Insufficient balance " << balance_
                             << " for payment of " << quote.amount;
    throw data::PaymentRejectedError("insufficient balance");
  }

  balance_ -= quote.amount;
  spent_ += quote.amount;

  Bytes token = crypto::random_bytes(kTokenSize);
  unspent_[token].insert(quote.addresses.begin(), quote.addresses.end());

  BOOST_LOG_TRIVIAL(info) << "Local ledger: Paid " << quote.amount << " for "
                          << quote.addresses.size() << " addresses, balance now " << balance_;
  return PaymentProof(std::move(token));
}

//==============================================
// PAYMENT VERIFIER
//==============================================

void LocalLedger::verify(const PaymentProof& proof, const Address& address) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = unspent_.find(proof.token());
  if (it == unspent_.end()) {
    throw data::PaymentRejectedError("unknown payment proof", address);
  }
  if (it->second.erase(address) == 0) {
    throw data::PaymentRejectedError("address not covered by payment proof", address);
  }
  if (it->second.empty()) {
    unspent_.erase(it);
  }
}

//==============================================
// QUERIES
//==============================================

uint64_t LocalLedger::balance() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return balance_;
}

uint64_t LocalLedger::spent() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return spent_;
}

std::size_t LocalLedger::outstanding(const PaymentProof& proof) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = unspent_.find(proof.token());
  return it == unspent_.end() ? 0 : it->second.size();
}

} // namespace payment
} // namespace autonomi
