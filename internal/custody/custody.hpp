#pragma once

#include <string>
#include <utility>

#include "internal/model/types.hpp"

namespace streamledger::custody {

enum class TransferStatus {
  OK = 0,

  InsufficientEscrow,
  Rejected
};

struct TransferResult {
  TransferStatus status = TransferStatus::OK;
  std::string    message;

  static TransferResult Ok() {
    return {};
  }

  static TransferResult Err(TransferStatus s, std::string msg = {}) {
    return {s, std::move(msg)};
  }

  explicit operator bool() const {
    return status == TransferStatus::OK;
  }
};

/*
  Value custody primitive provided by the host.

  Deposit moves funds attached to a call from the caller into the ledger's
  escrow. Payout moves funds from escrow to an account. A failed transfer
  must leave balances untouched.

  The Reverse* calls undo a transfer that succeeded but whose ledger write
  could not be committed. They are only ever called with the exact account
  and amount of the transfer being undone.
*/
class Custody {
 public:
  virtual ~Custody() = default;

  virtual TransferResult Deposit(const model::AccountId& from, model::Amount amount) = 0;

  virtual TransferResult Payout(const model::AccountId& to, model::Amount amount) = 0;

  virtual TransferResult ReverseDeposit(const model::AccountId& from, model::Amount amount) = 0;

  virtual TransferResult ReversePayout(const model::AccountId& to, model::Amount amount) = 0;
};

} // namespace streamledger::custody
