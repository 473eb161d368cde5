#pragma once

#include <mutex>
#include <unordered_map>

#include "custody.hpp"

namespace streamledger::custody {

/*
  In-process custody.

  The host has already verified the value attached to a call, so deposits
  are accepted as long as escrow does not overflow. Payouts are refused
  when escrow cannot cover them.

  Escrow is not persisted. A host restarting over a durable repository
  seeds it with the outstanding stream balances.
*/
class MemoryCustody final : public Custody {
 public:
  MemoryCustody() = default;
  explicit MemoryCustody(model::Amount escrow) : escrow_(escrow) {}

  TransferResult Deposit(const model::AccountId& from, model::Amount amount) override;
  TransferResult Payout(const model::AccountId& to, model::Amount amount) override;
  TransferResult ReverseDeposit(const model::AccountId& from, model::Amount amount) override;
  TransferResult ReversePayout(const model::AccountId& to, model::Amount amount) override;

  model::Amount Escrow() const;
  model::Amount DepositedBy(const model::AccountId& account) const;
  model::Amount PaidTo(const model::AccountId& account) const;

 private:
  mutable std::mutex mutex_;

  model::Amount                                     escrow_ = 0;
  std::unordered_map<model::AccountId, model::Amount> deposited_;
  std::unordered_map<model::AccountId, model::Amount> paid_;
};

} // namespace streamledger::custody
