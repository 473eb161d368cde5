#include "memory_custody.hpp"

#include <limits>

namespace streamledger::custody {

TransferResult MemoryCustody::Deposit(const model::AccountId& from, model::Amount amount) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (amount > std::numeric_limits<model::Amount>::max() - escrow_) {
    return TransferResult::Err(TransferStatus::Rejected, "deposit would overflow escrow");
  }
  escrow_ += amount;
  deposited_[from] += amount;
  return TransferResult::Ok();
}

TransferResult MemoryCustody::Payout(const model::AccountId& to, model::Amount amount) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (amount > escrow_) {
    return TransferResult::Err(TransferStatus::InsufficientEscrow, "payout exceeds escrow");
  }
  escrow_ -= amount;
  paid_[to] += amount;
  return TransferResult::Ok();
}

TransferResult MemoryCustody::ReverseDeposit(const model::AccountId& from, model::Amount amount) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = deposited_.find(from);
  if (amount > escrow_ || it == deposited_.end() || it->second < amount) {
    return TransferResult::Err(TransferStatus::Rejected, "no matching deposit to reverse");
  }
  escrow_ -= amount;
  it->second -= amount;
  return TransferResult::Ok();
}

TransferResult MemoryCustody::ReversePayout(const model::AccountId& to, model::Amount amount) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = paid_.find(to);
  if (it == paid_.end() || it->second < amount) {
    return TransferResult::Err(TransferStatus::Rejected, "no matching payout to reverse");
  }
  // the payout left escrow, so returning it cannot exceed the old total
  escrow_ += amount;
  it->second -= amount;
  return TransferResult::Ok();
}

model::Amount MemoryCustody::Escrow() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return escrow_;
}

model::Amount MemoryCustody::DepositedBy(const model::AccountId& account) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto                  it = deposited_.find(account);
  return it == deposited_.end() ? 0 : it->second;
}

model::Amount MemoryCustody::PaidTo(const model::AccountId& account) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto                  it = paid_.find(account);
  return it == paid_.end() ? 0 : it->second;
}

} // namespace streamledger::custody
