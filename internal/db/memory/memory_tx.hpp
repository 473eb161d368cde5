#pragma once

#include <cstdint>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace streamledger::db::memory {

/*
  Copy of the committed ledger taken at Begin().

  Commit publishes the copy only if the repository version still matches
  the one the copy was taken at. Otherwise it throws and the staged writes
  are dropped, so two withdrawals can never both apply against the same
  balance.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override = default;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return phase_ == Phase::kCommitted;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  enum class Phase { kOpen, kCommitted, kRolledBack };

  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  uint64_t                base_version_ = 0;
  Phase                   phase_        = Phase::kOpen;
};

} // namespace streamledger::db::memory
