#include "memory_tx.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace streamledger::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_      = repo_.committed_;
  base_version_ = repo_.committed_version_;
}

void MemoryTransaction::Commit() {
  if (phase_ != Phase::kOpen) {
    throw std::logic_error("memory transaction already finished");
  }

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != base_version_) {
    phase_ = Phase::kRolledBack;
    throw std::runtime_error("ledger changed since version " + std::to_string(base_version_) + " (now " +
                             std::to_string(repo_.committed_version_) + "); staged writes dropped");
  }
  repo_.committed_ = std::move(working_);
  ++repo_.committed_version_;
  phase_ = Phase::kCommitted;
}

void MemoryTransaction::Rollback() {
  // nothing was published; the working copy dies with the transaction
  if (phase_ == Phase::kOpen) {
    phase_ = Phase::kRolledBack;
  }
}

} // namespace streamledger::db::memory
