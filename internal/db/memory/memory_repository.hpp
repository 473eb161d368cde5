#pragma once

#include <mutex>
#include <optional>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace streamledger::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  std::optional<model::LedgerMetaRecord> GetLedgerMeta(Transaction&) override;
  Result UpsertLedgerMeta(Transaction&, const model::LedgerMetaRecord&) override;

  Result InsertStream(Transaction&, const model::StreamRecord&) override;
  std::optional<model::StreamRecord> GetStream(Transaction&, uint64_t stream_id) override;
  Result UpdateStream(Transaction&, const model::StreamRecord&) override;
  uint64_t SumCurrentBalances(Transaction&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::optional<model::LedgerMetaRecord> meta;
    std::unordered_map<uint64_t, model::StreamRecord> streams;
  };

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

}
