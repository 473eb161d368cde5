#include "memory_repository.hpp"

#include <limits>
#include <stdexcept>

#include "memory_tx.hpp"

namespace streamledger::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

std::optional<model::LedgerMetaRecord> MemoryRepository::GetLedgerMeta(Transaction& t) {
  return TX(t).View().meta;
}

Result MemoryRepository::UpsertLedgerMeta(Transaction& t, const model::LedgerMetaRecord& r) {
  TX(t).Mutable().meta = r;
  return Result::Ok();
}

Result MemoryRepository::InsertStream(Transaction& t, const model::StreamRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.streams.contains(r.stream_id)) return Result::Err(ErrorCode::AlreadyExists);
  s.streams[r.stream_id] = r;
  return Result::Ok();
}

std::optional<model::StreamRecord> MemoryRepository::GetStream(Transaction& t, uint64_t stream_id) {
  const auto& s  = TX(t).View();
  const auto  it = s.streams.find(stream_id);
  if (it == s.streams.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateStream(Transaction& t, const model::StreamRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.streams.contains(r.stream_id)) return Result::Err(ErrorCode::NotFound);
  s.streams[r.stream_id] = r;
  return Result::Ok();
}

uint64_t MemoryRepository::SumCurrentBalances(Transaction& t) {
  uint64_t total = 0;
  for (const auto& [id, stream] : TX(t).View().streams) {
    if (stream.current_balance > std::numeric_limits<uint64_t>::max() - total) {
      throw std::overflow_error("outstanding stream balances overflow uint64");
    }
    total += stream.current_balance;
  }
  return total;
}

} // namespace streamledger::db::memory
