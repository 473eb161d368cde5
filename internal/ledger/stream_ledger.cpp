#include "stream_ledger.hpp"

#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

#include "internal/db/model/ledger_meta_record.hpp"
#include "internal/db/model/stream_record.hpp"
#include "internal/observability/logging.hpp"
#include "internal/vesting/vesting.hpp"

namespace streamledger::ledger {

namespace {

model::Stream ToStream(const db::model::StreamRecord& record) {
  model::Stream stream;
  stream.payer            = record.payer;
  stream.recipient        = record.recipient;
  stream.original_balance = record.original_balance;
  stream.current_balance  = record.current_balance;
  stream.start_date       = record.start_date;
  stream.end_date         = record.end_date;
  return stream;
}

db::model::StreamRecord ToRecord(model::StreamId id, const model::Stream& stream) {
  db::model::StreamRecord record;
  record.stream_id        = id;
  record.payer            = stream.payer;
  record.recipient        = stream.recipient;
  record.original_balance = stream.original_balance;
  record.current_balance  = stream.current_balance;
  record.start_date       = stream.start_date;
  record.end_date         = stream.end_date;
  return record;
}

std::string DbMessage(const std::string& context, const db::Result& result) {
  auto message = context + ": " + std::string(db::ToString(result.code));
  if (!result.message.empty()) {
    message += " (" + result.message + ")";
  }
  return message;
}

// Commits tx. On failure runs undo so custody matches the unchanged ledger,
// and reports the commit error. A failed undo is logged because funds and
// balances now disagree.
template <typename T, typename Undo>
std::optional<Outcome<T>> CommitOrUndo(db::Transaction& tx, const std::string& op, Undo undo) {
  try {
    tx.Commit();
    return std::nullopt;
  } catch (const std::exception& e) {
    auto message = op + " not committed: " + e.what();
    if (auto reversed = undo(); !reversed) {
      STREAMLEDGER_LOG_ERROR("custody transfer could not be reversed",
                             {observability::StringField("op", op), observability::StringField("commit_error", e.what()),
                              observability::StringField("reverse_error", reversed.message)});
      message += "; transfer reversal failed: " + reversed.message;
    }
    return Outcome<T>::Err(ErrorCode::StorageFailure, message);
  }
}

} // namespace

model::Amount OutstandingBalance(db::Repository& repository) {
  auto tx    = repository.Begin();
  auto total = repository.SumCurrentBalances(*tx);
  tx->Rollback();
  return total;
}

StreamLedger::StreamLedger(std::shared_ptr<db::Repository> repository, std::shared_ptr<custody::Custody> custody,
                           model::AccountId owner, LedgerOptions options)
    : repository_(std::move(repository)), custody_(std::move(custody)), options_(options) {
  if (!repository_ || !custody_) {
    throw std::invalid_argument("stream ledger requires a repository and a custody backend");
  }

  auto tx = repository_->Begin();
  if (repository_->GetLedgerMeta(*tx)) {
    tx->Rollback();
    return;
  }

  db::model::LedgerMetaRecord meta;
  meta.owner          = std::move(owner);
  meta.next_stream_id = 1;

  auto result = repository_->UpsertLedgerMeta(*tx, meta);
  if (!result) {
    throw std::runtime_error(DbMessage("initialise ledger metadata", result));
  }
  tx->Commit();
}

// ------------------------------------------------------------------
// Create
// ------------------------------------------------------------------

Outcome<model::StreamId> StreamLedger::CreateStream(const CallContext& ctx, const CreateStreamParams& params) {
  std::lock_guard lock(mutex_);
  try {
    return CreateStreamLocked(ctx, params);
  } catch (const std::exception& e) {
    return Outcome<model::StreamId>::Err(ErrorCode::StorageFailure, e.what());
  }
}

Outcome<model::StreamId> StreamLedger::CreateStreamLocked(const CallContext& ctx, const CreateStreamParams& params) {
  using Result = Outcome<model::StreamId>;

  if (params.recipient == ctx.caller) {
    return Result::Err(ErrorCode::SelfStream, "recipient cannot be the payer");
  }

  if (params.funded_amount == 0) {
    return Result::Err(ErrorCode::ZeroOrMissingFunds, "stream must be funded");
  }

  if (params.end_date.has_value() == params.duration.has_value()) {
    return Result::Err(ErrorCode::InvalidTimeParameters, "exactly one of end_date or duration is required");
  }

  const model::Timestamp start = ctx.now;
  model::Timestamp       end   = 0;
  if (params.end_date) {
    end = *params.end_date;
  } else {
    if (*params.duration > std::numeric_limits<model::Timestamp>::max() - start) {
      return Result::Err(ErrorCode::InvalidTimeParameters, "duration overflows the end date");
    }
    end = start + *params.duration;
  }

  if (end <= start) {
    return Result::Err(ErrorCode::InvalidTimeParameters, "end date must be after the start date");
  }

  if (end - start < options_.min_stream_duration_sec) {
    return Result::Err(ErrorCode::InvalidTimeParameters,
                       "stream duration is below the minimum of " + std::to_string(options_.min_stream_duration_sec) + "s");
  }

  auto tx   = repository_->Begin();
  auto meta = repository_->GetLedgerMeta(*tx);
  if (!meta) {
    return Result::Err(ErrorCode::StorageFailure, "ledger metadata missing");
  }

  const model::StreamId id = meta->next_stream_id;

  model::Stream stream;
  stream.payer            = ctx.caller;
  stream.recipient        = params.recipient;
  stream.original_balance = params.funded_amount;
  stream.current_balance  = params.funded_amount;
  stream.start_date       = start;
  stream.end_date         = end;

  if (auto r = repository_->InsertStream(*tx, ToRecord(id, stream)); !r) {
    return Result::Err(ErrorCode::StorageFailure, DbMessage("insert stream", r));
  }

  meta->next_stream_id = id + 1;
  if (auto r = repository_->UpsertLedgerMeta(*tx, *meta); !r) {
    return Result::Err(ErrorCode::StorageFailure, DbMessage("advance stream id", r));
  }

  auto transfer = custody_->Deposit(ctx.caller, params.funded_amount);
  if (!transfer) {
    tx->Rollback();
    return Result::Err(ErrorCode::TransferFailed, "deposit failed: " + transfer.message);
  }

  if (auto failed = CommitOrUndo<model::StreamId>(*tx, "create stream",
                                                  [&] { return custody_->ReverseDeposit(ctx.caller, params.funded_amount); })) {
    return *failed;
  }
  return Result::Ok(id);
}

// ------------------------------------------------------------------
// Withdraw
// ------------------------------------------------------------------

Outcome<model::Amount> StreamLedger::RecipientWithdraw(const CallContext& ctx, model::StreamId stream_id,
                                                       std::optional<model::Amount> withdrawal_amount) {
  std::lock_guard lock(mutex_);
  try {
    return WithdrawLocked(ctx, stream_id, withdrawal_amount);
  } catch (const std::exception& e) {
    return Outcome<model::Amount>::Err(ErrorCode::StorageFailure, e.what());
  }
}

Outcome<model::Amount> StreamLedger::WithdrawLocked(const CallContext& ctx, model::StreamId stream_id,
                                                    std::optional<model::Amount> amount) {
  using Result = Outcome<model::Amount>;

  auto tx     = repository_->Begin();
  auto record = repository_->GetStream(*tx, stream_id);
  if (!record) {
    return Result::Err(ErrorCode::StreamNotFound, "stream " + std::to_string(stream_id) + " not found");
  }

  auto stream = ToStream(*record);
  if (ctx.caller != stream.recipient) {
    return Result::Err(ErrorCode::Unauthorized, "only the recipient may withdraw");
  }

  const model::Amount available = vesting::WithdrawableAmount(stream, ctx.now);

  model::Amount to_withdraw = 0;
  if (amount) {
    if (*amount == 0 || *amount > available) {
      return Result::Err(ErrorCode::InsufficientAvailableBalance,
                         "requested " + std::to_string(*amount) + ", available " + std::to_string(available));
    }
    to_withdraw = *amount;
  } else {
    if (available == 0) {
      return Result::Ok(0);
    }
    to_withdraw = available;
  }

  stream.current_balance -= to_withdraw;
  if (auto r = repository_->UpdateStream(*tx, ToRecord(stream_id, stream)); !r) {
    return Result::Err(ErrorCode::StorageFailure, DbMessage("update stream", r));
  }

  auto transfer = custody_->Payout(stream.recipient, to_withdraw);
  if (!transfer) {
    tx->Rollback();
    return Result::Err(ErrorCode::TransferFailed, "payout failed: " + transfer.message);
  }

  if (auto failed = CommitOrUndo<model::Amount>(*tx, "withdraw",
                                               [&] { return custody_->ReversePayout(stream.recipient, to_withdraw); })) {
    return *failed;
  }
  return Result::Ok(to_withdraw);
}

// ------------------------------------------------------------------
// Reads
// ------------------------------------------------------------------

Outcome<model::Stream> StreamLedger::GetStreamById(model::StreamId stream_id) {
  using Result = Outcome<model::Stream>;

  std::lock_guard lock(mutex_);
  try {
    auto tx     = repository_->Begin();
    auto record = repository_->GetStream(*tx, stream_id);
    tx->Rollback();
    if (!record) {
      return Result::Err(ErrorCode::StreamNotFound, "stream " + std::to_string(stream_id) + " not found");
    }
    return Result::Ok(ToStream(*record));
  } catch (const std::exception& e) {
    return Result::Err(ErrorCode::StorageFailure, e.what());
  }
}

Outcome<LedgerInfo> StreamLedger::GetLedgerInfo() {
  using Result = Outcome<LedgerInfo>;

  std::lock_guard lock(mutex_);
  try {
    auto tx   = repository_->Begin();
    auto meta = repository_->GetLedgerMeta(*tx);
    tx->Rollback();
    if (!meta) {
      return Result::Err(ErrorCode::StorageFailure, "ledger metadata missing");
    }
    return Result::Ok(LedgerInfo{meta->owner, meta->next_stream_id});
  } catch (const std::exception& e) {
    return Result::Err(ErrorCode::StorageFailure, e.what());
  }
}

} // namespace streamledger::ledger
