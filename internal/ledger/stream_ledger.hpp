#pragma once

#include <memory>
#include <mutex>
#include <optional>

#include "internal/custody/custody.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/ledger/call_context.hpp"
#include "internal/ledger/outcome.hpp"
#include "internal/model/stream.hpp"
#include "internal/model/types.hpp"

namespace streamledger::ledger {

struct LedgerOptions {
  // Shortest accepted end_date - start_date. 0 only requires end > start.
  model::Timestamp min_stream_duration_sec = 0;
};

/*
  Exactly one of end_date / duration must be set.
*/
struct CreateStreamParams {
  model::AccountId                recipient;
  std::optional<model::Timestamp> end_date;
  std::optional<model::Timestamp> duration;
  model::Amount                   funded_amount = 0;
};

struct LedgerInfo {
  model::AccountId owner;
  model::StreamId  next_stream_id = 1;
};

/*
  StreamLedger

  Owns stream lifecycle through an injected repository:
    create  -> deposit into custody, insert stream, bump id counter
    withdraw -> decrement balance, pay out from custody

  Every mutating call runs in one repository transaction under mutex_.
  A failure at any step rolls the transaction back and returns a typed
  Outcome; nothing partial is ever committed. Custody moves funds before
  commit, and a commit that fails reverses that transfer.
*/
class StreamLedger {
 public:
  // Initialises the ledger metadata row on first use. An existing row keeps
  // its stored owner.
  StreamLedger(std::shared_ptr<db::Repository> repository, std::shared_ptr<custody::Custody> custody, model::AccountId owner,
               LedgerOptions options = {});

  Outcome<model::StreamId> CreateStream(const CallContext& ctx, const CreateStreamParams& params);

  Outcome<model::Amount> RecipientWithdraw(const CallContext& ctx, model::StreamId stream_id,
                                           std::optional<model::Amount> withdrawal_amount = std::nullopt);

  Outcome<model::Stream> GetStreamById(model::StreamId stream_id);

  Outcome<LedgerInfo> GetLedgerInfo();

  const LedgerOptions& Options() const {
    return options_;
  }

 private:
  Outcome<model::StreamId> CreateStreamLocked(const CallContext& ctx, const CreateStreamParams& params);
  Outcome<model::Amount>   WithdrawLocked(const CallContext& ctx, model::StreamId stream_id, std::optional<model::Amount> amount);

  std::shared_ptr<db::Repository>  repository_;
  std::shared_ptr<custody::Custody> custody_;
  LedgerOptions                    options_;

  std::mutex mutex_;
};

/*
  What custody must hold for every stream to drain: the sum of current
  balances. Hosts whose custody does not persist seed it from this at start.
*/
model::Amount OutstandingBalance(db::Repository& repository);

} // namespace streamledger::ledger
