#include "ledger_service.hpp"

#include <optional>
#include <stdexcept>
#include <utility>

#include "internal/ledger/stream_ledger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/vesting/vesting.hpp"

namespace streamledger::service {

using namespace streamledger::v1;
using streamledger::observability::StringField;
using streamledger::observability::UintField;

namespace {

void RequireCaller(const std::string& caller) {
  if (caller.empty()) {
    throw streamledger::util::Unauthenticated("caller identity is required");
  }
}

template <typename T>
void ThrowIfLedgerError(const ledger::Outcome<T>& outcome, const std::string& operation) {
  if (outcome) {
    return;
  }

  const std::string code(ledger::ToString(outcome.code));
  STREAMLEDGER_LOG_WARN("ledger call rejected", {StringField("op", operation), StringField("code", code), StringField("reason", outcome.message)});

  const auto message = code + ": " + outcome.message;
  switch (outcome.code) {
    case ledger::ErrorCode::InvalidTimeParameters:
    case ledger::ErrorCode::ZeroOrMissingFunds:
    case ledger::ErrorCode::SelfStream:
      throw streamledger::util::InvalidArgument(message);
    case ledger::ErrorCode::StreamNotFound:
      throw streamledger::util::NotFound(message);
    case ledger::ErrorCode::Unauthorized:
      throw streamledger::util::PermissionDenied(message);
    case ledger::ErrorCode::InsufficientAvailableBalance:
      throw streamledger::util::InvalidState(message);
    case ledger::ErrorCode::TransferFailed:
      throw streamledger::util::TransferFailed(message);
    default:
      throw std::runtime_error(message);
  }
}

StreamState ToProto(model::StreamState state) {
  switch (state) {
    case model::StreamState::kActive:
      return STREAM_STATE_ACTIVE;
    case model::StreamState::kDrained:
      return STREAM_STATE_DRAINED;
    case model::StreamState::kUnspecified:
    default:
      return STREAM_STATE_UNSPECIFIED;
  }
}

} // namespace

LedgerService::LedgerService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.ledger) {
    throw std::invalid_argument("ledger service requires a ledger");
  }
}

model::Timestamp LedgerService::Now() const {
  return ctx_.clock ? ctx_.clock() : util::NowSeconds();
}

CreateStreamResponse LedgerService::CreateStream(const std::string& caller, const CreateStreamRequest& req) {
  RequireCaller(caller);

  ledger::CreateStreamParams params;
  params.recipient     = req.recipient();
  params.funded_amount = req.funded_amount();
  if (req.has_end_date()) params.end_date = req.end_date();
  if (req.has_duration()) params.duration = req.duration();

  auto outcome = ctx_.ledger->CreateStream({caller, Now()}, params);
  ThrowIfLedgerError(outcome, "create_stream");

  STREAMLEDGER_LOG_INFO("stream created", {UintField("stream_id", *outcome), StringField("payer", caller),
                                           StringField("recipient", req.recipient()), UintField("amount", req.funded_amount())});

  CreateStreamResponse resp;
  resp.set_stream_id(*outcome);
  return resp;
}

WithdrawResponse LedgerService::Withdraw(const std::string& caller, const WithdrawRequest& req) {
  RequireCaller(caller);

  std::optional<model::Amount> amount;
  if (req.has_amount()) amount = req.amount();

  auto outcome = ctx_.ledger->RecipientWithdraw({caller, Now()}, req.stream_id(), amount);
  ThrowIfLedgerError(outcome, "withdraw");

  STREAMLEDGER_LOG_INFO("withdrawal", {UintField("stream_id", req.stream_id()), StringField("recipient", caller), UintField("amount", *outcome)});

  WithdrawResponse resp;
  resp.set_amount_withdrawn(*outcome);
  return resp;
}

GetStreamResponse LedgerService::GetStream(const GetStreamRequest& req) {
  auto outcome = ctx_.ledger->GetStreamById(req.stream_id());
  ThrowIfLedgerError(outcome, "get_stream");

  const auto& stream = *outcome;
  const auto  now    = Now();

  GetStreamResponse resp;
  auto*             out = resp.mutable_stream();
  out->set_stream_id(req.stream_id());
  out->set_payer(stream.payer);
  out->set_recipient(stream.recipient);
  out->set_original_balance(stream.original_balance);
  out->set_current_balance(stream.current_balance);
  out->set_start_date(stream.start_date);
  out->set_end_date(stream.end_date);

  const auto status = vesting::Evaluate(stream, now);
  auto*      st     = resp.mutable_status();
  st->set_vested(status.vested);
  st->set_withdrawable(status.withdrawable);
  st->set_state(ToProto(status.state));
  st->set_evaluated_at(now);
  return resp;
}

GetLedgerInfoResponse LedgerService::GetLedgerInfo(const GetLedgerInfoRequest&) {
  auto outcome = ctx_.ledger->GetLedgerInfo();
  ThrowIfLedgerError(outcome, "get_ledger_info");

  GetLedgerInfoResponse resp;
  resp.set_owner(outcome->owner);
  resp.set_next_stream_id(outcome->next_stream_id);
  return resp;
}

} // namespace streamledger::service
