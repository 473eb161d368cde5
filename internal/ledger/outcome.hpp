#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace streamledger::ledger {

/*
  Ledger failure taxonomy.

  Every engine operation either applies fully or returns one of these with
  no state change.
*/
enum class ErrorCode {
  OK = 0,

  InvalidTimeParameters,
  ZeroOrMissingFunds,
  SelfStream,
  StreamNotFound,
  Unauthorized,
  InsufficientAvailableBalance,
  TransferFailed,

  // Repository backend reported an error or threw.
  StorageFailure
};

constexpr std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::InvalidTimeParameters:
      return "invalid_time_parameters";
    case ErrorCode::ZeroOrMissingFunds:
      return "zero_or_missing_funds";
    case ErrorCode::SelfStream:
      return "self_stream";
    case ErrorCode::StreamNotFound:
      return "stream_not_found";
    case ErrorCode::Unauthorized:
      return "unauthorized";
    case ErrorCode::InsufficientAvailableBalance:
      return "insufficient_available_balance";
    case ErrorCode::TransferFailed:
      return "transfer_failed";
    case ErrorCode::StorageFailure:
    default:
      return "storage_failure";
  }
}

/*
  Value-or-error result of a ledger operation.
*/
template <typename T>
struct Outcome {
  ErrorCode        code = ErrorCode::OK;
  std::string      message;
  std::optional<T> value;

  static Outcome Ok(T v) {
    Outcome out;
    out.value = std::move(v);
    return out;
  }

  static Outcome Err(ErrorCode c, std::string msg = {}) {
    Outcome out;
    out.code    = c;
    out.message = std::move(msg);
    return out;
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }

  const T& operator*() const {
    return *value;
  }

  const T* operator->() const {
    return &*value;
  }
};

} // namespace streamledger::ledger
