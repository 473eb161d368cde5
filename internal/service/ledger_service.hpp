#pragma once

#include <string>

#include "service_context.hpp"
#include "streamledger/v1.hpp"

namespace streamledger::service {

/*
  Host-facing ledger operations.

  Resolves the call context (caller + clock), delegates to StreamLedger and
  turns rejected outcomes into util/errors.hpp exceptions.
*/
class LedgerService {
 public:
  explicit LedgerService(ServiceContext ctx);

  streamledger::v1::CreateStreamResponse CreateStream(const std::string& caller,
                                                      const streamledger::v1::CreateStreamRequest& req);

  streamledger::v1::WithdrawResponse Withdraw(const std::string& caller, const streamledger::v1::WithdrawRequest& req);

  streamledger::v1::GetStreamResponse GetStream(const streamledger::v1::GetStreamRequest& req);

  streamledger::v1::GetLedgerInfoResponse GetLedgerInfo(const streamledger::v1::GetLedgerInfoRequest& req);

 private:
  model::Timestamp Now() const;

  ServiceContext ctx_;
};

} // namespace streamledger::service
