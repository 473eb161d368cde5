#pragma once

#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "internal/service/ledger_service.hpp"
#include "streamledger/v1_grpc.hpp"

namespace streamledger::grpc {

// Request metadata entry carrying the caller's account id.
inline constexpr const char* kAccountMetadataKey = "x-ledger-account";

class LedgerServer final : public streamledger::v1::StreamLedgerService::Service {
public:
  explicit LedgerServer(std::shared_ptr<streamledger::service::LedgerService> svc);

  ::grpc::Status CreateStream(::grpc::ServerContext*,
                              const streamledger::v1::CreateStreamRequest*,
                              streamledger::v1::CreateStreamResponse*) override;

  ::grpc::Status Withdraw(::grpc::ServerContext*,
                          const streamledger::v1::WithdrawRequest*,
                          streamledger::v1::WithdrawResponse*) override;

  ::grpc::Status GetStream(::grpc::ServerContext*,
                           const streamledger::v1::GetStreamRequest*,
                           streamledger::v1::GetStreamResponse*) override;

  ::grpc::Status GetLedgerInfo(::grpc::ServerContext*,
                               const streamledger::v1::GetLedgerInfoRequest*,
                               streamledger::v1::GetLedgerInfoResponse*) override;

private:
  static std::string CallerOf(const ::grpc::ServerContext* ctx);

  std::shared_ptr<streamledger::service::LedgerService> service_;
};

} // namespace streamledger::grpc
