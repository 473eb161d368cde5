#include "ledger_server.hpp"

#include "grpc_error.hpp"

namespace streamledger::grpc {

LedgerServer::LedgerServer(std::shared_ptr<streamledger::service::LedgerService> svc)
    : service_(std::move(svc)) {}

std::string LedgerServer::CallerOf(const ::grpc::ServerContext* ctx) {
  if (!ctx) {
    return {};
  }
  const auto& metadata = ctx->client_metadata();
  auto it = metadata.find(kAccountMetadataKey);
  if (it == metadata.end()) {
    return {};
  }
  return std::string(it->second.data(), it->second.size());
}

::grpc::Status LedgerServer::CreateStream(::grpc::ServerContext* ctx,
                                          const streamledger::v1::CreateStreamRequest* req,
                                          streamledger::v1::CreateStreamResponse* resp) {
  try {
    *resp = service_->CreateStream(CallerOf(ctx), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::Withdraw(::grpc::ServerContext* ctx,
                                      const streamledger::v1::WithdrawRequest* req,
                                      streamledger::v1::WithdrawResponse* resp) {
  try {
    *resp = service_->Withdraw(CallerOf(ctx), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::GetStream(::grpc::ServerContext*,
                                       const streamledger::v1::GetStreamRequest* req,
                                       streamledger::v1::GetStreamResponse* resp) {
  try {
    *resp = service_->GetStream(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::GetLedgerInfo(::grpc::ServerContext*,
                                           const streamledger::v1::GetLedgerInfoRequest* req,
                                           streamledger::v1::GetLedgerInfoResponse* resp) {
  try {
    *resp = service_->GetLedgerInfo(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace streamledger::grpc
