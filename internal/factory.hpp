#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"

#include "internal/custody/memory_custody.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/ledger/stream_ledger.hpp"
#include "internal/service/ledger_service.hpp"

namespace streamledger::factory {

/*
  Application

  Owns all long-lived singletons used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository> repository;
  std::shared_ptr<custody::MemoryCustody> custody;
  std::shared_ptr<ledger::StreamLedger> ledger;
  std::shared_ptr<service::LedgerService> ledger_service;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Picks the repository backend named by database config and bootstraps
  its schema. Memory when no backend is configured.
*/
std::shared_ptr<db::Repository> BuildRepository(const streamledger::runtime::config::RuntimeConfig& config);

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const streamledger::runtime::config::RuntimeConfig& config);

} // namespace streamledger::factory
