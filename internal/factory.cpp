#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/ledger_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/time.hpp"
#if STREAMLEDGER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace streamledger::factory {

namespace {

constexpr const char* kDefaultOwner = "owner";

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const streamledger::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if STREAMLEDGER_DB_SQLITE
    const auto& sqlite = database.sqlite();
    if (sqlite.path().empty()) {
      throw std::runtime_error("database.sqlite.path is required");
    }
    const bool wal_mode = sqlite.has_wal_mode() ? sqlite.wal_mode() : true;

    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), wal_mode);
    db::sqlite::BootstrapSchema(*sqlite_db);
    STREAMLEDGER_LOG_DEBUG("sqlite schema ready", {observability::StringField("path", sqlite_db->Path()), observability::BoolField("wal", wal_mode)});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const streamledger::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Storage + custody
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  // escrow lives in process memory; a durable store already owes its open balances
  const model::Amount escrow = ledger::OutstandingBalance(*app.repository);
  app.custody                = std::make_shared<custody::MemoryCustody>(escrow);

  // ------------------------------------------------------------------
  // Ledger
  // ------------------------------------------------------------------
  const auto& ledger_cfg = config.ledger();
  std::string owner      = ledger_cfg.owner().empty() ? kDefaultOwner : ledger_cfg.owner();

  ledger::LedgerOptions options;
  options.min_stream_duration_sec = ledger_cfg.min_stream_duration_sec();

  app.ledger = std::make_shared<ledger::StreamLedger>(app.repository, app.custody, owner, options);

  auto info = app.ledger->GetLedgerInfo();
  if (!info) {
    throw std::runtime_error("ledger metadata unreadable: " + info.message);
  }
  if (info->owner != owner) {
    STREAMLEDGER_LOG_WARN("configured owner ignored, ledger already initialised",
                          {observability::StringField("configured", owner), observability::StringField("stored", info->owner)});
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.ledger = app.ledger;
  ctx.clock  = [] { return util::NowSeconds(); };

  app.ledger_service = std::make_shared<service::LedgerService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::LedgerServer>(app.ledger_service));

  STREAMLEDGER_LOG_INFO("ledger ready", {observability::StringField("owner", info->owner), observability::UintField("next_stream_id", info->next_stream_id),
                                         observability::UintField("escrow", escrow),
                                         observability::StringField("backend", config.database().has_sqlite() ? "sqlite" : "memory")});

  return app;
}

} // namespace streamledger::factory
