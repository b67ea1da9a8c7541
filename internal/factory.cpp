#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/network_admin_server.hpp"
#include "internal/lifecycle/registrar.hpp"
#include "internal/lifecycle/settlement_engine.hpp"
#include "internal/liquidity/position_book.hpp"
#include "internal/migrations/migrations.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/network_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/storage/genesis.hpp"
#if SUBNET_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace subnet::factory {

using namespace subnet;

std::shared_ptr<db::Repository> BuildRepository(const subnet::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if SUBNET_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sqlite::SqliteRepository::BootstrapSchema(*sqlite_db);
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
Application Build(const subnet::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Ledger
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  storage::ApplyGenesis(*app.repository, config.network());

  for (const auto& outcome : migrations::RunPendingMigrations(*app.repository)) {
    SUBNET_LOG_INFO("migration checked", {observability::StringField("name", outcome.name),
                                          observability::BoolField("executed", outcome.executed),
                                          observability::UintField("reads", outcome.cost.reads),
                                          observability::UintField("writes", outcome.cost.writes)});
  }

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto liquidity  = std::make_shared<liquidity::PositionBook>();
  auto settlement = std::make_shared<lifecycle::SettlementEngine>(liquidity);
  auto registrar  = std::make_shared<lifecycle::Registrar>(settlement, storage::DefaultsFromConfig(config.network()));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository = app.repository;
  ctx.settlement = settlement;
  ctx.registrar  = registrar;

  auto network_service = std::make_shared<service::NetworkService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::NetworkAdminServer>(network_service));

  return app;
}

} // namespace subnet::factory
