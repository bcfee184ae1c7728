#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <utility>

#include "internal/access/access_guard.hpp"
#include "internal/catalog/product_catalog.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/ledger/repository_ledger.hpp"
#include "internal/lifecycle/request_lifecycle.hpp"
#include "internal/observability/logging.hpp"
#include "internal/settlement/settlement_engine.hpp"
#if MARKET_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if MARKET_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace market::factory {

using market::observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const market::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if MARKET_DB_SQLITE
    db::sqlite::SqliteOptions options;
    options.path     = database.sqlite().path();
    options.wal_mode = database.sqlite().wal_mode();
    if (database.sqlite().busy_timeout_ms() > 0) {
      options.busy_timeout_ms = static_cast<int>(database.sqlite().busy_timeout_ms());
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(std::move(options));
    db::sqlite::SqliteRepository::BootstrapSchema(*sqlite_db);
    MARKET_LOG_INFO("store opened", {StringField("backend", "sqlite"), StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if MARKET_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    pool->BootstrapSchema();
    MARKET_LOG_INFO("store opened", {StringField("backend", "postgres")});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  MARKET_LOG_INFO("store opened", {StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full marketplace dependency graph
*/
Runtime BuildRuntime(const market::runtime::config::RuntimeConfig& config) {
  Runtime runtime;

  // ------------------------------------------------------------------
  // Store and ledger
  // ------------------------------------------------------------------
  auto repository = BuildRepository(config);
  auto ledger     = std::make_shared<ledger::RepositoryLedger>(repository);

  // ------------------------------------------------------------------
  // Operator components
  // ------------------------------------------------------------------
  auto access = std::make_shared<access::AccessGuard>(repository, config.bootstrap().admin(), config.bootstrap().fee_destination());
  access->Bootstrap();

  auto catalog    = std::make_shared<catalog::ProductCatalog>(repository, ledger);
  auto lifecycle  = std::make_shared<lifecycle::RequestLifecycle>(repository);
  auto settlement = std::make_shared<settlement::SettlementEngine>(repository, ledger, access);

  // ------------------------------------------------------------------
  // Service
  // ------------------------------------------------------------------
  runtime.components.repository = repository;
  runtime.components.ledger     = ledger;
  runtime.components.access     = access;
  runtime.components.catalog    = catalog;
  runtime.components.lifecycle  = lifecycle;
  runtime.components.settlement = settlement;

  runtime.service = std::make_shared<service::MarketService>(runtime.components);
  return runtime;
}

} // namespace market::factory
