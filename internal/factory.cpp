#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/core/pairing_coordinator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/grpc/session_server.hpp"
#include "internal/identity/directory_identity_resolver.hpp"
#include "internal/legacy/simulated_legacy_sink.hpp"
#include "internal/observability/logging.hpp"
#include "internal/reconcile/reconciliation_scheduler.hpp"
#include "internal/reconcile/reconciliation_worker.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/session_service.hpp"
#include "internal/session/session_registry.hpp"
#if SCANHUB_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if SCANHUB_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace scanhub::factory {

using namespace scanhub;

namespace {

#if SCANHUB_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  sqlite_db->Exec(db::sql::CREATE_PAIRINGS_SQLITE);
  sqlite_db->Exec(db::sql::CREATE_PAIRINGS_INDEXES_SQLITE);

  sqlite_db->Exec("SELECT id,login,platform,product,scanned_at_ms,is_overwrite,sync_status,sync_error FROM pairings LIMIT 1;");
}
#endif

#if SCANHUB_DB_POSTGRES
// Runs on a dedicated connection: pooled connections prepare statements
// against the table and cannot be opened before it exists.
void BootstrapPostgresSchema(const std::string& connection_uri) {
  pqxx::connection conn(connection_uri);
  pqxx::work       tx(conn);

  tx.exec(db::sql::CREATE_PAIRINGS_POSTGRES);
  tx.exec("SELECT id,login,platform,product,scanned_at_ms,is_overwrite,sync_status,sync_error FROM pairings LIMIT 1;");
  tx.commit();
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const scanhub::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if SCANHUB_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    BootstrapSqliteSchema(sqlite_db);
    SCANHUB_LOG_INFO("sqlite repository ready", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if SCANHUB_DB_POSTGRES
    BootstrapPostgresSchema(database.postgres().connection_uri());
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16);
    SCANHUB_LOG_INFO("postgres repository ready");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  SCANHUB_LOG_WARN("memory repository in use, pairings are lost on restart");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const scanhub::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence and collaborators
  // ------------------------------------------------------------------
  auto repository = BuildRepository(config);
  auto resolver   = std::make_shared<identity::DirectoryIdentityResolver>(config.identity());
  auto sink       = legacy::SimulatedLegacySink::FromConfig(config.legacy_sink());

  // ------------------------------------------------------------------
  // Reconciliation
  // ------------------------------------------------------------------
  auto scheduler = std::make_shared<reconcile::ReconciliationScheduler>();
  auto worker    = std::make_shared<reconcile::ReconciliationWorker>(scheduler, repository, sink);

  worker->Start();

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto registry    = std::make_shared<session::SessionRegistry>(repository);
  auto coordinator = std::make_shared<core::PairingCoordinator>(registry, repository, scheduler);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.registry    = registry;
  ctx.coordinator = coordinator;
  ctx.resolver    = resolver;

  auto session_service = std::make_shared<service::SessionService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::SessionServer>(session_service));

  // Keep ownership of workers so they live for process lifetime
  app.background_workers.push_back(worker);
  app.registry   = registry;
  app.repository = repository;

  return app;
}

} // namespace scanhub::factory
