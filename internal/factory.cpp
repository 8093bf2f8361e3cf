#include "factory.hpp"

#include <chrono>
#include <stdexcept>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#if CASETRACK_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if CASETRACK_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace casetrack::factory {

namespace {

using namespace std::chrono_literals;
using casetrack::config::DurationOr;

#if CASETRACK_DB_POSTGRES
// Runs before the pool opens its first connection: statements are
// prepared per connection and need the tables to exist.
class PostgresBootstrap final : public db::sql::MigrationExecutor {
 public:
  explicit PostgresBootstrap(const std::string& conninfo) : conn_(conninfo), tx_(conn_) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

  void Commit() {
    tx_.commit();
  }

 private:
  pqxx::connection conn_;
  pqxx::work       tx_;
};
#endif

struct Stores {
  std::shared_ptr<db::Repository> repository;
  std::shared_ptr<db::Repository> breaker_store;
};

Stores BuildStores(const casetrack::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();

  if (database.has_sqlite()) {
#if CASETRACK_DB_SQLITE
    const auto& sqlite    = database.sqlite();
    auto        sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), sqlite.has_wal_mode() ? sqlite.wal_mode() : true);
    db::sql::RunMigrations(*sqlite_db, db::sql::SqliteSchema());
    CASETRACK_LOG_INFO("store ready", {observability::StringField("backend", "sqlite"), observability::StringField("path", sqlite.path())});

    // One writer per file: a breaker transaction cannot open beside a
    // request transaction, so breaker state stays in process.
    return {std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db)), std::make_shared<db::memory::MemoryRepository>()};
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if CASETRACK_DB_POSTGRES
    const auto& postgres = database.postgres();
    {
      PostgresBootstrap bootstrap(postgres.conninfo());
      db::sql::RunMigrations(bootstrap, db::sql::PostgresSchema());
      bootstrap.Commit();
    }
    const std::size_t max_connections = postgres.max_connections() == 0 ? 16 : postgres.max_connections();
    auto              pool            = std::make_shared<db::postgres::PgPool>(postgres.conninfo(), max_connections);
    auto              repository      = std::make_shared<db::postgres::PgRepository>(std::move(pool));
    CASETRACK_LOG_INFO("store ready",
                       {observability::StringField("backend", "postgres"), observability::IntField("max_connections", static_cast<int64_t>(max_connections))});
    return {repository, repository};
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  CASETRACK_LOG_INFO("store ready", {observability::StringField("backend", "memory")});
  return {std::make_shared<db::memory::MemoryRepository>(), std::make_shared<db::memory::MemoryRepository>()};
}

breaker::BreakerOptions BreakerDefaults(const casetrack::runtime::config::BreakerConfig& config) {
  breaker::BreakerOptions options;
  if (config.default_failure_threshold() != 0) options.failure_threshold = config.default_failure_threshold();
  options.cooldown = DurationOr(config.default_cooldown(), options.cooldown);
  return options;
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const casetrack::runtime::config::RuntimeConfig& config, util::ClockFn clock) {
  casetrack::config::ConfigLoader::Validate(config);

  Application app;

  // ------------------------------------------------------------------
  // Stores
  // ------------------------------------------------------------------
  auto stores       = BuildStores(config);
  app.repository    = stores.repository;
  app.breaker_store = stores.breaker_store;

  // ------------------------------------------------------------------
  // Write-safety components
  // ------------------------------------------------------------------
  idempotency::IdempotencyOptions idempotency_options;
  idempotency_options.retention     = DurationOr(config.idempotency().retention(), idempotency_options.retention);
  idempotency_options.pending_lease = DurationOr(config.idempotency().pending_lease(), idempotency_options.pending_lease);

  lock::LockOptions lock_options;
  lock_options.inactivity_timeout = DurationOr(config.locks().inactivity_timeout(), lock_options.inactivity_timeout);

  app.guard       = std::make_shared<txn::TransactionGuard>(app.repository);
  app.coordinator = std::make_shared<idempotency::IdempotencyCoordinator>(app.repository, idempotency_options, clock);
  app.sequence    = std::make_shared<sequence::SequenceCounter>(app.repository, app.guard);
  app.locks       = std::make_shared<lock::EntityLockManager>(app.repository, app.guard, lock_options, clock);
  app.lifecycle   = std::make_shared<lifecycle::CaseLifecycle>(app.repository, app.guard, clock);

  const auto& breakers = config.breakers();
  app.breakers         = std::make_shared<breaker::CircuitBreaker>(app.breaker_store, BreakerDefaults(breakers), clock);
  for (const auto& dependency : breakers.dependencies()) {
    breaker::BreakerOptions options = app.breakers->OptionsFor(dependency.name());
    if (dependency.failure_threshold() != 0) options.failure_threshold = dependency.failure_threshold();
    options.cooldown = DurationOr(dependency.cooldown(), options.cooldown);
    app.breakers->Configure(dependency.name(), options);
  }

  app.executor = std::make_shared<service::MutationExecutor>(app.coordinator, app.guard, clock, app.breakers);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository = app.repository;
  ctx.guard      = app.guard;
  ctx.executor   = app.executor;
  ctx.sequence   = app.sequence;
  ctx.locks      = app.locks;
  ctx.lifecycle  = app.lifecycle;
  ctx.clock      = clock;

  app.cases = std::make_shared<service::CaseService>(ctx);

  // ------------------------------------------------------------------
  // Background workers
  // ------------------------------------------------------------------
  auto lifecycle   = app.lifecycle;
  auto coordinator = app.coordinator;

  app.background_workers.push_back(std::make_shared<runtime::PeriodicWorker>(
      "parked-resume", DurationOr(config.lifecycle().resume_sweep_interval(), 60s), [lifecycle] { lifecycle->ResumeDue(); }));
  app.background_workers.push_back(std::make_shared<runtime::PeriodicWorker>(
      "idempotency-sweep", DurationOr(config.idempotency().sweep_interval(), 5min), [coordinator] { coordinator->SweepExpired(); }));

  return app;
}

} // namespace casetrack::factory
