#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <utility>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/delivery_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/outcome/outcome_sync.hpp"
#include "internal/probability/probability_estimator.hpp"
#include "internal/probability/risk_policy.hpp"
#include "internal/service/service_context.hpp"
#include "internal/survival/curve_engine.hpp"
#include "internal/util/time.hpp"
#if DELIVERYIQ_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if DELIVERYIQ_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace deliveryiq::factory {

using deliveryiq::observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const deliveryiq::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if DELIVERYIQ_DB_SQLITE
    const auto& sqlite    = database.sqlite();
    auto        sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), !sqlite.has_wal_mode() || sqlite.wal_mode());
    db::sql::RunMigrations(*sqlite_db, db::sql::SqliteSchema());
    DELIVERYIQ_LOG_INFO("repository ready", {StringField("backend", "sqlite"), StringField("path", sqlite.path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if DELIVERYIQ_DB_POSTGRES
    const auto& postgres        = database.postgres();
    const auto  max_connections = postgres.max_connections() > 0 ? postgres.max_connections() : 16;
    auto        pool            = std::make_shared<db::postgres::PgPool>(postgres.connection_uri(), max_connections);
    {
      db::postgres::PgMigrationExecutor executor(pool);
      db::sql::RunMigrations(executor, db::sql::PostgresSchema());
      executor.Commit();
    }
    DELIVERYIQ_LOG_INFO("repository ready", {StringField("backend", "postgres")});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  DELIVERYIQ_LOG_WARN("no database configured, using in-memory repository");
  return std::make_shared<db::memory::MemoryRepository>();
}

Application Build(const deliveryiq::runtime::config::RuntimeConfig& config, std::function<int64_t()> now_ms) {
  return Build(config, BuildRepository(config), std::move(now_ms));
}

/*
    Build full application dependency graph
*/
Application Build(const deliveryiq::runtime::config::RuntimeConfig& config,
                  std::shared_ptr<db::Repository>                   repository,
                  std::function<int64_t()>                          now_ms) {
  Application app;
  app.repository = repository;

  if (!now_ms) {
    now_ms = [] { return util::ToUnixMillis(util::Now()); };
  }

  // ------------------------------------------------------------------
  // Batch jobs + estimator
  // ------------------------------------------------------------------
  auto outcome_sync = std::make_shared<outcome::OutcomeSync>(repository,
                                                             outcome::OutcomeClassifier(outcome::OutcomeThresholds::FromConfig(config.outcomes())),
                                                             outcome::SyncOptions::FromConfig(config.outcomes()));
  auto curve_engine = std::make_shared<survival::CurveEngine>(repository, survival::CurveEngineOptions::FromConfig(config.survival()));

  std::shared_ptr<const probability::RiskPolicy> policy = probability::MakeRiskPolicy(config.risk_policy());

  const uint64_t min_sample_size = config.resolver().min_sample_size() > 0 ? config.resolver().min_sample_size() : resolver::kDefaultMinSampleSize;
  auto           estimator       = std::make_shared<probability::ProbabilityEstimator>(repository, policy, min_sample_size);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository   = repository;
  ctx.outcome_sync = outcome_sync;
  ctx.curve_engine = curve_engine;
  ctx.estimator    = estimator;
  ctx.now_ms       = std::move(now_ms);

  app.estimator_service = std::make_shared<service::EstimatorService>(ctx);
  app.pipeline_service  = std::make_shared<service::PipelineService>(ctx);
  app.admin_service     = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::DeliveryServer>(app.estimator_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(app.pipeline_service, app.admin_service));

  return app;
}

} // namespace deliveryiq::factory
