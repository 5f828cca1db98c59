#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/core/timeline_engine.hpp"
#include "internal/dataset/dataset_loader.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/timeline_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/timeline_service.hpp"
#include "internal/tags/automatic_tags.hpp"
#if OPENTIMELINE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if OPENTIMELINE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/db/sql/schema.hpp"
#endif

namespace opentimeline::factory {

namespace {

#if OPENTIMELINE_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto conn = pool->Acquire();
  pqxx::work tx(*conn);

  for (const char* sql : db::sql::kBootstrapSchema) {
    tx.exec(sql);
  }
  tx.commit();
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const opentimeline::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if OPENTIMELINE_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    auto repository = std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
    repository->BootstrapSchema();
    OPENTIMELINE_LOG_INFO("database ready", {observability::StringField("backend", "sqlite"),
                                             observability::StringField("path", database.sqlite().path())});
    return repository;
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if OPENTIMELINE_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16;
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    // Acquire() requires shared ownership of the pool
    BootstrapPostgresSchema(pool);
    OPENTIMELINE_LOG_INFO("database ready", {observability::StringField("backend", "postgres")});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  OPENTIMELINE_LOG_INFO("database ready", {observability::StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const opentimeline::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  if (!config.dataset().path().empty()) {
    auto dataset = dataset::DatasetLoader::LoadFile(config.dataset().path());
    dataset::DatasetLoader::Import(*app.repository, dataset);
  }

  // ------------------------------------------------------------------
  // Engine
  // ------------------------------------------------------------------
  core::EngineOptions options;
  options.compose_threads = config.engine().compose_threads();
  if (config.engine().expression_cache_capacity() > 0) {
    options.expression_cache_capacity = config.engine().expression_cache_capacity();
  }

  app.engine = std::make_shared<core::TimelineEngine>(app.repository, tags::AutomaticTags::FromConfig(config.engine()), options);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.engine     = app.engine;
  ctx.repository = app.repository;

  app.timeline_service = std::make_shared<service::TimelineService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::TimelineServer>(app.timeline_service));

  return app;
}

} // namespace opentimeline::factory
