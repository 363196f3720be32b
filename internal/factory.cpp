#include "factory.hpp"

#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/grpc/archive_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/storage/storage_factory.hpp"
#include "internal/transfer/retry_policy.hpp"
#include "internal/upload/capability.hpp"
#include "internal/util/digest.hpp"
#include "internal/util/time.hpp"
#if VAULT_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if VAULT_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace vault::factory {

using observability::StringField;
using observability::UIntField;

namespace {

std::shared_ptr<db::Repository> BuildRepository(const vault::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if VAULT_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sql::RunMigrations(*sqlite_db, db::sql::SqliteSchema());
    VAULT_LOG_INFO("catalog backend ready", {StringField("backend", "sqlite"), StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if VAULT_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? 16u : database.postgres().max_connections();
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    pool->Bootstrap(db::sql::PostgresSchema());
    VAULT_LOG_INFO("catalog backend ready", {StringField("backend", "postgres")});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  VAULT_LOG_WARN("no database configured; catalog is in memory and lost on exit");
  return std::make_shared<db::memory::MemoryRepository>();
}

std::string CapabilitySecret(const vault::runtime::config::UploadsConfig& uploads) {
  if (!uploads.capability_secret().empty()) {
    return uploads.capability_secret();
  }
  VAULT_LOG_WARN("uploads.capability_secret is empty; using a random per-process secret, "
                 "part URLs will not survive a restart");
  return util::ToHex(util::RandomBytes(32));
}

} // namespace

Application Build(const vault::runtime::config::RuntimeConfig& config) {
  auto store      = storage::StorageFactory::Build(config.storage());
  auto repository = BuildRepository(config);
  return Build(config, std::move(store), std::move(repository));
}

Application Build(const vault::runtime::config::RuntimeConfig& config, storage::ObjectStorePtr store,
                  std::shared_ptr<db::Repository> repository) {
  const auto& uploads = config.uploads();

  // ------------------------------------------------------------------
  // Limits
  // ------------------------------------------------------------------
  const auto limits = store->Limits();
  if (uploads.default_chunk_size_bytes() < limits.min_part_size_bytes) {
    throw std::runtime_error("uploads.default_chunk_size_bytes (" + std::to_string(uploads.default_chunk_size_bytes()) +
                             ") is below the object store minimum part size (" + std::to_string(limits.min_part_size_bytes) + ")");
  }

  Application app;
  app.store      = std::move(store);
  app.repository = std::move(repository);
  app.metadata   = std::make_shared<metadata::MetadataCache>();

  // ------------------------------------------------------------------
  // Upload sessions
  // ------------------------------------------------------------------
  upload::SessionOptions options;
  options.default_chunk_size_bytes = uploads.default_chunk_size_bytes();
  options.capability_ttl           = util::ToMillis(uploads.capability_ttl());
  options.session_max_age          = util::ToMillis(uploads.session_max_age());

  upload::CapabilitySigner signer(CapabilitySecret(uploads), uploads.capability_base_url());

  app.sessions   = std::make_shared<upload::SessionManager>(app.store, app.repository, std::move(signer), options);
  app.reconciler = std::make_shared<upload::CompletionReconciler>(app.sessions, app.store, app.repository, app.metadata,
                                                                  transfer::RetryPolicy::FromConfig(uploads.catalog_retry()));
  app.reaper     = std::make_shared<upload::SessionReaper>(app.sessions, app.reconciler, util::ToMillis(uploads.reaper_interval()));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.sessions                     = app.sessions;
  ctx.reconciler                   = app.reconciler;
  ctx.store                        = app.store;
  ctx.metadata                     = app.metadata;
  ctx.repository                   = app.repository;
  ctx.small_object_threshold_bytes = uploads.small_object_threshold_bytes();

  app.archive_service = std::make_shared<service::ArchiveService>(ctx);
  app.grpc_services.push_back(std::make_shared<grpc::ArchiveServer>(app.archive_service));

  VAULT_LOG_INFO("application built", {UIntField("min_part_size_bytes", limits.min_part_size_bytes),
                                       UIntField("max_part_count", limits.max_part_count),
                                       UIntField("default_chunk_size_bytes", uploads.default_chunk_size_bytes())});
  return app;
}

} // namespace vault::factory
