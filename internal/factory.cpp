#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/core/catalog_manager.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/deletion/deletion_scheduler.hpp"
#include "internal/deletion/deletion_worker.hpp"
#include "internal/deletion/deletion_workflow.hpp"
#include "internal/events/curl_webhook_sender.hpp"
#include "internal/events/event_notifier.hpp"
#include "internal/gc/object_reaper.hpp"
#include "internal/grpc/catalog_server.hpp"
#include "internal/index/segment_index.hpp"
#include "internal/lease/lease_table.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/storage/storage_factory.hpp"
#if TAMS_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if TAMS_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace tams::factory {

using namespace tams;
using std::chrono::milliseconds;

namespace {

#if TAMS_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  for (const auto& sql : db::sql::SqliteSchema()) {
    sqlite_db->Exec(sql);
  }
}
#endif

#if TAMS_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);
  for (const auto& sql : db::sql::PostgresSchema()) {
    tx.exec(sql);
  }
  tx.commit();
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const tams::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if TAMS_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    BootstrapSqliteSchema(sqlite_db);
    TAMS_LOG_INFO("catalog backend: sqlite", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if TAMS_DB_POSTGRES
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), database.postgres().max_connections());
    BootstrapPostgresSchema(pool);
    TAMS_LOG_INFO("catalog backend: postgres");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  TAMS_LOG_WARN("catalog backend: memory, nothing is persisted");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const tams::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  auto object_store = storage::StorageFactory::Build(config.object_store());
  auto repository   = BuildRepository(config);
  app.repository    = repository;

  // ------------------------------------------------------------------
  // Event notifier
  // ------------------------------------------------------------------
  const auto& notifier_cfg = config.notifier();

  events::NotifierOptions notifier_options;
  notifier_options.poll_interval   = milliseconds(notifier_cfg.poll_interval_ms());
  notifier_options.max_attempts    = notifier_cfg.max_attempts();
  notifier_options.initial_backoff = milliseconds(notifier_cfg.initial_backoff_ms());
  notifier_options.max_backoff     = milliseconds(notifier_cfg.max_backoff_ms());
  notifier_options.attempt_timeout = milliseconds(notifier_cfg.attempt_timeout_ms());
  notifier_options.lanes           = notifier_cfg.lanes();

  auto sender   = std::make_shared<events::CurlWebhookSender>(notifier_cfg.user_agent());
  auto notifier = std::make_shared<events::EventNotifier>(repository, sender, notifier_options);
  app.notifier  = notifier;

  std::weak_ptr<events::EventNotifier> weak_notifier = notifier;
  auto                                 nudge         = [weak_notifier] {
    if (auto n = weak_notifier.lock()) n->Notify();
  };

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto segment_index = std::make_shared<index::SegmentIndex>(repository);

  core::CatalogOptions catalog_options;
  catalog_options.public_url_base = config.server().public_url_base();
  catalog_options.default_limit   = config.pagination().default_limit();
  catalog_options.max_limit       = config.pagination().max_limit();
  auto catalog = std::make_shared<core::CatalogManager>(repository, segment_index, object_store, catalog_options, nudge);

  // ------------------------------------------------------------------
  // Deletion workflow
  // ------------------------------------------------------------------
  auto scheduler = std::make_shared<deletion::DeletionScheduler>();

  deletion::DeletionOptions deletion_options;
  deletion_options.batch_size = config.deletion().batch_size();
  deletion_options.lease_ttl  = milliseconds(config.deletion().lease_ttl_ms());

  deletion::DeletionHooks hooks;
  hooks.on_created = [scheduler](const std::string& id) { scheduler->Enqueue(id); };
  hooks.on_events  = nudge;

  auto workflow = std::make_shared<deletion::DeletionWorkflow>(repository, segment_index, std::make_shared<lease::LeaseTable>(),
                                                               deletion_options, std::move(hooks));
  app.deletion_worker = std::make_shared<deletion::DeletionWorker>(scheduler, workflow, config.deletion().workers(),
                                                                   milliseconds(config.cleanup().scan_interval_ms()));

  // ------------------------------------------------------------------
  // Orphaned object cleanup
  // ------------------------------------------------------------------
  app.object_reaper = std::make_shared<gc::ObjectReaper>(repository, object_store,
                                                         std::chrono::seconds(config.cleanup().orphaned_object_retention_seconds()),
                                                         milliseconds(config.cleanup().scan_interval_ms()));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.catalog              = catalog;
  ctx.deletion             = workflow;
  ctx.identity.name        = config.service().name();
  ctx.identity.description = config.service().description();
  ctx.identity.version     = config.service().version();

  app.catalog_service = std::make_shared<service::CatalogService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::CatalogServer>(app.catalog_service));

  return app;
}

void Application::StartBackground() {
  notifier->Start();
  deletion_worker->Start();
  object_reaper->Start();
}

void Application::StopBackground() {
  if (object_reaper) object_reaper->Stop();
  if (deletion_worker) deletion_worker->Stop();
  if (notifier) notifier->Stop();
}

} // namespace tams::factory
