#include "factory.hpp"

#include <chrono>
#include <filesystem>
#include <stdexcept>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/extraction/report_extractor.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/storage_factory.hpp"
#include "internal/store/memory_domain_store.hpp"
#if CARELOG_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/store/sqlite_domain_store.hpp"
#endif

namespace carelog::factory {

using observability::IntField;
using observability::StringField;

namespace {

pipeline::PipelineOptions BuildPipelineOptions(const carelog::runtime::config::DetectionConfig& detection) {
  pipeline::PipelineOptions options;
  options.windows.sleep_default_duration = std::chrono::minutes(detection.sleep_default_window_minutes());
  options.windows.instant_tolerance      = std::chrono::minutes(detection.instant_window_minutes());
  options.history.padding                = std::chrono::hours(detection.history_padding_hours());
  options.history.max_span               = std::chrono::days(detection.history_window_days());
  return options;
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const carelog::runtime::config::RuntimeConfig& config, extraction::ExtractionServicePtr service) {
  Application app;

  // ------------------------------------------------------------------
  // Metadata index + domain stores
  // ------------------------------------------------------------------
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if CARELOG_DB_SQLITE
    const std::filesystem::path db_path(database.sqlite().path());
    if (db_path.has_parent_path()) {
      std::error_code ec;
      std::filesystem::create_directories(db_path.parent_path(), ec);
      if (ec) throw std::runtime_error("create " + db_path.parent_path().string() + ": " + ec.message());
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(db_path.string());
    db::sqlite::BootstrapSchema(*sqlite_db);
    app.repository = std::make_shared<db::sqlite::SqliteRepository>(sqlite_db);
    app.stores     = store::MakeSqliteDomainStores(sqlite_db);
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  } else {
    app.repository = std::make_shared<db::memory::MemoryRepository>();
    app.stores     = store::MakeMemoryDomainStores();
  }

  // ------------------------------------------------------------------
  // Pending-report queue
  // ------------------------------------------------------------------
  app.blobs = storage::StorageFactory::Build(config.storage(), !database.has_sqlite());
  app.queue = std::make_shared<queue::OfflineQueue>(app.blobs, app.repository, config.storage().disk().fsync());

  auto orphans = app.queue->RemoveOrphanedBlobs();
  if (!orphans.ok()) {
    throw std::runtime_error("pending report cleanup failed: " + orphans.status().message);
  }

  // ------------------------------------------------------------------
  // Pipeline
  // ------------------------------------------------------------------
  extraction::ExtractorOptions extractor_options;
  extractor_options.timeout = std::chrono::milliseconds(config.extraction().timeout_ms());

  app.pipeline = std::make_shared<pipeline::ImportPipeline>(extraction::ReportExtractor(std::move(service), extractor_options),
                                                            app.queue, app.stores, BuildPipelineOptions(config.detection()));

  CARELOG_LOG_INFO("application ready", {StringField("database", database.has_sqlite() ? "sqlite" : "memory"),
                                         IntField("orphaned_blobs_removed", static_cast<int64_t>(*orphans))});
  return app;
}

} // namespace carelog::factory
