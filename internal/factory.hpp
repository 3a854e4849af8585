#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/extraction/extraction_service.hpp"
#include "internal/pipeline/import_pipeline.hpp"
#include "internal/queue/offline_queue.hpp"
#include "internal/storage/blob_store.hpp"
#include "internal/store/domain_store.hpp"

namespace carelog::factory {

/*
  Application

  Owns every long-lived component of one process. The pipeline refers to the
  others, so keep the whole struct alive while it is in use.
*/
struct Application {
  std::shared_ptr<db::Repository>           repository;
  storage::BlobStorePtr                     blobs;
  std::shared_ptr<queue::OfflineQueue>      queue;
  store::DomainStoreMap                     stores;
  std::shared_ptr<pipeline::ImportPipeline> pipeline;
};

/*
  Build

  Composition root: the ONLY place that knows concrete backend types.
  A sqlite database backs the pending-report index and the domain stores;
  the memory database backs both with in-process state.

  Orphaned report blobs from an interrupted enqueue are removed before the
  queue is handed out. Throws on configuration or storage failure.
*/
Application Build(const carelog::runtime::config::RuntimeConfig& config, extraction::ExtractionServicePtr service);

} // namespace carelog::factory
