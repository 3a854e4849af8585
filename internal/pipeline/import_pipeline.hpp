#pragma once

#include <arrow/buffer.h>

#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "internal/commit/commit_dispatcher.hpp"
#include "internal/dedupe/duplicate_detector.hpp"
#include "internal/dedupe/history_window.hpp"
#include "internal/extraction/cancellation.hpp"
#include "internal/extraction/report_extractor.hpp"
#include "internal/model/source_document.hpp"
#include "internal/queue/offline_queue.hpp"
#include "internal/review/review_session.hpp"
#include "internal/store/domain_store.hpp"
#include "internal/util/status.hpp"

namespace carelog::pipeline {

struct PipelineOptions {
  dedupe::DetectionWindows windows;
  dedupe::HistoryWindow    history;
};

struct ImportOutcome {
  util::Status                        status;
  review::ReviewSession               session;
  // set when a transient failure parked the report for a later retry
  std::optional<queue::PendingReport> queued;
  // the report the session came from; pass it to Commit so a transient commit
  // failure can queue it again (a successful retry has already dequeued it)
  std::optional<model::SourceDocument> source;

  bool ok() const {
    return status.ok();
  }
};

struct CommitOutcome {
  commit::CommitResult                result;
  std::optional<queue::PendingReport> queued;
  util::Status                        queue_status;
};

/*
  Running import or retry. Cancel() is safe from any thread; Wait() blocks
  until the outcome is ready and may be called more than once.
*/
class ImportHandle {
 public:
  ImportHandle(extraction::CancellationToken token, std::shared_future<ImportOutcome> future);

  void          Cancel();
  bool          Ready() const;
  ImportOutcome Wait() const;

 private:
  extraction::CancellationToken     token_;
  std::shared_future<ImportOutcome> future_;
};

/*
  Orchestrates one report from bytes to a review session, and a reviewed
  session into the domain stores.

    Import:  format check -> extraction -> history lookup -> detection
    Retry:   queued source -> same stages; the report leaves the queue only
             when all of them succeed
    Commit:  session.ConfirmedBatch() -> CommitDispatcher

  Transient failures queue the report; cancellation never does. The pipeline
  must outlive every ImportHandle it hands out.
*/
class ImportPipeline {
 public:
  ImportPipeline(extraction::ReportExtractor extractor, std::shared_ptr<queue::OfflineQueue> queue,
                 store::DomainStoreMap stores, PipelineOptions options = {});

  // Format routing before any service call.
  static util::StatusOr<model::SourceDocument> Prepare(std::string name, std::shared_ptr<arrow::Buffer> bytes,
                                                       util::Day reference_day);

  ImportOutcome Import(const model::SourceDocument& document, const extraction::CancellationToken& token = {});
  ImportOutcome Retry(const std::string& pending_id, const extraction::CancellationToken& token = {});

  // kInvalidState while an import of the same document name (or a retry of the
  // same pending id) is already running.
  util::StatusOr<ImportHandle> StartImport(model::SourceDocument document);
  util::StatusOr<ImportHandle> StartRetry(std::string pending_id);

  // Explicit parking of a report, e.g. after a malformed extraction result.
  util::StatusOr<queue::PendingReport> SaveForLater(const model::SourceDocument& document);

  // source may be null. When given and an item fails transiently, it is
  // queued so the report is not lost.
  CommitOutcome Commit(const review::ReviewSession& session, const model::SourceDocument* source = nullptr);

  // Existing records around the batch, from the stores of the kinds present.
  util::StatusOr<std::vector<model::ExistingRecord>> LoadHistory(const std::vector<model::CandidateEvent>& candidates);

  const std::shared_ptr<queue::OfflineQueue>& Queue() const {
    return queue_;
  }

 private:
  util::StatusOr<std::vector<model::CandidateEvent>> ExtractAndDetect(const model::SourceDocument&         document,
                                                                      const extraction::CancellationToken& token);

  ImportOutcome QueueAfterFailure(const model::SourceDocument& document, util::Status failure);

  bool TryBeginFlight(const std::string& key);
  void EndFlight(const std::string& key);

  extraction::ReportExtractor          extractor_;
  std::shared_ptr<queue::OfflineQueue> queue_;
  store::DomainStoreMap                stores_;
  PipelineOptions                      options_;
  dedupe::DuplicateDetector            detector_;
  commit::CommitDispatcher             dispatcher_;

  std::mutex                      inflight_mutex_;
  std::unordered_set<std::string> inflight_;
};

} // namespace carelog::pipeline
