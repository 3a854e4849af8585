#include "import_pipeline.hpp"

#include <chrono>
#include <set>
#include <system_error>

#include "internal/extraction/input_format.hpp"
#include "internal/observability/logging.hpp"

namespace carelog::pipeline {

using extraction::CancellationToken;
using model::CandidateEvent;
using model::SourceDocument;
using observability::IntField;
using observability::StringField;
using util::Status;
using util::StatusCode;

// ------------------------------------------------------------------
// ImportHandle
// ------------------------------------------------------------------

ImportHandle::ImportHandle(CancellationToken token, std::shared_future<ImportOutcome> future)
    : token_(std::move(token)), future_(std::move(future)) {
}

void ImportHandle::Cancel() {
  token_.Cancel();
}

bool ImportHandle::Ready() const {
  return future_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

ImportOutcome ImportHandle::Wait() const {
  return future_.get();
}

// ------------------------------------------------------------------
// ImportPipeline
// ------------------------------------------------------------------

ImportPipeline::ImportPipeline(extraction::ReportExtractor extractor, std::shared_ptr<queue::OfflineQueue> queue,
                               store::DomainStoreMap stores, PipelineOptions options)
    : extractor_(std::move(extractor)),
      queue_(std::move(queue)),
      stores_(stores),
      options_(options),
      detector_(options.windows),
      dispatcher_(std::move(stores)) {
}

util::StatusOr<SourceDocument> ImportPipeline::Prepare(std::string name, std::shared_ptr<arrow::Buffer> bytes,
                                                       util::Day reference_day) {
  if (!bytes) return Status::Err(StatusCode::kInvalidArgument, "report has no content");

  auto format = extraction::DetectFormat(name, *bytes);
  if (!format.ok()) return format.status();

  return SourceDocument{std::move(name), *format, std::move(bytes), reference_day};
}

ImportOutcome ImportPipeline::Import(const SourceDocument& document, const CancellationToken& token) {
  ImportOutcome outcome;
  try {
    auto prepared = Prepare(document.name, document.bytes, document.reference_day);
    if (!prepared.ok()) {
      CARELOG_LOG_WARN("report rejected", {StringField("source", document.name), StringField("error", prepared.status().message)});
      outcome.status = prepared.status();
      return outcome;
    }

    auto candidates = ExtractAndDetect(*prepared, token);
    if (!candidates.ok()) {
      const auto& failure = candidates.status();
      if (failure.code == StatusCode::kCancelled || token.IsCancelled()) {
        CARELOG_LOG_INFO("import cancelled", {StringField("source", document.name)});
        outcome.status = Status::Err(StatusCode::kCancelled, "import cancelled");
        return outcome;
      }
      // history lookups fail with kStorageError; the extraction is redone on retry
      if (failure.IsTransient() || failure.code == StatusCode::kStorageError) {
        return QueueAfterFailure(*prepared, failure);
      }
      outcome.status = failure;
      return outcome;
    }

    outcome.session = review::ReviewSession(std::move(candidates).value());
    outcome.source  = *prepared;
    const auto summary = outcome.session.Summary();
    CARELOG_LOG_INFO("report imported",
                     {StringField("source", document.name), IntField("candidates", static_cast<int64_t>(outcome.session.Size())),
                      IntField("duplicates", static_cast<int64_t>(summary.duplicates))});
  } catch (const std::exception& e) {
    outcome.status = util::ToStatus(e);
    CARELOG_LOG_ERROR("import failed", {StringField("source", document.name), StringField("error", e.what())});
  }
  return outcome;
}

ImportOutcome ImportPipeline::Retry(const std::string& pending_id, const CancellationToken& token) {
  ImportOutcome outcome;
  try {
    std::optional<SourceDocument> loaded;
    auto candidates = queue_->Retry(pending_id, [this, &token, &loaded](const SourceDocument& document) {
      loaded = document;
      return ExtractAndDetect(document, token);
    });
    if (!candidates.ok()) {
      outcome.status = token.IsCancelled() ? Status::Err(StatusCode::kCancelled, "retry cancelled") : candidates.status();
      return outcome;
    }
    outcome.session = review::ReviewSession(std::move(candidates).value());
    outcome.source  = std::move(loaded);
  } catch (const std::exception& e) {
    outcome.status = util::ToStatus(e);
    CARELOG_LOG_ERROR("retry failed", {StringField("report_id", pending_id), StringField("error", e.what())});
  }
  return outcome;
}

util::StatusOr<ImportHandle> ImportPipeline::StartImport(SourceDocument document) {
  const auto key = "import:" + document.name;
  if (!TryBeginFlight(key)) {
    return Status::Err(StatusCode::kInvalidState, "an import of " + document.name + " is already running");
  }

  CancellationToken token;
  try {
    auto future = std::async(std::launch::async, [this, key, token, document = std::move(document)]() {
      auto outcome = Import(document, token);
      EndFlight(key);
      return outcome;
    });
    return ImportHandle(token, future.share());
  } catch (const std::system_error& e) {
    EndFlight(key);
    return Status::Err(StatusCode::kInternal, std::string("could not start import: ") + e.what());
  }
}

util::StatusOr<ImportHandle> ImportPipeline::StartRetry(std::string pending_id) {
  const auto key = "retry:" + pending_id;
  if (!TryBeginFlight(key)) {
    return Status::Err(StatusCode::kInvalidState, "a retry of " + pending_id + " is already running");
  }

  CancellationToken token;
  try {
    auto future = std::async(std::launch::async, [this, key, token, pending_id = std::move(pending_id)]() {
      auto outcome = Retry(pending_id, token);
      EndFlight(key);
      return outcome;
    });
    return ImportHandle(token, future.share());
  } catch (const std::system_error& e) {
    EndFlight(key);
    return Status::Err(StatusCode::kInternal, std::string("could not start retry: ") + e.what());
  }
}

util::StatusOr<queue::PendingReport> ImportPipeline::SaveForLater(const SourceDocument& document) {
  return queue_->Enqueue(document);
}

CommitOutcome ImportPipeline::Commit(const review::ReviewSession& session, const SourceDocument* source) {
  CommitOutcome outcome;
  outcome.result = dispatcher_.Commit(session.ConfirmedBatch());

  if (source && outcome.result.AnyTransientFailure()) {
    auto queued = queue_->Enqueue(*source);
    if (queued.ok()) {
      outcome.queued = std::move(queued).value();
      CARELOG_LOG_WARN("report queued after commit failure",
                       {StringField("source", source->name), StringField("report_id", outcome.queued->id)});
    } else {
      outcome.queue_status = queued.status();
      CARELOG_LOG_ERROR("report could not be queued", {StringField("source", source->name), StringField("error", queued.status().message)});
    }
  }
  return outcome;
}

util::StatusOr<std::vector<model::ExistingRecord>> ImportPipeline::LoadHistory(const std::vector<CandidateEvent>& candidates) {
  std::vector<model::ExistingRecord> history;

  auto range = dedupe::HistoryRangeFor(candidates, options_.history);
  if (!range) return history;

  std::set<model::EventKind> kinds;
  for (const auto& candidate : candidates) {
    // "other" is never compared
    if (candidate.kind != model::EventKind::kOther) kinds.insert(candidate.kind);
  }

  for (auto kind : kinds) {
    auto it = stores_.find(kind);
    if (it == stores_.end() || !it->second) continue;

    auto records = it->second->Query(*range);
    if (!records.ok()) {
      CARELOG_LOG_WARN("history lookup failed",
                       {StringField("kind", model::ToString(kind)), StringField("error", records.status().message)});
      return records.status();
    }
    history.insert(history.end(), records->begin(), records->end());
  }
  return history;
}

util::StatusOr<std::vector<CandidateEvent>> ImportPipeline::ExtractAndDetect(const SourceDocument&    document,
                                                                             const CancellationToken& token) {
  auto extracted = extractor_.Extract(document, token);
  if (!extracted.ok()) return extracted.status();

  auto history = LoadHistory(*extracted);
  if (!history.ok()) return history.status();

  return detector_.Detect(std::move(extracted).value(), *history);
}

ImportOutcome ImportPipeline::QueueAfterFailure(const SourceDocument& document, Status failure) {
  ImportOutcome outcome;

  auto queued = queue_->Enqueue(document);
  if (!queued.ok()) {
    CARELOG_LOG_ERROR("report could not be queued", {StringField("source", document.name), StringField("error", queued.status().message)});
    outcome.status = Status::Err(StatusCode::kStorageError, failure.message + "; queueing the report failed: " + queued.status().message);
    return outcome;
  }

  CARELOG_LOG_WARN("report queued for retry", {StringField("source", document.name), StringField("report_id", queued->id),
                                               StringField("reason", util::StatusCodeName(failure.code))});
  outcome.status = std::move(failure);
  outcome.queued = std::move(queued).value();
  return outcome;
}

bool ImportPipeline::TryBeginFlight(const std::string& key) {
  std::lock_guard<std::mutex> lock(inflight_mutex_);
  return inflight_.insert(key).second;
}

void ImportPipeline::EndFlight(const std::string& key) {
  std::lock_guard<std::mutex> lock(inflight_mutex_);
  inflight_.erase(key);
}

} // namespace carelog::pipeline
