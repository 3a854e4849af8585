#include "offline_queue.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace carelog::queue {

using observability::IntField;
using observability::StringField;
using util::Status;
using util::StatusCode;

namespace {

constexpr const char* kBlobPrefix = "report-";

Status StorageFailure(const std::string& operation, const std::string& detail) {
  return Status::Err(StatusCode::kStorageError, operation + ": " + detail);
}

Status StorageFailure(const std::string& operation, const db::Result& result) {
  return StorageFailure(operation, result.message.empty() ? "repository error" : result.message);
}

db::model::PendingReportRecord ToRecord(const PendingReport& report) {
  db::model::PendingReportRecord record;
  record.id             = report.id;
  record.created_at_ms  = util::ToUnixMillis(report.created_at);
  record.source_ref     = report.source_reference;
  record.format         = std::string(model::ToString(report.format));
  record.source_name    = report.source_name;
  record.reference_date = util::FormatDate(report.reference_day);
  record.size_bytes     = report.size_bytes;
  return record;
}

util::StatusOr<PendingReport> FromRecord(const db::model::PendingReportRecord& record) {
  auto day = util::ParseDate(record.reference_date);
  if (!day || (record.format != "image" && record.format != "text")) {
    return Status::Err(StatusCode::kStorageError, "pending report " + record.id + " has corrupt metadata");
  }

  PendingReport report;
  report.id               = record.id;
  report.created_at       = util::FromUnixMillis(record.created_at_ms);
  report.source_reference = record.source_ref;
  report.format           = record.format == "image" ? model::SourceFormat::kImage : model::SourceFormat::kText;
  report.source_name      = record.source_name;
  report.reference_day    = *day;
  report.size_bytes       = record.size_bytes;
  return report;
}

} // namespace

OfflineQueue::OfflineQueue(storage::BlobStorePtr blobs, std::shared_ptr<db::Repository> repository, bool fsync)
    : blobs_(std::move(blobs)), repository_(std::move(repository)), fsync_(fsync) {
}

std::string OfflineQueue::BlobKey(const std::string& id) {
  return kBlobPrefix + id;
}

std::shared_ptr<std::mutex> OfflineQueue::ReportMutex(const std::string& id) {
  std::lock_guard<std::mutex> lock(report_mutexes_guard_);
  auto&                       report_mutex = report_mutexes_[id];
  if (!report_mutex) {
    report_mutex = std::make_shared<std::mutex>();
  }
  return report_mutex;
}

void OfflineQueue::ReleaseReportMutex(const std::string& id) {
  std::lock_guard<std::mutex> lock(report_mutexes_guard_);
  report_mutexes_.erase(id);
}

std::size_t OfflineQueue::TrackedReportCount() const {
  std::lock_guard<std::mutex> lock(report_mutexes_guard_);
  return report_mutexes_.size();
}

int64_t OfflineQueue::NextCreatedAtMs() {
  std::lock_guard<std::mutex> lock(clock_mutex_);
  last_created_ms_ = std::max(util::ToUnixMillis(util::Now()), last_created_ms_ + 1);
  return last_created_ms_;
}

// ------------------------------------------------------------------
// Enqueue
// ------------------------------------------------------------------

util::StatusOr<PendingReport> OfflineQueue::Enqueue(const model::SourceDocument& document) {
  if (!document.bytes) {
    return Status::Err(StatusCode::kInvalidArgument, "report has no bytes");
  }

  PendingReport report;
  report.id               = util::NewId();
  report.created_at       = util::FromUnixMillis(NextCreatedAtMs());
  report.source_reference = BlobKey(report.id);
  report.format           = document.format;
  report.source_name      = document.name;
  report.reference_day    = document.reference_day;
  report.size_bytes       = static_cast<uint64_t>(document.bytes->size());

  auto                        report_mutex = ReportMutex(report.id);
  std::lock_guard<std::mutex> report_lock(*report_mutex);

  try {
    blobs_->Write(report.source_reference, document.bytes, fsync_);
  } catch (const std::exception& e) {
    CARELOG_LOG_ERROR("enqueue: writing report bytes failed", {StringField("report_id", report.id), StringField("error", e.what())});
    ReleaseReportMutex(report.id);
    return StorageFailure("write report bytes", e.what());
  }

  Status metadata_status;
  try {
    auto tx     = repository_->Begin();
    auto result = repository_->InsertPendingReport(*tx, ToRecord(report));
    if (result) {
      tx->Commit();
    } else {
      metadata_status = StorageFailure("record pending report", result);
    }
  } catch (const std::exception& e) {
    metadata_status = StorageFailure("record pending report", e.what());
  }

  if (!metadata_status.ok()) {
    try {
      blobs_->Remove(report.source_reference);
    } catch (const std::exception& e) {
      CARELOG_LOG_WARN("enqueue: could not remove bytes of failed report",
                       {StringField("report_id", report.id), StringField("error", e.what())});
    }
    CARELOG_LOG_ERROR("enqueue failed", {StringField("report_id", report.id), StringField("error", metadata_status.message)});
    ReleaseReportMutex(report.id);
    return metadata_status;
  }

  CARELOG_LOG_INFO("report queued", {StringField("report_id", report.id), StringField("source", report.source_name),
                                     IntField("size_bytes", static_cast<int64_t>(report.size_bytes))});
  return report;
}

// ------------------------------------------------------------------
// Read
// ------------------------------------------------------------------

util::StatusOr<std::vector<PendingReport>> OfflineQueue::List() {
  std::vector<db::model::PendingReportRecord> records;
  try {
    auto tx = repository_->Begin();
    records = repository_->ListPendingReports(*tx);
    tx->Commit();
  } catch (const std::exception& e) {
    return StorageFailure("list pending reports", e.what());
  }

  std::vector<PendingReport> reports;
  reports.reserve(records.size());
  for (const auto& record : records) {
    auto report = FromRecord(record);
    if (!report.ok()) return report.status();
    reports.push_back(std::move(report).value());
  }
  return reports;
}

util::StatusOr<PendingReport> OfflineQueue::GetUnlocked(const std::string& id) {
  std::optional<db::model::PendingReportRecord> record;
  try {
    auto tx = repository_->Begin();
    record  = repository_->GetPendingReport(*tx, id);
    tx->Commit();
  } catch (const std::exception& e) {
    return StorageFailure("read pending report " + id, e.what());
  }

  if (!record) return Status::Err(StatusCode::kNotFound, "no pending report " + id);
  return FromRecord(*record);
}

util::StatusOr<PendingReport> OfflineQueue::Get(const std::string& id) {
  auto                        report_mutex = ReportMutex(id);
  std::lock_guard<std::mutex> report_lock(*report_mutex);

  auto report = GetUnlocked(id);
  if (!report.ok() && report.status().code == StatusCode::kNotFound) ReleaseReportMutex(id);
  return report;
}

util::StatusOr<model::SourceDocument> OfflineQueue::LoadUnlocked(const PendingReport& report) {
  model::SourceDocument document;
  document.name          = report.source_name;
  document.format        = report.format;
  document.reference_day = report.reference_day;

  try {
    document.bytes = blobs_->Read(report.source_reference);
  } catch (const util::NotFound&) {
    return StorageFailure("read report bytes", "bytes of pending report " + report.id + " are missing");
  } catch (const std::exception& e) {
    return StorageFailure("read report bytes", e.what());
  }
  return document;
}

util::StatusOr<model::SourceDocument> OfflineQueue::Load(const std::string& id) {
  auto                        report_mutex = ReportMutex(id);
  std::lock_guard<std::mutex> report_lock(*report_mutex);

  auto report = GetUnlocked(id);
  if (!report.ok()) {
    if (report.status().code == StatusCode::kNotFound) ReleaseReportMutex(id);
    return report.status();
  }
  return LoadUnlocked(*report);
}

// ------------------------------------------------------------------
// Retry / discard
// ------------------------------------------------------------------

util::StatusOr<std::vector<model::CandidateEvent>> OfflineQueue::Retry(const std::string& id, const Extractor& extractor) {
  auto                        report_mutex = ReportMutex(id);
  std::lock_guard<std::mutex> report_lock(*report_mutex);

  auto report = GetUnlocked(id);
  if (!report.ok()) {
    if (report.status().code == StatusCode::kNotFound) ReleaseReportMutex(id);
    return report.status();
  }

  auto document = LoadUnlocked(*report);
  if (!document.ok()) {
    CARELOG_LOG_ERROR("retry: report source unavailable", {StringField("report_id", id), StringField("error", document.status().message)});
    return document.status();
  }

  auto candidates = extractor(*document);
  if (!candidates.ok()) {
    CARELOG_LOG_WARN("retry failed, report kept",
                     {StringField("report_id", id), StringField("code", util::StatusCodeName(candidates.status().code)),
                      StringField("error", candidates.status().message)});
    return candidates.status();
  }

  try {
    auto tx     = repository_->Begin();
    auto result = repository_->DeletePendingReport(*tx, id);
    if (!result) return StorageFailure("delete pending report " + id, result);
    tx->Commit();
  } catch (const std::exception& e) {
    return StorageFailure("delete pending report " + id, e.what());
  }
  ReleaseReportMutex(id);

  try {
    blobs_->Remove(report->source_reference);
  } catch (const std::exception& e) {
    // metadata is gone, so the report is no longer pending; the bytes are an orphan
    CARELOG_LOG_WARN("retry: could not remove report bytes", {StringField("report_id", id), StringField("error", e.what())});
  }

  CARELOG_LOG_INFO("retry succeeded", {StringField("report_id", id), IntField("candidates", static_cast<int64_t>(candidates->size()))});
  return candidates;
}

Status OfflineQueue::Discard(const std::string& id) {
  auto                        report_mutex = ReportMutex(id);
  std::lock_guard<std::mutex> report_lock(*report_mutex);

  auto report = GetUnlocked(id);
  if (!report.ok()) {
    if (report.status().code == StatusCode::kNotFound) ReleaseReportMutex(id);
    return report.status();
  }

  try {
    auto tx     = repository_->Begin();
    auto result = repository_->DeletePendingReport(*tx, id);
    if (!result) return StorageFailure("delete pending report " + id, result);
    tx->Commit();
  } catch (const std::exception& e) {
    return StorageFailure("delete pending report " + id, e.what());
  }
  ReleaseReportMutex(id);

  try {
    blobs_->Remove(report->source_reference);
  } catch (const std::exception& e) {
    CARELOG_LOG_ERROR("discard: report bytes not removed", {StringField("report_id", id), StringField("error", e.what())});
    return StorageFailure("remove report bytes", e.what());
  }

  CARELOG_LOG_INFO("report discarded", {StringField("report_id", id)});
  return Status::Ok();
}

util::StatusOr<std::size_t> OfflineQueue::RemoveOrphanedBlobs() {
  auto reports = List();
  if (!reports.ok()) return reports.status();

  std::size_t removed = 0;
  try {
    for (const auto& key : blobs_->List(kBlobPrefix)) {
      const bool referenced = std::any_of(reports->begin(), reports->end(),
                                          [&](const PendingReport& r) { return r.source_reference == key; });
      if (referenced) continue;

      blobs_->Remove(key);
      ++removed;
      CARELOG_LOG_WARN("removed orphaned report bytes", {StringField("blob", key)});
    }
  } catch (const std::exception& e) {
    return StorageFailure("remove orphaned report bytes", e.what());
  }
  return removed;
}

} // namespace carelog::queue
