#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/candidate_event.hpp"
#include "internal/model/source_document.hpp"
#include "internal/queue/pending_report.hpp"
#include "internal/storage/blob_store.hpp"
#include "internal/util/status.hpp"

namespace carelog::queue {

using Extractor = std::function<util::StatusOr<std::vector<model::CandidateEvent>>(const model::SourceDocument&)>;

/*
  Durable queue of reports awaiting a successful extraction.

  Bytes live in the blob store under "report-<id>", metadata in the
  repository's pending_report table. The metadata row is what makes a report
  pending: it is written only after the bytes are durable, and removed
  before the bytes are.

  Operations on the same id are serialized; different ids run concurrently.
  Nothing is cached, List() always reads the repository.
*/
class OfflineQueue {
 public:
  OfflineQueue(storage::BlobStorePtr blobs, std::shared_ptr<db::Repository> repository, bool fsync = true);

  // Persists bytes then metadata. On failure nothing is left behind.
  util::StatusOr<PendingReport> Enqueue(const model::SourceDocument& document);

  // Newest first.
  util::StatusOr<std::vector<PendingReport>> List();

  util::StatusOr<PendingReport> Get(const std::string& id);

  // Rebuilds the source document of a pending report.
  util::StatusOr<model::SourceDocument> Load(const std::string& id);

  /*
    Runs extractor on the stored source while holding the report's lock.
    Success: the report is deleted and the candidates returned.
    Failure: the report is left exactly as it was and the failure returned.
  */
  util::StatusOr<std::vector<model::CandidateEvent>> Retry(const std::string& id, const Extractor& extractor);

  // User-initiated permanent removal of metadata and bytes.
  util::Status Discard(const std::string& id);

  // Removes report blobs with no metadata row (a crash between the two
  // writes). Call before the queue is shared; returns the number removed.
  util::StatusOr<std::size_t> RemoveOrphanedBlobs();

  static std::string BlobKey(const std::string& id);

  // Ids with a lock entry: reports being worked on or still pending.
  std::size_t TrackedReportCount() const;

 private:
  // Callers keep the returned pointer while locked, so a release by another
  // thread never destroys a held mutex.
  std::shared_ptr<std::mutex> ReportMutex(const std::string& id);
  // Called once an id's report is gone for good; ids are never reused.
  void ReleaseReportMutex(const std::string& id);

  util::StatusOr<PendingReport>         GetUnlocked(const std::string& id);
  util::StatusOr<model::SourceDocument> LoadUnlocked(const PendingReport& report);
  int64_t                               NextCreatedAtMs();

  storage::BlobStorePtr           blobs_;
  std::shared_ptr<db::Repository> repository_;
  bool                            fsync_;

  std::mutex clock_mutex_;
  int64_t    last_created_ms_ = 0;

  mutable std::mutex                                           report_mutexes_guard_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> report_mutexes_;
};

} // namespace carelog::queue
