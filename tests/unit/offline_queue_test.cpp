#include "internal/queue/offline_queue.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/disk/disk_blob_store.hpp"
#include "internal/storage/ram/ram_blob_store.hpp"

#if CARELOG_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace {

using namespace std::chrono_literals;

using carelog::db::memory::MemoryRepository;
using carelog::db::model::PendingReportRecord;
using carelog::model::CandidateEvent;
using carelog::model::SourceDocument;
using carelog::model::SourceFormat;
using carelog::queue::OfflineQueue;
using carelog::storage::common::AsStringView;
using carelog::storage::common::BufferFromString;
using carelog::storage::RamBlobStore;
using carelog::util::Status;
using carelog::util::StatusCode;
using carelog::util::StatusOr;

const carelog::util::Day kDay{std::chrono::year{2026} / 3 / 14};

SourceDocument Document(std::string name, std::string text) {
  return SourceDocument{std::move(name), SourceFormat::kText, BufferFromString(std::move(text)), kDay};
}

StatusOr<std::vector<CandidateEvent>> Succeeds(const SourceDocument&) {
  return std::vector<CandidateEvent>(2);
}

StatusOr<std::vector<CandidateEvent>> Unavailable(const SourceDocument&) {
  return Status::Err(StatusCode::kUnavailable, "still offline");
}

// Metadata writes fail; everything else goes to an in-memory repository.
class FailingInsertRepository : public carelog::db::Repository {
 public:
  std::unique_ptr<carelog::db::Transaction> Begin() override {
    return inner_.Begin();
  }

  carelog::db::Result InsertPendingReport(carelog::db::Transaction&, const PendingReportRecord&) override {
    return carelog::db::Result::Err(carelog::db::ErrorCode::IOError, "disk full");
  }

  std::optional<PendingReportRecord> GetPendingReport(carelog::db::Transaction& tx, const std::string& id) override {
    return inner_.GetPendingReport(tx, id);
  }

  std::vector<PendingReportRecord> ListPendingReports(carelog::db::Transaction& tx) override {
    return inner_.ListPendingReports(tx);
  }

  carelog::db::Result DeletePendingReport(carelog::db::Transaction& tx, const std::string& id) override {
    return inner_.DeletePendingReport(tx, id);
  }

 private:
  MemoryRepository inner_;
};

void TestEnqueueListLoad() {
  auto         blobs = std::make_shared<RamBlobStore>();
  OfflineQueue queue(blobs, std::make_shared<MemoryRepository>());

  auto first  = queue.Enqueue(Document("monday.txt", "Nap 13:00-14:00"));
  auto second = queue.Enqueue(Document("tuesday.txt", "Bottle 4oz 9:15"));
  assert(first.ok() && second.ok());
  assert(first->id != second->id);
  assert(first->source_reference == OfflineQueue::BlobKey(first->id));
  assert(first->size_bytes == 15);
  assert(blobs->Exists(first->source_reference));

  auto listed = queue.List();
  assert(listed.ok());
  assert(listed->size() == 2);
  // newest first
  assert((*listed)[0].id == second->id);
  assert((*listed)[1].id == first->id);
  assert((*listed)[1].reference_day == kDay);

  auto loaded = queue.Load(first->id);
  assert(loaded.ok());
  assert(loaded->name == "monday.txt");
  assert(loaded->format == SourceFormat::kText);
  assert(AsStringView(*loaded->bytes) == "Nap 13:00-14:00");

  assert(queue.Get("missing").status().code == StatusCode::kNotFound);
}

void TestRetryKeepsReportUntilSuccess() {
  auto         blobs = std::make_shared<RamBlobStore>();
  OfflineQueue queue(blobs, std::make_shared<MemoryRepository>());

  auto report = queue.Enqueue(Document("daily.txt", "Wet diaper 10:00"));
  assert(report.ok());

  auto failed = queue.Retry(report->id, Unavailable);
  assert(failed.status().code == StatusCode::kUnavailable);
  assert(queue.List()->size() == 1);
  assert(blobs->Exists(report->source_reference));

  auto succeeded = queue.Retry(report->id, Succeeds);
  assert(succeeded.ok());
  assert(succeeded->size() == 2);
  assert(queue.List()->empty());
  assert(!blobs->Exists(report->source_reference));

  assert(queue.Retry(report->id, Succeeds).status().code == StatusCode::kNotFound);
}

void TestRetryWithMissingBytesKeepsMetadata() {
  auto         blobs = std::make_shared<RamBlobStore>();
  OfflineQueue queue(blobs, std::make_shared<MemoryRepository>());

  auto report = queue.Enqueue(Document("daily.txt", "Nap"));
  blobs->Remove(report->source_reference);

  assert(queue.Retry(report->id, Succeeds).status().code == StatusCode::kStorageError);
  assert(queue.Get(report->id).ok());
}

void TestDiscard() {
  auto         blobs = std::make_shared<RamBlobStore>();
  OfflineQueue queue(blobs, std::make_shared<MemoryRepository>());

  auto report = queue.Enqueue(Document("daily.txt", "Nap"));
  assert(queue.Discard(report->id).ok());
  assert(queue.List()->empty());
  assert(!blobs->Exists(report->source_reference));
  assert(queue.Discard(report->id).code == StatusCode::kNotFound);
}

void TestFailedMetadataWriteLeavesNothingBehind() {
  auto         blobs = std::make_shared<RamBlobStore>();
  OfflineQueue queue(blobs, std::make_shared<FailingInsertRepository>());

  auto report = queue.Enqueue(Document("daily.txt", "Nap"));
  assert(report.status().code == StatusCode::kStorageError);
  assert(report.status().message.find("disk full") != std::string::npos);
  assert(blobs->List("report-").empty());
  assert(queue.TrackedReportCount() == 0);
}

void TestOrphanedBlobsAreRemoved() {
  auto         blobs = std::make_shared<RamBlobStore>();
  OfflineQueue queue(blobs, std::make_shared<MemoryRepository>());

  auto kept = queue.Enqueue(Document("daily.txt", "Nap"));
  blobs->Write("report-orphan", BufferFromString("half written"), false);
  blobs->Write("unrelated", BufferFromString("x"), false);

  auto removed = queue.RemoveOrphanedBlobs();
  assert(removed.ok() && *removed == 1);
  assert(!blobs->Exists("report-orphan"));
  assert(blobs->Exists("unrelated"));
  assert(blobs->Exists(kept->source_reference));
}

void TestSameIdIsSerialized() {
  auto         blobs = std::make_shared<RamBlobStore>();
  OfflineQueue queue(blobs, std::make_shared<MemoryRepository>());

  auto report = queue.Enqueue(Document("daily.txt", "Nap"));
  auto other  = queue.Enqueue(Document("other.txt", "Bottle"));

  std::promise<void> release;
  auto               released = release.get_future().share();
  std::atomic<bool>  entered{false};

  std::thread retrying([&]() {
    auto result = queue.Retry(report->id, [&](const SourceDocument& document) {
      entered = true;
      released.wait();
      return Succeeds(document);
    });
    assert(result.ok());
  });

  while (!entered) std::this_thread::sleep_for(1ms);

  // a different id is not blocked by the running retry
  assert(queue.Discard(other->id).ok());

  auto discard = std::async(std::launch::async, [&]() { return queue.Discard(report->id); });
  assert(discard.wait_for(50ms) == std::future_status::timeout);

  release.set_value();
  retrying.join();
  assert(discard.get().code == StatusCode::kNotFound);
  assert(queue.List()->empty());
}

#if CARELOG_DB_SQLITE
void TestLockEntriesEndWithTheReport() {
  auto         blobs = std::make_shared<RamBlobStore>();
  OfflineQueue queue(blobs, std::make_shared<MemoryRepository>());

  auto retried   = queue.Enqueue(Document("retried.txt", "Bottle 4oz 9:15"));
  auto discarded = queue.Enqueue(Document("discarded.txt", "Nap 13:00-14:00"));
  auto kept      = queue.Enqueue(Document("kept.txt", "Wet diaper 10:00"));
  assert(retried.ok() && discarded.ok() && kept.ok());
  assert(queue.TrackedReportCount() == 3);

  // a failed retry keeps the report, and its entry
  assert(!queue.Retry(retried->id, Unavailable).ok());
  assert(queue.TrackedReportCount() == 3);

  assert(queue.Retry(retried->id, Succeeds).ok());
  assert(queue.Discard(discarded->id).ok());
  assert(queue.TrackedReportCount() == 1);

  // lookups of unknown or finished ids leave nothing behind
  assert(queue.Get("never-queued").status().code == StatusCode::kNotFound);
  assert(queue.Load(retried->id).status().code == StatusCode::kNotFound);
  assert(queue.Discard(discarded->id).code == StatusCode::kNotFound);
  assert(queue.TrackedReportCount() == 1);

  assert(queue.Get(kept->id).ok());
}

void TestReportSurvivesRestart() {
  const auto root    = std::filesystem::temp_directory_path() / ("carelog_queue_restart_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
  const auto db_path = (root / "carelog.db").string();
  std::filesystem::create_directories(root);

  auto open = [&]() {
    auto db = std::make_shared<carelog::db::sqlite::SqliteDB>(db_path);
    carelog::db::sqlite::BootstrapSchema(*db);
    return std::make_unique<OfflineQueue>(std::make_shared<carelog::storage::DiskBlobStore>(root / "pending"),
                                          std::make_shared<carelog::db::sqlite::SqliteRepository>(db));
  };

  std::string id;
  {
    auto queue  = open();
    auto report = queue->Enqueue(Document("scan.txt", "7:00 PM nap"));
    assert(report.ok());
    id = report->id;
  }

  {
    auto queue  = open();
    auto listed = queue->List();
    assert(listed.ok() && listed->size() == 1);
    assert((*listed)[0].id == id);
    assert((*listed)[0].source_name == "scan.txt");

    auto loaded = queue->Load(id);
    assert(loaded.ok() && AsStringView(*loaded->bytes) == "7:00 PM nap");

    assert(queue->Retry(id, Succeeds).ok());
  }

  {
    auto queue = open();
    assert(queue->List()->empty());
  }

  std::filesystem::remove_all(root);
}
#endif

} // namespace

int main() {
  TestEnqueueListLoad();
  TestRetryKeepsReportUntilSuccess();
  TestRetryWithMissingBytesKeepsMetadata();
  TestDiscard();
  TestFailedMetadataWriteLeavesNothingBehind();
  TestOrphanedBlobsAreRemoved();
  TestSameIdIsSerialized();
  TestLockEntriesEndWithTheReport();
#if CARELOG_DB_SQLITE
  TestReportSurvivesRestart();
#endif

  std::cout << "carelog_unit_offline_queue: pass\n";
  return 0;
}
