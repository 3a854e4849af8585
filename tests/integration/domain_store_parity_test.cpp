#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>

#include "internal/store/domain_store.hpp"
#include "internal/store/memory_domain_store.hpp"

#if CARELOG_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/store/sqlite_domain_store.hpp"
#endif

namespace {

using namespace std::chrono_literals;

using carelog::model::EventKind;
using carelog::model::TimeRange;
using carelog::store::ActivityRecord;
using carelog::store::BottleFeedRecord;
using carelog::store::DiaperRecord;
using carelog::store::DiaperType;
using carelog::store::DomainStoreMap;
using carelog::store::NursingRecord;
using carelog::store::SleepRecord;
using carelog::util::StatusCode;
using carelog::util::TimePoint;

const carelog::util::Day kDay{std::chrono::year{2026} / 3 / 14};

TimePoint T(std::chrono::minutes since_midnight) {
  return carelog::util::At(kDay, since_midnight);
}

TimeRange Evening() {
  return TimeRange{T(18h), T(23h)};
}

struct StoreBackend {
  std::string                     name;
  std::function<DomainStoreMap()> open;
  bool                            persistent = false;
  std::function<void()>           cleanup;
};

void VerifyAppendAndQuery(DomainStoreMap& stores) {
  auto sleep = stores.at(EventKind::kSleep)->Append(SleepRecord{T(19h), T(20h + 30min)});
  assert(sleep.ok());
  assert(sleep->table == "sleep_log");

  auto& feed = stores.at(EventKind::kFeed);
  BottleFeedRecord bottle;
  bottle.time   = T(21h + 15min);
  bottle.amount = 4.0;
  assert(feed->Append(bottle).ok());
  NursingRecord nursing;
  nursing.time             = T(22h + 30min);
  nursing.duration_minutes = 15.0;
  assert(feed->Append(nursing).ok());
  // outside the evening range
  bottle.time = T(6h);
  assert(feed->Append(bottle).ok());

  auto sleeps = stores.at(EventKind::kSleep)->Query(Evening());
  assert(sleeps.ok());
  assert(sleeps->size() == 1);
  assert((*sleeps)[0].reference == sleep->ToString());
  assert((*sleeps)[0].kind == EventKind::kSleep);
  assert((*sleeps)[0].end_time == T(20h + 30min));

  // both feed tables answer for the feed kind
  auto feeds = feed->Query(Evening());
  assert(feeds.ok());
  assert(feeds->size() == 2);
  for (const auto& record : *feeds) {
    assert(record.kind == EventKind::kFeed);
    assert(record.quantity.has_value());
    assert(!record.end_time.has_value());
  }
}

void VerifyRangeIsHalfOpen(DomainStoreMap& stores) {
  auto& diapers = stores.at(EventKind::kDiaper);
  assert(diapers->Append(DiaperRecord{T(23h), DiaperType::kDirty}).ok());
  assert(diapers->Append(DiaperRecord{T(18h), DiaperType::kWet}).ok());

  auto found = diapers->Query(Evening());
  assert(found.ok());
  assert(found->size() == 1);
  assert(found->front().start_time == T(18h));
}

void VerifyWrongKindIsRefused(DomainStoreMap& stores) {
  auto refused = stores.at(EventKind::kDiaper)->Append(SleepRecord{T(13h), T(14h)});
  assert(!refused.ok());
  assert(refused.status().code == StatusCode::kInvalidArgument);

  ActivityRecord activity;
  activity.time          = T(20h);
  activity.activity_type = "other";
  activity.description   = "Happy all evening";
  assert(stores.at(EventKind::kActivity)->Append(activity).ok());
  assert(stores.at(EventKind::kActivity)->Query(Evening())->size() == 1);
}

void VerifyRecordsSurviveReopen(StoreBackend& backend) {
  if (!backend.persistent) return;

  auto reopened = backend.open();
  auto sleeps   = reopened.at(EventKind::kSleep)->Query(Evening());
  assert(sleeps.ok());
  assert(sleeps->size() == 1);
  assert(reopened.at(EventKind::kFeed)->Query(Evening())->size() == 2);
}

void RunStoreSuite(StoreBackend& backend) {
  std::cout << "running domain store suite: " << backend.name << "\n";
  {
    auto stores = backend.open();
    VerifyAppendAndQuery(stores);
    VerifyRangeIsHalfOpen(stores);
    VerifyWrongKindIsRefused(stores);
  }
  VerifyRecordsSurviveReopen(backend);
  backend.cleanup();
}

StoreBackend MakeMemoryBackend() {
  return StoreBackend{
      .name       = "memory",
      .open       = []() { return carelog::store::MakeMemoryDomainStores(); },
      .persistent = false,
      .cleanup    = []() {},
  };
}

#if CARELOG_DB_SQLITE
StoreBackend MakeSqliteBackend() {
  const auto stamp   = std::chrono::steady_clock::now().time_since_epoch().count();
  const auto db_path = (std::filesystem::temp_directory_path() / ("carelog_domain_stores_" + std::to_string(stamp) + ".db")).string();

  return StoreBackend{
      .name = "sqlite",
      .open =
          [db_path]() {
            auto db = std::make_shared<carelog::db::sqlite::SqliteDB>(db_path);
            carelog::db::sqlite::BootstrapSchema(*db);
            return carelog::store::MakeSqliteDomainStores(db);
          },
      .persistent = true,
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
  };
}
#endif

} // namespace

int main() {
  auto memory = MakeMemoryBackend();
  RunStoreSuite(memory);

#if CARELOG_DB_SQLITE
  auto sqlite = MakeSqliteBackend();
  RunStoreSuite(sqlite);
#endif

  std::cout << "carelog_integration_domain_store_parity: pass\n";
  return 0;
}
