#include "commit_dispatcher.hpp"

#include <algorithm>

#include "internal/normalize/field_normalizer.hpp"
#include "internal/observability/logging.hpp"

namespace carelog::commit {

using model::CandidateEvent;
using model::EventKind;
using observability::StringField;
using util::Status;
using util::StatusCode;

std::size_t CommitResult::SucceededCount() const {
  return static_cast<std::size_t>(std::count_if(items.begin(), items.end(), [](const auto& i) { return i.ok(); }));
}

bool CommitResult::AllSucceeded() const {
  return SucceededCount() == items.size();
}

bool CommitResult::AnyTransientFailure() const {
  return std::any_of(items.begin(), items.end(), [](const auto& i) { return i.status.IsTransient(); });
}

std::vector<std::string> CommitResult::FailedIds() const {
  std::vector<std::string> ids;
  for (const auto& item : items) {
    if (!item.ok()) ids.push_back(item.candidate_id);
  }
  return ids;
}

CommitDispatcher::CommitDispatcher(store::DomainStoreMap stores) : stores_(std::move(stores)) {
}

util::StatusOr<store::DomainRecord> CommitDispatcher::Route(const CandidateEvent& candidate) {
  if (candidate.review_state != model::ReviewState::kConfirmed) {
    return Status::Err(StatusCode::kInvalidState, "candidate is " + std::string(model::ToString(candidate.review_state)) +
                                                      ", only confirmed events are committed");
  }
  if (!model::HasValidInterval(candidate)) {
    return Status::Err(StatusCode::kInvalidArgument, "end time is not after start time");
  }

  switch (candidate.kind) {
    case EventKind::kSleep: {
      if (!candidate.end_time) {
        return Status::Err(StatusCode::kInvalidArgument, "sleep needs an end time");
      }
      return store::DomainRecord{store::SleepRecord{candidate.start_time, *candidate.end_time, store::SleepQuality::kFair}};
    }

    case EventKind::kFeed: {
      const auto quantity = normalize::Normalize(candidate.quantity_text);
      if (model::IsVolume(quantity.unit)) {
        store::BottleFeedRecord bottle;
        bottle.time      = candidate.start_time;
        bottle.amount    = quantity.amount;
        bottle.unit      = quantity.unit;
        bottle.feed_type = store::FeedType::kFormula;
        bottle.notes     = candidate.details;
        return store::DomainRecord{bottle};
      }
      store::NursingRecord nursing;
      nursing.time             = candidate.start_time;
      nursing.duration_minutes = model::DurationMinutes(quantity);
      nursing.side             = store::NursingSide::kUnknown;
      nursing.notes            = candidate.details;
      return store::DomainRecord{nursing};
    }

    case EventKind::kDiaper: {
      store::DiaperType type = store::DiaperType::kWet;
      if (candidate.wet && candidate.dirty) {
        type = store::DiaperType::kBoth;
      } else if (candidate.dirty) {
        type = store::DiaperType::kDirty;
      }
      return store::DomainRecord{store::DiaperRecord{candidate.start_time, type}};
    }

    case EventKind::kActivity:
    case EventKind::kOther: {
      store::ActivityRecord activity;
      activity.time          = candidate.start_time;
      activity.activity_type = std::string(model::ToString(candidate.kind));
      activity.description   = candidate.details;
      activity.notes         = candidate.quantity_text;
      return store::DomainRecord{activity};
    }
  }
  return Status::Err(StatusCode::kInternal, "unknown event kind");
}

CommitItemResult CommitDispatcher::CommitOne(const CandidateEvent& candidate) {
  CommitItemResult item;
  item.candidate_id = candidate.id;
  item.kind         = candidate.kind;

  auto record = Route(candidate);
  if (!record.ok()) {
    item.status = record.status();
    return item;
  }

  const auto target = store::KindOf(*record);
  auto       it     = stores_.find(target);
  if (it == stores_.end() || !it->second) {
    item.status = Status::Err(StatusCode::kInvalidState, "no " + std::string(model::ToString(target)) + " store configured");
    return item;
  }

  try {
    auto reference = it->second->Append(*record);
    if (reference.ok()) {
      item.reference = *reference;
    } else {
      item.status = reference.status();
    }
  } catch (const std::exception& e) {
    item.status = util::ToStatus(e);
  }
  return item;
}

CommitResult CommitDispatcher::Commit(const std::vector<CandidateEvent>& confirmed) {
  CommitResult result;
  result.items.reserve(confirmed.size());

  for (const auto& candidate : confirmed) {
    auto item = CommitOne(candidate);
    if (!item.ok()) {
      CARELOG_LOG_WARN("commit failed for candidate",
                       {StringField("candidate_id", item.candidate_id), StringField("kind", model::ToString(item.kind)),
                        StringField("code", util::StatusCodeName(item.status.code)), StringField("error", item.status.message)});
    }
    result.items.push_back(std::move(item));
  }

  CARELOG_LOG_INFO("commit finished", {observability::IntField("committed", static_cast<int64_t>(result.SucceededCount())),
                                       observability::IntField("failed", static_cast<int64_t>(result.items.size() - result.SucceededCount()))});
  return result;
}

} // namespace carelog::commit
