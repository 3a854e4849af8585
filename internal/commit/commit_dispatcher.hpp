#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/model/candidate_event.hpp"
#include "internal/store/domain_store.hpp"
#include "internal/util/status.hpp"

namespace carelog::commit {

struct CommitItemResult {
  std::string                           candidate_id;
  model::EventKind                      kind = model::EventKind::kOther;
  util::Status                          status;
  std::optional<store::RecordReference> reference;

  bool ok() const {
    return status.ok();
  }
};

struct CommitResult {
  std::vector<CommitItemResult> items;

  std::size_t SucceededCount() const;
  bool        AllSucceeded() const;
  bool        AnyTransientFailure() const;

  // Ids to re-offer for another commit attempt.
  std::vector<std::string> FailedIds() const;
};

/*
  Routes confirmed candidates to their domain store.

  sleep            -> SleepRecord (end time required)
  feed             -> BottleFeedRecord when the quantity is a volume,
                      otherwise NursingRecord (duration in minutes, 0 if none)
  diaper           -> DiaperRecord: both / dirty / otherwise wet
  activity, other  -> ActivityRecord with details and raw quantity text

  Items are independent: every candidate gets its own result and a failure
  never stops or undoes another item.
*/
class CommitDispatcher {
 public:
  explicit CommitDispatcher(store::DomainStoreMap stores);

  CommitResult Commit(const std::vector<model::CandidateEvent>& confirmed);

  // Pure mapping. kInvalidState for a candidate that is not confirmed,
  // kInvalidArgument for one that fails validation.
  static util::StatusOr<store::DomainRecord> Route(const model::CandidateEvent& candidate);

 private:
  CommitItemResult CommitOne(const model::CandidateEvent& candidate);

  store::DomainStoreMap stores_;
};

} // namespace carelog::commit
