#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/dedupe/duplicate_detector.hpp"
#include "internal/model/candidate_event.hpp"
#include "internal/model/existing_record.hpp"
#include "internal/util/status.hpp"

namespace carelog::review {

enum class ReviewAction : std::uint8_t {
  kEdit = 0,
  kConfirm = 1,
  kReject = 2,
};

/*
  Explicit transition function. Returns the state the event moves to, or
  kInvalidState when the action is not allowed:
    - editing a confirmed or rejected event
    - confirming an incomplete sleep (no end time)
*/
util::StatusOr<model::ReviewState> Transition(const model::CandidateEvent& event, ReviewAction action);

struct ReviewSummary {
  std::size_t detected   = 0;
  std::size_t edited     = 0;
  std::size_t confirmed  = 0;
  std::size_t rejected   = 0;
  std::size_t duplicates = 0;
};

/*
  Session-scoped candidate list under user review.

  Every mutation goes through Transition() and is applied to a copy first, so
  a refused edit leaves the candidate exactly as it was. Not thread-safe; a
  session belongs to one interactive workflow.
*/
class ReviewSession {
 public:
  ReviewSession() = default;
  explicit ReviewSession(std::vector<model::CandidateEvent> candidates);

  const std::vector<model::CandidateEvent>& Candidates() const {
    return candidates_;
  }

  std::size_t Size() const {
    return candidates_.size();
  }

  const model::CandidateEvent* Find(const std::string& id) const;

  // ----- field edits (detected -> edited) -----
  // Changing kind away from sleep drops the end time; away from diaper drops
  // the wet/dirty flags.
  util::Status SetKind(const std::string& id, model::EventKind kind);
  util::Status SetStartTime(const std::string& id, util::TimePoint start);
  util::Status SetEndTime(const std::string& id, std::optional<util::TimePoint> end);
  util::Status SetQuantityText(const std::string& id, std::optional<std::string> quantity);
  util::Status SetDetails(const std::string& id, std::string details);
  util::Status SetDiaperFlags(const std::string& id, bool wet, bool dirty);

  util::Status Remove(const std::string& id);

  // ----- resolution -----
  util::Status Confirm(const std::string& id);
  util::Status Reject(const std::string& id);

  // All non-rejected -> confirmed, or nothing changes.
  util::Status ConfirmAll();
  void         RejectAll();

  void Reannotate(const dedupe::DuplicateDetector& detector, const std::vector<model::ExistingRecord>& history);

  // The only events a commit may see.
  std::vector<model::CandidateEvent> ConfirmedBatch() const;

  ReviewSummary Summary() const;

 private:
  template <typename Mutation>
  util::Status Edit(const std::string& id, Mutation&& mutation);

  util::Status Resolve(const std::string& id, ReviewAction action);

  model::CandidateEvent* FindMutable(const std::string& id);

  std::vector<model::CandidateEvent> candidates_;
};

} // namespace carelog::review
