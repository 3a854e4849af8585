#include "review_session.hpp"

#include <algorithm>

namespace carelog::review {

using model::CandidateEvent;
using model::EventKind;
using model::ReviewState;
using util::Status;
using util::StatusCode;

namespace {

Status NotFound(const std::string& id) {
  return Status::Err(StatusCode::kNotFound, "no candidate " + id + " in session");
}

} // namespace

util::StatusOr<ReviewState> Transition(const CandidateEvent& event, ReviewAction action) {
  switch (action) {
    case ReviewAction::kEdit:
      if (!model::CanTransition(event.review_state, ReviewState::kEdited)) {
        return Status::Err(StatusCode::kInvalidState, "candidate " + event.id + " is " +
                                                          std::string(model::ToString(event.review_state)) +
                                                          " and can no longer be edited");
      }
      return ReviewState::kEdited;

    case ReviewAction::kConfirm:
      if (!model::IsComplete(event)) {
        return Status::Err(StatusCode::kInvalidState, "sleep candidate " + event.id + " needs an end time");
      }
      return ReviewState::kConfirmed;

    case ReviewAction::kReject:
      return ReviewState::kRejected;
  }
  return Status::Err(StatusCode::kInternal, "unknown review action");
}

ReviewSession::ReviewSession(std::vector<CandidateEvent> candidates) : candidates_(std::move(candidates)) {
}

const CandidateEvent* ReviewSession::Find(const std::string& id) const {
  auto it = std::find_if(candidates_.begin(), candidates_.end(), [&](const auto& c) { return c.id == id; });
  return it == candidates_.end() ? nullptr : &*it;
}

CandidateEvent* ReviewSession::FindMutable(const std::string& id) {
  auto it = std::find_if(candidates_.begin(), candidates_.end(), [&](const auto& c) { return c.id == id; });
  return it == candidates_.end() ? nullptr : &*it;
}

template <typename Mutation>
Status ReviewSession::Edit(const std::string& id, Mutation&& mutation) {
  auto* event = FindMutable(id);
  if (!event) return NotFound(id);

  auto next = Transition(*event, ReviewAction::kEdit);
  if (!next.ok()) return next.status();

  CandidateEvent draft = *event;
  if (auto status = mutation(draft); !status.ok()) return status;

  if (!model::HasValidInterval(draft)) {
    return Status::Err(StatusCode::kInvalidArgument, "end time must be after start time");
  }

  draft.review_state = *next;
  *event             = std::move(draft);
  return Status::Ok();
}

// ------------------------------------------------------------
// Field edits
// ------------------------------------------------------------

Status ReviewSession::SetKind(const std::string& id, EventKind kind) {
  return Edit(id, [kind](CandidateEvent& e) {
    e.kind = kind;
    if (!model::HasInterval(kind)) e.end_time.reset();
    if (kind != EventKind::kDiaper) {
      e.wet   = false;
      e.dirty = false;
    }
    return Status::Ok();
  });
}

Status ReviewSession::SetStartTime(const std::string& id, util::TimePoint start) {
  return Edit(id, [start](CandidateEvent& e) {
    e.start_time = start;
    return Status::Ok();
  });
}

Status ReviewSession::SetEndTime(const std::string& id, std::optional<util::TimePoint> end) {
  return Edit(id, [end](CandidateEvent& e) {
    if (end && !model::HasInterval(e.kind)) {
      return Status::Err(StatusCode::kInvalidArgument,
                         std::string(model::ToString(e.kind)) + " events have no end time");
    }
    e.end_time = end;
    return Status::Ok();
  });
}

Status ReviewSession::SetQuantityText(const std::string& id, std::optional<std::string> quantity) {
  return Edit(id, [quantity = std::move(quantity)](CandidateEvent& e) mutable {
    if (quantity && quantity->find_first_not_of(" \t") == std::string::npos) quantity.reset();
    e.quantity_text = std::move(quantity);
    return Status::Ok();
  });
}

Status ReviewSession::SetDetails(const std::string& id, std::string details) {
  return Edit(id, [details = std::move(details)](CandidateEvent& e) mutable {
    e.details = std::move(details);
    return Status::Ok();
  });
}

Status ReviewSession::SetDiaperFlags(const std::string& id, bool wet, bool dirty) {
  return Edit(id, [wet, dirty](CandidateEvent& e) {
    if (e.kind != EventKind::kDiaper) {
      return Status::Err(StatusCode::kInvalidArgument, "wet/dirty only apply to diaper events");
    }
    e.wet   = wet;
    e.dirty = dirty;
    return Status::Ok();
  });
}

Status ReviewSession::Remove(const std::string& id) {
  auto it = std::find_if(candidates_.begin(), candidates_.end(), [&](const auto& c) { return c.id == id; });
  if (it == candidates_.end()) return NotFound(id);
  candidates_.erase(it);
  return Status::Ok();
}

// ------------------------------------------------------------
// Resolution
// ------------------------------------------------------------

Status ReviewSession::Resolve(const std::string& id, ReviewAction action) {
  auto* event = FindMutable(id);
  if (!event) return NotFound(id);

  auto next = Transition(*event, action);
  if (!next.ok()) return next.status();

  event->review_state = *next;
  return Status::Ok();
}

Status ReviewSession::Confirm(const std::string& id) {
  return Resolve(id, ReviewAction::kConfirm);
}

Status ReviewSession::Reject(const std::string& id) {
  return Resolve(id, ReviewAction::kReject);
}

Status ReviewSession::ConfirmAll() {
  std::string incomplete;
  for (const auto& event : candidates_) {
    if (event.review_state == ReviewState::kRejected) continue;
    if (!Transition(event, ReviewAction::kConfirm).ok()) {
      if (!incomplete.empty()) incomplete += ", ";
      incomplete += event.id;
    }
  }
  if (!incomplete.empty()) {
    return Status::Err(StatusCode::kInvalidState, "sleep candidates need an end time: " + incomplete);
  }

  for (auto& event : candidates_) {
    if (event.review_state != ReviewState::kRejected) event.review_state = ReviewState::kConfirmed;
  }
  return Status::Ok();
}

void ReviewSession::RejectAll() {
  for (auto& event : candidates_) {
    event.review_state = ReviewState::kRejected;
  }
}

void ReviewSession::Reannotate(const dedupe::DuplicateDetector&          detector,
                               const std::vector<model::ExistingRecord>& history) {
  for (auto& event : candidates_) {
    detector.Annotate(event, history);
  }
}

std::vector<CandidateEvent> ReviewSession::ConfirmedBatch() const {
  std::vector<CandidateEvent> batch;
  for (const auto& event : candidates_) {
    if (event.review_state == ReviewState::kConfirmed) batch.push_back(event);
  }
  return batch;
}

ReviewSummary ReviewSession::Summary() const {
  ReviewSummary summary;
  for (const auto& event : candidates_) {
    switch (event.review_state) {
      case ReviewState::kDetected:
        ++summary.detected;
        break;
      case ReviewState::kEdited:
        ++summary.edited;
        break;
      case ReviewState::kConfirmed:
        ++summary.confirmed;
        break;
      case ReviewState::kRejected:
        ++summary.rejected;
        break;
    }
    if (event.duplicate_flag) ++summary.duplicates;
  }
  return summary;
}

} // namespace carelog::review
