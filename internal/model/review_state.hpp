#pragma once

#include <cstdint>
#include <string_view>

namespace carelog::model {

enum class ReviewState : std::uint8_t {
  kDetected = 0,
  kEdited = 1,
  kConfirmed = 2,
  kRejected = 3,
};

constexpr bool IsResolved(ReviewState state) {
  return state == ReviewState::kConfirmed || state == ReviewState::kRejected;
}

/*
  detected -> edited -> confirmed
  detected | edited | rejected -> confirmed
  any -> rejected

  Resolved events are not reopened for editing, and nothing returns to
  detected.
*/
constexpr bool CanTransition(ReviewState from, ReviewState to) {
  if (from == to) {
    return true;
  }
  switch (to) {
    case ReviewState::kDetected:
      return false;
    case ReviewState::kEdited:
      return from == ReviewState::kDetected;
    case ReviewState::kConfirmed:
    case ReviewState::kRejected:
      return true;
  }
  return false;
}

constexpr std::string_view ToString(ReviewState state) {
  switch (state) {
    case ReviewState::kDetected:
      return "detected";
    case ReviewState::kEdited:
      return "edited";
    case ReviewState::kConfirmed:
      return "confirmed";
    case ReviewState::kRejected:
    default:
      return "rejected";
  }
}

}  // namespace carelog::model
