#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "carelog/v1.hpp"
#include "internal/model/candidate_event.hpp"
#include "internal/util/status.hpp"
#include "internal/util/time.hpp"

namespace carelog::extraction {

struct DroppedEntry {
  std::size_t index = 0;
  std::string reason;
};

struct ParsedExtraction {
  std::vector<model::CandidateEvent> candidates;
  std::vector<DroppedEntry>          dropped;
};

/*
  Turns raw model output into validated candidates.

  Output may be wrapped in a Markdown code fence and may be either a JSON
  array of events or an object with an "events" array. Field values are read
  tolerantly (numbers where strings were asked for, camelCase or snake_case
  keys); entries that cannot yield a start time are dropped and reported.

  kMalformedResponse when the output is not JSON of that shape, or when a
  non-empty list produced no usable entry. An empty list is success with no
  candidates.
*/
util::StatusOr<ParsedExtraction> ParseModelOutput(std::string_view model_output, util::Day reference_day);

// Content of the first Markdown code fence, trimmed; the whole text when
// there is no fence.
std::string StripCodeFences(std::string_view text);

model::EventKind KindFromExtractedType(std::string_view type);

// Validation of one decoded entry; kInvalidArgument when it must be dropped.
util::StatusOr<model::CandidateEvent> ToCandidate(const v1::ExtractedEvent& event, util::Day reference_day);

} // namespace carelog::extraction
