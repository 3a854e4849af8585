#include "prompt.hpp"

namespace carelog::extraction {

const std::string& ExtractionInstructions() {
  static const std::string kInstructions = R"(You are reading a daycare daily report.
Extract every caregiving event from the text and return a JSON array, nothing else.
Times in the text refer to the reference date unless the text says otherwise.

Each element:
  "type":      one of "sleep", "bottle", "nursing", "solid", "feed", "diaper", "activity", "other"
  "startTime": "HH:mm", 24-hour clock; best guess when implied
  "endTime":   "HH:mm" or null; only for sleep
  "quantity":  string or null, e.g. "5 oz", "1 jar", "15 mins"
  "details":   short description, e.g. "Ate all the chicken"
  "isWet":     true/false for diapers, otherwise null
  "isDirty":   true/false for diapers, otherwise null

Example:
[
  {"type": "diaper", "startTime": "10:30", "endTime": null, "quantity": null,
   "details": "Mixed", "isWet": true, "isDirty": true}
])";
  return kInstructions;
}

} // namespace carelog::extraction
