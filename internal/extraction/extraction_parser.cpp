#include "extraction_parser.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <initializer_list>
#include <optional>

#include "internal/observability/logging.hpp"
#include "internal/util/uuid.hpp"

namespace carelog::extraction {

using google::protobuf::Struct;
using google::protobuf::Value;
using model::CandidateEvent;
using model::EventKind;
using observability::IntField;
using observability::StringField;
using util::Status;
using util::StatusCode;

namespace {

std::string Trim(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
  return std::string(text);
}

std::string Lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

const Value* Field(const Struct& object, std::initializer_list<const char*> names) {
  for (const char* name : names) {
    auto it = object.fields().find(name);
    if (it != object.fields().end() && it->second.kind_case() != Value::kNullValue) return &it->second;
  }
  return nullptr;
}

std::optional<std::string> StringOf(const Value* value) {
  if (!value) return std::nullopt;
  switch (value->kind_case()) {
    case Value::kStringValue:
      return value->string_value();
    case Value::kNumberValue: {
      const double n = value->number_value();
      char         buf[32];
      if (std::floor(n) == n && std::fabs(n) < 1e15) {
        std::snprintf(buf, sizeof(buf), "%.0f", n);
      } else {
        std::snprintf(buf, sizeof(buf), "%g", n);
      }
      return std::string(buf);
    }
    case Value::kBoolValue:
      return std::string(value->bool_value() ? "true" : "false");
    default:
      return std::nullopt;
  }
}

std::optional<bool> BoolOf(const Value* value) {
  if (!value) return std::nullopt;
  switch (value->kind_case()) {
    case Value::kBoolValue:
      return value->bool_value();
    case Value::kNumberValue:
      return value->number_value() != 0.0;
    case Value::kStringValue: {
      const auto s = Lower(Trim(value->string_value()));
      if (s == "true" || s == "yes") return true;
      if (s == "false" || s == "no") return false;
      return std::nullopt;
    }
    default:
      return std::nullopt;
  }
}

std::optional<v1::ExtractedEvent> DecodeEntry(const Value& entry) {
  if (entry.kind_case() != Value::kStructValue) return std::nullopt;
  const auto& object = entry.struct_value();

  v1::ExtractedEvent event;
  event.set_type(StringOf(Field(object, {"type", "kind"})).value_or(""));
  if (auto start = StringOf(Field(object, {"startTime", "start_time", "time"}))) event.set_start_time(*start);
  if (auto end = StringOf(Field(object, {"endTime", "end_time"}))) event.set_end_time(*end);
  if (auto quantity = StringOf(Field(object, {"quantity", "amount"}))) event.set_quantity(*quantity);
  event.set_details(StringOf(Field(object, {"details", "notes", "description"})).value_or(""));
  if (auto wet = BoolOf(Field(object, {"isWet", "is_wet", "wet"}))) event.set_is_wet(*wet);
  if (auto dirty = BoolOf(Field(object, {"isDirty", "is_dirty", "dirty"}))) event.set_is_dirty(*dirty);
  return event;
}

} // namespace

std::string StripCodeFences(std::string_view text) {
  const auto open = text.find("```");
  if (open == std::string_view::npos) return Trim(text);

  auto start = open + 3;
  // language tag, e.g. ```json
  while (start < text.size() && std::isalpha(static_cast<unsigned char>(text[start]))) ++start;

  const auto close = text.find("```", start);
  return Trim(text.substr(start, close == std::string_view::npos ? std::string_view::npos : close - start));
}

EventKind KindFromExtractedType(std::string_view type) {
  const auto t = Lower(Trim(type));
  if (t == "sleep" || t == "nap") return EventKind::kSleep;
  if (t == "feed" || t == "bottle" || t == "nursing" || t == "solid") return EventKind::kFeed;
  if (t == "diaper") return EventKind::kDiaper;
  if (t == "activity") return EventKind::kActivity;
  return EventKind::kOther;
}

util::StatusOr<CandidateEvent> ToCandidate(const v1::ExtractedEvent& event, util::Day reference_day) {
  const auto start_minutes = util::ParseClockTime(event.start_time());
  if (!start_minutes) {
    return Status::Err(StatusCode::kInvalidArgument, event.start_time().empty()
                                                         ? "missing start time"
                                                         : "unusable start time '" + event.start_time() + "'");
  }

  CandidateEvent candidate;
  candidate.id         = util::NewId();
  candidate.kind       = KindFromExtractedType(event.type());
  candidate.start_time = util::At(reference_day, *start_minutes);
  candidate.details    = Trim(event.details());

  if (candidate.kind == EventKind::kSleep && event.has_end_time()) {
    if (auto end_minutes = util::ParseClockTime(event.end_time())) {
      auto end = util::At(reference_day, *end_minutes);
      // a nap that ends "earlier" ran past midnight
      if (end < candidate.start_time) end += std::chrono::days(1);
      if (end > candidate.start_time) candidate.end_time = end;
    }
  }

  if (event.has_quantity()) {
    auto quantity = Trim(event.quantity());
    if (!quantity.empty()) candidate.quantity_text = std::move(quantity);
  }

  if (candidate.kind == EventKind::kDiaper) {
    candidate.wet   = event.has_is_wet() && event.is_wet();
    candidate.dirty = event.has_is_dirty() && event.is_dirty();
  }

  candidate.review_state = model::ReviewState::kDetected;
  return candidate;
}

util::StatusOr<ParsedExtraction> ParseModelOutput(std::string_view model_output, util::Day reference_day) {
  const auto json = StripCodeFences(model_output);
  if (json.empty()) {
    return Status::Err(StatusCode::kMalformedResponse, "extraction returned no content");
  }

  Value root;
  auto  status = google::protobuf::util::JsonStringToMessage(json, &root);
  if (!status.ok()) {
    return Status::Err(StatusCode::kMalformedResponse, "extraction output is not JSON: " + std::string(status.message()));
  }

  const google::protobuf::ListValue* entries = nullptr;
  if (root.kind_case() == Value::kListValue) {
    entries = &root.list_value();
  } else if (root.kind_case() == Value::kStructValue) {
    const auto* events = Field(root.struct_value(), {"events"});
    if (events && events->kind_case() == Value::kListValue) entries = &events->list_value();
  }
  if (!entries) {
    return Status::Err(StatusCode::kMalformedResponse, "extraction output is not a list of events");
  }

  ParsedExtraction parsed;
  for (int i = 0; i < entries->values_size(); ++i) {
    const auto index = static_cast<std::size_t>(i);

    auto decoded = DecodeEntry(entries->values(i));
    if (!decoded) {
      parsed.dropped.push_back({index, "entry is not an object"});
      continue;
    }

    auto candidate = ToCandidate(*decoded, reference_day);
    if (!candidate.ok()) {
      parsed.dropped.push_back({index, candidate.status().message});
      continue;
    }
    parsed.candidates.push_back(std::move(candidate).value());
  }

  for (const auto& dropped : parsed.dropped) {
    CARELOG_LOG_WARN("dropped extracted entry", {IntField("index", static_cast<int64_t>(dropped.index)), StringField("reason", dropped.reason)});
  }

  if (entries->values_size() > 0 && parsed.candidates.empty()) {
    return Status::Err(StatusCode::kMalformedResponse,
                       "none of the " + std::to_string(entries->values_size()) + " extracted entries were usable");
  }
  return parsed;
}

} // namespace carelog::extraction
