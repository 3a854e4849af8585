#pragma once

#include <cstdint>
#include <string_view>

namespace carelog::model {

enum class QuantityUnit : std::uint8_t {
  kUnknown = 0,
  kOunce = 1,
  kMilliliter = 2,
  kMinute = 3,
  kHour = 4,
};

struct NormalizedQuantity {
  double       amount = 0.0;
  QuantityUnit unit   = QuantityUnit::kUnknown;
};

constexpr bool IsVolume(QuantityUnit unit) {
  return unit == QuantityUnit::kOunce || unit == QuantityUnit::kMilliliter;
}

constexpr bool IsDuration(QuantityUnit unit) {
  return unit == QuantityUnit::kMinute || unit == QuantityUnit::kHour;
}

// Unit-less amounts on a duration field are read as minutes.
constexpr double DurationMinutes(const NormalizedQuantity& quantity) {
  return quantity.unit == QuantityUnit::kHour ? quantity.amount * 60.0 : quantity.amount;
}

constexpr std::string_view ToString(QuantityUnit unit) {
  switch (unit) {
    case QuantityUnit::kOunce:
      return "oz";
    case QuantityUnit::kMilliliter:
      return "ml";
    case QuantityUnit::kMinute:
      return "min";
    case QuantityUnit::kHour:
      return "h";
    case QuantityUnit::kUnknown:
    default:
      return "unknown";
  }
}

}  // namespace carelog::model
