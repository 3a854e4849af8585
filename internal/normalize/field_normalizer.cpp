#include "field_normalizer.hpp"

#include <cctype>
#include <charconv>
#include <cmath>

namespace carelog::normalize {
namespace {

using model::NormalizedQuantity;
using model::QuantityUnit;

bool IsDigit(char c) {
  return c >= '0' && c <= '9';
}

bool IsAlpha(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

std::size_t ScanDigits(std::string_view text, std::size_t pos) {
  while (pos < text.size() && IsDigit(text[pos])) ++pos;
  return pos;
}

std::optional<double> ParseDecimal(std::string_view text) {
  double value = 0.0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value, std::chars_format::fixed);
  if (ec != std::errc{} || ptr != text.data() + text.size() || !std::isfinite(value)) return std::nullopt;
  return value;
}

struct NumericToken {
  double      value = 0.0;
  std::size_t end   = 0;
};

std::optional<NumericToken> FirstNumber(std::string_view text) {
  for (std::size_t i = 0; i < text.size(); ++i) {
    const bool leading_dot = text[i] == '.' && i + 1 < text.size() && IsDigit(text[i + 1]);
    if (!IsDigit(text[i]) && !leading_dot) continue;

    std::size_t end = leading_dot ? i : ScanDigits(text, i);
    if (end < text.size() && text[end] == '.' && end + 1 < text.size() && IsDigit(text[end + 1])) {
      end = ScanDigits(text, end + 1);
    }

    auto value = ParseDecimal(text.substr(i, end - i));
    if (!value) return std::nullopt;
    NumericToken token{*value, end};

    // "a/b"; a zero denominator leaves the numerator as the amount
    if (end + 1 < text.size() && text[end] == '/' && IsDigit(text[end + 1])) {
      const std::size_t den_end = ScanDigits(text, end + 1);
      auto denominator = ParseDecimal(text.substr(end + 1, den_end - end - 1));
      if (denominator && *denominator > 0.0) {
        token.value /= *denominator;
      }
      token.end = den_end;
    }
    return token;
  }
  return std::nullopt;
}

bool StartsWith(std::string_view word, std::string_view prefix) {
  return word.substr(0, prefix.size()) == prefix;
}

QuantityUnit UnitForWord(std::string_view word) {
  if (word == "oz" || StartsWith(word, "ounce")) return QuantityUnit::kOunce;
  if (word == "ml" || word == "mls" || StartsWith(word, "milliliter") || StartsWith(word, "millilitre")) {
    return QuantityUnit::kMilliliter;
  }
  if (word == "min" || word == "mins" || StartsWith(word, "minute")) return QuantityUnit::kMinute;
  if (word == "h" || word == "hr" || word == "hrs" || StartsWith(word, "hour")) return QuantityUnit::kHour;
  return QuantityUnit::kUnknown;
}

QuantityUnit FirstUnit(std::string_view rest) {
  std::size_t i = 0;
  while (i < rest.size()) {
    if (!IsAlpha(rest[i])) {
      ++i;
      continue;
    }
    std::string word;
    while (i < rest.size() && IsAlpha(rest[i])) {
      word.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(rest[i]))));
      ++i;
    }
    auto unit = UnitForWord(word);
    if (unit != QuantityUnit::kUnknown) return unit;
  }
  return QuantityUnit::kUnknown;
}

} // namespace

NormalizedQuantity Normalize(std::string_view text) {
  auto number = FirstNumber(text);
  if (!number) return {};

  NormalizedQuantity quantity{number->value, FirstUnit(text.substr(number->end))};
  if (quantity.unit == QuantityUnit::kHour) {
    quantity.amount *= 60.0;
    quantity.unit = QuantityUnit::kMinute;
  }
  return quantity;
}

NormalizedQuantity Normalize(const std::optional<std::string>& text) {
  if (!text) return {};
  return Normalize(std::string_view(*text));
}

} // namespace carelog::normalize
