#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace carelog::model {

enum class SourceFormat : std::uint8_t {
  kImage = 0,
  kText = 1,
};

constexpr std::string_view ToString(SourceFormat format) {
  return format == SourceFormat::kImage ? "image" : "text";
}

// A report as handed to the pipeline: raw bytes plus the date its clock times
// refer to.
struct SourceDocument {
  std::string                   name;
  SourceFormat                  format = SourceFormat::kText;
  std::shared_ptr<arrow::Buffer> bytes;
  util::Day                     reference_day{};
};

}  // namespace carelog::model
