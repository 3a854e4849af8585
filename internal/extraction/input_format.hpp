#pragma once

#include <arrow/buffer.h>

#include <memory>
#include <string>
#include <string_view>

#include "internal/model/source_document.hpp"
#include "internal/util/status.hpp"

namespace carelog::extraction {

/*
  Decides how a report enters extraction, before any service call.

    png jpg jpeg heic heif  -> image (OCR first)
    txt csv                 -> text, must be valid UTF-8
    no extension            -> image if PNG/JPEG magic, else UTF-8 text

  Anything else (pdf, docx, ...) is kUnsupportedFormat.
*/
util::StatusOr<model::SourceFormat> DetectFormat(std::string_view name, const arrow::Buffer& bytes);

bool IsValidUtf8(std::string_view text);

// "daycare report image" / "daycare report csv" / "daycare report text"
std::string SourceContext(const model::SourceDocument& document);

} // namespace carelog::extraction
