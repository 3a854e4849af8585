#include "input_format.hpp"

#include <algorithm>
#include <cctype>

#include "internal/storage/common/arrow_utils.hpp"

namespace carelog::extraction {

using util::Status;
using util::StatusCode;

namespace {

std::string Extension(std::string_view name) {
  const auto slash = name.find_last_of("/\\");
  if (slash != std::string_view::npos) name.remove_prefix(slash + 1);

  const auto dot = name.rfind('.');
  if (dot == std::string_view::npos || dot == 0) return {};

  std::string ext(name.substr(dot + 1));
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext;
}

bool HasImageMagic(const arrow::Buffer& bytes) {
  static constexpr unsigned char kPng[]  = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
  static constexpr unsigned char kJpeg[] = {0xFF, 0xD8, 0xFF};

  const auto* data = bytes.data();
  const auto  size = static_cast<std::size_t>(bytes.size());
  if (size >= sizeof(kPng) && std::equal(std::begin(kPng), std::end(kPng), data)) return true;
  if (size >= sizeof(kJpeg) && std::equal(std::begin(kJpeg), std::end(kJpeg), data)) return true;
  return false;
}

util::StatusOr<model::SourceFormat> RequireText(std::string_view name, const arrow::Buffer& bytes) {
  if (!IsValidUtf8(storage::common::AsStringView(bytes))) {
    return Status::Err(StatusCode::kUnsupportedFormat, std::string(name) + " is not UTF-8 text");
  }
  return model::SourceFormat::kText;
}

} // namespace

bool IsValidUtf8(std::string_view text) {
  std::size_t i = 0;
  while (i < text.size()) {
    const auto c = static_cast<unsigned char>(text[i]);
    std::size_t extra = 0;
    unsigned    min   = 0;
    unsigned    cp    = 0;
    if (c < 0x80) {
      ++i;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      extra = 1;
      min   = 0x80;
      cp    = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      extra = 2;
      min   = 0x800;
      cp    = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      extra = 3;
      min   = 0x10000;
      cp    = c & 0x07;
    } else {
      return false;
    }

    if (i + extra >= text.size()) return false;
    for (std::size_t k = 1; k <= extra; ++k) {
      const auto cc = static_cast<unsigned char>(text[i + k]);
      if ((cc & 0xC0) != 0x80) return false;
      cp = (cp << 6) | (cc & 0x3F);
    }
    // overlong, surrogate or out of range
    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
    i += extra + 1;
  }
  return true;
}

util::StatusOr<model::SourceFormat> DetectFormat(std::string_view name, const arrow::Buffer& bytes) {
  const auto ext = Extension(name);

  if (ext == "png" || ext == "jpg" || ext == "jpeg" || ext == "heic" || ext == "heif") {
    return model::SourceFormat::kImage;
  }
  if (ext == "txt" || ext == "csv") {
    return RequireText(name, bytes);
  }
  if (ext.empty()) {
    if (HasImageMagic(bytes)) return model::SourceFormat::kImage;
    return RequireText(name, bytes);
  }

  return Status::Err(StatusCode::kUnsupportedFormat, "." + ext + " reports are not supported; use an image, .txt or .csv");
}

std::string SourceContext(const model::SourceDocument& document) {
  if (document.format == model::SourceFormat::kImage) return "daycare report image";
  return Extension(document.name) == "csv" ? "daycare report csv" : "daycare report text";
}

} // namespace carelog::extraction
