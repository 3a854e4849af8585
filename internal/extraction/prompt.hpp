#pragma once

#include <string>

#include "internal/model/source_document.hpp"

namespace carelog::extraction {

// Instructions sent with every ExtractEvents call: the event JSON shape and
// the accepted type names.
const std::string& ExtractionInstructions();

} // namespace carelog::extraction
