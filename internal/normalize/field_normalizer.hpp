#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "internal/model/quantity.hpp"

namespace carelog::normalize {

/*
  Free-text quantity -> amount + unit.

  The first number in the text (decimal or simple fraction "a/b") is the
  amount; the first recognized unit word after it decides the unit:

    oz, ounce(s)                 -> ounce
    ml, milliliter(s)/millilitre -> milliliter
    min, mins, minute(s)         -> minute
    h, hr, hrs, hour(s)          -> minute, amount * 60

  Text without a number yields {0, unknown}. Never fails.
*/
model::NormalizedQuantity Normalize(std::string_view text);
model::NormalizedQuantity Normalize(const std::optional<std::string>& text);

} // namespace carelog::normalize
