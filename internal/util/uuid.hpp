#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace carelog::util {

/*
  UUID helpers

  Candidate events and pending reports are keyed by random RFC4122 v4 ids in
  their canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// ToString(GenerateUUID())
std::string NewId();

} // namespace carelog::util
