#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace opentimeline::util {

/*
  UUID helpers

  Entity and timeline ids are RFC4122 UUIDs in canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Convenience for callers that only need a fresh id string.
std::string NewId();

bool IsValidUuid(const std::string& str);

} // namespace opentimeline::util
