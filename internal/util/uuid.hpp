#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace jobclaim::util {

/*
  UUID helpers

  Run ids, job ids, trace ids and dead-letter ids are RFC4122 v4 UUIDs in
  canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// Shorthand for ToString(GenerateUUID()).
std::string NewUuidString();

} // namespace jobclaim::util
