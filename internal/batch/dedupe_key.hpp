#pragma once

#include <string>
#include <string_view>

namespace jobclaim::batch {

// Lower-case, trim, collapse internal whitespace runs to one space.
std::string NormalizeNaturalKey(std::string_view natural_key);

// "<source_system>:<sha256 hex of the normalized natural key>"
std::string DedupeKey(const std::string& source_system, std::string_view natural_key);

} // namespace jobclaim::batch
