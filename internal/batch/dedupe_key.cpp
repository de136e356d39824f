#include "internal/batch/dedupe_key.hpp"

#include <cctype>

#include "internal/util/hash.hpp"

namespace jobclaim::batch {

std::string NormalizeNaturalKey(std::string_view natural_key) {
  std::string out;
  out.reserve(natural_key.size());

  bool pending_space = false;
  for (char c : natural_key) {
    auto uc = static_cast<unsigned char>(c);
    if (std::isspace(uc)) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(static_cast<char>(std::tolower(uc)));
  }
  return out;
}

std::string DedupeKey(const std::string& source_system, std::string_view natural_key) {
  return source_system + ":" + util::Sha256Hex(NormalizeNaturalKey(natural_key));
}

} // namespace jobclaim::batch
