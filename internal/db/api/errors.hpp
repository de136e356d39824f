#pragma once

#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace jobclaim::db {

// Maps a non-OK repository result onto the service exception taxonomy.
inline void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::Conflict:
      throw util::InvalidState(message);
    default:
      throw util::StorageError(message);
  }
}

} // namespace jobclaim::db
