#pragma once

#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace tams::db {

// Maps a failed Result onto the domain exception hierarchy.
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
    case ErrorCode::ConstraintViolation:
      throw util::InvalidArgument(message);
    default:
      throw util::StorageFailure(message);
  }
}

} // namespace tams::db
