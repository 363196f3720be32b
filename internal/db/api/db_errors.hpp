#pragma once

#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace vault::db {

/*
  Translates a failed Result into the util error hierarchy.
  Busy / IO failures surface as StorageError so callers may retry them.
*/
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
    case ErrorCode::ConstraintViolation:
      throw util::InvalidState(message);
    case ErrorCode::Busy:
    case ErrorCode::IOError:
    case ErrorCode::SerializationFailure:
      throw util::StorageError(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace vault::db
