#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace market::db {

// Raises the util:: exception matching a failed repository result.
inline void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::AlreadyExists:
    case ErrorCode::Conflict:
      throw market::util::StateConflict(message);
    case ErrorCode::NotFound:
      throw market::util::NotFound(message);
    default:
      throw std::runtime_error(message + " (" + std::string(ToString(result.code)) + ")");
  }
}

} // namespace market::db
