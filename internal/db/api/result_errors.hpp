#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace scanhub::db {

inline void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::NotFound:
      throw scanhub::util::NotFound(message);
    case ErrorCode::Conflict:
    case ErrorCode::ConstraintViolation:
      throw scanhub::util::InvalidState(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace scanhub::db
