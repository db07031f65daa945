#pragma once

#include <stdexcept>
#include <string>

namespace scanhub::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Protocol violation on a session: bad first message or unresolved credential.
class PolicyViolation : public std::runtime_error {
 public:
  explicit PolicyViolation(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A single connection could not accept an event.
class DeliveryFailed : public std::runtime_error {
 public:
  explicit DeliveryFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace scanhub::util
