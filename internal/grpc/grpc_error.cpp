#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace scanhub::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace scanhub::util;

  if (dynamic_cast<const PolicyViolation*>(&e)) {
    return {::grpc::StatusCode::PERMISSION_DENIED, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const DeliveryFailed*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace scanhub::grpc
