#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace casetrack::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace casetrack::util;

  if (dynamic_cast<const FingerprintConflict*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const IdempotencyInProgress*>(&e) || dynamic_cast<const ConcurrentModification*>(&e) ||
      dynamic_cast<const LockConflict*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }
  if (dynamic_cast<const InvalidTransition*>(&e) || dynamic_cast<const MissingAnnotation*>(&e) || dynamic_cast<const MissingField*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const Forbidden*>(&e)) {
    return {::grpc::StatusCode::PERMISSION_DENIED, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const DependencyUnavailable*>(&e) || dynamic_cast<const StoreUnavailable*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }
  if (dynamic_cast<const DeadlineExceeded*>(&e)) {
    return {::grpc::StatusCode::DEADLINE_EXCEEDED, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace casetrack::grpc
