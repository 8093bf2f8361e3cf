#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace casetrack::grpc {

/*
  Converts internal exceptions into gRPC status codes for the upstream
  RPC layer. Unknown exceptions map to INTERNAL.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace casetrack::grpc
