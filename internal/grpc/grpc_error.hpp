#pragma once

#include <grpcpp/grpcpp.h>
#include "internal/util/errors.hpp"

namespace opentimeline::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  NotFound        -> NOT_FOUND
  ParseError      -> INVALID_ARGUMENT
  InvalidArgument -> INVALID_ARGUMENT
  CycleError      -> FAILED_PRECONDITION
  AlreadyExists   -> ALREADY_EXISTS
  anything else   -> INTERNAL
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace opentimeline::grpc
