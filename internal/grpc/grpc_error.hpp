#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

#include "internal/util/errors.hpp"

namespace creditgate::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace creditgate::grpc
