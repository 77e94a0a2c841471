#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace creditgate::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace creditgate::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const Conflict*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }
  if (dynamic_cast<const ResourceExhausted*>(&e)) {
    return {::grpc::StatusCode::RESOURCE_EXHAUSTED, e.what()};
  }
  if (const auto* degraded = dynamic_cast<const ProviderDegraded*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what(), std::string(degraded->code())};
  }
  if (dynamic_cast<const ProviderTimeout*>(&e)) {
    return {::grpc::StatusCode::DEADLINE_EXCEEDED, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace creditgate::grpc
