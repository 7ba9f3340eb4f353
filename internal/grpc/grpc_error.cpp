#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace phrase::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace phrase::util;

  if (dynamic_cast<const ValidationFailed*>(&e) || dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const FailedPrecondition*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const Conflict*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }
  if (const auto* storage = dynamic_cast<const StorageError*>(&e)) {
    return {storage->Transient() ? ::grpc::StatusCode::UNAVAILABLE : ::grpc::StatusCode::INTERNAL, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace phrase::grpc
