#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace usedgear::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace usedgear::util;

  // Most specific first: NotFound and LimitExceeded derive from ValidationError.
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const LimitExceeded*>(&e)) {
    return {::grpc::StatusCode::RESOURCE_EXHAUSTED, e.what()};
  }
  if (dynamic_cast<const ValidationError*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const FundsError*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const RaceRejection*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }
  if (dynamic_cast<const CorruptRecordError*>(&e)) {
    return {::grpc::StatusCode::DATA_LOSS, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace usedgear::grpc
