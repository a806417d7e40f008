#pragma once

#include <exception>

#include <grpcpp/grpcpp.h>

namespace usedgear::grpc {

/*
  Maps a market failure onto the status a client acts on:

    NotFound            NOT_FOUND            unknown listing, search, sale or inspection
    LimitExceeded       RESOURCE_EXHAUSTED   search or sale cap reached
    ValidationError     INVALID_ARGUMENT     bad input or wrong owner
    FundsError          FAILED_PRECONDITION  balance too low, nothing was charged
    RaceRejection       ABORTED              listing changed hands, retry against fresh state
    CorruptRecordError  DATA_LOSS            stored record could not be decoded

  Anything else is INTERNAL. The exception text becomes the status message.
*/
::grpc::Status ToStatus(const std::exception& e);

} // namespace usedgear::grpc
