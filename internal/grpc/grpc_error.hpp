#pragma once

#include <exception>

#include <grpcpp/grpcpp.h>

namespace streamledger::grpc {

/*
  Maps util/errors.hpp exceptions thrown by the service layer to gRPC
  status codes:

    InvalidArgument  -> INVALID_ARGUMENT
    NotFound         -> NOT_FOUND
    PermissionDenied -> PERMISSION_DENIED
    Unauthenticated  -> UNAUTHENTICATED
    InvalidState     -> FAILED_PRECONDITION
    TransferFailed   -> ABORTED
    anything else    -> INTERNAL
*/
::grpc::Status ToStatus(const std::exception& e);

} // namespace streamledger::grpc
