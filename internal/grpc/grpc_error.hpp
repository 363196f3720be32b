#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace vault::grpc {

/*
  Converts internal exceptions into gRPC status codes and back.

      NotFound                      NOT_FOUND
      AlreadyExists                 ALREADY_EXISTS
      InvalidArgument, EmptyArchive INVALID_ARGUMENT
      InvalidState, Reconciliation  FAILED_PRECONDITION
      SessionExpired (capability)   UNAUTHENTICATED
      SessionExpired (session)      ABORTED
      StorageError                  UNAVAILABLE
      anything else                 INTERNAL

  error_details carries a marker where one code covers two types.
*/

::grpc::Status ToStatus(const std::exception& e);

// No-op for OK.
void ThrowIfError(const ::grpc::Status& status);

} // namespace vault::grpc
