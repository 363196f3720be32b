#include "grpc_error.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace vault::grpc {

namespace {

constexpr const char* kEmptyArchiveMarker   = "vault.empty_archive";
constexpr const char* kReconciliationMarker = "vault.reconciliation";

} // namespace

::grpc::Status ToStatus(const std::exception& e) {
  using namespace vault::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const EmptyArchiveError*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what(), kEmptyArchiveMarker};
  }
  if (dynamic_cast<const InvalidArgument*>(&e) || dynamic_cast<const PackagingError*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const ReconciliationError*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what(), kReconciliationMarker};
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (const auto* expired = dynamic_cast<const SessionExpiredError*>(&e)) {
    const auto code = expired->scope() == SessionExpiredError::Scope::kCapability ? ::grpc::StatusCode::UNAUTHENTICATED
                                                                                   : ::grpc::StatusCode::ABORTED;
    return {code, e.what()};
  }
  if (dynamic_cast<const StorageError*>(&e)) {
    // backend messages may carry bucket paths and store upload ids
    VAULT_LOG_ERROR("storage failure", {observability::StringField("error", e.what())});
    return {::grpc::StatusCode::UNAVAILABLE, "object store or catalog unavailable"};
  }

  VAULT_LOG_ERROR("internal error", {observability::StringField("error", e.what())});
  return {::grpc::StatusCode::INTERNAL, "internal error"};
}

void ThrowIfError(const ::grpc::Status& status) {
  using namespace vault::util;

  if (status.ok()) {
    return;
  }

  const auto& message = status.error_message();
  switch (status.error_code()) {
    case ::grpc::StatusCode::NOT_FOUND:
      throw NotFound(message);
    case ::grpc::StatusCode::ALREADY_EXISTS:
      throw AlreadyExists(message);
    case ::grpc::StatusCode::INVALID_ARGUMENT:
      if (status.error_details() == kEmptyArchiveMarker) {
        throw EmptyArchiveError();
      }
      throw InvalidArgument(message);
    case ::grpc::StatusCode::FAILED_PRECONDITION:
      if (status.error_details() == kReconciliationMarker) {
        const std::string prefix = "reconciliation failed: ";
        throw ReconciliationError({}, {}, message.rfind(prefix, 0) == 0 ? message.substr(prefix.size()) : message);
      }
      throw InvalidState(message);
    case ::grpc::StatusCode::UNAUTHENTICATED:
      throw SessionExpiredError(SessionExpiredError::Scope::kCapability, message);
    case ::grpc::StatusCode::ABORTED:
      throw SessionExpiredError(SessionExpiredError::Scope::kSession, message);
    case ::grpc::StatusCode::UNAVAILABLE:
    case ::grpc::StatusCode::DEADLINE_EXCEEDED:
      throw StorageError(message);
    default:
      throw std::runtime_error("rpc failed (" + std::to_string(static_cast<int>(status.error_code())) + "): " + message);
  }
}

} // namespace vault::grpc
