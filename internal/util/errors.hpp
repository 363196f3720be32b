#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace vault::util {

/*
  Central error types.

  These get translated later to gRPC status codes (grpc/grpc_error.cpp)
  and back again on the client side (client/cpp/grpc_endpoint.cc).
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Object store or catalog unreachable / failed.
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// ---------------------------------------------------------------------------
// Upload pipeline taxonomy
// ---------------------------------------------------------------------------

class PackagingError : public std::runtime_error {
 public:
  explicit PackagingError(const std::string& msg) : std::runtime_error("packaging failed: " + msg) {
  }
};

class EmptyArchiveError : public std::runtime_error {
 public:
  EmptyArchiveError() : std::runtime_error("archive is empty; empty archives are never uploaded") {
  }
};

/*
  One failed write of one part. Recoverable: the flow retries the part with a
  fresh capability until its retry policy is exhausted.
*/
class PartTransferError : public std::runtime_error {
 public:
  PartTransferError(uint32_t part_number, const std::string& cause)
      : std::runtime_error("part " + std::to_string(part_number) + " transfer failed: " + cause),
        part_number_(part_number),
        cause_(cause) {
  }

  uint32_t part_number() const {
    return part_number_;
  }
  const std::string& cause() const {
    return cause_;
  }

 private:
  uint32_t    part_number_;
  std::string cause_;
};

class ReconciliationError : public std::runtime_error {
 public:
  ReconciliationError(std::vector<uint32_t> missing, std::vector<uint32_t> duplicate, const std::string& detail)
      : std::runtime_error("reconciliation failed: " + detail), missing_(std::move(missing)), duplicate_(std::move(duplicate)) {
  }

  const std::vector<uint32_t>& missing_parts() const {
    return missing_;
  }
  const std::vector<uint32_t>& duplicate_parts() const {
    return duplicate_;
  }

 private:
  std::vector<uint32_t> missing_;
  std::vector<uint32_t> duplicate_;
};

class SessionExpiredError : public std::runtime_error {
 public:
  enum class Scope { kCapability, kSession };

  SessionExpiredError(Scope scope, const std::string& msg) : std::runtime_error(msg), scope_(scope) {
  }

  Scope scope() const {
    return scope_;
  }

 private:
  Scope scope_;
};

/*
  Terminal, user-visible failure of one upload. Carries the part that
  exhausted its retries (0 when the failure was not part specific).
*/
class UploadFailed : public std::runtime_error {
 public:
  UploadFailed(uint32_t part_number, const std::string& cause)
      : std::runtime_error(part_number == 0 ? "upload failed: " + cause
                                            : "upload failed at part " + std::to_string(part_number) + ": " + cause),
        part_number_(part_number),
        cause_(cause) {
  }

  uint32_t part_number() const {
    return part_number_;
  }
  const std::string& cause() const {
    return cause_;
  }

 private:
  uint32_t    part_number_;
  std::string cause_;
};

} // namespace vault::util
