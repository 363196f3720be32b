#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/archive_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/storage/memory/memory_object_store.hpp"
#include "internal/util/errors.hpp"
#include "vault/archive/v1.hpp"

namespace {

using vault::util::SessionExpiredError;

vault::factory::Application BuildApplication() {
  vault::runtime::config::RuntimeConfig config;
  auto*                                 uploads = config.mutable_uploads();
  uploads->set_small_object_threshold_bytes(64);
  uploads->set_default_chunk_size_bytes(16);
  uploads->set_capability_secret("status-test-secret");
  uploads->set_capability_base_url("vault://parts");
  uploads->mutable_capability_ttl()->set_seconds(60);
  uploads->mutable_session_max_age()->set_seconds(3600);
  uploads->mutable_reaper_interval()->set_seconds(60);
  uploads->mutable_catalog_retry()->set_max_attempts(1);

  return vault::factory::Build(config, std::make_shared<vault::storage::MemoryObjectStore>(vault::storage::StoreLimits{16, 100}),
                               std::make_shared<vault::db::memory::MemoryRepository>());
}

template <typename Error>
void ExpectRoundTrip(const ::grpc::Status& status) {
  bool thrown = false;
  try {
    vault::grpc::ThrowIfError(status);
  } catch (const Error&) {
    thrown = true;
  }
  assert(thrown);
}

void TestExceptionsMapToStatusCodes() {
  using vault::grpc::ToStatus;

  assert(ToStatus(vault::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(vault::util::InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(vault::util::InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(SessionExpiredError(SessionExpiredError::Scope::kCapability, "x")).error_code() ==
         ::grpc::StatusCode::UNAUTHENTICATED);
  assert(ToStatus(SessionExpiredError(SessionExpiredError::Scope::kSession, "x")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);
}

void TestStorageDetailDoesNotLeak() {
  const auto status = vault::grpc::ToStatus(vault::util::StorageError("s3://bucket/archives/x upload-id=abc123 failed"));
  assert(status.error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(status.error_message().find("abc123") == std::string::npos);
  assert(status.error_message().find("bucket") == std::string::npos);
  ExpectRoundTrip<vault::util::StorageError>(status);
}

void TestSharedCodesKeepTheirTypeOnTheClient() {
  const auto empty = vault::grpc::ToStatus(vault::util::EmptyArchiveError());
  assert(empty.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  ExpectRoundTrip<vault::util::EmptyArchiveError>(empty);
  ExpectRoundTrip<vault::util::InvalidArgument>(vault::grpc::ToStatus(vault::util::InvalidArgument("bad")));

  const auto reconcile = vault::grpc::ToStatus(vault::util::ReconciliationError({2}, {}, "missing parts [2]"));
  assert(reconcile.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  try {
    vault::grpc::ThrowIfError(reconcile);
    assert(false);
  } catch (const vault::util::ReconciliationError& e) {
    assert(std::string(e.what()) == "reconciliation failed: missing parts [2]");
  }
  ExpectRoundTrip<vault::util::InvalidState>(vault::grpc::ToStatus(vault::util::InvalidState("busy")));

  try {
    vault::grpc::ThrowIfError(vault::grpc::ToStatus(SessionExpiredError(SessionExpiredError::Scope::kCapability, "late")));
    assert(false);
  } catch (const SessionExpiredError& e) {
    assert(e.scope() == SessionExpiredError::Scope::kCapability);
  }

  vault::grpc::ThrowIfError(::grpc::Status::OK);
}

void TestServerReportsNotFound() {
  auto                        app = BuildApplication();
  vault::grpc::ArchiveServer server(app.archive_service);

  {
    vault::archive::v1::GetArchiveRequest  req;
    vault::archive::v1::GetArchiveResponse resp;
    req.set_file_id("missing-file");
    ::grpc::ServerContext ctx;
    assert(server.GetArchive(&ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
  }
  {
    vault::archive::v1::CompleteUploadRequest  req;
    vault::archive::v1::CompleteUploadResponse resp;
    req.set_upload_id("missing-upload");
    req.set_filename("a.zip");
    ::grpc::ServerContext ctx;
    assert(server.CompleteUpload(&ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
  }
  {
    vault::archive::v1::AbortUploadRequest req;
    google::protobuf::Empty                resp;
    req.set_upload_id("missing-upload");
    ::grpc::ServerContext ctx;
    assert(server.AbortUpload(&ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
  }
}

void TestServerRejectsEmptyAndMisnamedUploads() {
  auto                        app = BuildApplication();
  vault::grpc::ArchiveServer server(app.archive_service);

  vault::archive::v1::StartUploadRequest  start;
  vault::archive::v1::StartUploadResponse started;
  start.set_filename("batch.zip");
  start.set_content_type("application/zip");

  {
    ::grpc::ServerContext ctx;
    const auto            status = server.StartUpload(&ctx, &start, &started);
    assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
    ExpectRoundTrip<vault::util::EmptyArchiveError>(status);
  }

  start.set_expected_size_bytes(100);
  {
    ::grpc::ServerContext ctx;
    assert(server.StartUpload(&ctx, &start, &started).ok());
    assert(started.expected_part_count() == 7);
    assert(started.chunk_size_bytes() == 16);
  }

  vault::archive::v1::GetUploadPartUrlRequest  url_req;
  vault::archive::v1::GetUploadPartUrlResponse url_resp;
  url_req.set_upload_id(started.upload_id());
  url_req.set_part_number(1);
  url_req.set_filename("other.zip");
  {
    ::grpc::ServerContext ctx;
    assert(server.GetUploadPartUrl(&ctx, &url_req, &url_resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  }

  url_req.set_filename("batch.zip");
  url_req.set_part_number(8);
  {
    ::grpc::ServerContext ctx;
    assert(server.GetUploadPartUrl(&ctx, &url_req, &url_resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  }

  vault::archive::v1::CompleteUploadRequest  complete;
  vault::archive::v1::CompleteUploadResponse completed;
  complete.set_upload_id(started.upload_id());
  complete.set_filename("batch.zip");
  complete.set_file_size_bytes(100);
  {
    ::grpc::ServerContext ctx;
    const auto            status = server.CompleteUpload(&ctx, &complete, &completed);
    assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
    ExpectRoundTrip<vault::util::ReconciliationError>(status);
  }
}

} // namespace

int main() {
  TestExceptionsMapToStatusCodes();
  TestStorageDetailDoesNotLeak();
  TestSharedCodesKeepTheirTypeOnTheClient();
  TestServerReportsNotFound();
  TestServerRejectsEmptyAndMisnamedUploads();

  std::cout << "vault_unit_grpc_status: pass\n";
  return 0;
}
