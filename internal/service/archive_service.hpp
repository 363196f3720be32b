#pragma once

#include <arrow/buffer.h>

#include <functional>
#include <memory>
#include <string>

#include "internal/packaging/archive_stream.hpp"
#include "service_context.hpp"
#include "vault/archive/v1.hpp"

namespace vault::service {

/*
  Origin service operations, transport independent.

  Served over gRPC by grpc::ArchiveServer and in-process by LocalEndpoint.
  Errors are util exceptions; the transports translate them.
*/
class ArchiveService {
 public:
  using ChunkSink = std::function<void(const std::shared_ptr<arrow::Buffer>&)>;

  explicit ArchiveService(ServiceContext ctx);

  vault::archive::v1::StartUploadResponse StartUpload(const vault::archive::v1::StartUploadRequest& req);

  vault::archive::v1::GetUploadPartUrlResponse GetUploadPartUrl(const vault::archive::v1::GetUploadPartUrlRequest& req);

  // Data plane: one write through a capability URL.
  vault::archive::v1::PutPartResponse PutPart(const std::string& url, const std::shared_ptr<arrow::Buffer>& data);

  vault::archive::v1::CompleteUploadResponse CompleteUpload(const vault::archive::v1::CompleteUploadRequest& req);

  void AbortUpload(const vault::archive::v1::AbortUploadRequest& req);

  // Single-shot: exactly header.size_bytes bytes are read from body.
  vault::archive::v1::ArchiveResponse Archive(const vault::archive::v1::ArchiveHeader& header, packaging::ArchiveStream& body);

  vault::archive::v1::GetArchiveResponse GetArchive(const vault::archive::v1::GetArchiveRequest& req);

  void ReadArchive(const vault::archive::v1::ReadArchiveRequest& req, const ChunkSink& sink);

 private:
  vault::archive::v1::ArchiveRecord LookupRecord(const std::string& file_id);

  ServiceContext ctx_;
};

} // namespace vault::service
