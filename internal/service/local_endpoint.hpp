#pragma once

#include <memory>

#include "archive_service.hpp"
#include "internal/transfer/part_transport.hpp"
#include "internal/transfer/upload_endpoint.hpp"

namespace vault::service {

/*
  In-process transport: the upload flow talks to an ArchiveService in the
  same process. Used by tests and by embedders that skip gRPC.

  Store failures during a part write surface as util::PartTransferError
  so the flow retries them like a failed network write.
*/
class LocalEndpoint final : public transfer::UploadEndpoint, public transfer::PartTransport {
 public:
  explicit LocalEndpoint(std::shared_ptr<ArchiveService> service);

  vault::archive::v1::StartUploadResponse StartUpload(const vault::archive::v1::StartUploadRequest& request) override;

  vault::archive::v1::GetUploadPartUrlResponse GetUploadPartUrl(const vault::archive::v1::GetUploadPartUrlRequest& request) override;

  vault::archive::v1::CompleteUploadResponse CompleteUpload(const vault::archive::v1::CompleteUploadRequest& request) override;

  void AbortUpload(const vault::archive::v1::AbortUploadRequest& request) override;

  vault::archive::v1::ArchiveResponse Archive(const vault::archive::v1::ArchiveHeader& header, packaging::ArchiveStream& stream) override;

  std::string TransferPart(const std::string& capability_url, uint32_t part_number,
                           const std::shared_ptr<arrow::Buffer>& data) override;

 private:
  std::shared_ptr<ArchiveService> service_;
};

} // namespace vault::service
