#pragma once

#include <grpcpp/channel.h>

#include <chrono>
#include <memory>
#include <string>

#include "internal/transfer/part_transport.hpp"
#include "internal/transfer/upload_endpoint.hpp"
#include "vault/archive/v1.hpp"

namespace vault::client {

/*
  UploadEndpoint and PartTransport over the ArchiveService gRPC API.

  Non-OK statuses come back as the util exception they were raised as on
  the server. Transport failures of a part write (unavailable, deadline,
  internal) become util::PartTransferError so the flow retries them.
*/
class GrpcEndpoint final : public transfer::UploadEndpoint, public transfer::PartTransport {
 public:
  // deadline of 0 means none
  explicit GrpcEndpoint(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds deadline = std::chrono::milliseconds(0));

  vault::archive::v1::StartUploadResponse StartUpload(const vault::archive::v1::StartUploadRequest& request) override;

  vault::archive::v1::GetUploadPartUrlResponse GetUploadPartUrl(const vault::archive::v1::GetUploadPartUrlRequest& request) override;

  vault::archive::v1::CompleteUploadResponse CompleteUpload(const vault::archive::v1::CompleteUploadRequest& request) override;

  void AbortUpload(const vault::archive::v1::AbortUploadRequest& request) override;

  vault::archive::v1::ArchiveResponse Archive(const vault::archive::v1::ArchiveHeader& header, packaging::ArchiveStream& stream) override;

  std::string TransferPart(const std::string& capability_url, uint32_t part_number,
                           const std::shared_ptr<arrow::Buffer>& data) override;

  vault::archive::v1::ArchiveService::Stub& stub() {
    return *stub_;
  }

 private:
  void Prepare(::grpc::ClientContext& ctx) const;

  std::unique_ptr<vault::archive::v1::ArchiveService::Stub> stub_;
  std::chrono::milliseconds                                 deadline_;
};

} // namespace vault::client
