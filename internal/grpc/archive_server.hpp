#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/archive_service.hpp"
#include "vault/archive/v1.hpp"

namespace vault::grpc {

/*
  Thin gRPC adapter over service::ArchiveService. Streams are reassembled
  or split here; every failure leaves through ToStatus.
*/
class ArchiveServer final : public vault::archive::v1::ArchiveService::Service {
 public:
  explicit ArchiveServer(std::shared_ptr<vault::service::ArchiveService> svc);

  ::grpc::Status StartUpload(::grpc::ServerContext* ctx, const vault::archive::v1::StartUploadRequest* req,
                             vault::archive::v1::StartUploadResponse* resp) override;

  ::grpc::Status GetUploadPartUrl(::grpc::ServerContext* ctx, const vault::archive::v1::GetUploadPartUrlRequest* req,
                                  vault::archive::v1::GetUploadPartUrlResponse* resp) override;

  ::grpc::Status PutPart(::grpc::ServerContext* ctx, ::grpc::ServerReader<vault::archive::v1::PutPartRequest>* reader,
                         vault::archive::v1::PutPartResponse* resp) override;

  ::grpc::Status CompleteUpload(::grpc::ServerContext* ctx, const vault::archive::v1::CompleteUploadRequest* req,
                                vault::archive::v1::CompleteUploadResponse* resp) override;

  ::grpc::Status AbortUpload(::grpc::ServerContext* ctx, const vault::archive::v1::AbortUploadRequest* req,
                             google::protobuf::Empty* resp) override;

  ::grpc::Status Archive(::grpc::ServerContext* ctx, ::grpc::ServerReader<vault::archive::v1::ArchiveRequest>* reader,
                         vault::archive::v1::ArchiveResponse* resp) override;

  ::grpc::Status GetArchive(::grpc::ServerContext* ctx, const vault::archive::v1::GetArchiveRequest* req,
                            vault::archive::v1::GetArchiveResponse* resp) override;

  ::grpc::Status ReadArchive(::grpc::ServerContext* ctx, const vault::archive::v1::ReadArchiveRequest* req,
                             ::grpc::ServerWriter<vault::archive::v1::ReadArchiveResponse>* writer) override;

 private:
  std::shared_ptr<vault::service::ArchiveService> service_;
};

} // namespace vault::grpc
