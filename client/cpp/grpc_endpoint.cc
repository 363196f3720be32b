#include "client/cpp/grpc_endpoint.h"

#include <grpcpp/client_context.h>

#include <algorithm>

#include "internal/grpc/grpc_error.hpp"
#include "internal/util/errors.hpp"

namespace vault::client {

using namespace vault::archive::v1;

namespace {

bool IsTransportFailure(const ::grpc::Status& status) {
  switch (status.error_code()) {
    case ::grpc::StatusCode::UNAVAILABLE:
    case ::grpc::StatusCode::DEADLINE_EXCEEDED:
    case ::grpc::StatusCode::INTERNAL:
    case ::grpc::StatusCode::UNKNOWN:
    case ::grpc::StatusCode::RESOURCE_EXHAUSTED:
      return true;
    default:
      return false;
  }
}

} // namespace

GrpcEndpoint::GrpcEndpoint(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds deadline)
    : stub_(ArchiveService::NewStub(std::move(channel))), deadline_(deadline) {
}

void GrpcEndpoint::Prepare(::grpc::ClientContext& ctx) const {
  if (deadline_.count() > 0) {
    ctx.set_deadline(std::chrono::system_clock::now() + deadline_);
  }
}

StartUploadResponse GrpcEndpoint::StartUpload(const StartUploadRequest& request) {
  ::grpc::ClientContext ctx;
  Prepare(ctx);
  StartUploadResponse response;
  grpc::ThrowIfError(stub_->StartUpload(&ctx, request, &response));
  return response;
}

GetUploadPartUrlResponse GrpcEndpoint::GetUploadPartUrl(const GetUploadPartUrlRequest& request) {
  ::grpc::ClientContext ctx;
  Prepare(ctx);
  GetUploadPartUrlResponse response;
  grpc::ThrowIfError(stub_->GetUploadPartUrl(&ctx, request, &response));
  return response;
}

CompleteUploadResponse GrpcEndpoint::CompleteUpload(const CompleteUploadRequest& request) {
  ::grpc::ClientContext ctx;
  Prepare(ctx);
  CompleteUploadResponse response;
  grpc::ThrowIfError(stub_->CompleteUpload(&ctx, request, &response));
  return response;
}

void GrpcEndpoint::AbortUpload(const AbortUploadRequest& request) {
  ::grpc::ClientContext ctx;
  Prepare(ctx);
  google::protobuf::Empty response;
  grpc::ThrowIfError(stub_->AbortUpload(&ctx, request, &response));
}

ArchiveResponse GrpcEndpoint::Archive(const ArchiveHeader& header, packaging::ArchiveStream& stream) {
  ::grpc::ClientContext ctx;
  Prepare(ctx);
  ArchiveResponse response;
  auto            writer = stub_->Archive(&ctx, &response);

  ArchiveRequest msg;
  *msg.mutable_header() = header;
  bool open             = writer->Write(msg);

  while (open) {
    auto window = stream.NextWindow(transfer::kStreamFrameBytes);
    if (!window || window->size() == 0) break;
    msg.Clear();
    msg.set_data(window->data(), static_cast<size_t>(window->size()));
    open = writer->Write(msg);
  }
  // a closed stream means the server already answered; Finish has its status
  writer->WritesDone();
  grpc::ThrowIfError(writer->Finish());
  return response;
}

std::string GrpcEndpoint::TransferPart(const std::string& capability_url, uint32_t part_number,
                                       const std::shared_ptr<arrow::Buffer>& data) {
  ::grpc::ClientContext ctx;
  Prepare(ctx);
  PutPartResponse response;
  auto            writer = stub_->PutPart(&ctx, &response);

  const auto size = static_cast<uint64_t>(data->size());

  PutPartRequest msg;
  msg.mutable_header()->set_url(capability_url);
  msg.mutable_header()->set_length_bytes(size);
  bool open = writer->Write(msg);

  uint64_t offset = 0;
  while (open && offset < size) {
    const auto frame = std::min<uint64_t>(transfer::kStreamFrameBytes, size - offset);
    msg.Clear();
    msg.set_data(data->data() + offset, static_cast<size_t>(frame));
    open = writer->Write(msg);
    offset += frame;
  }
  writer->WritesDone();

  const auto status = writer->Finish();
  if (IsTransportFailure(status)) {
    throw util::PartTransferError(part_number, status.error_message());
  }
  grpc::ThrowIfError(status);

  if (response.part_number() != part_number) {
    throw util::InvalidState("capability was issued for part " + std::to_string(response.part_number()) + ", not part " +
                             std::to_string(part_number));
  }
  return response.receipt_token();
}

} // namespace vault::client
