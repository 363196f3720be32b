#include "client/cpp/archive_client.h"

#include <arrow/buffer.h>
#include <arrow/io/file.h>
#include <grpcpp/client_context.h>
#include <grpcpp/create_channel.h>

#include "internal/grpc/grpc_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace vault::client {

using namespace vault::archive::v1;

namespace {

// several frames of headroom over one stream frame
constexpr int kChannelMessageBytes = 16 * 1024 * 1024;

} // namespace

arrow::Status ToArrowStatus(const std::exception& e) {
  using namespace vault::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return arrow::Status::KeyError(e.what());
  }
  if (const auto* failed = dynamic_cast<const UploadFailed*>(&e)) {
    if (failed->part_number() == 0 && failed->cause() == "upload cancelled") {
      return arrow::Status::Cancelled(e.what());
    }
    return arrow::Status::IOError(e.what());
  }
  if (dynamic_cast<const InvalidArgument*>(&e) || dynamic_cast<const EmptyArchiveError*>(&e) ||
      dynamic_cast<const PackagingError*>(&e) || dynamic_cast<const AlreadyExists*>(&e) || dynamic_cast<const InvalidState*>(&e) ||
      dynamic_cast<const ReconciliationError*>(&e)) {
    return arrow::Status::Invalid(e.what());
  }
  return arrow::Status::IOError(e.what());
}

ArchiveClient::ArchiveClient(std::shared_ptr<::grpc::Channel> channel, vault::runtime::config::TransferConfig transfer)
    : channel_(std::move(channel)), endpoint_(std::make_shared<GrpcEndpoint>(channel_)), transfer_(std::move(transfer)) {
}

std::shared_ptr<::grpc::Channel> ArchiveClient::Connect(const std::string& endpoint) {
  ::grpc::ChannelArguments args;
  args.SetMaxReceiveMessageSize(kChannelMessageBytes);
  args.SetMaxSendMessageSize(kChannelMessageBytes);
  return ::grpc::CreateCustomChannel(endpoint, ::grpc::InsecureChannelCredentials(), args);
}

arrow::Result<transfer::UploadOutcome> ArchiveClient::Upload(const packaging::ArchiveRequest& request,
                                                             const transfer::CancellationToken* cancel) const {
  try {
    transfer::UploadFlow flow(endpoint_, endpoint_, transfer::FlowOptions::FromConfig(transfer_));
    if (progress_) flow.SetProgressListener(progress_);
    if (state_listener_) flow.SetStateListener(state_listener_);
    return flow.Run(request, cancel);
  } catch (const std::exception& e) {
    return ToArrowStatus(e);
  }
}

arrow::Result<ArchiveRecord> ArchiveClient::GetArchive(const std::string& file_id) const {
  try {
    ::grpc::ClientContext ctx;
    GetArchiveRequest     request;
    GetArchiveResponse    response;
    request.set_file_id(file_id);
    grpc::ThrowIfError(endpoint_->stub().GetArchive(&ctx, request, &response));
    return response.record();
  } catch (const std::exception& e) {
    return ToArrowStatus(e);
  }
}

arrow::Result<uint64_t> ArchiveClient::Download(const std::string& file_id, const std::string& path) const {
  ARROW_ASSIGN_OR_RAISE(auto out, arrow::io::FileOutputStream::Open(path));

  uint64_t written = 0;
  try {
    ::grpc::ClientContext ctx;
    ReadArchiveRequest    request;
    request.set_file_id(file_id);
    auto reader = endpoint_->stub().ReadArchive(&ctx, request);

    ReadArchiveResponse chunk;
    while (reader->Read(&chunk)) {
      ARROW_RETURN_NOT_OK(out->Write(chunk.data().data(), static_cast<int64_t>(chunk.data().size())));
      written += chunk.data().size();
    }
    grpc::ThrowIfError(reader->Finish());
  } catch (const std::exception& e) {
    ARROW_RETURN_NOT_OK(out->Close());
    return ToArrowStatus(e);
  }

  ARROW_RETURN_NOT_OK(out->Close());
  VAULT_LOG_INFO("archive downloaded", {observability::StringField("file_id", file_id), observability::StringField("path", path),
                                        observability::UIntField("bytes", written)});
  return written;
}

} // namespace vault::client
