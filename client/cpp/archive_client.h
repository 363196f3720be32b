#pragma once

#include <arrow/result.h>
#include <arrow/status.h>
#include <grpcpp/channel.h>

#include <cstdint>
#include <memory>
#include <string>

#include "client/cpp/grpc_endpoint.h"
#include "config/config.pb.h"
#include "internal/packaging/archive_request.hpp"
#include "internal/transfer/upload_flow.hpp"
#include "vault/archive/v1.hpp"

namespace vault::client {

/*
  Public client facade.

  Runs the upload flow against a remote archive-vault and exposes
  retrieval. Every failure is returned as an arrow::Status:

      NotFound                         KeyError
      invalid input, empty archive     Invalid
      cancelled upload                 Cancelled
      transport, storage, upload       IOError
*/
class ArchiveClient {
 public:
  ArchiveClient(std::shared_ptr<::grpc::Channel> channel, vault::runtime::config::TransferConfig transfer);

  // Insecure channel with message limits large enough for one frame.
  static std::shared_ptr<::grpc::Channel> Connect(const std::string& endpoint);

  void SetProgressListener(transfer::ProgressListener listener) {
    progress_ = std::move(listener);
  }
  void SetStateListener(transfer::StateListener listener) {
    state_listener_ = std::move(listener);
  }

  arrow::Result<transfer::UploadOutcome> Upload(const packaging::ArchiveRequest& request,
                                                const transfer::CancellationToken* cancel = nullptr) const;

  arrow::Result<vault::archive::v1::ArchiveRecord> GetArchive(const std::string& file_id) const;

  // Streams the archive into a local file; returns bytes written.
  arrow::Result<uint64_t> Download(const std::string& file_id, const std::string& path) const;

 private:
  std::shared_ptr<::grpc::Channel>       channel_;
  std::shared_ptr<GrpcEndpoint>          endpoint_;
  vault::runtime::config::TransferConfig transfer_;

  transfer::ProgressListener progress_;
  transfer::StateListener    state_listener_;
};

// exception → arrow::Status, following the table above
arrow::Status ToArrowStatus(const std::exception& e);

} // namespace vault::client
