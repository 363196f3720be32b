#pragma once

#include <cstdint>

#include "internal/packaging/archive_stream.hpp"
#include "vault/archive/v1.hpp"

namespace vault::transfer {

// Bytes per stream message; stays well below gRPC's default 4 MiB cap.
inline constexpr uint64_t kStreamFrameBytes = 1ull << 20;

/*
  Origin service operations used by the upload flow.

  Implemented over gRPC by client::GrpcEndpoint and in-process by
  service::LocalEndpoint. Errors arrive as util exceptions.
*/
class UploadEndpoint {
 public:
  virtual ~UploadEndpoint() = default;

  virtual vault::archive::v1::StartUploadResponse StartUpload(const vault::archive::v1::StartUploadRequest& request) = 0;

  virtual vault::archive::v1::GetUploadPartUrlResponse GetUploadPartUrl(const vault::archive::v1::GetUploadPartUrlRequest& request) = 0;

  virtual vault::archive::v1::CompleteUploadResponse CompleteUpload(const vault::archive::v1::CompleteUploadRequest& request) = 0;

  virtual void AbortUpload(const vault::archive::v1::AbortUploadRequest& request) = 0;

  // Single-shot: header, then the whole stream in frames.
  virtual vault::archive::v1::ArchiveResponse Archive(const vault::archive::v1::ArchiveHeader& header,
                                                      packaging::ArchiveStream&                stream) = 0;
};

} // namespace vault::transfer
