#include "local_endpoint.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace vault::service {

using namespace vault::archive::v1;

LocalEndpoint::LocalEndpoint(std::shared_ptr<ArchiveService> service) : service_(std::move(service)) {
  if (!service_) {
    throw std::invalid_argument("LocalEndpoint: service is null");
  }
}

StartUploadResponse LocalEndpoint::StartUpload(const StartUploadRequest& request) {
  return service_->StartUpload(request);
}

GetUploadPartUrlResponse LocalEndpoint::GetUploadPartUrl(const GetUploadPartUrlRequest& request) {
  return service_->GetUploadPartUrl(request);
}

CompleteUploadResponse LocalEndpoint::CompleteUpload(const CompleteUploadRequest& request) {
  return service_->CompleteUpload(request);
}

void LocalEndpoint::AbortUpload(const AbortUploadRequest& request) {
  service_->AbortUpload(request);
}

ArchiveResponse LocalEndpoint::Archive(const ArchiveHeader& header, packaging::ArchiveStream& stream) {
  return service_->Archive(header, stream);
}

std::string LocalEndpoint::TransferPart(const std::string& capability_url, uint32_t part_number,
                                        const std::shared_ptr<arrow::Buffer>& data) {
  PutPartResponse resp;
  try {
    resp = service_->PutPart(capability_url, data);
  } catch (const util::StorageError& e) {
    throw util::PartTransferError(part_number, e.what());
  }
  if (resp.part_number() != part_number) {
    throw util::InvalidState("capability was issued for part " + std::to_string(resp.part_number()) + ", not part " +
                             std::to_string(part_number));
  }
  return resp.receipt_token();
}

} // namespace vault::service
