#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <string>

namespace vault::transfer {

/*
  Writes one part through a capability URL and returns its receipt.

  Exactly one write of exactly data->size() bytes per call.

  Errors:
    util::PartTransferError    network failure or non-success response (retryable)
    util::SessionExpiredError  capability (retry with a fresh one) or session expired
    anything else              fatal for the upload
*/
class PartTransport {
 public:
  virtual ~PartTransport() = default;

  virtual std::string TransferPart(const std::string& capability_url, uint32_t part_number,
                                   const std::shared_ptr<arrow::Buffer>& data) = 0;
};

} // namespace vault::transfer
