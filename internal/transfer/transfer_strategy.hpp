#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "config/config.pb.h"

namespace vault::transfer {

enum class TransferMode { kSingleShot, kMultipart };

std::string_view ToString(TransferMode mode);

struct TransferPolicy {
  uint64_t small_object_threshold_bytes = 0;
  uint64_t chunk_size_bytes             = 0;
  uint64_t min_part_size_bytes          = 0;
};

// One contiguous slice of the archive; part numbers start at 1.
struct PartWindow {
  uint32_t part_number = 0;
  uint64_t offset      = 0;
  uint64_t length      = 0;
};

struct TransferPlan {
  TransferMode            mode       = TransferMode::kSingleShot;
  uint64_t                total_size = 0;
  uint64_t                chunk_size = 0;
  std::vector<PartWindow> parts; // empty for single-shot

  uint32_t PartCount() const {
    return static_cast<uint32_t>(parts.size());
  }
};

TransferPolicy TransferPolicyFromConfig(const vault::runtime::config::TransferConfig& config);

// threshold >= 1, chunk >= min part size (and >= 1); throws util::InvalidArgument
void ValidateTransferPolicy(const TransferPolicy& policy);

// ceil(total / chunk)
uint64_t PartCountFor(uint64_t total_size, uint64_t chunk_size);

/*
  total == 0          → util::EmptyArchiveError
  total <= threshold  → single-shot
  otherwise           → ceil(total / chunk) parts, all but the last exactly chunk bytes
*/
TransferPlan PlanTransfer(uint64_t total_size, const TransferPolicy& policy);

} // namespace vault::transfer
