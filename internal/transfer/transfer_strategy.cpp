#include "transfer_strategy.hpp"

#include <algorithm>
#include <limits>

#include "internal/util/errors.hpp"

namespace vault::transfer {

std::string_view ToString(TransferMode mode) {
  switch (mode) {
    case TransferMode::kSingleShot:
      return "single-shot";
    case TransferMode::kMultipart:
      return "multipart";
  }
  return "unknown";
}

TransferPolicy TransferPolicyFromConfig(const vault::runtime::config::TransferConfig& config) {
  return TransferPolicy{config.small_object_threshold_bytes(), config.chunk_size_bytes(), config.min_part_size_bytes()};
}

void ValidateTransferPolicy(const TransferPolicy& policy) {
  if (policy.small_object_threshold_bytes == 0) {
    throw util::InvalidArgument("small object threshold must be at least 1 byte");
  }
  if (policy.chunk_size_bytes == 0) {
    throw util::InvalidArgument("chunk size must be at least 1 byte");
  }
  if (policy.chunk_size_bytes < policy.min_part_size_bytes) {
    throw util::InvalidArgument("chunk size " + std::to_string(policy.chunk_size_bytes) + " is below the minimum part size " +
                                std::to_string(policy.min_part_size_bytes));
  }
}

uint64_t PartCountFor(uint64_t total_size, uint64_t chunk_size) {
  if (chunk_size == 0) {
    throw util::InvalidArgument("chunk size must be at least 1 byte");
  }
  return total_size / chunk_size + (total_size % chunk_size == 0 ? 0 : 1);
}

TransferPlan PlanTransfer(uint64_t total_size, const TransferPolicy& policy) {
  if (total_size == 0) {
    throw util::EmptyArchiveError();
  }
  ValidateTransferPolicy(policy);

  TransferPlan plan;
  plan.total_size = total_size;
  plan.chunk_size = policy.chunk_size_bytes;

  if (total_size <= policy.small_object_threshold_bytes) {
    plan.mode = TransferMode::kSingleShot;
    return plan;
  }

  const auto count = PartCountFor(total_size, policy.chunk_size_bytes);
  if (count > std::numeric_limits<uint32_t>::max()) {
    throw util::InvalidArgument("archive needs too many parts for chunk size " + std::to_string(policy.chunk_size_bytes));
  }

  plan.mode = TransferMode::kMultipart;
  plan.parts.reserve(count);
  for (uint64_t i = 0; i < count; ++i) {
    const uint64_t offset = i * policy.chunk_size_bytes;
    const uint64_t length = std::min(policy.chunk_size_bytes, total_size - offset);
    plan.parts.push_back(PartWindow{static_cast<uint32_t>(i + 1), offset, length});
  }
  return plan;
}

} // namespace vault::transfer
