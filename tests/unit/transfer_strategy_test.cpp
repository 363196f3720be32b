#include "internal/transfer/transfer_strategy.hpp"
#include "internal/util/errors.hpp"

#include <cassert>
#include <iostream>

namespace {

using vault::transfer::PlanTransfer;
using vault::transfer::TransferMode;
using vault::transfer::TransferPolicy;

TransferPolicy Policy(uint64_t threshold, uint64_t chunk, uint64_t min_part = 1) {
  return TransferPolicy{threshold, chunk, min_part};
}

void TestAtOrBelowThresholdIsSingleShot() {
  auto plan = PlanTransfer(100, Policy(100, 10));
  assert(plan.mode == TransferMode::kSingleShot);
  assert(plan.parts.empty());
  assert(plan.total_size == 100);

  plan = PlanTransfer(1, Policy(100, 10));
  assert(plan.mode == TransferMode::kSingleShot);
}

void TestAboveThresholdSplitsIntoChunks() {
  const auto plan = PlanTransfer(101, Policy(100, 25));
  assert(plan.mode == TransferMode::kMultipart);
  assert(plan.PartCount() == 5);

  uint64_t covered = 0;
  for (uint32_t i = 0; i < plan.PartCount(); ++i) {
    const auto& part = plan.parts[i];
    assert(part.part_number == i + 1);
    assert(part.offset == covered);
    covered += part.length;
  }
  assert(covered == 101);
  assert(plan.parts.back().length == 1);
  assert(plan.parts.front().length == 25);
}

void TestExactMultipleHasNoShortTail() {
  const auto plan = PlanTransfer(100, Policy(10, 20));
  assert(plan.PartCount() == 5);
  for (const auto& part : plan.parts) assert(part.length == 20);
  assert(vault::transfer::PartCountFor(100, 20) == 5);
  assert(vault::transfer::PartCountFor(101, 20) == 6);
}

void TestEmptyArchiveIsRejected() {
  bool thrown = false;
  try {
    PlanTransfer(0, Policy(100, 10));
  } catch (const vault::util::EmptyArchiveError&) {
    thrown = true;
  }
  assert(thrown);
}

void TestInvalidPoliciesAreRejected() {
  const TransferPolicy bad[] = {Policy(0, 10), Policy(10, 0), Policy(10, 4, 5)};
  for (const auto& policy : bad) {
    bool thrown = false;
    try {
      vault::transfer::ValidateTransferPolicy(policy);
    } catch (const vault::util::InvalidArgument&) {
      thrown = true;
    }
    assert(thrown);
  }
  vault::transfer::ValidateTransferPolicy(Policy(10, 5, 5));
}

void TestPolicyFromConfig() {
  vault::runtime::config::TransferConfig config;
  config.set_small_object_threshold_bytes(1024);
  config.set_chunk_size_bytes(512);
  config.set_min_part_size_bytes(256);

  const auto policy = vault::transfer::TransferPolicyFromConfig(config);
  assert(policy.small_object_threshold_bytes == 1024);
  assert(policy.chunk_size_bytes == 512);
  assert(policy.min_part_size_bytes == 256);
  assert(vault::transfer::ToString(TransferMode::kMultipart) == "multipart");
}

} // namespace

int main() {
  TestAtOrBelowThresholdIsSingleShot();
  TestAboveThresholdSplitsIntoChunks();
  TestExactMultipleHasNoShortTail();
  TestEmptyArchiveIsRejected();
  TestInvalidPoliciesAreRejected();
  TestPolicyFromConfig();

  std::cout << "vault_unit_transfer_strategy: pass\n";
  return 0;
}
