#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "vault/archive/v1.hpp"

namespace vault::transfer {

/*
  Part receipts keyed by part number.

  Workers finish parts in any order; each slot is written at most once.
  Record() throws util::InvalidState for a second receipt on the same part
  and util::InvalidArgument for part numbers outside 1..expected or an
  empty receipt.
*/
class ReceiptTable {
 public:
  explicit ReceiptTable(uint32_t expected_parts) : expected_(expected_parts) {
  }

  void Record(uint32_t part_number, std::string receipt);

  std::optional<std::string> Get(uint32_t part_number) const;

  size_t Size() const;
  bool   Complete() const;

  // Ascending part order, ready for completion.
  std::vector<vault::archive::v1::PartReceipt> Ordered() const;

  std::vector<uint32_t> Missing() const;

  uint32_t expected_parts() const {
    return expected_;
  }

 private:
  const uint32_t                  expected_;
  mutable std::mutex              mutex_;
  std::map<uint32_t, std::string> receipts_;
};

} // namespace vault::transfer
