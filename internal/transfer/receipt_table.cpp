#include "receipt_table.hpp"

#include "internal/util/errors.hpp"

namespace vault::transfer {

void ReceiptTable::Record(uint32_t part_number, std::string receipt) {
  if (part_number == 0 || part_number > expected_) {
    throw util::InvalidArgument("part number " + std::to_string(part_number) + " outside 1.." + std::to_string(expected_));
  }
  if (receipt.empty()) {
    throw util::InvalidArgument("empty receipt for part " + std::to_string(part_number));
  }

  std::lock_guard lock(mutex_);
  auto [it, inserted] = receipts_.emplace(part_number, std::move(receipt));
  if (!inserted) {
    throw util::InvalidState("part " + std::to_string(part_number) + " already has a receipt");
  }
}

std::optional<std::string> ReceiptTable::Get(uint32_t part_number) const {
  std::lock_guard lock(mutex_);
  auto            it = receipts_.find(part_number);
  if (it == receipts_.end()) return std::nullopt;
  return it->second;
}

size_t ReceiptTable::Size() const {
  std::lock_guard lock(mutex_);
  return receipts_.size();
}

bool ReceiptTable::Complete() const {
  return Size() == expected_;
}

std::vector<vault::archive::v1::PartReceipt> ReceiptTable::Ordered() const {
  std::lock_guard lock(mutex_);

  std::vector<vault::archive::v1::PartReceipt> out;
  out.reserve(receipts_.size());
  for (const auto& [part_number, token] : receipts_) {
    vault::archive::v1::PartReceipt receipt;
    receipt.set_part_number(part_number);
    receipt.set_receipt_token(token);
    out.push_back(std::move(receipt));
  }
  return out;
}

std::vector<uint32_t> ReceiptTable::Missing() const {
  std::lock_guard lock(mutex_);

  std::vector<uint32_t> missing;
  for (uint32_t n = 1; n <= expected_; ++n) {
    if (!receipts_.count(n)) missing.push_back(n);
  }
  return missing;
}

} // namespace vault::transfer
