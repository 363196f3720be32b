#pragma once

#include <string>
#include <unordered_set>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace vault::db::memory {

/*
  Transaction = snapshot + write set

  Commit applies only the rows this transaction touched and fails when any
  of them was committed by another transaction after the snapshot was taken.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable(const std::string& row) {
    touched_.insert(row);
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&               repo_;
  MemoryRepository::State         working_;
  std::unordered_set<std::string> touched_;
  bool                            committed_   = false;
  bool                            rolled_back_ = false;
};

} // namespace vault::db::memory
