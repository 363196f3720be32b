#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace vault::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  std::scoped_lock lock(repo_.mutex_);
  auto&            target = repo_.committed_;

  for (const auto& row : touched_) {
    const auto committed_version = target.row_versions.contains(row) ? target.row_versions.at(row) : 0;
    const auto snapshot_version  = working_.row_versions.contains(row) ? working_.row_versions.at(row) : 0;
    if (committed_version != snapshot_version) {
      throw util::InvalidState("transaction conflict: row " + row + " was modified by a concurrent transaction");
    }
  }

  for (const auto& row : touched_) {
    if (row.rfind("archive/", 0) == 0) {
      const auto id = row.substr(8);
      auto       it = working_.archives.find(id);
      if (it == working_.archives.end()) {
        target.archives.erase(id);
      } else {
        target.archives[id] = it->second;
      }
    } else {
      const auto id = row.substr(8);
      auto       it = working_.sessions.find(id);
      if (it == working_.sessions.end()) {
        target.sessions.erase(id);
      } else {
        target.sessions[id] = it->second;
      }
    }
    target.row_versions[row]++;
  }
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
}

} // namespace vault::db::memory
