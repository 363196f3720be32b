#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace vault::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                              UpsertArchive(Transaction&, const model::ArchiveRecord&) override;
  std::optional<model::ArchiveRecord> GetArchive(Transaction&, const std::string&) override;
  std::vector<model::ArchiveRecord>   ListArchives(Transaction&) override;

  Result                                    InsertSession(Transaction&, const model::UploadSessionRecord&) override;
  Result                                    UpdateSession(Transaction&, const model::UploadSessionRecord&) override;
  std::optional<model::UploadSessionRecord> GetSession(Transaction&, const std::string&) override;
  std::vector<model::UploadSessionRecord>   ListSessionsCreatedBefore(Transaction&, uint64_t cutoff_ms) override;
  Result                                    DeleteSession(Transaction&, const std::string&) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::ArchiveRecord>       archives;
    std::unordered_map<std::string, model::UploadSessionRecord> sessions;

    // per-row write version, used for commit-time conflict detection
    std::unordered_map<std::string, uint64_t> row_versions;
  };

  static std::string ArchiveRow(const std::string& file_id) {
    return "archive/" + file_id;
  }
  static std::string SessionRow(const std::string& session_id) {
    return "session/" + session_id;
  }

  std::mutex mutex_;
  State      committed_;
};

} // namespace vault::db::memory
