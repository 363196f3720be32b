#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace vault::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;
  std::mutex                tx_mutex_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace vault::db::sqlite
