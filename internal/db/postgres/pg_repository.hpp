#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace vault::db::postgres {

class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception&);
};

} // namespace vault::db::postgres
