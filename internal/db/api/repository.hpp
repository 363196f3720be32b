#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/archive_record.hpp"
#include "internal/db/model/upload_session_record.hpp"

namespace vault::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - UpsertArchive is idempotent on file_id

  The DB is the source of truth for:
    archive catalog records
    upload session rows (orphan cleanup only)
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Archive catalog
  // ---------------------------------------------------------------------

  virtual Result UpsertArchive(Transaction&, const model::ArchiveRecord&) = 0;

  virtual std::optional<model::ArchiveRecord> GetArchive(Transaction&, const std::string& file_id) = 0;

  // ordered by archived_at_ms, then file_id
  virtual std::vector<model::ArchiveRecord> ListArchives(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Upload sessions
  // ---------------------------------------------------------------------

  virtual Result InsertSession(Transaction&, const model::UploadSessionRecord&) = 0;

  virtual Result UpdateSession(Transaction&, const model::UploadSessionRecord&) = 0;

  virtual std::optional<model::UploadSessionRecord> GetSession(Transaction&, const std::string& session_id) = 0;

  virtual std::vector<model::UploadSessionRecord> ListSessionsCreatedBefore(Transaction&, uint64_t cutoff_ms) = 0;

  virtual Result DeleteSession(Transaction&, const std::string& session_id) = 0;
};

} // namespace vault::db
