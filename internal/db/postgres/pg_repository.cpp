#include "pg_repository.hpp"

#include "internal/db/sql/tags_json.hpp"

namespace vault::db::postgres {

namespace {

model::ArchiveRecord ReadArchiveRow(const pqxx::row& row) {
  model::ArchiveRecord r;
  r.file_id             = row[0].c_str();
  r.storage_key         = row[1].c_str();
  r.original_filename   = row[2].c_str();
  r.size_bytes          = row[3].as<uint64_t>();
  r.tags                = sql::DecodeTags(row[4].c_str());
  r.content_type        = row[5].c_str();
  r.retention_policy    = static_cast<vault::archive::v1::RetentionPolicy>(row[6].as<int>());
  r.content_fingerprint = row[7].c_str();
  r.archived_at_ms      = row[8].as<uint64_t>();
  r.status              = static_cast<vault::archive::v1::ArchiveStatus>(row[9].as<int>());
  return r;
}

model::UploadSessionRecord ReadSessionRow(const pqxx::row& row) {
  model::UploadSessionRecord r;
  r.session_id      = row[0].c_str();
  r.file_id         = row[1].c_str();
  r.object_key      = row[2].c_str();
  r.store_upload_id = row[3].c_str();
  r.state           = static_cast<model::SessionState>(row[4].as<int>());
  r.created_at_ms   = row[5].as<uint64_t>();
  r.updated_at_ms   = row[6].as<uint64_t>();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Archives
// ------------------------------------------------------------------

Result PgRepository::UpsertArchive(Transaction& t, const model::ArchiveRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_archive", r.file_id, r.storage_key, r.original_filename, r.size_bytes, sql::EncodeTags(r.tags),
                               r.content_type, static_cast<int>(r.retention_policy), r.content_fingerprint, r.archived_at_ms,
                               static_cast<int>(r.status));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ArchiveRecord> PgRepository::GetArchive(Transaction& t, const std::string& file_id) {
  auto res = TX(t).Work().exec_prepared("get_archive", file_id);
  if (res.empty()) return std::nullopt;
  return ReadArchiveRow(res[0]);
}

std::vector<model::ArchiveRecord> PgRepository::ListArchives(Transaction& t) {
  auto res = TX(t).Work().exec(
      "SELECT file_id,storage_key,original_filename,size_bytes,tags::text,content_type,retention_policy,content_fingerprint,"
      "archived_at_ms,status FROM archives ORDER BY archived_at_ms ASC, file_id ASC;");

  std::vector<model::ArchiveRecord> records;
  records.reserve(res.size());
  for (const auto& row : res) {
    records.push_back(ReadArchiveRow(row));
  }
  return records;
}

// ------------------------------------------------------------------
// Sessions
// ------------------------------------------------------------------

Result PgRepository::InsertSession(Transaction& t, const model::UploadSessionRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_session", r.session_id, r.file_id, r.object_key, r.store_upload_id, static_cast<int>(r.state),
                               r.created_at_ms, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateSession(Transaction& t, const model::UploadSessionRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_session", r.session_id, r.file_id, r.object_key, r.store_upload_id,
                                          static_cast<int>(r.state), r.updated_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::UploadSessionRecord> PgRepository::GetSession(Transaction& t, const std::string& session_id) {
  auto res = TX(t).Work().exec_prepared("get_session", session_id);
  if (res.empty()) return std::nullopt;
  return ReadSessionRow(res[0]);
}

std::vector<model::UploadSessionRecord> PgRepository::ListSessionsCreatedBefore(Transaction& t, uint64_t cutoff_ms) {
  auto res = TX(t).Work().exec_params(
      "SELECT session_id,file_id,object_key,store_upload_id,state,created_at_ms,updated_at_ms FROM upload_sessions "
      "WHERE created_at_ms < $1 ORDER BY created_at_ms ASC;",
      cutoff_ms);

  std::vector<model::UploadSessionRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadSessionRow(row));
  }
  return out;
}

Result PgRepository::DeleteSession(Transaction& t, const std::string& session_id) {
  try {
    TX(t).Work().exec_prepared("delete_session", session_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace vault::db::postgres
