#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/tags_json.hpp"

namespace vault::db::sqlite {

using vault::db::ErrorCode;
using vault::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

static std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

static constexpr const char* kArchiveColumns =
    "file_id,storage_key,original_filename,size_bytes,tags,content_type,retention_policy,content_fingerprint,archived_at_ms,status";

static constexpr const char* kSessionColumns = "session_id,file_id,object_key,store_upload_id,state,created_at_ms,updated_at_ms";

static model::ArchiveRecord ReadArchiveRow(sqlite3_stmt* st) {
  model::ArchiveRecord r;
  r.file_id             = ColText(st, 0);
  r.storage_key         = ColText(st, 1);
  r.original_filename   = ColText(st, 2);
  r.size_bytes          = ColU64(st, 3);
  r.tags                = sql::DecodeTags(ColText(st, 4));
  r.content_type        = ColText(st, 5);
  r.retention_policy    = static_cast<vault::archive::v1::RetentionPolicy>(ColI32(st, 6));
  r.content_fingerprint = ColText(st, 7);
  r.archived_at_ms      = ColU64(st, 8);
  r.status              = static_cast<vault::archive::v1::ArchiveStatus>(ColI32(st, 9));
  return r;
}

static model::UploadSessionRecord ReadSessionRow(sqlite3_stmt* st) {
  model::UploadSessionRecord r;
  r.session_id      = ColText(st, 0);
  r.file_id         = ColText(st, 1);
  r.object_key      = ColText(st, 2);
  r.store_upload_id = ColText(st, 3);
  r.state           = static_cast<model::SessionState>(ColI32(st, 4));
  r.created_at_ms   = ColU64(st, 5);
  r.updated_at_ms   = ColU64(st, 6);
  return r;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_, std::unique_lock<std::mutex>(tx_mutex_));
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Archives
// ------------------------------------------------------------------

Result SqliteRepository::UpsertArchive(Transaction& t, const model::ArchiveRecord& r) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("INSERT INTO archives(") + kArchiveColumns +
                          ") VALUES(?,?,?,?,?,?,?,?,?,?) "
                          "ON CONFLICT(file_id) DO UPDATE SET storage_key=excluded.storage_key, "
                          "original_filename=excluded.original_filename, size_bytes=excluded.size_bytes, tags=excluded.tags, "
                          "content_type=excluded.content_type, retention_policy=excluded.retention_policy, "
                          "content_fingerprint=excluded.content_fingerprint, archived_at_ms=excluded.archived_at_ms, "
                          "status=excluded.status;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, r.file_id);
  BindText(st, 2, r.storage_key);
  BindText(st, 3, r.original_filename);
  BindU64(st, 4, r.size_bytes);
  BindText(st, 5, sql::EncodeTags(r.tags));
  BindText(st, 6, r.content_type);
  BindI32(st, 7, static_cast<int>(r.retention_policy));
  BindText(st, 8, r.content_fingerprint);
  BindU64(st, 9, r.archived_at_ms);
  BindI32(st, 10, static_cast<int>(r.status));

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  return Translate(db, rc);
}

std::optional<model::ArchiveRecord> SqliteRepository::GetArchive(Transaction& t, const std::string& file_id) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kArchiveColumns + " FROM archives WHERE file_id=?;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) return std::nullopt;

  BindText(st, 1, file_id);

  if (sqlite3_step(st) != SQLITE_ROW) {
    sqlite3_finalize(st);
    return std::nullopt;
  }

  auto r = ReadArchiveRow(st);
  sqlite3_finalize(st);
  return r;
}

std::vector<model::ArchiveRecord> SqliteRepository::ListArchives(Transaction& t) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kArchiveColumns + " FROM archives ORDER BY archived_at_ms ASC, file_id ASC;";

  std::vector<model::ArchiveRecord> out;
  sqlite3_stmt*                     st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) return out;

  while (sqlite3_step(st) == SQLITE_ROW) {
    out.push_back(ReadArchiveRow(st));
  }
  sqlite3_finalize(st);
  return out;
}

// ------------------------------------------------------------------
// Sessions
// ------------------------------------------------------------------

Result SqliteRepository::InsertSession(Transaction& t, const model::UploadSessionRecord& r) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("INSERT INTO upload_sessions(") + kSessionColumns + ") VALUES(?,?,?,?,?,?,?);";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, r.session_id);
  BindText(st, 2, r.file_id);
  BindText(st, 3, r.object_key);
  BindText(st, 4, r.store_upload_id);
  BindI32(st, 5, static_cast<int>(r.state));
  BindU64(st, 6, r.created_at_ms);
  BindU64(st, 7, r.updated_at_ms);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  if ((rc & 0xFF) == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, "upload session already exists");
  return Translate(db, rc);
}

Result SqliteRepository::UpdateSession(Transaction& t, const model::UploadSessionRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql = "UPDATE upload_sessions SET file_id=?,object_key=?,store_upload_id=?,state=?,updated_at_ms=? WHERE session_id=?;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, r.file_id);
  BindText(st, 2, r.object_key);
  BindText(st, 3, r.store_upload_id);
  BindI32(st, 4, static_cast<int>(r.state));
  BindU64(st, 5, r.updated_at_ms);
  BindText(st, 6, r.session_id);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  auto result = Translate(db, rc);
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return result;
}

std::optional<model::UploadSessionRecord> SqliteRepository::GetSession(Transaction& t, const std::string& session_id) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kSessionColumns + " FROM upload_sessions WHERE session_id=?;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) return std::nullopt;

  BindText(st, 1, session_id);

  if (sqlite3_step(st) != SQLITE_ROW) {
    sqlite3_finalize(st);
    return std::nullopt;
  }

  auto r = ReadSessionRow(st);
  sqlite3_finalize(st);
  return r;
}

std::vector<model::UploadSessionRecord> SqliteRepository::ListSessionsCreatedBefore(Transaction& t, uint64_t cutoff_ms) {
  auto* db = TX(t).Handle();

  const std::string sql =
      std::string("SELECT ") + kSessionColumns + " FROM upload_sessions WHERE created_at_ms < ? ORDER BY created_at_ms ASC;";

  std::vector<model::UploadSessionRecord> out;
  sqlite3_stmt*                           st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) return out;

  BindU64(st, 1, cutoff_ms);
  while (sqlite3_step(st) == SQLITE_ROW) {
    out.push_back(ReadSessionRow(st));
  }
  sqlite3_finalize(st);
  return out;
}

Result SqliteRepository::DeleteSession(Transaction& t, const std::string& session_id) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, "DELETE FROM upload_sessions WHERE session_id=?;", -1, &st, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, session_id);
  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  return Translate(db, rc);
}

} // namespace vault::db::sqlite
