#include "migrations.hpp"

namespace vault::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS archives (file_id TEXT PRIMARY KEY, storage_key TEXT NOT NULL, original_filename TEXT NOT NULL, size_bytes INTEGER NOT NULL, tags TEXT NOT NULL DEFAULT '[]', content_type TEXT NOT NULL, retention_policy INTEGER NOT NULL, content_fingerprint TEXT NOT NULL, archived_at_ms INTEGER NOT NULL, status INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS archives_archived_at_idx ON archives(archived_at_ms);",
      "CREATE TABLE IF NOT EXISTS upload_sessions (session_id TEXT PRIMARY KEY, file_id TEXT NOT NULL, object_key TEXT NOT NULL, store_upload_id TEXT NOT NULL, state INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS upload_sessions_created_at_idx ON upload_sessions(created_at_ms);",
      "CREATE TABLE IF NOT EXISTS vault_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",
      "INSERT OR IGNORE INTO vault_schema_migrations(version, applied_at_ms) VALUES (1, CAST(strftime('%s','now') AS INTEGER) * 1000);"};
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS archives (file_id TEXT PRIMARY KEY, storage_key TEXT NOT NULL, original_filename TEXT NOT NULL, size_bytes BIGINT NOT NULL, tags JSONB NOT NULL DEFAULT '[]'::jsonb, content_type TEXT NOT NULL, retention_policy SMALLINT NOT NULL, content_fingerprint TEXT NOT NULL, archived_at_ms BIGINT NOT NULL, status SMALLINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS archives_archived_at_idx ON archives(archived_at_ms);",
      "CREATE TABLE IF NOT EXISTS upload_sessions (session_id TEXT PRIMARY KEY, file_id TEXT NOT NULL, object_key TEXT NOT NULL, store_upload_id TEXT NOT NULL, state SMALLINT NOT NULL, created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS upload_sessions_created_at_idx ON upload_sessions(created_at_ms);",
      "CREATE TABLE IF NOT EXISTS vault_schema_migrations (version INTEGER PRIMARY KEY, applied_at TIMESTAMPTZ DEFAULT NOW());",
      "INSERT INTO vault_schema_migrations(version) VALUES (1) ON CONFLICT DO NOTHING;"};
  return kSchema;
}

} // namespace vault::db::sql
