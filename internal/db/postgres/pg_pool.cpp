#include "pg_pool.hpp"

namespace vault::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });
    }
  }
}

void PgPool::Bootstrap(const std::vector<std::string>& ordered_sql) {
  auto       conn = Acquire();
  pqxx::work tx(*conn);
  for (const auto& sql : ordered_sql) {
    tx.exec(sql);
  }
  tx.commit();
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("upsert_archive",
               "INSERT INTO archives(file_id,storage_key,original_filename,size_bytes,tags,content_type,retention_policy,"
               "content_fingerprint,archived_at_ms,status) VALUES($1,$2,$3,$4,$5::jsonb,$6,$7,$8,$9,$10) "
               "ON CONFLICT(file_id) DO UPDATE SET storage_key=EXCLUDED.storage_key,original_filename=EXCLUDED.original_filename,"
               "size_bytes=EXCLUDED.size_bytes,tags=EXCLUDED.tags,content_type=EXCLUDED.content_type,"
               "retention_policy=EXCLUDED.retention_policy,content_fingerprint=EXCLUDED.content_fingerprint,"
               "archived_at_ms=EXCLUDED.archived_at_ms,status=EXCLUDED.status");

  conn.prepare("get_archive",
               "SELECT file_id,storage_key,original_filename,size_bytes,tags::text,content_type,retention_policy,"
               "content_fingerprint,archived_at_ms,status FROM archives WHERE file_id=$1");

  conn.prepare("insert_session",
               "INSERT INTO upload_sessions(session_id,file_id,object_key,store_upload_id,state,created_at_ms,updated_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7)");

  conn.prepare("update_session",
               "UPDATE upload_sessions SET file_id=$2,object_key=$3,store_upload_id=$4,state=$5,updated_at_ms=$6 WHERE session_id=$1");

  conn.prepare("get_session",
               "SELECT session_id,file_id,object_key,store_upload_id,state,created_at_ms,updated_at_ms "
               "FROM upload_sessions WHERE session_id=$1");

  conn.prepare("delete_session", "DELETE FROM upload_sessions WHERE session_id=$1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace vault::db::postgres
