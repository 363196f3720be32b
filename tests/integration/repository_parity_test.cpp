#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"

#if VAULT_DB_SQLITE
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if VAULT_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#endif

namespace {

using vault::db::ErrorCode;
using vault::db::Repository;
using vault::db::memory::MemoryRepository;
using vault::db::model::ArchiveRecord;
using vault::db::model::SessionState;
using vault::db::model::UploadSessionRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

ArchiveRecord MakeArchive(const std::string& file_id, uint64_t archived_at_ms) {
  ArchiveRecord record;
  record.file_id             = file_id;
  record.storage_key         = "archives/" + file_id + "/photos.zip";
  record.original_filename   = "photos.zip";
  record.size_bytes          = 12 * 1024 * 1024;
  record.tags                = {"scan", "2024", "quote\"and,comma"};
  record.content_type        = "application/zip";
  record.retention_policy    = vault::archive::v1::RETENTION_POLICY_LEGAL_HOLD;
  record.content_fingerprint = "9b2cf535f27731c974343645a3985328-3";
  record.archived_at_ms      = archived_at_ms;
  record.status              = vault::archive::v1::ARCHIVE_STATUS_ARCHIVED;
  return record;
}

UploadSessionRecord MakeSession(const std::string& session_id, uint64_t created_at_ms) {
  UploadSessionRecord record;
  record.session_id      = session_id;
  record.file_id         = session_id + "-file";
  record.object_key      = "archives/" + record.file_id + "/batch.zip";
  record.store_upload_id = "store-upload-" + session_id;
  record.state           = SessionState::Open;
  record.created_at_ms   = created_at_ms;
  record.updated_at_ms   = created_at_ms;
  return record;
}

void VerifyArchiveUpsertIsIdempotent(Repository& repo, const std::string& id) {
  const auto first = MakeArchive(id, 1'000);
  {
    auto tx = repo.Begin();
    assert(repo.UpsertArchive(*tx, first));
    assert(repo.UpsertArchive(*tx, first));
    tx->Commit();
  }

  {
    auto tx     = repo.Begin();
    auto stored = repo.GetArchive(*tx, id);
    assert(stored.has_value());
    assert(stored->storage_key == first.storage_key);
    assert(stored->size_bytes == first.size_bytes);
    assert(stored->tags == first.tags);
    assert(stored->retention_policy == vault::archive::v1::RETENTION_POLICY_LEGAL_HOLD);
    assert(stored->content_fingerprint == first.content_fingerprint);
    assert(stored->status == vault::archive::v1::ARCHIVE_STATUS_ARCHIVED);
    assert(stored->archived_at_ms == 1'000);

    // a later upsert replaces the row in place
    auto changed   = first;
    changed.status = vault::archive::v1::ARCHIVE_STATUS_ERROR;
    changed.tags   = {};
    assert(repo.UpsertArchive(*tx, changed));
    auto reread = repo.GetArchive(*tx, id);
    assert(reread->status == vault::archive::v1::ARCHIVE_STATUS_ERROR);
    assert(reread->tags.empty());
    tx->Commit();
  }

  auto missing_tx = repo.Begin();
  assert(!repo.GetArchive(*missing_tx, id + "-missing").has_value());
  missing_tx->Commit();
}

void VerifyArchiveListing(Repository& repo, const std::string& prefix) {
  {
    auto tx = repo.Begin();
    assert(repo.UpsertArchive(*tx, MakeArchive(prefix + "-b", 2'000)));
    assert(repo.UpsertArchive(*tx, MakeArchive(prefix + "-a", 2'000)));
    assert(repo.UpsertArchive(*tx, MakeArchive(prefix + "-c", 1'500)));
    tx->Commit();
  }

  auto                     tx = repo.Begin();
  std::vector<std::string> ids;
  for (const auto& record : repo.ListArchives(*tx)) {
    if (record.file_id.rfind(prefix + "-", 0) == 0) ids.push_back(record.file_id);
  }
  tx->Commit();
  assert((ids == std::vector<std::string>{prefix + "-c", prefix + "-a", prefix + "-b"}));
}

void VerifySessionRows(Repository& repo, const std::string& prefix) {
  const auto old_row   = MakeSession(prefix + "-old", 1'000);
  const auto fresh_row = MakeSession(prefix + "-fresh", 5'000);
  {
    auto tx = repo.Begin();
    assert(repo.InsertSession(*tx, old_row));
    assert(repo.InsertSession(*tx, fresh_row));
    tx->Commit();
  }
  {
    auto tx        = repo.Begin();
    auto duplicate = repo.InsertSession(*tx, old_row);
    assert(!duplicate);
    assert(duplicate.code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }
  {
    auto tx               = repo.Begin();
    auto updated          = old_row;
    updated.state         = SessionState::Reconciling;
    updated.updated_at_ms = 4'000;
    assert(repo.UpdateSession(*tx, updated));

    auto missing = repo.UpdateSession(*tx, MakeSession(prefix + "-ghost", 1));
    assert(!missing && missing.code == ErrorCode::NotFound);
    tx->Commit();
  }
  {
    auto tx  = repo.Begin();
    auto row = repo.GetSession(*tx, old_row.session_id);
    assert(row.has_value());
    assert(row->state == SessionState::Reconciling);
    assert(row->updated_at_ms == 4'000);
    assert(row->store_upload_id == old_row.store_upload_id);

    std::vector<std::string> stale;
    for (const auto& r : repo.ListSessionsCreatedBefore(*tx, 5'000)) {
      if (r.session_id.rfind(prefix + "-", 0) == 0) stale.push_back(r.session_id);
    }
    assert((stale == std::vector<std::string>{old_row.session_id}));

    assert(repo.DeleteSession(*tx, old_row.session_id));
    assert(!repo.GetSession(*tx, old_row.session_id).has_value());
    tx->Commit();
  }
}

void VerifyRollbackBehavior(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.UpsertArchive(*tx, MakeArchive(id, 10)));
    assert(repo.InsertSession(*tx, MakeSession(id, 10)));
    tx->Rollback();
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetArchive(*check_tx, id).has_value());
  assert(!repo.GetSession(*check_tx, id).has_value());
  check_tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->UpsertArchive(*tx, MakeArchive(id, NowMs())));
    assert(repo->InsertSession(*tx, MakeSession(id + "-session", 1)));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx      = repo->Begin();
  auto archive = repo->GetArchive(*tx, id);
  assert(archive.has_value());
  assert(archive->tags.size() == 3);

  // orphaned session rows survive a restart so the reaper can find them
  auto sessions = repo->ListSessionsCreatedBefore(*tx, 2);
  bool found    = false;
  for (const auto& row : sessions) found = found || row.session_id == id + "-session";
  assert(found);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if VAULT_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("vault_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<vault::db::sqlite::SqliteDB>(db_path);
    vault::db::sql::RunMigrations(*db, vault::db::sql::SqliteSchema());
    return std::make_shared<vault::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = [db_path]() { std::filesystem::remove(db_path); },
  };
}
#endif

#if VAULT_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("VAULT_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("VAULT_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto suffix    = std::to_string(NowMs());
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<vault::db::postgres::PgPool>(conninfo);
    pool->Bootstrap(vault::db::sql::PostgresSchema());
    return std::make_shared<vault::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres-" + suffix,
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  VerifyArchiveUpsertIsIdempotent(*repo, backend.name + "-upsert");
  VerifyArchiveListing(*repo, backend.name + "-list");
  VerifySessionRows(*repo, backend.name + "-session");
  VerifyRollbackBehavior(*repo, backend.name + "-rollback");

  repo.reset();
  VerifyRestartDurability(backend, backend.name + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if VAULT_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if VAULT_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "vault_integration_repository_parity: pass\n";
  return 0;
}
