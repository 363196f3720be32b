#include "internal/db/memory/memory_repository.hpp"
#include "internal/storage/memory/memory_object_store.hpp"
#include "internal/upload/completion_reconciler.hpp"
#include "internal/upload/session_reaper.hpp"
#include "internal/util/errors.hpp"

#include <arrow/buffer.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

using namespace std::chrono_literals;
using vault::archive::v1::CompleteUploadRequest;
using vault::db::model::SessionState;

/*
  Catalog that fails the next `failures` archive upserts and the next
  `delete_failures` session deletes, then recovers. While `offline` is set
  every transaction fails to open.
*/
class FlakyCatalog final : public vault::db::Repository {
 public:
  std::atomic<int>  failures{0};
  std::atomic<int>  delete_failures{0};
  std::atomic<bool> offline{false};

  std::unique_ptr<vault::db::Transaction> Begin() override {
    if (offline) throw vault::util::StorageError("catalog offline");
    return inner_.Begin();
  }

  vault::db::Result UpsertArchive(vault::db::Transaction& tx, const vault::db::model::ArchiveRecord& row) override {
    if (failures > 0) {
      --failures;
      return vault::db::Result::Err(vault::db::ErrorCode::IOError, "catalog unavailable");
    }
    return inner_.UpsertArchive(tx, row);
  }
  std::optional<vault::db::model::ArchiveRecord> GetArchive(vault::db::Transaction& tx, const std::string& id) override {
    return inner_.GetArchive(tx, id);
  }
  std::vector<vault::db::model::ArchiveRecord> ListArchives(vault::db::Transaction& tx) override {
    return inner_.ListArchives(tx);
  }
  vault::db::Result InsertSession(vault::db::Transaction& tx, const vault::db::model::UploadSessionRecord& row) override {
    return inner_.InsertSession(tx, row);
  }
  vault::db::Result UpdateSession(vault::db::Transaction& tx, const vault::db::model::UploadSessionRecord& row) override {
    return inner_.UpdateSession(tx, row);
  }
  std::optional<vault::db::model::UploadSessionRecord> GetSession(vault::db::Transaction& tx, const std::string& id) override {
    return inner_.GetSession(tx, id);
  }
  std::vector<vault::db::model::UploadSessionRecord> ListSessionsCreatedBefore(vault::db::Transaction& tx, uint64_t cutoff_ms) override {
    return inner_.ListSessionsCreatedBefore(tx, cutoff_ms);
  }
  vault::db::Result DeleteSession(vault::db::Transaction& tx, const std::string& id) override {
    if (delete_failures > 0) {
      --delete_failures;
      return vault::db::Result::Err(vault::db::ErrorCode::IOError, "catalog unavailable");
    }
    return inner_.DeleteSession(tx, id);
  }

 private:
  vault::db::memory::MemoryRepository inner_;
};

struct Fixture {
  std::shared_ptr<vault::storage::MemoryObjectStore>  store   = std::make_shared<vault::storage::MemoryObjectStore>(vault::storage::StoreLimits{4, 16});
  std::shared_ptr<FlakyCatalog>                       catalog = std::make_shared<FlakyCatalog>();
  std::shared_ptr<vault::metadata::MetadataCache>     cache   = std::make_shared<vault::metadata::MetadataCache>();
  std::shared_ptr<vault::upload::SessionManager>      sessions;
  std::shared_ptr<vault::upload::CompletionReconciler> reconciler;
  std::vector<std::chrono::milliseconds>              sleeps;

  Fixture() {
    vault::upload::SessionOptions options;
    options.default_chunk_size_bytes = 4;
    options.capability_ttl           = 30s;
    options.session_max_age          = 10min;
    sessions = std::make_shared<vault::upload::SessionManager>(store, catalog, vault::upload::CapabilitySigner("secret", "vault://parts"),
                                                               options);

    vault::transfer::RetryPolicy retry;
    retry.max_attempts    = 3;
    retry.initial_backoff = 10ms;
    retry.max_backoff     = 1s;
    retry.multiplier      = 2.0;
    reconciler = std::make_shared<vault::upload::CompletionReconciler>(sessions, store, catalog, cache, retry);
    reconciler->SetSleeper([this](std::chrono::milliseconds d) { sleeps.push_back(d); });
  }

  // Opens a 10 byte session (parts of 4, 4, 2) and writes every part.
  vault::upload::UploadSession Upload() {
    const std::string payload = "0123456789";
    auto              session = sessions->OpenSession("batch.zip", "application/zip", payload.size(), 4);
    for (uint32_t n = 1; n <= session.expected_part_count; ++n) {
      const auto cap = sessions->IssuePartCapability(session.session_id, n);
      sessions->WritePart(cap.url, arrow::Buffer::FromString(payload.substr((n - 1) * 4, 4)));
    }
    return sessions->Get(session.session_id);
  }

  bool Catalogued(const std::string& file_id) {
    auto tx  = catalog->Begin();
    auto row = catalog->GetArchive(*tx, file_id);
    tx->Commit();
    return row.has_value();
  }

  bool HasSessionRow(const std::string& session_id) {
    auto tx  = catalog->Begin();
    auto row = catalog->GetSession(*tx, session_id);
    tx->Commit();
    return row.has_value();
  }
};

CompleteUploadRequest RequestFor(const vault::upload::UploadSession& session) {
  CompleteUploadRequest request;
  request.set_upload_id(session.session_id);
  request.set_filename(session.filename);
  request.set_file_size_bytes(session.expected_size_bytes);
  request.set_policy(vault::archive::v1::RETENTION_POLICY_LEGAL_HOLD);
  request.add_tags("batch");
  // receipts deliberately out of order
  for (auto it = session.parts.rbegin(); it != session.parts.rend(); ++it) {
    auto* receipt = request.add_parts();
    receipt->set_part_number(it->first);
    receipt->set_receipt_token(it->second.etag);
  }
  return request;
}

vault::util::ReconciliationError ExpectReconciliationError(Fixture& f, const CompleteUploadRequest& request) {
  try {
    f.reconciler->Complete(request);
  } catch (const vault::util::ReconciliationError& e) {
    return e;
  }
  assert(false && "expected ReconciliationError");
  return vault::util::ReconciliationError({}, {}, "");
}

void TestCompleteCommitsAndCatalogues() {
  Fixture    f;
  const auto session = f.Upload();

  const auto record = f.reconciler->Complete(RequestFor(session));
  assert(record.file_id() == session.file_id);
  assert(record.status() == vault::archive::v1::ARCHIVE_STATUS_ARCHIVED);
  assert(record.size_bytes() == 10);
  assert(record.original_filename() == "batch.zip");
  assert(record.retention_policy() == vault::archive::v1::RETENTION_POLICY_LEGAL_HOLD);
  assert(record.tags_size() == 1 && record.tags(0) == "batch");
  assert(record.content_fingerprint().find("-3") != std::string::npos);

  assert(f.Catalogued(session.file_id));
  assert(f.cache->Get(session.file_id).has_value());
  assert(f.store->Head(session.object_key)->size_bytes == 10);
  assert(f.store->ReadRange(session.object_key, 0, 10)->ToString() == "0123456789");
  assert(f.sessions->Get(session.session_id).state == SessionState::Committed);
  assert(f.sleeps.empty());

  // a repeated completion returns the same record
  const auto again = f.reconciler->Complete(RequestFor(session));
  assert(again.file_id() == record.file_id());
  assert(f.store->ObjectCount() == 1);
}

void TestMissingPartAbortsSession() {
  Fixture    f;
  const auto session = f.Upload();
  auto       request = RequestFor(session);
  request.mutable_parts()->RemoveLast(); // drops part 1

  const auto error = ExpectReconciliationError(f, request);
  assert((error.missing_parts() == std::vector<uint32_t>{1}));
  assert(std::string(error.what()).rfind("reconciliation failed: ", 0) == 0);
  assert(f.sessions->Get(session.session_id).state == SessionState::Aborted);
  assert(f.store->PendingUploadCount() == 0);
  assert(f.store->ObjectCount() == 0);
  assert(!f.Catalogued(session.file_id));
  assert(!f.HasSessionRow(session.session_id));
  assert(f.reconciler->PendingCount() == 0);
}

void TestDuplicateReceiptIsRejected() {
  Fixture    f;
  const auto session = f.Upload();
  auto       request = RequestFor(session);
  *request.add_parts() = request.parts(0);

  const auto error = ExpectReconciliationError(f, request);
  assert((error.duplicate_parts() == std::vector<uint32_t>{3}));
}

void TestWrongDeclaredSizeOrReceiptIsRejected() {
  {
    Fixture    f;
    const auto session = f.Upload();
    auto       request = RequestFor(session);
    request.set_file_size_bytes(11);
    ExpectReconciliationError(f, request);
    assert(f.sessions->Get(session.session_id).state == SessionState::Aborted);
  }
  {
    Fixture    f;
    const auto session = f.Upload();
    auto       request = RequestFor(session);
    request.mutable_parts(1)->set_receipt_token("forged");
    const auto error = ExpectReconciliationError(f, request);
    assert(error.missing_parts().empty());
    assert(std::string(error.what()).find("receipt mismatch") != std::string::npos);
  }
}

void TestFilenameMismatchLeavesSessionUsable() {
  Fixture    f;
  const auto session = f.Upload();
  auto       request = RequestFor(session);
  request.set_filename("other.zip");

  bool thrown = false;
  try {
    f.reconciler->Complete(request);
  } catch (const vault::util::InvalidArgument&) {
    thrown = true;
  }
  assert(thrown);
  assert(f.sessions->Get(session.session_id).state == SessionState::PartsInFlight);

  assert(f.reconciler->Complete(RequestFor(session)).status() == vault::archive::v1::ARCHIVE_STATUS_ARCHIVED);
}

void TestCatalogFailuresAreRetriedWithBackoff() {
  Fixture    f;
  const auto session = f.Upload();
  f.catalog->failures = 2;

  const auto record = f.reconciler->Complete(RequestFor(session));
  assert(record.status() == vault::archive::v1::ARCHIVE_STATUS_ARCHIVED);
  assert((f.sleeps == std::vector<std::chrono::milliseconds>{10ms, 20ms}));
  assert(f.reconciler->PendingCount() == 0);
}

void TestExhaustedRegistrationStaysPending() {
  Fixture    f;
  const auto session = f.Upload();
  f.catalog->failures = 3;

  bool thrown = false;
  try {
    f.reconciler->Complete(RequestFor(session));
  } catch (const vault::util::StorageError&) {
    thrown = true;
  }
  assert(thrown);
  assert(f.reconciler->PendingCount() == 1);
  assert(f.store->ObjectCount() == 1);
  assert(!f.Catalogued(session.file_id));
  assert(f.sessions->Get(session.session_id).state == SessionState::Committed);

  assert(f.reconciler->RetryPendingRegistrations() == 1);
  assert(f.reconciler->PendingCount() == 0);
  assert(f.Catalogued(session.file_id));
  assert(f.cache->Get(session.file_id).has_value());
}

void TestRepeatedCompleteFinishesPendingRegistration() {
  Fixture    f;
  const auto session = f.Upload();
  f.catalog->failures = 3;

  bool thrown = false;
  try {
    f.reconciler->Complete(RequestFor(session));
  } catch (const vault::util::StorageError&) {
    thrown = true;
  }
  assert(thrown);

  const auto record = f.reconciler->Complete(RequestFor(session));
  assert(record.file_id() == session.file_id);
  assert(f.reconciler->PendingCount() == 0);
  assert(f.store->ObjectCount() == 1);
}

void TestSessionRowCleanupFailureKeepsArchive() {
  Fixture    f;
  const auto session = f.Upload();
  f.catalog->delete_failures = 1;

  const auto record = f.reconciler->Complete(RequestFor(session));
  assert(record.status() == vault::archive::v1::ARCHIVE_STATUS_ARCHIVED);
  assert(f.Catalogued(session.file_id));
  assert(f.cache->Get(session.file_id).has_value());
  assert(f.reconciler->PendingCount() == 0);
  assert(f.sessions->Get(session.session_id).state == SessionState::Committed);
  // the stale row is left for the reaper
  assert(f.HasSessionRow(session.session_id));

  const auto again = f.reconciler->Complete(RequestFor(session));
  assert(again.file_id() == record.file_id());
  assert(f.store->ObjectCount() == 1);
}

void TestReaperSurvivesOfflineCatalog() {
  Fixture    f;
  const auto session = f.Upload();
  f.catalog->failures = 3;

  bool thrown = false;
  try {
    f.reconciler->Complete(RequestFor(session));
  } catch (const vault::util::StorageError&) {
    thrown = true;
  }
  assert(thrown);
  assert(f.reconciler->PendingCount() == 1);

  vault::upload::SessionReaper reaper(f.sessions, f.reconciler, 1h);
  f.catalog->offline = true;
  reaper.RunOnce();
  assert(f.reconciler->PendingCount() == 1);

  f.catalog->offline = false;
  reaper.RunOnce();
  assert(f.reconciler->PendingCount() == 0);
  assert(f.Catalogued(session.file_id));
}

} // namespace

int main() {
  TestCompleteCommitsAndCatalogues();
  TestMissingPartAbortsSession();
  TestDuplicateReceiptIsRejected();
  TestWrongDeclaredSizeOrReceiptIsRejected();
  TestFilenameMismatchLeavesSessionUsable();
  TestCatalogFailuresAreRetriedWithBackoff();
  TestExhaustedRegistrationStaysPending();
  TestRepeatedCompleteFinishesPendingRegistration();
  TestSessionRowCleanupFailureKeepsArchive();
  TestReaperSurvivesOfflineCatalog();

  std::cout << "vault_unit_completion_reconciler: pass\n";
  return 0;
}
