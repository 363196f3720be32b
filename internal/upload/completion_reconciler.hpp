#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/archive_record.hpp"
#include "internal/metadata/metadata_cache.hpp"
#include "internal/storage/object_store.hpp"
#include "internal/transfer/retry_policy.hpp"
#include "session_manager.hpp"
#include "vault/archive/v1.hpp"

namespace vault::upload {

/*
  CompletionReconciler

  Turns a finished set of parts into one catalogued archive:

    1. validate the receipts against what the session recorded
       (missing, duplicate, foreign or mismatched receipts and a wrong
       declared size fail reconciliation and abort the session)
    2. complete the store upload with receipts in ascending part order
    3. confirm the committed object size
    4. register the catalog record, retried with backoff

  The store commit and the catalog write are not atomic. A commit whose
  registration keeps failing stays pending here; RetryPendingRegistrations
  (driven by the reaper) and a repeated CompleteUpload both finish it, and
  the upsert on file_id keeps that idempotent.
*/
class CompletionReconciler {
 public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  CompletionReconciler(std::shared_ptr<SessionManager> sessions, storage::ObjectStorePtr store,
                       std::shared_ptr<db::Repository> repository, std::shared_ptr<metadata::MetadataCache> cache,
                       transfer::RetryPolicy catalog_retry);

  void SetSleeper(Sleeper sleeper);

  vault::archive::v1::ArchiveRecord Complete(const vault::archive::v1::CompleteUploadRequest& request);

  // Catalog registration with retry; used for single-shot uploads too.
  // util::StorageError once retries are exhausted; the record is kept pending.
  vault::archive::v1::ArchiveRecord Register(const db::model::ArchiveRecord& row);

  // Returns the number of records registered.
  size_t RetryPendingRegistrations();

  size_t PendingCount() const;

 private:
  void ValidateParts(const UploadSession& session, const vault::archive::v1::CompleteUploadRequest& request);

  void UpsertOnce(const db::model::ArchiveRecord& row);
  void KeepPending(const db::model::ArchiveRecord& row, const std::string& error);
  void AbortRejected(const std::string& session_id);

  db::model::ArchiveRecord BuildRecord(const UploadSession& session, const vault::archive::v1::CompleteUploadRequest& request,
                                       const storage::ObjectInfo& info) const;

  vault::archive::v1::ArchiveRecord FinishCommitted(const UploadSession& session,
                                                    const vault::archive::v1::CompleteUploadRequest& request);

  std::shared_ptr<SessionManager>          sessions_;
  storage::ObjectStorePtr                  store_;
  std::shared_ptr<db::Repository>          repository_;
  std::shared_ptr<metadata::MetadataCache> cache_;
  transfer::RetryPolicy                    catalog_retry_;
  Sleeper                                  sleeper_;

  mutable std::mutex                                        pending_mutex_;
  std::unordered_map<std::string, db::model::ArchiveRecord> pending_;
};

} // namespace vault::upload
