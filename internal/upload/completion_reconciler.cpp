#include "completion_reconciler.hpp"

#include <algorithm>
#include <map>
#include <optional>
#include <stdexcept>
#include <thread>
#include <vector>

#include "internal/db/api/db_errors.hpp"
#include "internal/db/model/record_mapping.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace vault::upload {

using observability::StringField;
using observability::UIntField;
using vault::archive::v1::ArchiveRecord;
using vault::archive::v1::CompleteUploadRequest;

namespace {

std::string JoinNumbers(const std::vector<uint32_t>& numbers) {
  std::string out;
  for (auto n : numbers) {
    if (!out.empty()) out += ",";
    out += std::to_string(n);
  }
  return out;
}

} // namespace

CompletionReconciler::CompletionReconciler(std::shared_ptr<SessionManager> sessions, storage::ObjectStorePtr store,
                                           std::shared_ptr<db::Repository> repository, std::shared_ptr<metadata::MetadataCache> cache,
                                           transfer::RetryPolicy catalog_retry)
    : sessions_(std::move(sessions)),
      store_(std::move(store)),
      repository_(std::move(repository)),
      cache_(std::move(cache)),
      catalog_retry_(catalog_retry),
      sleeper_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }) {
  if (!sessions_ || !store_ || !repository_ || !cache_) {
    throw std::invalid_argument("CompletionReconciler: missing dependency");
  }
}

void CompletionReconciler::SetSleeper(Sleeper sleeper) {
  sleeper_ = std::move(sleeper);
}

// ---------------------------------------------------------------------------
// Complete
// ---------------------------------------------------------------------------

ArchiveRecord CompletionReconciler::Complete(const CompleteUploadRequest& request) {
  auto session = sessions_->BeginReconcile(request.upload_id());

  if (session.state == db::model::SessionState::Committed) {
    return FinishCommitted(session, request);
  }

  if (!request.filename().empty() && request.filename() != session.filename) {
    sessions_->RevertReconcile(session.session_id);
    throw util::InvalidArgument("filename '" + request.filename() + "' does not match upload session " + session.session_id);
  }

  try {
    ValidateParts(session, request);
  } catch (const util::ReconciliationError& e) {
    VAULT_LOG_WARN("reconciliation rejected", {StringField("session_id", session.session_id), StringField("error", e.what())});
    AbortRejected(session.session_id);
    throw;
  }

  std::vector<storage::CompletedPart> parts;
  parts.reserve(request.parts_size());
  for (const auto& receipt : request.parts()) {
    parts.push_back(storage::CompletedPart{receipt.part_number(), receipt.receipt_token()});
  }
  std::sort(parts.begin(), parts.end(), [](const auto& a, const auto& b) { return a.part_number < b.part_number; });

  storage::ObjectInfo committed;
  try {
    committed = store_->CompleteMultipartUpload(session.object_key, session.store_upload_id, parts);
  } catch (const util::InvalidState& e) {
    AbortRejected(session.session_id);
    throw util::ReconciliationError({}, {}, std::string("store rejected completion: ") + e.what());
  } catch (const util::NotFound& e) {
    AbortRejected(session.session_id);
    throw util::ReconciliationError({}, {}, std::string("store upload is gone: ") + e.what());
  } catch (const util::StorageError&) {
    sessions_->RevertReconcile(session.session_id);
    throw;
  }

  // From here on the store commit is applied; a failure keeps the record
  // pending instead of losing it.
  std::optional<storage::ObjectInfo> head;
  try {
    sessions_->MarkCommitted(session.session_id, committed);
    session.committed  = committed;
    session.updated_at = sessions_->Get(session.session_id).updated_at;
    head               = store_->Head(session.object_key);
  } catch (const std::exception& e) {
    auto row = BuildRecord(session, request, committed);
    if (committed.size_bytes != session.expected_size_bytes) {
      row.status     = vault::archive::v1::ARCHIVE_STATUS_ERROR;
      row.size_bytes = committed.size_bytes;
    }
    KeepPending(row, e.what());
    throw util::StorageError("archive " + row.file_id + " committed but not registered: " + e.what());
  }

  if (!head || head->size_bytes != session.expected_size_bytes) {
    auto row   = BuildRecord(session, request, committed);
    row.status = vault::archive::v1::ARCHIVE_STATUS_ERROR;
    if (head) row.size_bytes = head->size_bytes;
    VAULT_LOG_ERROR("committed object size mismatch", {StringField("file_id", row.file_id), UIntField("expected", session.expected_size_bytes),
                                                       UIntField("actual", head ? head->size_bytes : 0)});
    try {
      UpsertOnce(row);
    } catch (const std::exception& e) {
      KeepPending(row, e.what());
    }
    throw util::StorageError("committed object " + session.object_key + " does not have the declared size");
  }

  return FinishCommitted(session, request);
}

ArchiveRecord CompletionReconciler::FinishCommitted(const UploadSession& session, const CompleteUploadRequest& request) {
  std::optional<db::model::ArchiveRecord> pending;
  {
    std::lock_guard lock(pending_mutex_);
    auto            it = pending_.find(session.file_id);
    if (it != pending_.end()) pending = it->second;
  }
  if (pending) {
    auto record = Register(*pending);
    if (pending->status == vault::archive::v1::ARCHIVE_STATUS_ERROR) {
      throw util::InvalidState("archive " + session.file_id + " failed verification after commit");
    }
    return record;
  }

  {
    auto tx       = repository_->Begin();
    auto existing = repository_->GetArchive(*tx, session.file_id);
    tx->Commit();
    if (existing) {
      if (existing->status == vault::archive::v1::ARCHIVE_STATUS_ERROR) {
        throw util::InvalidState("archive " + session.file_id + " failed verification after commit");
      }
      return db::model::ToProto(*existing);
    }
  }
  return Register(BuildRecord(session, request, session.committed));
}

void CompletionReconciler::ValidateParts(const UploadSession& session, const CompleteUploadRequest& request) {
  if (request.file_size_bytes() != session.expected_size_bytes) {
    throw util::ReconciliationError({}, {}, "declared size " + std::to_string(request.file_size_bytes()) +
                                                " does not match session size " + std::to_string(session.expected_size_bytes));
  }

  std::vector<uint32_t>           duplicate;
  std::vector<uint32_t>           foreign;
  std::map<uint32_t, std::string> seen;
  for (const auto& receipt : request.parts()) {
    const auto n = receipt.part_number();
    if (n == 0 || n > session.expected_part_count) {
      foreign.push_back(n);
      continue;
    }
    if (!seen.emplace(n, receipt.receipt_token()).second) {
      duplicate.push_back(n);
    }
  }

  std::vector<uint32_t> missing;
  std::vector<uint32_t> mismatched;
  for (uint32_t n = 1; n <= session.expected_part_count; ++n) {
    auto sent     = seen.find(n);
    auto recorded = session.parts.find(n);
    if (sent == seen.end() || recorded == session.parts.end()) {
      missing.push_back(n);
    } else if (sent->second != recorded->second.etag) {
      mismatched.push_back(n);
    }
  }

  if (missing.empty() && duplicate.empty() && foreign.empty() && mismatched.empty()) {
    return;
  }

  std::string detail;
  if (!missing.empty()) detail += "missing parts [" + JoinNumbers(missing) + "] ";
  if (!duplicate.empty()) detail += "duplicate parts [" + JoinNumbers(duplicate) + "] ";
  if (!foreign.empty()) detail += "unknown parts [" + JoinNumbers(foreign) + "] ";
  if (!mismatched.empty()) detail += "receipt mismatch on parts [" + JoinNumbers(mismatched) + "] ";
  detail.pop_back();

  throw util::ReconciliationError(std::move(missing), std::move(duplicate), detail);
}

void CompletionReconciler::AbortRejected(const std::string& session_id) {
  try {
    sessions_->AbortReconciling(session_id);
  } catch (const std::exception& e) {
    // the rejection is what the caller sees; the reaper retries orphaned rows
    VAULT_LOG_WARN("abort after rejected completion failed", {StringField("session_id", session_id), StringField("error", e.what())});
  }
}

db::model::ArchiveRecord CompletionReconciler::BuildRecord(const UploadSession& session, const CompleteUploadRequest& request,
                                                           const storage::ObjectInfo& info) const {
  db::model::ArchiveRecord row;
  row.file_id           = session.file_id;
  row.storage_key       = session.object_key;
  row.original_filename = session.filename;
  row.size_bytes        = session.expected_size_bytes;
  row.tags.assign(request.tags().begin(), request.tags().end());
  row.content_type        = session.content_type.empty() ? request.content_type() : session.content_type;
  row.retention_policy    = request.policy();
  row.content_fingerprint = info.etag;
  row.archived_at_ms      = util::ToUnixMillis(session.updated_at);
  row.status              = vault::archive::v1::ARCHIVE_STATUS_ARCHIVED;
  return row;
}

// ---------------------------------------------------------------------------
// Catalog registration
// ---------------------------------------------------------------------------

void CompletionReconciler::UpsertOnce(const db::model::ArchiveRecord& row) {
  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->UpsertArchive(*tx, row), "upsert archive " + row.file_id);
  tx->Commit();
}

ArchiveRecord CompletionReconciler::Register(const db::model::ArchiveRecord& row) {
  transfer::RetryState retry(catalog_retry_);
  for (;;) {
    try {
      UpsertOnce(row);
      break;
    } catch (const std::exception& e) {
      auto delay = retry.RecordFailure();
      if (!delay) {
        KeepPending(row, e.what());
        throw util::StorageError("catalog registration of " + row.file_id + " failed: " + e.what());
      }
      VAULT_LOG_WARN("catalog registration failed; retrying", {StringField("file_id", row.file_id), UIntField("attempt", retry.failures()),
                                                               StringField("error", e.what())});
      sleeper_(*delay);
    }
  }

  {
    std::lock_guard lock(pending_mutex_);
    pending_.erase(row.file_id);
  }

  auto record = db::model::ToProto(row);
  cache_->Put(record);
  VAULT_LOG_INFO("archive registered", {StringField("file_id", row.file_id), UIntField("size_bytes", row.size_bytes),
                                        StringField("storage_key", row.storage_key)});
  return record;
}

void CompletionReconciler::KeepPending(const db::model::ArchiveRecord& row, const std::string& error) {
  {
    std::lock_guard lock(pending_mutex_);
    pending_[row.file_id] = row;
  }
  VAULT_LOG_ERROR("catalog registration failed; record kept pending", {StringField("file_id", row.file_id), StringField("error", error)});
}

size_t CompletionReconciler::RetryPendingRegistrations() {
  std::vector<db::model::ArchiveRecord> pending;
  {
    std::lock_guard lock(pending_mutex_);
    for (const auto& [id, row] : pending_) pending.push_back(row);
  }

  size_t registered = 0;
  for (const auto& row : pending) {
    try {
      UpsertOnce(row);
    } catch (const std::exception& e) {
      VAULT_LOG_WARN("pending catalog registration still failing", {StringField("file_id", row.file_id), StringField("error", e.what())});
      continue;
    }
    {
      std::lock_guard lock(pending_mutex_);
      pending_.erase(row.file_id);
    }
    cache_->Put(db::model::ToProto(row));
    ++registered;
  }
  return registered;
}

size_t CompletionReconciler::PendingCount() const {
  std::lock_guard lock(pending_mutex_);
  return pending_.size();
}

} // namespace vault::upload
