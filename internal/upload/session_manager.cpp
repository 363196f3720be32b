#include "session_manager.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

#include "internal/db/api/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace vault::upload {

using observability::StringField;
using observability::UIntField;

namespace {

db::model::UploadSessionRecord ToRecord(const UploadSession& session) {
  db::model::UploadSessionRecord record;
  record.session_id      = session.session_id;
  record.file_id         = session.file_id;
  record.object_key      = session.object_key;
  record.store_upload_id = session.store_upload_id;
  record.state           = session.state;
  record.created_at_ms   = util::ToUnixMillis(session.created_at);
  record.updated_at_ms   = util::ToUnixMillis(session.updated_at);
  return record;
}

uint64_t ExpectedPartLength(const UploadSession& session, uint32_t part_number) {
  const uint64_t offset = static_cast<uint64_t>(part_number - 1) * session.chunk_size_bytes;
  return std::min(session.chunk_size_bytes, session.expected_size_bytes - offset);
}

} // namespace

SessionManager::SessionManager(storage::ObjectStorePtr store, std::shared_ptr<db::Repository> repository, CapabilitySigner signer,
                               SessionOptions options, ClockFn clock)
    : store_(std::move(store)),
      repository_(std::move(repository)),
      signer_(std::move(signer)),
      options_(options),
      clock_(std::move(clock)) {
  if (!store_) {
    throw std::invalid_argument("SessionManager: store is null");
  }
  if (!repository_) {
    throw std::invalid_argument("SessionManager: repository is null");
  }
}

// ---------------------------------------------------------------------------
// Open
// ---------------------------------------------------------------------------

UploadSession SessionManager::OpenSession(const std::string& filename, const std::string& content_type, uint64_t expected_size_bytes,
                                          uint64_t chunk_size_bytes) {
  if (expected_size_bytes == 0) {
    throw util::EmptyArchiveError();
  }
  if (filename.empty()) {
    throw util::InvalidArgument("filename must not be empty");
  }

  const auto limits = store_->Limits();
  const auto chunk  = chunk_size_bytes == 0 ? options_.default_chunk_size_bytes : chunk_size_bytes;
  if (chunk < limits.min_part_size_bytes) {
    throw util::InvalidArgument("chunk size " + std::to_string(chunk) + " is below the store minimum part size " +
                                std::to_string(limits.min_part_size_bytes));
  }
  const uint64_t parts = (expected_size_bytes + chunk - 1) / chunk;
  if (parts > limits.max_part_count) {
    throw util::InvalidArgument("archive of " + std::to_string(expected_size_bytes) + " bytes needs " + std::to_string(parts) +
                                " parts; the store allows " + std::to_string(limits.max_part_count));
  }

  UploadSession session;
  session.session_id          = util::NewId();
  session.file_id             = util::NewId();
  session.filename            = filename;
  session.content_type        = content_type;
  session.object_key          = storage::common::ArchiveObjectKey(session.file_id, filename);
  session.chunk_size_bytes    = chunk;
  session.expected_size_bytes = expected_size_bytes;
  session.expected_part_count = static_cast<uint32_t>(parts);
  session.created_at          = clock_();
  session.updated_at          = session.created_at;
  session.expires_at          = session.created_at + options_.session_max_age;
  session.state               = SessionState::Open;

  session.store_upload_id = store_->CreateMultipartUpload(session.object_key, content_type);

  try {
    PersistInsert(session);
  } catch (const std::exception& e) {
    VAULT_LOG_ERROR("session row insert failed; aborting store upload",
                    {StringField("session_id", session.session_id), StringField("error", e.what())});
    store_->AbortMultipartUpload(session.object_key, session.store_upload_id);
    throw;
  }

  {
    std::lock_guard lock(mutex_);
    sessions_.emplace(session.session_id, Entry{session, {}});
  }

  VAULT_LOG_INFO("upload session opened", {StringField("session_id", session.session_id), StringField("file_id", session.file_id),
                                           UIntField("size_bytes", expected_size_bytes), UIntField("chunk_size_bytes", chunk),
                                           UIntField("parts", parts)});
  return session;
}

// ---------------------------------------------------------------------------
// Parts
// ---------------------------------------------------------------------------

IssuedCapability SessionManager::IssuePartCapability(const std::string& session_id, uint32_t part_number) {
  const auto now = clock_();

  CapabilityClaims claims;
  claims.session_id    = session_id;
  claims.part_number   = part_number;
  claims.expires_at_ms = util::ToUnixMillis(now + options_.capability_ttl);
  claims.nonce         = CapabilitySigner::NewNonce();

  bool expired = false;
  {
    std::lock_guard lock(mutex_);
    auto&           entry = Find(session_id);
    if (Expired(entry.session, now) && entry.session.state != SessionState::Aborted) {
      expired = true;
    } else {
      ThrowIfNotWritable(entry.session, now);
      if (part_number == 0 || part_number > entry.session.expected_part_count) {
        throw util::InvalidArgument("part " + std::to_string(part_number) + " is outside 1.." +
                                    std::to_string(entry.session.expected_part_count));
      }
      entry.outstanding_nonces.insert(claims.nonce);
    }
  }

  if (expired) {
    AbortInternal(session_id, true);
    throw util::SessionExpiredError(util::SessionExpiredError::Scope::kSession, "upload session " + session_id + " expired");
  }

  return IssuedCapability{signer_.Issue(claims), util::FromUnixMillis(claims.expires_at_ms)};
}

WrittenPart SessionManager::WritePart(const std::string& capability_url, const std::shared_ptr<arrow::Buffer>& data) {
  const auto now    = clock_();
  const auto claims = signer_.Verify(capability_url, now);
  const auto size   = data ? static_cast<uint64_t>(data->size()) : 0;

  std::string key;
  std::string upload_id;
  bool        first_part = false;
  bool        expired    = false;
  {
    std::lock_guard lock(mutex_);
    auto&           entry = Find(claims.session_id);
    if (Expired(entry.session, now) && entry.session.state != SessionState::Aborted) {
      expired = true;
    } else {
      ThrowIfNotWritable(entry.session, now);
      if (entry.outstanding_nonces.erase(claims.nonce) == 0) {
        throw util::InvalidArgument("capability for part " + std::to_string(claims.part_number) + " was already used");
      }
      const auto expected = ExpectedPartLength(entry.session, claims.part_number);
      if (size != expected) {
        throw util::InvalidArgument("part " + std::to_string(claims.part_number) + " carries " + std::to_string(size) +
                                    " bytes; expected " + std::to_string(expected));
      }
      if (entry.session.state == SessionState::Open) {
        entry.session.state      = SessionState::PartsInFlight;
        entry.session.updated_at = now;
        first_part               = true;
      }
      key       = entry.session.object_key;
      upload_id = entry.session.store_upload_id;
    }
  }

  if (expired) {
    AbortInternal(claims.session_id, true);
    throw util::SessionExpiredError(util::SessionExpiredError::Scope::kSession, "upload session " + claims.session_id + " expired");
  }

  if (first_part) {
    PersistState(claims.session_id, SessionState::PartsInFlight);
  }

  auto etag = store_->UploadPart(key, upload_id, claims.part_number, data);

  {
    std::lock_guard lock(mutex_);
    auto&           entry = Find(claims.session_id);
    if (entry.session.state != SessionState::PartsInFlight) {
      throw util::InvalidState("upload session " + claims.session_id + " is " + db::model::ToString(entry.session.state) +
                               "; part " + std::to_string(claims.part_number) + " was not recorded");
    }
    entry.session.parts[claims.part_number] = PartState{etag, size};
    entry.session.updated_at                = clock_();
  }

  VAULT_LOG_DEBUG("part stored", {StringField("session_id", claims.session_id), UIntField("part", claims.part_number),
                                  UIntField("size_bytes", size)});
  return WrittenPart{claims.part_number, etag};
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

UploadSession SessionManager::Get(const std::string& session_id) const {
  std::lock_guard lock(mutex_);
  auto            it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    throw util::NotFound("upload session not found: " + session_id);
  }
  return it->second.session;
}

UploadSession SessionManager::BeginReconcile(const std::string& session_id) {
  const auto now     = clock_();
  bool       expired = false;
  {
    std::lock_guard lock(mutex_);
    auto&           entry = Find(session_id);
    auto&           s     = entry.session;
    switch (s.state) {
      case SessionState::Committed:
        return s;
      case SessionState::Aborted:
        if (s.expired) {
          throw util::SessionExpiredError(util::SessionExpiredError::Scope::kSession, "upload session " + session_id + " expired");
        }
        throw util::InvalidState("upload session " + session_id + " was aborted");
      case SessionState::Reconciling:
        throw util::InvalidState("upload session " + session_id + " is already being completed");
      case SessionState::Open:
      case SessionState::PartsInFlight:
        break;
    }
    if (Expired(s, now)) {
      expired = true;
    } else {
      s.state      = SessionState::Reconciling;
      s.updated_at = now;
      entry.outstanding_nonces.clear();
    }
  }

  if (expired) {
    AbortInternal(session_id, true);
    throw util::SessionExpiredError(util::SessionExpiredError::Scope::kSession, "upload session " + session_id + " expired");
  }

  PersistState(session_id, SessionState::Reconciling);
  return Get(session_id);
}

void SessionManager::RevertReconcile(const std::string& session_id) {
  {
    std::lock_guard lock(mutex_);
    auto&           s = Find(session_id).session;
    if (s.state != SessionState::Reconciling) {
      return;
    }
    s.state      = SessionState::PartsInFlight;
    s.updated_at = clock_();
  }
  PersistState(session_id, SessionState::PartsInFlight);
}

void SessionManager::MarkCommitted(const std::string& session_id, const storage::ObjectInfo& info) {
  {
    std::lock_guard lock(mutex_);
    auto&           s = Find(session_id).session;
    if (s.state != SessionState::Reconciling) {
      throw util::InvalidState("upload session " + session_id + " is " + db::model::ToString(s.state) + ", not reconciling");
    }
    s.state      = SessionState::Committed;
    s.committed  = info;
    s.updated_at = clock_();
  }
  try {
    PersistDelete(session_id);
  } catch (const std::exception& e) {
    // the reaper drops the row once the entry ages out
    VAULT_LOG_WARN("committed session row not deleted", {StringField("session_id", session_id), StringField("error", e.what())});
  }
}

void SessionManager::Abort(const std::string& session_id) {
  AbortInternal(session_id, false);
}

void SessionManager::AbortReconciling(const std::string& session_id) {
  AbortInternal(session_id, false, true);
}

void SessionManager::AbortInternal(const std::string& session_id, bool expired, bool reconciling) {
  std::string key;
  std::string upload_id;
  {
    std::lock_guard lock(mutex_);
    auto&           entry = Find(session_id);
    auto&           s     = entry.session;
    if (s.state == SessionState::Aborted || s.state == SessionState::Committed) {
      return;
    }
    if (s.state == SessionState::Reconciling && !expired && !reconciling) {
      throw util::InvalidState("upload session " + session_id + " is being completed");
    }
    s.state      = SessionState::Aborted;
    s.expired    = expired;
    s.updated_at = clock_();
    entry.outstanding_nonces.clear();
    key       = s.object_key;
    upload_id = s.store_upload_id;
  }

  store_->AbortMultipartUpload(key, upload_id);
  PersistDelete(session_id);

  VAULT_LOG_INFO("upload session aborted", {StringField("session_id", session_id), observability::BoolField("expired", expired)});
}

size_t SessionManager::ReapExpired() {
  const auto now = clock_();

  std::vector<std::string> expired;
  {
    std::lock_guard lock(mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
      const auto& s        = it->second.session;
      const bool  terminal = s.state == SessionState::Aborted || s.state == SessionState::Committed;
      if (terminal && now - s.updated_at >= options_.session_max_age) {
        it = sessions_.erase(it);
        continue;
      }
      if (!terminal && s.state != SessionState::Reconciling && Expired(s, now)) {
        expired.push_back(s.session_id);
      }
      ++it;
    }
  }

  size_t reaped = 0;
  for (const auto& id : expired) {
    try {
      AbortInternal(id, true);
      ++reaped;
    } catch (const std::exception& e) {
      VAULT_LOG_WARN("expired session abort failed", {StringField("session_id", id), StringField("error", e.what())});
    }
  }

  // rows left behind by an earlier process
  const auto                                  cutoff = util::ToUnixMillis(now - options_.session_max_age);
  std::vector<db::model::UploadSessionRecord> orphans;
  {
    auto tx = repository_->Begin();
    orphans = repository_->ListSessionsCreatedBefore(*tx, cutoff);
    tx->Commit();
  }

  for (const auto& row : orphans) {
    {
      std::lock_guard lock(mutex_);
      if (sessions_.count(row.session_id) != 0) {
        continue;
      }
    }
    try {
      store_->AbortMultipartUpload(row.object_key, row.store_upload_id);
      PersistDelete(row.session_id);
      ++reaped;
      VAULT_LOG_INFO("orphaned upload session aborted", {StringField("session_id", row.session_id),
                                                         StringField("state", db::model::ToString(row.state))});
    } catch (const std::exception& e) {
      VAULT_LOG_WARN("orphaned session abort failed", {StringField("session_id", row.session_id), StringField("error", e.what())});
    }
  }

  return reaped;
}

size_t SessionManager::ActiveCount() const {
  std::lock_guard lock(mutex_);
  size_t          active = 0;
  for (const auto& [id, entry] : sessions_) {
    const auto state = entry.session.state;
    if (state != SessionState::Aborted && state != SessionState::Committed) ++active;
  }
  return active;
}

// ---------------------------------------------------------------------------
// Internals
// ---------------------------------------------------------------------------

SessionManager::Entry& SessionManager::Find(const std::string& session_id) {
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    throw util::NotFound("upload session not found: " + session_id);
  }
  return it->second;
}

bool SessionManager::Expired(const UploadSession& session, util::TimePoint now) const {
  return options_.session_max_age.count() > 0 && now - session.created_at >= options_.session_max_age;
}

void SessionManager::ThrowIfNotWritable(const UploadSession& session, util::TimePoint) const {
  switch (session.state) {
    case SessionState::Open:
    case SessionState::PartsInFlight:
      return;
    case SessionState::Aborted:
      if (session.expired) {
        throw util::SessionExpiredError(util::SessionExpiredError::Scope::kSession, "upload session " + session.session_id + " expired");
      }
      throw util::InvalidState("upload session " + session.session_id + " was aborted");
    case SessionState::Reconciling:
    case SessionState::Committed:
      throw util::InvalidState("upload session " + session.session_id + " no longer accepts parts");
  }
}

void SessionManager::PersistInsert(const UploadSession& session) {
  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->InsertSession(*tx, ToRecord(session)), "insert upload session");
  tx->Commit();
}

void SessionManager::PersistState(const std::string& session_id, SessionState state) {
  UploadSession snapshot;
  {
    std::lock_guard lock(mutex_);
    snapshot = Find(session_id).session;
  }
  snapshot.state = state;

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->UpdateSession(*tx, ToRecord(snapshot)), "update upload session");
  tx->Commit();
}

void SessionManager::PersistDelete(const std::string& session_id) {
  auto tx     = repository_->Begin();
  auto result = repository_->DeleteSession(*tx, session_id);
  if (!result && result.code != db::ErrorCode::NotFound) {
    db::ThrowIfDbError(result, "delete upload session");
  }
  tx->Commit();
}

} // namespace vault::upload
