#pragma once

#include <arrow/buffer.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "capability.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/model/upload_session_record.hpp"
#include "internal/storage/object_store.hpp"
#include "internal/util/time.hpp"

namespace vault::upload {

struct SessionOptions {
  uint64_t                  default_chunk_size_bytes = 0;
  std::chrono::milliseconds capability_ttl{0};
  std::chrono::milliseconds session_max_age{0};
};

struct PartState {
  std::string etag;
  uint64_t    size_bytes = 0;
};

struct UploadSession {
  std::string session_id;
  std::string file_id;
  std::string filename;
  std::string content_type;
  std::string object_key;
  std::string store_upload_id;

  uint64_t chunk_size_bytes    = 0;
  uint64_t expected_size_bytes = 0;
  uint32_t expected_part_count = 0;

  util::TimePoint         created_at;
  util::TimePoint         updated_at;
  util::TimePoint         expires_at;
  db::model::SessionState state = db::model::SessionState::Open;

  std::map<uint32_t, PartState> parts;
  storage::ObjectInfo           committed;

  // aborted because it outlived session_max_age
  bool expired = false;
};

struct IssuedCapability {
  std::string     url;
  util::TimePoint expires_at;
};

struct WrittenPart {
  uint32_t    part_number = 0;
  std::string etag;
};

using ClockFn = std::function<util::TimePoint()>;

/*
  SessionManager

  Server side owner of multipart upload sessions.

      Open → PartsInFlight → Reconciling → Committed
        \________________\______________→ Aborted

  - OpenSession allocates the file id, the object key and the store upload.
  - IssuePartCapability signs a single-use URL for one part.
  - WritePart redeems a capability and writes the part to the store.
  - Abort is idempotent on aborted and committed sessions.

  Locking:
    mutex_ guards the in-memory session map only. Store and catalog calls
    run without it; state checks happen before and after.

  Persistence:
    one upload_sessions row per live session (insert on open, delete on
    commit or abort) so orphans can be aborted after a restart.
*/
class SessionManager {
 public:
  SessionManager(storage::ObjectStorePtr store, std::shared_ptr<db::Repository> repository, CapabilitySigner signer,
                 SessionOptions options, ClockFn clock = &util::Now);

  // util::EmptyArchiveError for size 0, util::InvalidArgument for chunk sizes
  // below the store minimum or part counts above the store maximum.
  UploadSession OpenSession(const std::string& filename, const std::string& content_type, uint64_t expected_size_bytes,
                            uint64_t chunk_size_bytes);

  IssuedCapability IssuePartCapability(const std::string& session_id, uint32_t part_number);

  // data must be exactly the part's byte range.
  WrittenPart WritePart(const std::string& capability_url, const std::shared_ptr<arrow::Buffer>& data);

  UploadSession Get(const std::string& session_id) const;

  // Open / PartsInFlight → Reconciling. A Committed session is returned
  // unchanged so a retried completion can finish catalog registration.
  UploadSession BeginReconcile(const std::string& session_id);

  // Reconciling → PartsInFlight after a transient store failure.
  void RevertReconcile(const std::string& session_id);

  void MarkCommitted(const std::string& session_id, const storage::ObjectInfo& info);

  void Abort(const std::string& session_id);

  // Reconciling → Aborted; used by the reconciler after a rejected completion.
  void AbortReconciling(const std::string& session_id);

  /*
    Aborts sessions older than session_max_age that never committed,
    including persisted rows left by an earlier process, and forgets
    terminal sessions after the same age. Returns the number aborted.
  */
  size_t ReapExpired();

  size_t ActiveCount() const;

  storage::StoreLimits Limits() const {
    return store_->Limits();
  }

 private:
  using SessionState = db::model::SessionState;

  struct Entry {
    UploadSession                   session;
    std::unordered_set<std::string> outstanding_nonces;
  };

  Entry& Find(const std::string& session_id);
  bool   Expired(const UploadSession& session, util::TimePoint now) const;
  void   ThrowIfNotWritable(const UploadSession& session, util::TimePoint now) const;

  void AbortInternal(const std::string& session_id, bool expired, bool reconciling = false);

  void PersistInsert(const UploadSession& session);
  void PersistState(const std::string& session_id, SessionState state);
  void PersistDelete(const std::string& session_id);

  storage::ObjectStorePtr         store_;
  std::shared_ptr<db::Repository> repository_;
  CapabilitySigner                signer_;
  SessionOptions                  options_;
  ClockFn                         clock_;

  mutable std::mutex                     mutex_;
  std::unordered_map<std::string, Entry> sessions_;
};

} // namespace vault::upload
