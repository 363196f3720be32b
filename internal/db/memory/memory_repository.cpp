#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace vault::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Archives
// ------------------------------------------------------------------

Result MemoryRepository::UpsertArchive(Transaction& t, const model::ArchiveRecord& r) {
  if (r.file_id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "file_id must not be empty");
  TX(t).Mutable(ArchiveRow(r.file_id)).archives[r.file_id] = r;
  return Result::Ok();
}

std::optional<model::ArchiveRecord> MemoryRepository::GetArchive(Transaction& t, const std::string& file_id) {
  const auto& s  = TX(t).View();
  auto        it = s.archives.find(file_id);
  if (it == s.archives.end()) return std::nullopt;
  return it->second;
}

std::vector<model::ArchiveRecord> MemoryRepository::ListArchives(Transaction& t) {
  const auto&                       s = TX(t).View();
  std::vector<model::ArchiveRecord> records;
  records.reserve(s.archives.size());
  for (const auto& [_, record] : s.archives) {
    records.push_back(record);
  }
  std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) {
    if (a.archived_at_ms != b.archived_at_ms) return a.archived_at_ms < b.archived_at_ms;
    return a.file_id < b.file_id;
  });
  return records;
}

// ------------------------------------------------------------------
// Sessions
// ------------------------------------------------------------------

Result MemoryRepository::InsertSession(Transaction& t, const model::UploadSessionRecord& r) {
  auto& s = TX(t).Mutable(SessionRow(r.session_id));
  if (s.sessions.contains(r.session_id)) return Result::Err(ErrorCode::AlreadyExists);
  s.sessions[r.session_id] = r;
  return Result::Ok();
}

Result MemoryRepository::UpdateSession(Transaction& t, const model::UploadSessionRecord& r) {
  auto& s = TX(t).Mutable(SessionRow(r.session_id));
  if (!s.sessions.contains(r.session_id)) return Result::Err(ErrorCode::NotFound);
  s.sessions[r.session_id] = r;
  return Result::Ok();
}

std::optional<model::UploadSessionRecord> MemoryRepository::GetSession(Transaction& t, const std::string& session_id) {
  const auto& s  = TX(t).View();
  auto        it = s.sessions.find(session_id);
  if (it == s.sessions.end()) return std::nullopt;
  return it->second;
}

std::vector<model::UploadSessionRecord> MemoryRepository::ListSessionsCreatedBefore(Transaction& t, uint64_t cutoff_ms) {
  std::vector<model::UploadSessionRecord> out;
  for (const auto& [_, record] : TX(t).View().sessions) {
    if (record.created_at_ms < cutoff_ms) out.push_back(record);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.created_at_ms < b.created_at_ms; });
  return out;
}

Result MemoryRepository::DeleteSession(Transaction& t, const std::string& session_id) {
  TX(t).Mutable(SessionRow(session_id)).sessions.erase(session_id);
  return Result::Ok();
}

} // namespace vault::db::memory
