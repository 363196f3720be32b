#pragma once

#include <cstdint>
#include <string>

namespace vault::db::model {

enum class SessionState : int {
  Open          = 1,
  PartsInFlight = 2,
  Reconciling   = 3,
  Committed     = 4,
  Aborted       = 5,
};

inline const char* ToString(SessionState state) {
  switch (state) {
    case SessionState::Open:
      return "open";
    case SessionState::PartsInFlight:
      return "parts_in_flight";
    case SessionState::Reconciling:
      return "reconciling";
    case SessionState::Committed:
      return "committed";
    case SessionState::Aborted:
      return "aborted";
  }
  return "unknown";
}

/*
  Persisted upload session row.

  Only what is needed to abort an orphaned store-side upload after a
  process restart. Part receipts stay in memory.
*/

struct UploadSessionRecord {
  std::string session_id; // client-visible upload id
  std::string file_id;
  std::string object_key;

  // store-internal multipart id; never leaves the server
  std::string store_upload_id;

  SessionState state = SessionState::Open;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace vault::db::model
