#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "vault/archive/v1/types.pb.h"

namespace vault::db::model {

/*
  Catalog row for one archived object.

  Keyed by file_id. Writers upsert on file_id so that a retried catalog
  registration after a store commit never produces a second row.

  tags are persisted as a JSON array:
    postgres -> jsonb
    sqlite   -> text
*/

struct ArchiveRecord {
  std::string file_id; // UUID text form

  std::string storage_key;
  std::string original_filename;
  uint64_t    size_bytes = 0;

  std::vector<std::string> tags;
  std::string              content_type;

  vault::archive::v1::RetentionPolicy retention_policy = vault::archive::v1::RETENTION_POLICY_UNSPECIFIED;

  // store ETag of the committed object
  std::string content_fingerprint;

  uint64_t archived_at_ms = 0;

  vault::archive::v1::ArchiveStatus status = vault::archive::v1::ARCHIVE_STATUS_UNSPECIFIED;
};

} // namespace vault::db::model
