#pragma once

#include "internal/db/model/archive_record.hpp"
#include "internal/util/time.hpp"
#include "vault/archive/v1/types.pb.h"

namespace vault::db::model {

inline vault::archive::v1::ArchiveRecord ToProto(const ArchiveRecord& row) {
  vault::archive::v1::ArchiveRecord out;
  out.set_file_id(row.file_id);
  out.set_storage_key(row.storage_key);
  out.set_original_filename(row.original_filename);
  out.set_size_bytes(row.size_bytes);
  for (const auto& tag : row.tags) out.add_tags(tag);
  out.set_content_type(row.content_type);
  out.set_retention_policy(row.retention_policy);
  *out.mutable_archived_at() = util::ToProto(util::FromUnixMillis(row.archived_at_ms));
  out.set_status(row.status);
  out.set_content_fingerprint(row.content_fingerprint);
  return out;
}

inline ArchiveRecord FromProto(const vault::archive::v1::ArchiveRecord& record) {
  ArchiveRecord row;
  row.file_id           = record.file_id();
  row.storage_key       = record.storage_key();
  row.original_filename = record.original_filename();
  row.size_bytes        = record.size_bytes();
  row.tags.assign(record.tags().begin(), record.tags().end());
  row.content_type        = record.content_type();
  row.retention_policy    = record.retention_policy();
  row.archived_at_ms      = util::ToUnixMillis(util::FromProto(record.archived_at()));
  row.status              = record.status();
  row.content_fingerprint = record.content_fingerprint();
  return row;
}

} // namespace vault::db::model
