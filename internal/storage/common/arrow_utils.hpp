#pragma once

#include <arrow/buffer.h>
#include <arrow/filesystem/filesystem.h>
#include <arrow/result.h>

#include <memory>
#include <string>
#include <utility>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace vault::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw util::StorageError
*/
template <typename T>
T Unwrap(arrow::Result<T> result) {
  if (!result.ok()) throw util::StorageError(result.status().ToString());
  return std::move(result).ValueOrDie();
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw util::StorageError(status.ToString());
}

/*
  Resolve the filesystem and root path for an object storage config.

  FILE_SYSTEM_LOCAL → LocalFileSystem rooted at root_path
  FILE_SYSTEM_S3    → S3FileSystem built from s3 options, root_path is s3://bucket/prefix
  FILE_SYSTEM_AUTO  → inferred from root_path (URI or local path)
*/
arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(
    const vault::runtime::config::ObjectStorageConfig& config);

} // namespace vault::storage::common
