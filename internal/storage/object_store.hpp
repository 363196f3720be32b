#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vault::storage {

// S3 multipart constraints; used by backends that mimic S3.
inline constexpr uint64_t kS3MinPartSizeBytes = 5ull * 1024 * 1024;
inline constexpr uint32_t kS3MaxPartCount     = 10000;

struct ObjectInfo {
  uint64_t    size_bytes = 0;
  std::string etag; // empty when the backend cannot report one cheaply
};

struct StoreLimits {
  uint64_t min_part_size_bytes = kS3MinPartSizeBytes;
  uint32_t max_part_count      = kS3MaxPartCount;
};

struct CompletedPart {
  uint32_t    part_number = 0;
  std::string etag;
};

/*
  Streaming single-object write.

  Nothing is visible under the key until Close() returns. Abort() discards
  everything written so far. Destroying an unclosed writer aborts it.
*/
class ObjectWriter {
 public:
  virtual ~ObjectWriter() = default;

  virtual void       Write(const void* data, uint64_t size) = 0;
  virtual ObjectInfo Close()                                = 0;
  virtual void       Abort()                                = 0;
};

/*
  Object store abstraction.

  The archive pipeline consumes the store as an opaque capability:
    - streaming single-object writes
    - multipart upload: create, upload parts, complete with ordered receipts
    - head / ranged reads for verification and retrieval

  ETags follow S3:
    single object : hex(md5(bytes))
    multipart     : hex(md5(concat(md5(part_i)))) + "-N"

  Errors:
    util::NotFound      unknown key or upload id
    util::InvalidState  completion rejected (missing part, etag mismatch, part too small)
    util::StorageError  backend failure

  Implementations:
    MemoryObjectStore → Arrow buffers in process memory
    ArrowObjectStore  → Arrow filesystem (local path, S3 / MinIO)
*/
class ObjectStore {
 public:
  virtual ~ObjectStore() = default;

  virtual std::unique_ptr<ObjectWriter> OpenWriter(const std::string& key, const std::string& content_type) = 0;

  // ------------------------------------------------------------------
  // Multipart
  // ------------------------------------------------------------------

  // Returns a store-internal upload id; never exposed to clients.
  virtual std::string CreateMultipartUpload(const std::string& key, const std::string& content_type) = 0;

  // Re-uploading a part number replaces the previous bytes.
  virtual std::string UploadPart(const std::string& key, const std::string& upload_id, uint32_t part_number,
                                 const std::shared_ptr<arrow::Buffer>& data) = 0;

  // parts must be in ascending part order.
  virtual ObjectInfo CompleteMultipartUpload(const std::string& key, const std::string& upload_id,
                                             const std::vector<CompletedPart>& parts) = 0;

  // Idempotent; unknown upload ids are ignored.
  virtual void AbortMultipartUpload(const std::string& key, const std::string& upload_id) = 0;

  // ------------------------------------------------------------------
  // Reads
  // ------------------------------------------------------------------

  virtual std::optional<ObjectInfo> Head(const std::string& key) = 0;

  // length is clamped to the object end.
  virtual std::shared_ptr<arrow::Buffer> ReadRange(const std::string& key, uint64_t offset, uint64_t length) = 0;

  virtual StoreLimits Limits() const = 0;
};

using ObjectStorePtr = std::shared_ptr<ObjectStore>;

} // namespace vault::storage
