#pragma once

#include <arrow/buffer.h>

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/storage/object_store.hpp"

namespace vault::storage {

/*
  In-memory object store.

  Backed by Arrow buffers; behaves like S3 for multipart semantics
  (minimum part size, part count limit, etag rules). Used by tests and
  local development.

  Thread safety:
    - shared reads
    - exclusive writes
*/

class MemoryObjectStore final : public ObjectStore {
 public:
  explicit MemoryObjectStore(StoreLimits limits = {});

  std::unique_ptr<ObjectWriter> OpenWriter(const std::string& key, const std::string& content_type) override;

  std::string CreateMultipartUpload(const std::string& key, const std::string& content_type) override;
  std::string UploadPart(const std::string& key, const std::string& upload_id, uint32_t part_number,
                         const std::shared_ptr<arrow::Buffer>& data) override;
  ObjectInfo  CompleteMultipartUpload(const std::string& key, const std::string& upload_id,
                                      const std::vector<CompletedPart>& parts) override;
  void        AbortMultipartUpload(const std::string& key, const std::string& upload_id) override;

  std::optional<ObjectInfo>      Head(const std::string& key) override;
  std::shared_ptr<arrow::Buffer> ReadRange(const std::string& key, uint64_t offset, uint64_t length) override;

  StoreLimits Limits() const override {
    return limits_;
  }

  // Inspection helpers for tests.
  size_t ObjectCount() const;
  size_t PendingUploadCount() const;

 private:
  friend class MemoryObjectWriter;

  struct StoredObject {
    std::shared_ptr<arrow::Buffer> data;
    std::string                    etag;
    std::string                    content_type;
  };

  struct StoredPart {
    std::shared_ptr<arrow::Buffer> data;
    std::string                    etag;
  };

  struct PendingUpload {
    std::string                      key;
    std::string                      content_type;
    std::map<uint32_t, StoredPart> parts;
  };

  void Put(const std::string& key, StoredObject object);

  StoreLimits limits_;

  mutable std::shared_mutex                      mutex_;
  std::unordered_map<std::string, StoredObject>  objects_;
  std::unordered_map<std::string, PendingUpload> uploads_;
};

} // namespace vault::storage
