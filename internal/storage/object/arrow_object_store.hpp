#pragma once

#include <arrow/filesystem/filesystem.h>

#include <memory>
#include <string>

#include "internal/storage/object_store.hpp"

namespace vault::storage {

/*
  Object store over an Arrow filesystem (local path, S3 / MinIO).

  Layout under root:

      <root>/<key>                              committed objects
      <root>/.multipart/<upload_id>/.upload     marker holding the target key
      <root>/.multipart/<upload_id>/<n>.part    staged parts
      <root>/.multipart/<upload_id>.object      in-progress single writes

  Writes land in staging and are moved into place when finished, so a
  key never exposes a partial object. Staging state lives entirely in the
  filesystem; uploads survive a process restart and can still be aborted.

  Head() reports size only; Arrow filesystems do not expose ETags.
*/

class ArrowObjectStore final : public ObjectStore {
 public:
  ArrowObjectStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path, StoreLimits limits = {});

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

 private:
  std::string ObjectPath(const std::string& key) const;
  std::string StagingDir(const std::string& upload_id) const;
  std::string PartPath(const std::string& upload_id, uint32_t part_number) const;

  void        EnsureParentDir(const std::string& path);
  std::string ReadMarker(const std::string& upload_id);
  bool        Exists(const std::string& path);

  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                            root_path_;
  StoreLimits                            limits_;
};

} // namespace vault::storage
