#include "memory_object_store.hpp"

#include <arrow/io/memory.h>

#include <algorithm>
#include <mutex>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/digest.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace vault::storage {

using common::Unwrap;

// ------------------------------------------------------------------
// Writer
// ------------------------------------------------------------------

class MemoryObjectWriter final : public ObjectWriter {
 public:
  MemoryObjectWriter(MemoryObjectStore* store, std::string key, std::string content_type)
      : store_(store), key_(std::move(key)), content_type_(std::move(content_type)) {
    sink_ = Unwrap(arrow::io::BufferOutputStream::Create());
  }

  void Write(const void* data, uint64_t size) override {
    if (!sink_) throw util::InvalidState("writer already finished");
    Unwrap(sink_->Write(data, static_cast<int64_t>(size)));
    md5_.Update(data, size);
  }

  ObjectInfo Close() override {
    if (!sink_) throw util::InvalidState("writer already finished");
    auto buffer = Unwrap(sink_->Finish());
    sink_.reset();

    ObjectInfo info{static_cast<uint64_t>(buffer->size()), util::ToHex(md5_.Finish())};
    store_->Put(key_, {std::move(buffer), info.etag, content_type_});
    return info;
  }

  void Abort() override {
    sink_.reset();
  }

 private:
  MemoryObjectStore*                              store_;
  std::string                                     key_;
  std::string                                     content_type_;
  std::shared_ptr<arrow::io::BufferOutputStream>  sink_;
  util::Md5                                       md5_;
};

// ------------------------------------------------------------------
// Store
// ------------------------------------------------------------------

MemoryObjectStore::MemoryObjectStore(StoreLimits limits) : limits_(limits) {
}

void MemoryObjectStore::Put(const std::string& key, StoredObject object) {
  std::unique_lock lock(mutex_);
  objects_[key] = std::move(object);
}

std::unique_ptr<ObjectWriter> MemoryObjectStore::OpenWriter(const std::string& key, const std::string& content_type) {
  common::ValidateObjectKey(key);
  return std::make_unique<MemoryObjectWriter>(this, key, content_type);
}

std::string MemoryObjectStore::CreateMultipartUpload(const std::string& key, const std::string& content_type) {
  common::ValidateObjectKey(key);
  auto upload_id = util::NewId();

  std::unique_lock lock(mutex_);
  uploads_[upload_id] = PendingUpload{key, content_type, {}};
  return upload_id;
}

std::string MemoryObjectStore::UploadPart(const std::string& key, const std::string& upload_id, uint32_t part_number,
                                          const std::shared_ptr<arrow::Buffer>& data) {
  if (part_number == 0 || part_number > limits_.max_part_count) {
    throw util::InvalidArgument("part number out of range: " + std::to_string(part_number));
  }

  auto etag = util::ToHex(util::Md5::Digest(std::string_view(reinterpret_cast<const char*>(data->data()), data->size())));

  std::unique_lock lock(mutex_);
  auto             it = uploads_.find(upload_id);
  if (it == uploads_.end() || it->second.key != key) {
    throw util::NotFound("no such multipart upload");
  }
  it->second.parts[part_number] = StoredPart{data, etag};
  return etag;
}

ObjectInfo MemoryObjectStore::CompleteMultipartUpload(const std::string& key, const std::string& upload_id,
                                                      const std::vector<CompletedPart>& parts) {
  if (parts.empty()) {
    throw util::InvalidState("multipart completion requires at least one part");
  }

  std::unique_lock lock(mutex_);
  auto             it = uploads_.find(upload_id);
  if (it == uploads_.end() || it->second.key != key) {
    throw util::NotFound("no such multipart upload");
  }
  auto& pending = it->second;

  std::vector<std::shared_ptr<arrow::Buffer>> buffers;
  std::vector<std::string>                    etags;
  buffers.reserve(parts.size());
  etags.reserve(parts.size());

  uint32_t previous = 0;
  for (size_t i = 0; i < parts.size(); ++i) {
    const auto& part = parts[i];
    if (part.part_number <= previous) {
      throw util::InvalidState("parts must be listed in ascending order");
    }
    previous = part.part_number;

    auto stored = pending.parts.find(part.part_number);
    if (stored == pending.parts.end()) {
      throw util::InvalidState("part " + std::to_string(part.part_number) + " was never uploaded");
    }
    if (stored->second.etag != part.etag) {
      throw util::InvalidState("etag mismatch for part " + std::to_string(part.part_number));
    }
    const bool last = i + 1 == parts.size();
    if (!last && static_cast<uint64_t>(stored->second.data->size()) < limits_.min_part_size_bytes) {
      throw util::InvalidState("part " + std::to_string(part.part_number) + " is smaller than the minimum part size");
    }
    buffers.push_back(stored->second.data);
    etags.push_back(stored->second.etag);
  }

  auto       object = Unwrap(arrow::ConcatenateBuffers(buffers));
  ObjectInfo info{static_cast<uint64_t>(object->size()), util::MultipartEtag(etags.data(), etags.size())};

  objects_[key] = StoredObject{std::move(object), info.etag, pending.content_type};
  uploads_.erase(it);
  return info;
}

void MemoryObjectStore::AbortMultipartUpload(const std::string& /*key*/, const std::string& upload_id) {
  std::unique_lock lock(mutex_);
  uploads_.erase(upload_id);
}

std::optional<ObjectInfo> MemoryObjectStore::Head(const std::string& key) {
  std::shared_lock lock(mutex_);
  auto             it = objects_.find(key);
  if (it == objects_.end()) return std::nullopt;
  return ObjectInfo{static_cast<uint64_t>(it->second.data->size()), it->second.etag};
}

std::shared_ptr<arrow::Buffer> MemoryObjectStore::ReadRange(const std::string& key, uint64_t offset, uint64_t length) {
  std::shared_lock lock(mutex_);
  auto             it = objects_.find(key);
  if (it == objects_.end()) throw util::NotFound("object not found: " + key);

  const auto size = static_cast<uint64_t>(it->second.data->size());
  if (offset > size) throw util::InvalidArgument("read offset beyond object end");
  const auto clamped = std::min(length, size - offset);

  // zero-copy slice
  return arrow::SliceBuffer(it->second.data, static_cast<int64_t>(offset), static_cast<int64_t>(clamped));
}

size_t MemoryObjectStore::ObjectCount() const {
  std::shared_lock lock(mutex_);
  return objects_.size();
}

size_t MemoryObjectStore::PendingUploadCount() const {
  std::shared_lock lock(mutex_);
  return uploads_.size();
}

} // namespace vault::storage
