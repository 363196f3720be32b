#include "arrow_object_store.hpp"

#include <arrow/io/interfaces.h>
#include <arrow/util/key_value_metadata.h>

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/digest.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace vault::storage {

using common::JoinPath;
using common::Unwrap;

namespace {

constexpr int64_t kCopyWindowBytes = 1 << 20;

std::shared_ptr<const arrow::KeyValueMetadata> ContentTypeMetadata(const std::string& content_type) {
  if (content_type.empty()) return {};
  return arrow::key_value_metadata({"Content-Type"}, {content_type});
}

std::string ParentOf(const std::string& path) {
  auto slash = path.find_last_of('/');
  if (slash == std::string::npos) return {};
  return path.substr(0, slash);
}

} // namespace

// ------------------------------------------------------------------
// Writer
// ------------------------------------------------------------------

class ArrowObjectWriter final : public ObjectWriter {
 public:
  ArrowObjectWriter(std::shared_ptr<arrow::fs::FileSystem> fs, std::string staging_path, std::string final_path,
                    const std::string& content_type)
      : fs_(std::move(fs)), staging_path_(std::move(staging_path)), final_path_(std::move(final_path)) {
    out_ = Unwrap(fs_->OpenOutputStream(staging_path_, ContentTypeMetadata(content_type)));
  }

  ~ArrowObjectWriter() override {
    if (out_) {
      Abort();
    }
  }

  void Write(const void* data, uint64_t size) override {
    if (!out_) throw util::InvalidState("writer already finished");
    Unwrap(out_->Write(data, static_cast<int64_t>(size)));
    md5_.Update(data, size);
    size_ += size;
  }

  ObjectInfo Close() override {
    if (!out_) throw util::InvalidState("writer already finished");
    Unwrap(out_->Close());
    out_.reset();
    Unwrap(fs_->Move(staging_path_, final_path_));
    return ObjectInfo{size_, util::ToHex(md5_.Finish())};
  }

  void Abort() override {
    if (!out_) return;
    auto close_status = out_->Abort();
    out_.reset();
    if (!close_status.ok()) {
      VAULT_LOG_WARN("object writer abort failed", {observability::StringField("error", close_status.ToString())});
    }
    auto delete_status = fs_->DeleteFile(staging_path_);
    if (!delete_status.ok()) {
      VAULT_LOG_DEBUG("staged object not removed", {observability::StringField("error", delete_status.ToString())});
    }
  }

 private:
  std::shared_ptr<arrow::fs::FileSystem>  fs_;
  std::string                             staging_path_;
  std::string                             final_path_;
  std::shared_ptr<arrow::io::OutputStream> out_;
  util::Md5                               md5_;
  uint64_t                                size_ = 0;
};

// ------------------------------------------------------------------
// Store
// ------------------------------------------------------------------

ArrowObjectStore::ArrowObjectStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path, StoreLimits limits)
    : fs_(std::move(fs)), root_path_(std::move(root_path)), limits_(limits) {
}

std::string ArrowObjectStore::ObjectPath(const std::string& key) const {
  common::ValidateObjectKey(key);
  return JoinPath(root_path_, key);
}

std::string ArrowObjectStore::StagingDir(const std::string& upload_id) const {
  if (!util::IsUUID(upload_id)) {
    throw util::NotFound("no such multipart upload");
  }
  return JoinPath(root_path_, ".multipart/" + upload_id);
}

std::string ArrowObjectStore::PartPath(const std::string& upload_id, uint32_t part_number) const {
  return StagingDir(upload_id) + "/" + std::to_string(part_number) + ".part";
}

void ArrowObjectStore::EnsureParentDir(const std::string& path) {
  auto parent = ParentOf(path);
  if (!parent.empty()) {
    Unwrap(fs_->CreateDir(parent, /*recursive=*/true));
  }
}

bool ArrowObjectStore::Exists(const std::string& path) {
  auto info = Unwrap(fs_->GetFileInfo(path));
  return info.type() != arrow::fs::FileType::NotFound;
}

std::string ArrowObjectStore::ReadMarker(const std::string& upload_id) {
  auto marker = StagingDir(upload_id) + "/.upload";
  if (!Exists(marker)) {
    throw util::NotFound("no such multipart upload");
  }
  auto input = Unwrap(fs_->OpenInputFile(marker));
  auto size  = Unwrap(input->GetSize());
  auto data  = Unwrap(input->Read(size));
  return data->ToString();
}

std::unique_ptr<ObjectWriter> ArrowObjectStore::OpenWriter(const std::string& key, const std::string& content_type) {
  auto final_path   = ObjectPath(key);
  auto staging_path = JoinPath(root_path_, ".multipart/" + util::NewId() + ".object");
  EnsureParentDir(final_path);
  EnsureParentDir(staging_path);
  return std::make_unique<ArrowObjectWriter>(fs_, std::move(staging_path), std::move(final_path), content_type);
}

// ------------------------------------------------------------------
// Multipart
// ------------------------------------------------------------------

std::string ArrowObjectStore::CreateMultipartUpload(const std::string& key, const std::string& /*content_type*/) {
  common::ValidateObjectKey(key);
  auto upload_id = util::NewId();
  auto staging   = StagingDir(upload_id);

  Unwrap(fs_->CreateDir(staging, /*recursive=*/true));
  auto out = Unwrap(fs_->OpenOutputStream(staging + "/.upload"));
  Unwrap(out->Write(key.data(), static_cast<int64_t>(key.size())));
  Unwrap(out->Close());
  return upload_id;
}

std::string ArrowObjectStore::UploadPart(const std::string& key, const std::string& upload_id, uint32_t part_number,
                                         const std::shared_ptr<arrow::Buffer>& data) {
  if (part_number == 0 || part_number > limits_.max_part_count) {
    throw util::InvalidArgument("part number out of range: " + std::to_string(part_number));
  }
  if (ReadMarker(upload_id) != key) {
    throw util::NotFound("no such multipart upload");
  }

  auto out = Unwrap(fs_->OpenOutputStream(PartPath(upload_id, part_number)));
  Unwrap(out->Write(data));
  Unwrap(out->Close());

  return util::ToHex(util::Md5::Digest(std::string_view(reinterpret_cast<const char*>(data->data()), data->size())));
}

ObjectInfo ArrowObjectStore::CompleteMultipartUpload(const std::string& key, const std::string& upload_id,
                                                     const std::vector<CompletedPart>& parts) {
  if (parts.empty()) {
    throw util::InvalidState("multipart completion requires at least one part");
  }
  if (ReadMarker(upload_id) != key) {
    throw util::NotFound("no such multipart upload");
  }

  // Validate layout before any bytes move.
  uint32_t previous = 0;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (parts[i].part_number <= previous) {
      throw util::InvalidState("parts must be listed in ascending order");
    }
    previous = parts[i].part_number;

    auto info = Unwrap(fs_->GetFileInfo(PartPath(upload_id, parts[i].part_number)));
    if (info.type() == arrow::fs::FileType::NotFound) {
      throw util::InvalidState("part " + std::to_string(parts[i].part_number) + " was never uploaded");
    }
    const bool last = i + 1 == parts.size();
    if (!last && static_cast<uint64_t>(info.size()) < limits_.min_part_size_bytes) {
      throw util::InvalidState("part " + std::to_string(parts[i].part_number) + " is smaller than the minimum part size");
    }
  }

  const auto assembled = StagingDir(upload_id) + "/assembled";
  auto       out       = Unwrap(fs_->OpenOutputStream(assembled));

  std::vector<std::string> etags;
  etags.reserve(parts.size());
  uint64_t total = 0;

  for (const auto& part : parts) {
    auto      input = Unwrap(fs_->OpenInputStream(PartPath(upload_id, part.part_number)));
    util::Md5 md5;
    for (;;) {
      auto window = Unwrap(input->Read(kCopyWindowBytes));
      if (window->size() == 0) break;
      md5.Update(window->data(), static_cast<size_t>(window->size()));
      Unwrap(out->Write(window));
      total += static_cast<uint64_t>(window->size());
    }
    Unwrap(input->Close());

    auto etag = util::ToHex(md5.Finish());
    if (etag != part.etag) {
      Unwrap(out->Abort());
      throw util::InvalidState("etag mismatch for part " + std::to_string(part.part_number));
    }
    etags.push_back(std::move(etag));
  }
  Unwrap(out->Close());

  auto final_path = ObjectPath(key);
  EnsureParentDir(final_path);
  Unwrap(fs_->Move(assembled, final_path));
  Unwrap(fs_->DeleteDir(StagingDir(upload_id)));

  return ObjectInfo{total, util::MultipartEtag(etags.data(), etags.size())};
}

void ArrowObjectStore::AbortMultipartUpload(const std::string& /*key*/, const std::string& upload_id) {
  if (!util::IsUUID(upload_id)) return;
  auto staging = StagingDir(upload_id);
  if (!Exists(staging)) return;
  Unwrap(fs_->DeleteDir(staging));
}

// ------------------------------------------------------------------
// Reads
// ------------------------------------------------------------------

std::optional<ObjectInfo> ArrowObjectStore::Head(const std::string& key) {
  auto info = Unwrap(fs_->GetFileInfo(ObjectPath(key)));
  if (info.type() != arrow::fs::FileType::File) return std::nullopt;
  return ObjectInfo{static_cast<uint64_t>(info.size()), {}};
}

std::shared_ptr<arrow::Buffer> ArrowObjectStore::ReadRange(const std::string& key, uint64_t offset, uint64_t length) {
  auto path = ObjectPath(key);
  auto info = Unwrap(fs_->GetFileInfo(path));
  if (info.type() != arrow::fs::FileType::File) {
    throw util::NotFound("object not found: " + key);
  }

  const auto size = static_cast<uint64_t>(info.size());
  if (offset > size) throw util::InvalidArgument("read offset beyond object end");
  const auto clamped = std::min(length, size - offset);

  auto input = Unwrap(fs_->OpenInputFile(info));
  return Unwrap(input->ReadAt(static_cast<int64_t>(offset), static_cast<int64_t>(clamped)));
}

} // namespace vault::storage
