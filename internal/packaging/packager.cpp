#include "packager.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "zip_layout.hpp"

namespace vault::packaging {

namespace {

// ------------------------------------------------------------
// Verbatim single file
// ------------------------------------------------------------

class VerbatimStream final : public ArchiveStream {
 public:
  VerbatimStream(ByteSourcePtr source, uint64_t size) : source_(std::move(source)), remaining_(size) {
  }

  std::shared_ptr<arrow::Buffer> NextWindow(uint64_t max_bytes) override {
    if (max_bytes == 0) {
      throw util::InvalidArgument("window size must be positive");
    }
    if (!input_) {
      auto opened = source_->Open();
      if (!opened.ok()) {
        throw util::PackagingError("cannot open " + source_->Describe() + ": " + opened.status().ToString());
      }
      input_ = std::move(*opened);
    }
    if (remaining_ == 0) {
      return arrow::Buffer::FromString(std::string());
    }

    const auto want   = std::min(remaining_, max_bytes);
    auto       window = input_->Read(static_cast<int64_t>(want));
    if (!window.ok()) {
      throw util::PackagingError("cannot read " + source_->Describe() + ": " + window.status().ToString());
    }
    auto buffer = std::move(*window);
    if (buffer->size() == 0) {
      throw util::PackagingError(source_->Describe() + " is shorter than its declared size");
    }
    remaining_ -= static_cast<uint64_t>(buffer->size());
    position_ += static_cast<uint64_t>(buffer->size());
    return buffer;
  }

  uint64_t Position() const override {
    return position_;
  }

 private:
  ByteSourcePtr                           source_;
  std::shared_ptr<arrow::io::InputStream> input_;
  uint64_t                                remaining_;
  uint64_t                                position_ = 0;
};

class VerbatimLayout final : public ArchiveLayout {
 public:
  VerbatimLayout(ByteSourcePtr source, uint64_t size) : source_(std::move(source)), size_(size) {
  }

  uint64_t TotalSize() const override {
    return size_;
  }

  std::unique_ptr<ArchiveStream> Open() const override {
    return std::make_unique<VerbatimStream>(source_, size_);
  }

 private:
  ByteSourcePtr source_;
  uint64_t      size_;
};

// ------------------------------------------------------------
// Path checks
// ------------------------------------------------------------

void ValidateRelativePath(const std::string& path) {
  if (path.empty()) {
    throw util::PackagingError("empty relative path");
  }
  if (path.front() == '/' || path.find('\\') != std::string::npos || path.find('\0') != std::string::npos) {
    throw util::PackagingError("relative path must be a relative '/'-separated path: " + path);
  }

  size_t start = 0;
  while (start <= path.size()) {
    auto end = path.find('/', start);
    if (end == std::string::npos) end = path.size();
    auto segment = std::string_view(path).substr(start, end - start);
    if (segment.empty() || segment == "." || segment == "..") {
      throw util::PackagingError("relative path has an invalid segment: " + path);
    }
    start = end + 1;
  }
}

std::string FirstSegment(const std::string& path) {
  auto slash = path.find('/');
  return slash == std::string::npos ? std::string{} : path.substr(0, slash);
}

std::string BaseName(const std::string& path) {
  auto slash = path.find_last_of('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // namespace

// ------------------------------------------------------------
// Packager
// ------------------------------------------------------------

std::string Packager::CommonRoot(const std::vector<SourceItem>& items) {
  if (items.empty()) return {};

  auto root = FirstSegment(items.front().relative_path);
  if (root.empty()) return {};

  for (const auto& item : items) {
    if (FirstSegment(item.relative_path) != root) return {};
  }
  return root;
}

std::string Packager::GuessContentType(const std::string& filename) {
  static const std::unordered_map<std::string, std::string> kTypes = {
      {"txt", "text/plain"},        {"csv", "text/csv"},          {"html", "text/html"},       {"htm", "text/html"},
      {"json", "application/json"}, {"xml", "application/xml"},   {"pdf", "application/pdf"},  {"zip", "application/zip"},
      {"gz", "application/gzip"},   {"tar", "application/x-tar"}, {"png", "image/png"},        {"jpg", "image/jpeg"},
      {"jpeg", "image/jpeg"},       {"gif", "image/gif"},         {"svg", "image/svg+xml"},    {"mp3", "audio/mpeg"},
      {"wav", "audio/wav"},         {"mp4", "video/mp4"},         {"doc", "application/msword"},
      {"docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
      {"xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
  };

  auto base = BaseName(filename);
  auto dot  = base.find_last_of('.');
  if (dot == std::string::npos || dot == 0 || dot + 1 == base.size()) {
    return kDefaultContentType;
  }

  auto ext = base.substr(dot + 1);
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  auto it = kTypes.find(ext);
  return it == kTypes.end() ? kDefaultContentType : it->second;
}

PackagedArchive Packager::Package(const ArchiveRequest& request, util::TimePoint now) {
  PackagedArchive archive;
  archive.tags   = request.tags;
  archive.policy = request.policy;

  if (const auto* single = std::get_if<SingleSource>(&request.contents)) {
    const auto& item = single->item;
    ValidateRelativePath(item.relative_path);
    if (!item.source) {
      throw util::PackagingError("missing byte source for " + item.relative_path);
    }

    auto size = item.source->Size();
    if (!size.ok()) {
      throw util::PackagingError("cannot read " + item.source->Describe() + ": " + size.status().ToString());
    }

    archive.name         = item.relative_path;
    archive.total_size   = *size;
    archive.content_type = GuessContentType(item.relative_path);
    archive.layout       = std::make_shared<VerbatimLayout>(item.source, *size);

    VAULT_LOG_DEBUG("packaged single file", {observability::StringField("name", archive.name),
                                             observability::UIntField("size_bytes", archive.total_size)});
    return archive;
  }

  const auto& items = std::get<TreeSources>(request.contents).items;
  if (items.empty()) {
    throw util::PackagingError("no source items supplied");
  }

  std::unordered_set<std::string> seen;
  for (const auto& item : items) {
    ValidateRelativePath(item.relative_path);
    if (!item.source) {
      throw util::PackagingError("missing byte source for " + item.relative_path);
    }
    if (!seen.insert(item.relative_path).second) {
      throw util::PackagingError("duplicate relative path: " + item.relative_path);
    }
  }

  auto root = CommonRoot(items);
  auto zip  = ZipLayout::Build(items);

  archive.name         = root.empty() ? "archive-" + util::FormatCompactUtc(now) + ".zip" : root + ".zip";
  archive.total_size   = zip->TotalSize();
  archive.content_type = kZipContentType;
  archive.layout       = std::move(zip);

  VAULT_LOG_DEBUG("packaged container", {observability::StringField("name", archive.name),
                                         observability::UIntField("entries", items.size()),
                                         observability::UIntField("size_bytes", archive.total_size)});
  return archive;
}

} // namespace vault::packaging
