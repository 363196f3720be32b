#include "source_scanner.hpp"

#include <algorithm>
#include <filesystem>
#include <iterator>

#include "internal/util/errors.hpp"

namespace fs = std::filesystem;

namespace vault::packaging {

namespace {

std::string DirectoryName(const fs::path& dir) {
  auto normal = dir.lexically_normal();
  auto name   = normal.filename();
  if (name.empty()) name = normal.parent_path().filename();
  if (name.empty() || name == "." || name == "..") {
    name = fs::absolute(normal).lexically_normal().filename();
  }
  return name.generic_string();
}

void ScanDirectory(const fs::path& root, std::vector<SourceItem>& out) {
  const auto              prefix = DirectoryName(root);
  std::vector<SourceItem> found;
  std::error_code         ec;

  for (auto it = fs::recursive_directory_iterator(root, fs::directory_options::skip_permission_denied, ec);
       !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (!it->is_regular_file(ec)) continue;
    auto rel = fs::relative(it->path(), root, ec);
    if (ec) break;
    found.push_back(SourceItem{prefix + "/" + rel.generic_string(), std::make_shared<FileByteSource>(it->path().string())});
  }
  if (ec) {
    throw util::PackagingError("cannot scan " + root.string() + ": " + ec.message());
  }

  std::sort(found.begin(), found.end(), [](const SourceItem& a, const SourceItem& b) { return a.relative_path < b.relative_path; });
  std::move(found.begin(), found.end(), std::back_inserter(out));
}

} // namespace

std::vector<SourceItem> CollectSources(const std::vector<std::string>& paths) {
  std::vector<SourceItem> items;

  for (const auto& raw : paths) {
    fs::path        path(raw);
    std::error_code ec;
    auto            status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
      throw util::PackagingError("no such file or directory: " + raw);
    }

    if (fs::is_directory(status)) {
      ScanDirectory(path, items);
    } else if (fs::is_regular_file(status)) {
      items.push_back(SourceItem{path.filename().generic_string(), std::make_shared<FileByteSource>(path.string())});
    } else {
      throw util::PackagingError("not a regular file or directory: " + raw);
    }
  }
  return items;
}

} // namespace vault::packaging
