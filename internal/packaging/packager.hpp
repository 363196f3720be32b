#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "archive_request.hpp"
#include "archive_stream.hpp"
#include "internal/util/time.hpp"

namespace vault::packaging {

inline constexpr const char* kZipContentType     = "application/zip";
inline constexpr const char* kDefaultContentType = "application/octet-stream";

/*
  Output of the packager. The layout is immutable; each OpenStream()
  replays the archive bytes from the start, which is how an upload flow
  restarts after its session expired.
*/
struct PackagedArchive {
  std::string                          name;
  uint64_t                             total_size = 0;
  std::string                          content_type;
  std::vector<std::string>             tags;
  vault::archive::v1::RetentionPolicy policy = vault::archive::v1::RETENTION_POLICY_STANDARD;
  std::shared_ptr<const ArchiveLayout> layout;

  std::unique_ptr<ArchiveStream> OpenStream() const {
    return layout->Open();
  }
};

/*
  Packager

  SingleSource → the file verbatim, content type from its extension
  TreeSources  → one stored ZIP preserving relative paths, named
                 <common root>.zip or archive-<UTC yyyymmdd-HHMMSS>.zip

  Relative paths must be non-empty, relative, free of "." / ".." / empty
  segments and unique. Throws util::PackagingError.
*/
class Packager {
 public:
  static PackagedArchive Package(const ArchiveRequest& request, util::TimePoint now = util::Now());

  // Shared top-level directory of all items, or empty.
  static std::string CommonRoot(const std::vector<SourceItem>& items);

  static std::string GuessContentType(const std::string& filename);
};

} // namespace vault::packaging
