#include "arrow_utils.hpp"

#include <arrow/filesystem/localfs.h>
#include <arrow/filesystem/s3fs.h>

namespace vault::storage::common {

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(
    const vault::runtime::config::ObjectStorageConfig& config) {
  std::string resolved_path = config.root_path();

  switch (config.filesystem()) {
    case vault::runtime::config::FILE_SYSTEM_LOCAL:
      return std::make_pair(std::static_pointer_cast<arrow::fs::FileSystem>(std::make_shared<arrow::fs::LocalFileSystem>()),
                            resolved_path);

    case vault::runtime::config::FILE_SYSTEM_S3: {
      const auto& proto_options = config.s3();

      ARROW_ASSIGN_OR_RAISE(auto options, arrow::fs::S3Options::FromUri(resolved_path, &resolved_path));
      if (!proto_options.region().empty()) options.region = proto_options.region();
      if (!proto_options.endpoint_override().empty()) options.endpoint_override = proto_options.endpoint_override();
      if (!proto_options.scheme().empty()) options.scheme = proto_options.scheme();
      if (!proto_options.access_key().empty()) {
        options.ConfigureAccessKey(proto_options.access_key(), proto_options.secret_key());
      }
      options.allow_bucket_creation = proto_options.allow_bucket_creation();
      if (proto_options.connect_timeout() > 0) options.connect_timeout = proto_options.connect_timeout();
      if (proto_options.request_timeout() > 0) options.request_timeout = proto_options.request_timeout();

      ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::S3FileSystem::Make(options));
      return std::make_pair(std::static_pointer_cast<arrow::fs::FileSystem>(std::move(fs)), resolved_path);
    }

    case vault::runtime::config::FILE_SYSTEM_AUTO:
    default: {
      ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUriOrPath(resolved_path, &resolved_path));
      return std::make_pair(std::move(fs), resolved_path);
    }
  }
}

} // namespace vault::storage::common
