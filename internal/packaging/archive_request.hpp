#pragma once

#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "byte_source.hpp"
#include "vault/archive/v1.hpp"

namespace vault::packaging {

struct SourceItem {
  std::string   relative_path;
  ByteSourcePtr source;
};

// One file with no folder-relative path; uploaded verbatim.
struct SingleSource {
  SourceItem item;
};

// Everything else; packaged into one container preserving relative paths.
struct TreeSources {
  std::vector<SourceItem> items;
};

using ArchiveContents = std::variant<SingleSource, TreeSources>;

/*
  Immutable description of one archive to build.

  Use MakeArchiveRequest() to classify items; it picks SingleSource only
  for exactly one item whose path has no directory component.
*/
struct ArchiveRequest {
  ArchiveContents                      contents;
  std::vector<std::string>             tags;
  vault::archive::v1::RetentionPolicy policy = vault::archive::v1::RETENTION_POLICY_STANDARD;
};

// throws util::PackagingError when items is empty
ArchiveRequest MakeArchiveRequest(std::vector<SourceItem> items, std::vector<std::string> tags,
                                  vault::archive::v1::RetentionPolicy policy);

// Comma separated; entries trimmed, empties dropped, first occurrence kept.
std::vector<std::string> ParseTags(std::string_view csv);

// standard, standard-7, legal-hold, legal-hold-indefinite, temporary, temp-1
// throws util::InvalidArgument for anything else
vault::archive::v1::RetentionPolicy ParseRetentionPolicy(std::string_view value);

std::string_view RetentionPolicyName(vault::archive::v1::RetentionPolicy policy);

} // namespace vault::packaging
