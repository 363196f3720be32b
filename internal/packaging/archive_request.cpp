#include "archive_request.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace vault::packaging {

using vault::archive::v1::RetentionPolicy;

namespace {

std::string_view Trim(std::string_view s) {
  const auto is_space = [](char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; };
  while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
  while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
  return s;
}

} // namespace

ArchiveRequest MakeArchiveRequest(std::vector<SourceItem> items, std::vector<std::string> tags, RetentionPolicy policy) {
  if (items.empty()) {
    throw util::PackagingError("no source items supplied");
  }

  ArchiveRequest request;
  request.tags   = std::move(tags);
  request.policy = policy;

  if (items.size() == 1 && items.front().relative_path.find('/') == std::string::npos) {
    request.contents = SingleSource{std::move(items.front())};
  } else {
    request.contents = TreeSources{std::move(items)};
  }
  return request;
}

std::vector<std::string> ParseTags(std::string_view csv) {
  std::vector<std::string> tags;

  size_t start = 0;
  while (start <= csv.size()) {
    auto end = csv.find(',', start);
    if (end == std::string_view::npos) end = csv.size();

    auto tag = Trim(csv.substr(start, end - start));
    if (!tag.empty() && std::find(tags.begin(), tags.end(), tag) == tags.end()) {
      tags.emplace_back(tag);
    }
    start = end + 1;
  }
  return tags;
}

RetentionPolicy ParseRetentionPolicy(std::string_view value) {
  value = Trim(value);
  if (value == "standard" || value == "standard-7") return vault::archive::v1::RETENTION_POLICY_STANDARD;
  if (value == "legal-hold" || value == "legal-hold-indefinite") return vault::archive::v1::RETENTION_POLICY_LEGAL_HOLD;
  if (value == "temporary" || value == "temp-1") return vault::archive::v1::RETENTION_POLICY_TEMPORARY;
  throw util::InvalidArgument("unknown retention policy: " + std::string(value));
}

std::string_view RetentionPolicyName(RetentionPolicy policy) {
  switch (policy) {
    case vault::archive::v1::RETENTION_POLICY_STANDARD:
      return "standard";
    case vault::archive::v1::RETENTION_POLICY_LEGAL_HOLD:
      return "legal-hold";
    case vault::archive::v1::RETENTION_POLICY_TEMPORARY:
      return "temporary";
    default:
      return "unspecified";
  }
}

} // namespace vault::packaging
