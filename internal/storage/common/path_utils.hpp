#pragma once

#include <string>
#include <string_view>

#include "internal/util/errors.hpp"

namespace vault::storage::common {

/*
  Object keys are relative, '/'-separated, with no empty, "." or ".."
  segments. Keys under ".multipart/" are reserved for staged parts.
*/
inline void ValidateObjectKey(std::string_view key) {
  if (key.empty()) {
    throw util::InvalidArgument("object key must not be empty");
  }
  if (key.front() == '/' || key.back() == '/') {
    throw util::InvalidArgument("object key must not start or end with '/'");
  }
  if (key.rfind(".multipart/", 0) == 0) {
    throw util::InvalidArgument("object key uses a reserved prefix");
  }

  size_t start = 0;
  while (start <= key.size()) {
    auto end = key.find('/', start);
    if (end == std::string_view::npos) end = key.size();
    auto segment = key.substr(start, end - start);
    if (segment.empty() || segment == "." || segment == "..") {
      throw util::InvalidArgument("object key contains an invalid path segment");
    }
    for (char c : segment) {
      if (c == '\\' || c == '\0') {
        throw util::InvalidArgument("object key contains invalid character");
      }
    }
    start = end + 1;
  }
}

// Keeps [A-Za-z0-9._-]; everything else becomes '_'.
inline std::string SanitizeObjectName(std::string_view name) {
  std::string out;
  out.reserve(name.size());
  for (char c : name) {
    const bool keep = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '.' || c == '-' || c == '_';
    out.push_back(keep ? c : '_');
  }
  if (out.empty() || out == "." || out == "..") {
    return "archive";
  }
  return out;
}

/*
  Object key layout:

      archives/<file_id>/<sanitized name>
*/
inline std::string ArchiveObjectKey(const std::string& file_id, std::string_view name) {
  return "archives/" + file_id + "/" + SanitizeObjectName(name);
}

inline std::string JoinPath(const std::string& root, const std::string& relative) {
  if (root.empty()) return relative;
  if (root.back() == '/') return root + relative;
  return root + "/" + relative;
}

} // namespace vault::storage::common
