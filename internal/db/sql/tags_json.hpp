#pragma once

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace vault::db::sql {

/*
  Tags column codec: JSON array of strings through the protobuf JSON mapping.
*/

inline std::string EncodeTags(const std::vector<std::string>& tags) {
  google::protobuf::ListValue list;
  for (const auto& tag : tags) {
    list.add_values()->set_string_value(tag);
  }
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(list, &json);
  if (!status.ok()) {
    throw util::InvalidArgument("encode tags: " + std::string(status.message()));
  }
  return json;
}

inline std::vector<std::string> DecodeTags(const std::string& json) {
  std::vector<std::string> tags;
  if (json.empty()) return tags;

  google::protobuf::ListValue list;
  auto                        status = google::protobuf::util::JsonStringToMessage(json, &list);
  if (!status.ok()) {
    throw util::InvalidState("decode tags: " + std::string(status.message()));
  }
  tags.reserve(static_cast<size_t>(list.values_size()));
  for (const auto& value : list.values()) {
    tags.push_back(value.string_value());
  }
  return tags;
}

} // namespace vault::db::sql
