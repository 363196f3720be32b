#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace vault::util {

/*
  Wall-clock helpers shared by sessions, capabilities and the catalog.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// zero duration when unset
std::chrono::milliseconds ToMillis(const google::protobuf::Duration& d);

// yyyymmdd-HHMMSS in UTC
std::string FormatCompactUtc(TimePoint tp);

} // namespace vault::util
