#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace flowstate::util {

/*
  Time utilities.

  State documents carry RFC 3339 UTC strings; storage columns carry unix millis.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);
uint64_t  NowMillis();

std::string                ToRfc3339(TimePoint tp);
std::optional<TimePoint>   ParseRfc3339(const std::string& value);
std::string                NowRfc3339();

} // namespace flowstate::util
