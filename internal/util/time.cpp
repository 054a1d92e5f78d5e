#include "time.hpp"

#include <google/protobuf/util/time_util.h>

namespace flowstate::util {

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

uint64_t NowMillis() {
  return ToUnixMillis(Now());
}

std::string ToRfc3339(TimePoint tp) {
  // millisecond precision keeps documents stable across JSON round trips
  return google::protobuf::util::TimeUtil::ToString(ToProto(FromUnixMillis(ToUnixMillis(tp))));
}

std::optional<TimePoint> ParseRfc3339(const std::string& value) {
  google::protobuf::Timestamp ts;
  if (value.empty() || !google::protobuf::util::TimeUtil::FromString(value, &ts)) {
    return std::nullopt;
  }
  return FromProto(ts);
}

std::string NowRfc3339() {
  return ToRfc3339(Now());
}

} // namespace flowstate::util
