#include "time.hpp"

#include <ctime>

#include <google/protobuf/util/time_util.h>

namespace routine::util {

TimePoint SystemClockSource::Now() const {
  return Clock::now();
}

std::shared_ptr<const ClockSource> SystemClock() {
  static const auto clock = std::make_shared<SystemClockSource>();
  return clock;
}

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);
  if (nanos.count() < 0) {
    sec -= std::chrono::seconds(1);
    nanos += std::chrono::seconds(1);
  }

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

int LocalHour(TimePoint tp) {
  const std::time_t t = Clock::to_time_t(tp);
  std::tm           local{};
  localtime_r(&t, &local);
  return local.tm_hour;
}

std::string ToIso8601(TimePoint tp) {
  return google::protobuf::util::TimeUtil::ToString(ToProto(tp));
}

std::optional<TimePoint> FromIso8601(const std::string& text) {
  google::protobuf::Timestamp ts;
  if (text.empty() || !google::protobuf::util::TimeUtil::FromString(text, &ts)) {
    return std::nullopt;
  }
  return FromProto(ts);
}

} // namespace routine::util
