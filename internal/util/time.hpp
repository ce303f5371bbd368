#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace routine::util {

/*
  Time utilities: single place to control clock source.

  Components that need "now" take a ClockSource so tests can pin time.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

class ClockSource {
 public:
  virtual ~ClockSource() = default;

  virtual TimePoint Now() const = 0;
};

class SystemClockSource final : public ClockSource {
 public:
  TimePoint Now() const override;
};

std::shared_ptr<const ClockSource> SystemClock();

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t ToUnixMillis(TimePoint tp);

// Hour of day [0, 23] in the process local time zone.
int LocalHour(TimePoint tp);

// RFC 3339 in UTC with the fraction the value needs (0, 3, 6 or 9
// digits): 2024-01-31T07:05:00.123456789Z. Parsing accepts any RFC 3339
// offset, so millisecond strings written by older builds still load.
std::string              ToIso8601(TimePoint tp);
std::optional<TimePoint> FromIso8601(const std::string& text);

} // namespace routine::util
