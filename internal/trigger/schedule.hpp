#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "internal/trigger/timer.hpp"

namespace routine::trigger {

/*
  Parses a free-text schedule into a fixed period.

  Case-insensitive substring match:
    "every hour"                 -> 1h
    "every day" | "daily"        -> 24h
    "every week" | "weekly"      -> 7d
    "every N minute(s)"          -> N min
    "every N hour(s)"            -> N h
  N must be a positive integer and the period at most one year.
  Anything else -> nullopt.
*/
inline constexpr std::chrono::milliseconds kMaxSchedulePeriod = std::chrono::hours(24 * 365);
static_assert(kMaxSchedulePeriod <= kMaxTimerInterval);

std::optional<std::chrono::milliseconds> ParseSchedule(const std::string& schedule);

} // namespace routine::trigger
