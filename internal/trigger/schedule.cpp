#include "internal/trigger/schedule.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace routine::trigger {
namespace {

using namespace std::chrono_literals;

std::optional<std::chrono::milliseconds> MatchCount(const std::string& text, const std::regex& pattern, std::chrono::milliseconds unit) {
  std::smatch match;
  if (!std::regex_search(text, match, pattern)) {
    return std::nullopt;
  }

  const auto digits = match[1].str();
  if (digits.size() > 9) {
    return std::nullopt;
  }

  const long long count = std::stoll(digits);
  if (count <= 0 || count > kMaxSchedulePeriod / unit) {
    return std::nullopt;
  }
  return unit * count;
}

} // namespace

std::optional<std::chrono::milliseconds> ParseSchedule(const std::string& schedule) {
  std::string text = schedule;
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (text.find("every hour") != std::string::npos) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(1h);
  }
  if (text.find("every day") != std::string::npos || text.find("daily") != std::string::npos) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(24h);
  }
  if (text.find("every week") != std::string::npos || text.find("weekly") != std::string::npos) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(24h * 7);
  }

  static const std::regex kMinutes(R"(every (\d+) minutes?)");
  if (auto period = MatchCount(text, kMinutes, std::chrono::duration_cast<std::chrono::milliseconds>(1min))) {
    return period;
  }

  static const std::regex kHours(R"(every (\d+) hours?)");
  return MatchCount(text, kHours, std::chrono::duration_cast<std::chrono::milliseconds>(1h));
}

} // namespace routine::trigger
