#include "warden/common/time.hpp"

#include "warden/common/fs.hpp"

#include <algorithm>
#include <charconv>
#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>

namespace warden::common {

namespace {

std::tm to_utc_tm(const TimePoint at) {
  const auto t = Clock::to_time_t(at);
  std::tm tm{};
  gmtime_r(&t, &tm);
  return tm;
}

std::tm to_local_tm(const TimePoint at) {
  const auto t = Clock::to_time_t(at);
  std::tm tm{};
  localtime_r(&t, &tm);
  return tm;
}

bool parse_int64(const std::string &text, std::int64_t &out) {
  const auto *first = text.data();
  const auto *last = first + text.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last;
}

} // namespace

std::string format_rfc3339(const TimePoint at) {
  const std::tm tm = to_utc_tm(at);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

std::string now_rfc3339() { return format_rfc3339(Clock::now()); }

Result<TimePoint> parse_rfc3339(const std::string &text) {
  static const std::regex pattern(
      R"(^(\d{4})-(\d{2})-(\d{2})[T ](\d{2}):(\d{2}):(\d{2})(\.\d+)?(Z|[+-]\d{2}:?\d{2})?$)");
  std::smatch match;
  const std::string trimmed = trim(text);
  if (!std::regex_match(trimmed, match, pattern)) {
    return Result<TimePoint>::failure("invalid timestamp: " + text, ErrorKind::MalformedInput);
  }

  std::tm tm{};
  tm.tm_year = std::stoi(match[1].str()) - 1900;
  tm.tm_mon = std::stoi(match[2].str()) - 1;
  tm.tm_mday = std::stoi(match[3].str());
  tm.tm_hour = std::stoi(match[4].str());
  tm.tm_min = std::stoi(match[5].str());
  tm.tm_sec = std::stoi(match[6].str());

  std::int64_t seconds = static_cast<std::int64_t>(timegm(&tm));
  const std::string zone = match[8].str();
  if (!zone.empty() && zone != "Z") {
    std::string digits;
    for (const char ch : zone.substr(1)) {
      if (ch != ':') {
        digits.push_back(ch);
      }
    }
    const int hours = std::stoi(digits.substr(0, 2));
    const int minutes = std::stoi(digits.substr(2, 2));
    const std::int64_t offset = hours * 3600 + minutes * 60;
    seconds += zone.front() == '+' ? -offset : offset;
  }
  return Result<TimePoint>::success(from_unix_seconds(seconds));
}

std::string date_key(const TimePoint at) {
  const std::tm tm = to_local_tm(at);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%d");
  return out.str();
}

std::string git_date(const TimePoint at) {
  const std::tm tm = to_utc_tm(at);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << " +0000";
  return out.str();
}

TimePoint from_unix_seconds(const std::int64_t seconds) {
  return TimePoint(std::chrono::seconds(seconds));
}

std::int64_t to_unix_seconds(const TimePoint at) {
  return std::chrono::duration_cast<std::chrono::seconds>(at.time_since_epoch()).count();
}

std::string format_duration(const std::chrono::seconds duration) {
  const auto total_minutes = std::max<std::int64_t>(0, duration.count() / 60);
  const auto hours = total_minutes / 60;
  const auto minutes = total_minutes % 60;
  std::ostringstream out;
  if (hours > 0) {
    out << hours << "h " << std::setw(2) << std::setfill('0') << minutes << "m";
  } else {
    out << minutes << "m";
  }
  return out.str();
}

Result<TimePoint> parse_time_spec(const std::string &spec, const TimePoint now) {
  const std::string value = trim(spec);
  if (value.empty()) {
    return Result<TimePoint>::failure("empty time specification", ErrorKind::MalformedInput);
  }

  std::int64_t number = 0;
  if (parse_int64(value, number)) {
    return Result<TimePoint>::success(from_unix_seconds(number));
  }

  const char unit = value.back();
  if (unit == 's' || unit == 'm' || unit == 'h' || unit == 'd') {
    if (parse_int64(value.substr(0, value.size() - 1), number) && number >= 0) {
      std::int64_t multiplier = 1;
      if (unit == 'm') {
        multiplier = 60;
      } else if (unit == 'h') {
        multiplier = 3600;
      } else if (unit == 'd') {
        multiplier = 86'400;
      }
      return Result<TimePoint>::success(now - std::chrono::seconds(number * multiplier));
    }
  }

  return parse_rfc3339(value);
}

} // namespace warden::common
