#pragma once

#include "warden/common/result.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace warden::common {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

[[nodiscard]] std::string format_rfc3339(TimePoint at);
[[nodiscard]] std::string now_rfc3339();
[[nodiscard]] Result<TimePoint> parse_rfc3339(const std::string &text);

/// Local calendar day of `at`, `YYYY-MM-DD`.
[[nodiscard]] std::string date_key(TimePoint at);

/// Date in the form git's --since accepts unambiguously.
[[nodiscard]] std::string git_date(TimePoint at);

[[nodiscard]] TimePoint from_unix_seconds(std::int64_t seconds);
[[nodiscard]] std::int64_t to_unix_seconds(TimePoint at);

/// `1h 05m`, `12m`, `0m`.
[[nodiscard]] std::string format_duration(std::chrono::seconds duration);

/// Accepts RFC 3339, unix seconds, or a relative offset before `now` (`45m`, `2h`, `1d`).
[[nodiscard]] Result<TimePoint> parse_time_spec(const std::string &spec, TimePoint now);

} // namespace warden::common
