#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace colex {

/// Instant in nanoseconds since 1970-01-01T00:00:00Z (Unix epoch).
struct Timestamp {
    std::int64_t nanos = 0;
    auto operator<=>(const Timestamp&) const = default;
};

/// Midnight UTC of the given calendar day.  Returns nullopt for invalid dates.
[[nodiscard]] auto timestamp_from_ymd(int year, unsigned month, unsigned day)
    -> std::optional<Timestamp>;

/// Parse a date written as YYYYMMDD, YYYY-MM-DD or M/D/YYYY.
[[nodiscard]] auto parse_date(std::string_view text) -> std::optional<Timestamp>;

/// Format as M/D/YYYY (no zero padding).
[[nodiscard]] auto format_date(Timestamp ts) -> std::string;

/// Longest shift add_months() accepts, in either direction.
inline constexpr std::int64_t kMonthRange = 12 * 600;

/// Add whole calendar months, clamping the day to the end of the target month.
/// Returns nullopt when `months` exceeds kMonthRange or the result is not representable.
[[nodiscard]] auto add_months(Timestamp ts, std::int64_t months) -> std::optional<Timestamp>;

/// Whole days from `from` to `to` (negative when `to` is earlier).
[[nodiscard]] auto days_between(Timestamp from, Timestamp to) -> std::int64_t;

[[nodiscard]] auto year_of(Timestamp ts) -> std::int64_t;
[[nodiscard]] auto month_of(Timestamp ts) -> std::int64_t;

}  // namespace colex
