#include <colex/core/time.hpp>

#include <charconv>
#include <chrono>

namespace colex {

namespace {

using namespace std::chrono;

auto to_sys_days(Timestamp ts) -> sys_days {
    return floor<days>(sys_time<nanoseconds>{nanoseconds{ts.nanos}});
}

// Days on either side of the epoch that still fit in int64 nanoseconds with a full day to spare.
constexpr days::rep kDayRange = 106'750;

auto from_sys_days(sys_days day) -> std::optional<Timestamp> {
    const auto count = day.time_since_epoch().count();
    if (count < -kDayRange || count > kDayRange) {
        return std::nullopt;
    }
    return Timestamp{duration_cast<nanoseconds>(day.time_since_epoch()).count()};
}

auto parse_uint(std::string_view text, unsigned& out) -> bool {
    if (text.empty()) {
        return false;
    }
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, out);
    return ec == std::errc{} && ptr == end;
}

}  // namespace

auto timestamp_from_ymd(int year, unsigned month, unsigned day) -> std::optional<Timestamp> {
    year_month_day ymd{std::chrono::year{year}, std::chrono::month{month},
                       std::chrono::day{day}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    return from_sys_days(sys_days{ymd});
}

auto parse_date(std::string_view text) -> std::optional<Timestamp> {
    unsigned y = 0;
    unsigned m = 0;
    unsigned d = 0;
    if (auto slash = text.find('/'); slash != std::string_view::npos) {
        auto second = text.find('/', slash + 1);
        if (second == std::string_view::npos) {
            return std::nullopt;
        }
        if (!parse_uint(text.substr(0, slash), m) ||
            !parse_uint(text.substr(slash + 1, second - slash - 1), d) ||
            !parse_uint(text.substr(second + 1), y)) {
            return std::nullopt;
        }
    } else if (text.size() == 10 && text[4] == '-' && text[7] == '-') {
        if (!parse_uint(text.substr(0, 4), y) || !parse_uint(text.substr(5, 2), m) ||
            !parse_uint(text.substr(8, 2), d)) {
            return std::nullopt;
        }
    } else if (text.size() == 8) {
        if (!parse_uint(text.substr(0, 4), y) || !parse_uint(text.substr(4, 2), m) ||
            !parse_uint(text.substr(6, 2), d)) {
            return std::nullopt;
        }
    } else {
        return std::nullopt;
    }
    return timestamp_from_ymd(static_cast<int>(y), m, d);
}

auto format_date(Timestamp ts) -> std::string {
    year_month_day ymd{to_sys_days(ts)};
    return std::to_string(static_cast<unsigned>(ymd.month())) + "/" +
           std::to_string(static_cast<unsigned>(ymd.day())) + "/" +
           std::to_string(static_cast<int>(ymd.year()));
}

auto add_months(Timestamp ts, std::int64_t count) -> std::optional<Timestamp> {
    if (count < -kMonthRange || count > kMonthRange) {
        return std::nullopt;
    }
    auto day_point = to_sys_days(ts);
    auto time_of_day = nanoseconds{ts.nanos} - day_point.time_since_epoch();
    year_month_day ymd{day_point};
    year_month_day shifted = ymd + months{static_cast<months::rep>(count)};
    if (!shifted.ok()) {
        shifted = year_month_day_last{shifted.year(), month_day_last{shifted.month()}};
    }
    auto midnight = from_sys_days(sys_days{shifted});
    if (!midnight) {
        return std::nullopt;
    }
    return Timestamp{midnight->nanos + time_of_day.count()};
}

auto days_between(Timestamp from, Timestamp to) -> std::int64_t {
    return (to_sys_days(to) - to_sys_days(from)).count();
}

auto year_of(Timestamp ts) -> std::int64_t {
    return static_cast<int>(year_month_day{to_sys_days(ts)}.year());
}

auto month_of(Timestamp ts) -> std::int64_t {
    return static_cast<unsigned>(year_month_day{to_sys_days(ts)}.month());
}

}  // namespace colex
