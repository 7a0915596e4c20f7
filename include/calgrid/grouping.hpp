#pragma once

#include "calgrid/time_error.hpp"

#include <chrono>

#include <cstdint>

namespace calgrid {

/**
 * @brief Calendar granularity used to partition a time range
 *
 * Each grouping defines how to truncate a wall-clock time to the start of its
 * enclosing unit and how to reach the start of the following unit. Weeks
 * follow ISO 8601 and start on Monday 00:00. Month, quarter and year units
 * are stepped with std::chrono calendar arithmetic, so month lengths and leap
 * years are exact.
 */
enum class Grouping : uint8_t {
    per_hour,
    per_day,
    per_week,
    per_month,
    per_quarter,
    per_year
};

[[nodiscard]] constexpr const char* grouping_string(Grouping g) noexcept {
    switch (g) {
        case Grouping::per_hour:
            return "per_hour";
        case Grouping::per_day:
            return "per_day";
        case Grouping::per_week:
            return "per_week";
        case Grouping::per_month:
            return "per_month";
        case Grouping::per_quarter:
            return "per_quarter";
        case Grouping::per_year:
            return "per_year";
    }
    return "unknown";
}

namespace detail {

// First month of the quarter containing m (January, April, July or October)
constexpr std::chrono::month quarter_start(std::chrono::month m) noexcept {
    unsigned index = static_cast<unsigned>(m) - 1;
    return std::chrono::month{index - index % 3 + 1};
}

} // namespace detail

/**
 * Start of the grouping unit enclosing a wall-clock time.
 *
 * @param t Wall-clock time in the aligned frame
 * @return Greatest unit start <= t
 */
[[nodiscard]] constexpr std::chrono::local_seconds truncate(Grouping g,
                                                            std::chrono::local_seconds t) noexcept {
    using namespace std::chrono;
    const local_days day_start = floor<days>(t);
    switch (g) {
        case Grouping::per_hour:
            return floor<hours>(t);
        case Grouping::per_day:
            return day_start;
        case Grouping::per_week:
            return day_start - (weekday{day_start} - Monday);
        case Grouping::per_month: {
            const year_month_day ymd{day_start};
            return local_days{ymd.year() / ymd.month() / 1};
        }
        case Grouping::per_quarter: {
            const year_month_day ymd{day_start};
            return local_days{ymd.year() / detail::quarter_start(ymd.month()) / 1};
        }
        case Grouping::per_year: {
            const year_month_day ymd{day_start};
            return local_days{ymd.year() / January / 1};
        }
    }
    return t;
}

/**
 * Start of the grouping unit following the one that begins at `start`.
 *
 * @param start Wall-clock unit start in the aligned frame (see truncate())
 * @return The next unit start, or out_of_range when the calendar year would
 *         leave the std::chrono::year range
 */
[[nodiscard]] constexpr TimeResult<std::chrono::local_seconds>
advance(Grouping g, std::chrono::local_seconds start) noexcept {
    using namespace std::chrono;
    switch (g) {
        case Grouping::per_hour:
            return start + hours{1};
        case Grouping::per_day:
            return start + days{1};
        case Grouping::per_week:
            return start + weeks{1};
        case Grouping::per_month:
        case Grouping::per_quarter:
        case Grouping::per_year: {
            const year_month_day ymd{floor<days>(start)};
            if (ymd.year() == year::max() &&
                (g == Grouping::per_year || ymd.month() > (g == Grouping::per_month
                                                               ? November
                                                               : September))) {
                return make_time_error(TimeErrorCode::out_of_range);
            }
            year_month_day next = ymd;
            if (g == Grouping::per_month) {
                next += months{1};
            } else if (g == Grouping::per_quarter) {
                next += months{3};
            } else {
                next += years{1};
            }
            // Carry any time of day over unchanged
            return local_days{next} + (start - floor<days>(start));
        }
    }
    return make_time_error(TimeErrorCode::out_of_range);
}

} // namespace calgrid
