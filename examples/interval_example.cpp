#include <chrono>
#include <cstdio>

#include <calgrid.hpp>
#include <calgrid/format.hpp>
#include <fmt/core.h>

using namespace calgrid;

namespace {

// Print every interval, or the error that stopped generation
void printIntervals(const char* label, const IntervalResult& result) {
    fmt::print("{}:\n", label);
    if (!result) {
        fmt::print(stderr, "  error: {}\n\n", result.error().message());
        return;
    }
    for (const auto& iv : *result) {
        fmt::print("  {}\n", iv);
    }
    fmt::print("  ({} intervals)\n\n", result->size());
}

} // namespace

int main() {
    fmt::print("calgrid Interval Examples\n");
    fmt::print("=========================\n\n");

    // Example 1: Daily intervals with the default configuration
    fmt::print("1. Daily Intervals\n");
    fmt::print("------------------\n");

    auto begin = Instant::from_civil(2022, 6, 25, 8, 23, 45);
    auto end = Instant::from_civil(2022, 6, 27, 9, 31, 12);
    if (!begin || !end) {
        fmt::print(stderr, "invalid range: {}\n", (!begin ? begin : end).error().message());
        return 1;
    }
    fmt::print("Range: {} .. {}\n", *begin, *end);
    printIntervals("Per day, extended", get_intervals(new_generator(), *begin, *end));

    // Example 2: Month boundaries aligned to UTC-7
    fmt::print("2. Local Month Boundaries\n");
    fmt::print("-------------------------\n");

    constexpr int32_t pdt_east = -7 * 3600;
    auto local_begin = Instant::from_civil(2022, 6, 10, 12, 23, 45, 0, pdt_east);
    auto local_end = Instant::from_civil(2022, 8, 26, 12, 23, 45, 0, pdt_east);
    if (local_begin && local_end) {
        fmt::print("Range: {} .. {}\n", *local_begin, *local_end);
        auto monthly = GeneratorConfig::defaults()
                           .with_grouping(Grouping::per_month)
                           .with_offset_west_secs(-pdt_east);
        printIntervals("Per month at UTC-7", get_intervals(monthly, *local_begin, *local_end));
    }

    // Example 3: Only whole weeks inside the range
    fmt::print("3. Whole Weeks Only\n");
    fmt::print("-------------------\n");

    auto week_begin = Instant::from_civil(2022, 10, 2, 8, 23, 45);
    auto week_end = Instant::from_civil(2022, 10, 18, 8, 23, 45);
    if (week_begin && week_end) {
        auto weekly = GeneratorConfig::defaults()
                          .with_grouping(Grouping::per_week)
                          .with_offset_west_secs(-3600)
                          .with_precision(Duration::from_microseconds(1))
                          .without_extension();
        printIntervals("Per week at UTC+1, no extension",
                       get_intervals(weekly, *week_begin, *week_end));
    }

    // Example 4: Quarters around the current time
    fmt::print("4. Quarters Around Now\n");
    fmt::print("----------------------\n");

    auto now = Instant::from_sys_time(std::chrono::system_clock::now());
    if (now) {
        auto year_later = now->plus(Duration::from_days(365));
        if (year_later) {
            printIntervals("Per quarter",
                           get_extended_utc_intervals(*now, *year_later, Grouping::per_quarter, 0));
        }
    }

    // Example 5: Errors are returned, not thrown
    fmt::print("5. Error Handling\n");
    fmt::print("-----------------\n");

    printIntervals("Reversed range", get_intervals(new_generator(), *end, *begin));
    auto near_max = Instant::max().minus(Duration::from_days(2));
    if (near_max) {
        printIntervals("Past the last representable day",
                       get_extended_utc_intervals(*near_max, Instant::max(), Grouping::per_day, 0));
    }
    printIntervals("Beyond the calendar",
                   get_utc_intervals_opts(Instant::min(), Instant::max(), Grouping::per_day, 3600,
                                          Duration::from_milliseconds(1), true, true));

    return 0;
}
