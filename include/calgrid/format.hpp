#pragma once

// RFC 3339 rendering for calgrid values via {fmt}.
//
//   fmt::print("{}\n", instant);   // 2022-06-25T00:00:00Z
//   fmt::print("{}\n", interval);  // [2022-06-25T00:00:00Z, 2022-06-25T23:59:59.999Z]
//
// The fractional second is printed with the fewest of 3/6/9/12 digits that
// represent it exactly, and omitted when zero.

#include "calgrid/duration.hpp"
#include "calgrid/instant.hpp"
#include "calgrid/interval.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <ostream>
#include <string>

namespace calgrid::detail {

template <typename OutputIt>
OutputIt format_fraction(OutputIt out, uint64_t picos) {
    if (picos == 0) {
        return out;
    }
    if (picos % Duration::PICOSECONDS_PER_MILLISECOND == 0) {
        return fmt::format_to(out, ".{:03}", picos / Duration::PICOSECONDS_PER_MILLISECOND);
    }
    if (picos % Duration::PICOSECONDS_PER_MICROSECOND == 0) {
        return fmt::format_to(out, ".{:06}", picos / Duration::PICOSECONDS_PER_MICROSECOND);
    }
    if (picos % Duration::PICOSECONDS_PER_NANOSECOND == 0) {
        return fmt::format_to(out, ".{:09}", picos / Duration::PICOSECONDS_PER_NANOSECOND);
    }
    return fmt::format_to(out, ".{:012}", picos);
}

} // namespace calgrid::detail

template <> struct fmt::formatter<calgrid::Instant> : fmt::formatter<string_view> {
    auto format(const calgrid::Instant& t, fmt::format_context& ctx) const -> decltype(ctx.out()) {
        using namespace std::chrono;
        const local_seconds local = t.to_local_seconds();
        const local_days day_start = floor<days>(local);
        const year_month_day ymd{day_start};
        const hh_mm_ss<seconds> tod{local - day_start};

        auto out = ctx.out();
        const int y = static_cast<int>(ymd.year());
        out = y < 0 ? fmt::format_to(out, "-{:04}", -y) : fmt::format_to(out, "{:04}", y);
        out = fmt::format_to(out, "-{:02}-{:02}T{:02}:{:02}:{:02}",
                             static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
                             tod.hours().count(), tod.minutes().count(), tod.seconds().count());
        out = calgrid::detail::format_fraction(out, t.picoseconds());

        const int32_t offset = t.offset_east_seconds();
        if (offset == 0) {
            return fmt::format_to(out, "Z");
        }
        const int32_t abs_offset = std::abs(offset);
        out = fmt::format_to(out, "{}{:02}:{:02}", offset < 0 ? '-' : '+', abs_offset / 3600,
                             abs_offset % 3600 / 60);
        if (abs_offset % 60 != 0) {
            out = fmt::format_to(out, ":{:02}", abs_offset % 60);
        }
        return out;
    }
};

template <> struct fmt::formatter<calgrid::Duration> : fmt::formatter<string_view> {
    auto format(const calgrid::Duration& d, fmt::format_context& ctx) const
        -> decltype(ctx.out()) {
        auto out = ctx.out();
        calgrid::Duration magnitude = d;
        if (d.is_negative()) {
            out = fmt::format_to(out, "-");
            magnitude = -d;
        }
        out = fmt::format_to(out, "{}", magnitude.seconds());
        out = calgrid::detail::format_fraction(out, magnitude.picoseconds());
        return fmt::format_to(out, "s");
    }
};

template <> struct fmt::formatter<calgrid::Interval> : fmt::formatter<string_view> {
    auto format(const calgrid::Interval& iv, fmt::format_context& ctx) const
        -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "[{}, {}]", iv.start, iv.end);
    }
};

namespace calgrid {

inline std::string to_string(const Instant& t) {
    return fmt::format("{}", t);
}

inline std::ostream& operator<<(std::ostream& out, const Instant& t) {
    fmt::print(out, "{}", t);
    return out;
}

inline std::ostream& operator<<(std::ostream& out, const Duration& d) {
    fmt::print(out, "{}", d);
    return out;
}

inline std::ostream& operator<<(std::ostream& out, const Interval& iv) {
    fmt::print(out, "{}", iv);
    return out;
}

} // namespace calgrid
