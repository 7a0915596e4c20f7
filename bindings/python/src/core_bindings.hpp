#pragma once
// Core bindings: Grouping, Duration, Instant, Interval

#include <nanobind/nanobind.h>
#include <nanobind/stl/string.h>

#include <calgrid/duration.hpp>
#include <calgrid/format.hpp>
#include <calgrid/grouping.hpp>
#include <calgrid/instant.hpp>
#include <calgrid/interval.hpp>

#include "py_types.hpp"

#include <fmt/format.h>

#include <string>

namespace nb = nanobind;
using namespace nb::literals;

namespace calgrid_python {

inline void bind_core(nb::module_& m) {
    // =========================================================================
    // Grouping
    // =========================================================================

    nb::enum_<calgrid::Grouping>(m, "Grouping", "Calendar granularity of generated intervals")
        .value("per_hour", calgrid::Grouping::per_hour, "One interval per hour")
        .value("per_day", calgrid::Grouping::per_day, "One interval per day")
        .value("per_week", calgrid::Grouping::per_week, "One interval per ISO week (Monday start)")
        .value("per_month", calgrid::Grouping::per_month, "One interval per calendar month")
        .value("per_quarter", calgrid::Grouping::per_quarter, "One interval per calendar quarter")
        .value("per_year", calgrid::Grouping::per_year, "One interval per calendar year")
        .def("__str__",
             [](calgrid::Grouping g) { return std::string(calgrid::grouping_string(g)); })
        .def("__repr__", [](calgrid::Grouping g) {
            return std::string("Grouping.") + calgrid::grouping_string(g);
        });

    // Constants
    m.attr("PICOSECONDS_PER_SECOND") = calgrid::Duration::PICOSECONDS_PER_SECOND;

    // =========================================================================
    // Duration
    // =========================================================================

    nb::class_<calgrid::Duration>(m, "Duration", "Signed picosecond-resolution time span")
        .def_static("zero", &calgrid::Duration::zero, "Zero-length duration")
        .def_static("from_picoseconds", &calgrid::Duration::from_picoseconds, "picoseconds"_a)
        .def_static("from_nanoseconds", &calgrid::Duration::from_nanoseconds, "nanoseconds"_a)
        .def_static("from_microseconds", &calgrid::Duration::from_microseconds,
                    "microseconds"_a)
        .def_static("from_milliseconds", &calgrid::Duration::from_milliseconds,
                    "milliseconds"_a)
        .def_static("from_seconds", &calgrid::Duration::from_seconds, "seconds"_a)
        .def_static("from_minutes", &calgrid::Duration::from_minutes, "minutes"_a)
        .def_static("from_hours", &calgrid::Duration::from_hours, "hours"_a)
        .def_static("from_days", &calgrid::Duration::from_days, "days"_a)
        .def_prop_ro("seconds", &calgrid::Duration::seconds, "Whole seconds (floor)")
        .def_prop_ro("picoseconds", &calgrid::Duration::picoseconds,
                     "Fractional picoseconds [0, 10^12)")
        .def("__eq__", [](const calgrid::Duration& a,
                          const calgrid::Duration& b) { return a == b; })
        .def("__lt__", [](const calgrid::Duration& a,
                          const calgrid::Duration& b) { return a < b; })
        .def("__add__", [](const calgrid::Duration& a,
                           const calgrid::Duration& b) { return a + b; })
        .def("__sub__", [](const calgrid::Duration& a,
                           const calgrid::Duration& b) { return a - b; })
        .def("__neg__", [](const calgrid::Duration& d) { return -d; })
        .def("__str__", [](const calgrid::Duration& d) { return fmt::format("{}", d); })
        .def("__repr__",
             [](const calgrid::Duration& d) { return fmt::format("Duration({})", d); });

    // =========================================================================
    // Instant
    // =========================================================================

    nb::class_<calgrid::Instant>(m, "Instant", "Point in time with a fixed display offset")
        .def_static(
            "from_utc_seconds",
            [](int64_t seconds, uint64_t picoseconds) {
                return unwrap(calgrid::Instant::from_utc_seconds(seconds, picoseconds));
            },
            "Create an instant from seconds since the Unix epoch. Raises IntervalError if "
            "out of range.",
            "seconds"_a, "picoseconds"_a = 0)
        .def_static(
            "from_civil",
            [](int year, unsigned month, unsigned day, unsigned hour, unsigned minute,
               unsigned second, uint64_t picoseconds, int32_t offset_east) {
                return unwrap(calgrid::Instant::from_civil(year, month, day, hour, minute, second,
                                                           picoseconds, offset_east));
            },
            "Create an instant from wall-clock fields at a fixed offset (seconds east of UTC)",
            "year"_a, "month"_a, "day"_a, "hour"_a = 0, "minute"_a = 0, "second"_a = 0,
            "picoseconds"_a = 0, "offset_east"_a = 0)
        .def_static("min", &calgrid::Instant::min, "Earliest representable instant")
        .def_static("max", &calgrid::Instant::max, "Latest representable instant")
        .def_prop_ro("utc_seconds", &calgrid::Instant::utc_seconds,
                     "Seconds since the Unix epoch")
        .def_prop_ro("picoseconds", &calgrid::Instant::picoseconds,
                     "Fractional picoseconds [0, 10^12)")
        .def_prop_ro("offset_east_seconds", &calgrid::Instant::offset_east_seconds,
                     "Display offset in seconds east of UTC")
        .def_prop_ro("is_utc", &calgrid::Instant::is_utc, "True if the display offset is zero")
        .def("to_utc", &calgrid::Instant::to_utc, "Same instant expressed in UTC")
        .def(
            "with_offset_east",
            [](const calgrid::Instant& t, int32_t offset_east) {
                return unwrap(t.with_offset_east(offset_east));
            },
            "Same instant at another display offset", "offset_east"_a)
        .def(
            "__add__",
            [](const calgrid::Instant& t, const calgrid::Duration& d) { return unwrap(t.plus(d)); })
        .def("__sub__",
             [](const calgrid::Instant& t, const calgrid::Duration& d) {
                 return unwrap(t.minus(d));
             })
        .def("__sub__",
             [](const calgrid::Instant& a, const calgrid::Instant& b) { return a - b; })
        .def("__eq__",
             [](const calgrid::Instant& a, const calgrid::Instant& b) { return a == b; })
        .def("__lt__",
             [](const calgrid::Instant& a, const calgrid::Instant& b) { return a < b; })
        .def("__le__",
             [](const calgrid::Instant& a, const calgrid::Instant& b) { return a <= b; })
        .def("__hash__",
             [](const calgrid::Instant& t) {
                 return nb::hash(nb::make_tuple(t.utc_seconds(), t.picoseconds()));
             })
        .def("__str__", [](const calgrid::Instant& t) { return calgrid::to_string(t); })
        .def("__repr__", [](const calgrid::Instant& t) {
            return fmt::format("Instant('{}')", t);
        });

    // =========================================================================
    // Interval
    // =========================================================================

    nb::class_<calgrid::Interval>(m, "Interval", "Closed interval [start, end] of UTC instants")
        .def_ro("start", &calgrid::Interval::start, "First instant of the interval")
        .def_ro("end", &calgrid::Interval::end, "Last instant of the interval")
        .def("__eq__",
             [](const calgrid::Interval& a, const calgrid::Interval& b) { return a == b; })
        .def("__str__", [](const calgrid::Interval& iv) { return fmt::format("{}", iv); })
        .def("__repr__", [](const calgrid::Interval& iv) {
            return fmt::format("Interval('{}', '{}')", iv.start, iv.end);
        });
}

} // namespace calgrid_python
