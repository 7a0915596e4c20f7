#pragma once
// Generator bindings: GeneratorConfig, get_intervals and the convenience entry points

#include <nanobind/nanobind.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

#include <calgrid/format.hpp>
#include <calgrid/generator_config.hpp>
#include <calgrid/interval_generator.hpp>
#include <calgrid/intervals.hpp>

#include "py_types.hpp"

#include <fmt/format.h>

namespace nb = nanobind;
using namespace nb::literals;

namespace calgrid_python {

inline void bind_generator(nb::module_& m) {
    // =========================================================================
    // GeneratorConfig
    // =========================================================================

    nb::class_<calgrid::GeneratorConfig>(m, "GeneratorConfig",
                                         "Immutable interval generation settings")
        .def(nb::init<>(), "Default settings: per_day, UTC, 1 ms precision, both ends extended")
        .def("with_grouping", &calgrid::GeneratorConfig::with_grouping, "grouping"_a)
        .def("with_offset_west_secs", &calgrid::GeneratorConfig::with_offset_west_secs,
             "Align boundaries to a clock this many seconds behind UTC", "seconds"_a)
        .def("with_precision", &calgrid::GeneratorConfig::with_precision, "precision"_a)
        .def("without_extended_begin", &calgrid::GeneratorConfig::without_extended_begin)
        .def("without_extended_end", &calgrid::GeneratorConfig::without_extended_end)
        .def("without_extension", &calgrid::GeneratorConfig::without_extension)
        .def_prop_ro("grouping", &calgrid::GeneratorConfig::grouping)
        .def_prop_ro("offset_west_secs", &calgrid::GeneratorConfig::offset_west_secs)
        .def_prop_ro("precision", &calgrid::GeneratorConfig::precision)
        .def_prop_ro("extend_begin", &calgrid::GeneratorConfig::extend_begin)
        .def_prop_ro("extend_end", &calgrid::GeneratorConfig::extend_end)
        .def(
            "get_intervals",
            [](const calgrid::GeneratorConfig& c, const calgrid::Instant& begin,
               const calgrid::Instant& end) {
                return unwrap(calgrid::get_intervals(c, begin, end));
            },
            "Split [begin, end] into intervals. Raises IntervalError on failure.", "begin"_a,
            "end"_a)
        .def("__eq__", [](const calgrid::GeneratorConfig& a,
                          const calgrid::GeneratorConfig& b) { return a == b; })
        .def("__repr__", [](const calgrid::GeneratorConfig& c) {
            return fmt::format("GeneratorConfig(grouping={}, offset_west_secs={}, precision={}, "
                               "extend_begin={}, extend_end={})",
                               calgrid::grouping_string(c.grouping()), c.offset_west_secs(),
                               c.precision(), c.extend_begin() ? "True" : "False",
                               c.extend_end() ? "True" : "False");
        });

    m.def("new_generator", &calgrid::new_generator, "Default GeneratorConfig");

    // =========================================================================
    // Interval generation
    // =========================================================================

    m.def(
        "get_intervals",
        [](const calgrid::GeneratorConfig& c, const calgrid::Instant& begin,
           const calgrid::Instant& end) { return unwrap(calgrid::get_intervals(c, begin, end)); },
        "Split [begin, end] into calendar-aligned UTC intervals", "config"_a, "begin"_a,
        "end"_a);

    m.def(
        "get_extended_utc_intervals",
        [](const calgrid::Instant& begin, const calgrid::Instant& end, calgrid::Grouping grouping,
           int32_t offset_west_secs) {
            return unwrap(
                calgrid::get_extended_utc_intervals(begin, end, grouping, offset_west_secs));
        },
        "Extended intervals with 1 ms precision", "begin"_a, "end"_a, "grouping"_a,
        "offset_west_secs"_a = 0);

    m.def(
        "get_utc_intervals_opts",
        [](const calgrid::Instant& begin, const calgrid::Instant& end, calgrid::Grouping grouping,
           int32_t offset_west_secs, const calgrid::Duration& precision, bool extend_begin,
           bool extend_end) {
            return unwrap(calgrid::get_utc_intervals_opts(begin, end, grouping, offset_west_secs,
                                                          precision, extend_begin, extend_end));
        },
        "Intervals with every option explicit", "begin"_a, "end"_a, "grouping"_a,
        "offset_west_secs"_a, "precision"_a, "extend_begin"_a, "extend_end"_a);
}

} // namespace calgrid_python
