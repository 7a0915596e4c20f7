#pragma once
// Error bindings: TimeErrorCode, IntervalError

#include <nanobind/nanobind.h>

#include <calgrid/time_error.hpp>

#include "py_types.hpp"

#include <stdexcept>
#include <string>

namespace nb = nanobind;

namespace calgrid_python {

inline void bind_errors(nb::module_& m) {
    // =========================================================================
    // TimeErrorCode enum
    // =========================================================================

    nb::enum_<calgrid::TimeErrorCode>(m, "TimeErrorCode", "Reasons a time computation can fail")
        .value("out_of_range", calgrid::TimeErrorCode::out_of_range,
               "Result falls outside the representable calendar range")
        .value("invalid_range", calgrid::TimeErrorCode::invalid_range,
               "Requested range ends before it begins")
        .value("invalid_civil_time", calgrid::TimeErrorCode::invalid_civil_time,
               "Calendar fields do not name a real date/time")
        .def("__str__", [](calgrid::TimeErrorCode c) {
            return std::string(calgrid::time_error_string(c));
        });

    // =========================================================================
    // Custom Exceptions
    // =========================================================================

    // IntervalError - any failed instant construction or interval generation
    auto interval_error =
        nb::exception<std::runtime_error>(m, "IntervalError", PyExc_ValueError);
    interval_error_type = interval_error.ptr();
}

} // namespace calgrid_python
