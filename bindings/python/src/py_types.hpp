#pragma once
// Shared helpers for calgrid bindings

#include <nanobind/nanobind.h>

#include <calgrid/time_error.hpp>

#include <utility>

namespace nb = nanobind;

namespace calgrid_python {

// Exception type pointer (set during module init)
extern PyObject* interval_error_type;

/**
 * @brief Unwrap a TimeResult or raise IntervalError with its message
 */
template <typename T>
T unwrap(calgrid::TimeResult<T>&& result) {
    if (!result.has_value()) {
        PyErr_SetString(interval_error_type, result.error().message());
        throw nb::python_error();
    }
    return std::move(*result);
}

} // namespace calgrid_python
