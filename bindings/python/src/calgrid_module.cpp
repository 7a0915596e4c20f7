// calgrid Python Bindings
// Main module entry point - includes component bindings

#include <nanobind/nanobind.h>

// Binding components
#include "core_bindings.hpp"
#include "error_bindings.hpp"
#include "generator_bindings.hpp"

namespace nb = nanobind;

// Define the exception type pointer (declared extern in py_types.hpp)
namespace calgrid_python {
PyObject* interval_error_type = nullptr;
} // namespace calgrid_python

NB_MODULE(calgrid, m) {
    m.doc() = "calgrid - calendar-aligned time interval generation";

    // 1. Error types (sets interval_error_type) - used by every fallible call
    calgrid_python::bind_errors(m);

    // 2. Core value types (Grouping, Duration, Instant, Interval)
    calgrid_python::bind_core(m);

    // 3. GeneratorConfig and interval generation - needs core types
    calgrid_python::bind_generator(m);
}
