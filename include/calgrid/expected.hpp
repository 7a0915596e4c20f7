#pragma once

// calgrid Expected Type
//
// Exposes tl::expected in the calgrid namespace. Every fallible operation
// (instant arithmetic, boundary computation, interval generation) returns
// calgrid::expected<T, TimeError> instead of throwing.
//
// Usage:
//   auto intervals = calgrid::get_intervals(config, begin, end);
//   if (intervals.has_value()) {
//       for (const auto& iv : *intervals) { ... }
//   } else {
//       std::cerr << intervals.error().message() << "\n";
//   }
//
// Monadic operations:
//   result.and_then(f)  - chain on success
//   result.map(f)       - transform value
//   result.or_else(f)   - chain on error

#include <tl/expected.hpp>

namespace calgrid {

using tl::expected;
using tl::make_unexpected;
using tl::unexpect;
using tl::unexpect_t;
using tl::unexpected;

} // namespace calgrid
