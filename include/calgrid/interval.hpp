#pragma once

#include "calgrid/instant.hpp"
#include "calgrid/time_error.hpp"

#include <vector>

namespace calgrid {

/**
 * @brief One calendar-aligned bucket
 *
 * Both ends are UTC instants and inclusive: `end` lies one precision step
 * before the next grouping boundary.
 */
struct Interval {
    Instant start;
    Instant end;

    constexpr bool operator==(const Interval&) const noexcept = default;
};

/// Ordered, non-overlapping intervals
using IntervalList = std::vector<Interval>;

/// Result of interval generation: all intervals, or the reason there are none
using IntervalResult = TimeResult<IntervalList>;

} // namespace calgrid
