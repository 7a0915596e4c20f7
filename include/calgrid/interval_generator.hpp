#pragma once

#include "calgrid/boundary.hpp"
#include "calgrid/generator_config.hpp"
#include "calgrid/instant.hpp"
#include "calgrid/interval.hpp"
#include "calgrid/time_error.hpp"

#include <utility>

namespace calgrid {

namespace detail {

/**
 * First interval start for a range beginning at `begin`.
 *
 * With extend_begin the boundary at or before `begin` is used. Without it,
 * a boundary strictly before `begin` is skipped; a `begin` that sits exactly
 * on a boundary starts there either way.
 */
inline TimeResult<Instant> first_boundary(const GeneratorConfig& config, const Instant& begin) {
    auto first = boundary_at_or_before(begin, config.grouping(), config.offset_west_secs());
    if (!first || config.extend_begin() || *first == begin) {
        return first;
    }
    return next_boundary(*first, config.grouping(), config.offset_west_secs());
}

} // namespace detail

/**
 * @brief Split [begin, end] into calendar-aligned intervals
 *
 * Starting from the first boundary (see GeneratorConfig::without_extended_begin),
 * emits `(boundary, next_boundary - precision)` until the range end is
 * covered:
 * - extend_end: stops after the first interval whose end is >= `end`, so the
 *   last interval encloses `end`
 * - otherwise: keeps only intervals whose next boundary is <= `end`
 *
 * Every interval end is derived from its own next boundary, so the precision
 * never accumulates. All returned instants are UTC.
 *
 * @param begin Range start, at any fixed offset
 * @param end Range end, at any fixed offset
 * @return Intervals in ascending order (empty for begin == end or when no
 *         whole unit fits a non-extended range), invalid_range if
 *         end < begin, out_of_range if a boundary is not representable
 */
inline IntervalResult get_intervals(const GeneratorConfig& config, const Instant& begin,
                                    const Instant& end) {
    if (end < begin) {
        return make_time_error(TimeErrorCode::invalid_range);
    }

    IntervalList intervals;
    if (begin == end) {
        return intervals;
    }

    auto current = detail::first_boundary(config, begin);
    if (!current) {
        return make_unexpected(current.error());
    }

    while (true) {
        auto upper = next_boundary(*current, config.grouping(), config.offset_west_secs());
        if (!upper) {
            return make_unexpected(upper.error());
        }
        if (!config.extend_end() && *upper > end) {
            break;
        }

        auto last = upper->minus(config.precision());
        if (!last) {
            return make_unexpected(last.error());
        }
        intervals.push_back(Interval{current->to_utc(), last->to_utc()});

        if (config.extend_end() && *last >= end) {
            break;
        }
        current = std::move(upper);
    }

    return intervals;
}

} // namespace calgrid
