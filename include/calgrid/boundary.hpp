#pragma once

#include "calgrid/grouping.hpp"
#include "calgrid/instant.hpp"
#include "calgrid/time_error.hpp"

#include <chrono>

#include <cstdint>

namespace calgrid {

namespace detail {

/**
 * Wall-clock seconds of an instant in the frame `offset_west` seconds behind
 * UTC. Sub-second picoseconds are dropped.
 *
 * Fails with out_of_range if the shifted time leaves the calendar range, so
 * that truncate()/advance() only ever see representable dates.
 */
constexpr TimeResult<std::chrono::local_seconds> to_aligned_frame(const Instant& instant,
                                                                  int32_t offset_west) noexcept {
    int64_t local = instant.utc_seconds() - static_cast<int64_t>(offset_west);
    if (!Instant::in_range(local)) {
        return make_time_error(TimeErrorCode::out_of_range);
    }
    return std::chrono::local_seconds{std::chrono::seconds{local}};
}

/// Inverse of to_aligned_frame(): the UTC instant of an aligned wall-clock time
constexpr TimeResult<Instant> from_aligned_frame(std::chrono::local_seconds local,
                                                 int32_t offset_west) noexcept {
    return Instant::from_utc_seconds(local.time_since_epoch().count() +
                                     static_cast<int64_t>(offset_west));
}

} // namespace detail

/**
 * @brief Grouping boundary at or before an instant
 *
 * Shifts `instant` west by `offset_west` seconds, truncates it to the start
 * of the enclosing grouping unit, then shifts the result back to UTC.
 *
 * Example: with per_month and offset_west = 25200 (UTC-7),
 * 2022-06-10T19:23:45Z maps to 2022-06-01T07:00:00Z.
 *
 * @param instant Any instant; its display offset is irrelevant
 * @param grouping Calendar granularity
 * @param offset_west Alignment offset in seconds west of UTC
 * @return UTC boundary <= instant, or out_of_range
 */
[[nodiscard]] constexpr TimeResult<Instant>
boundary_at_or_before(const Instant& instant, Grouping grouping, int32_t offset_west) noexcept {
    return detail::to_aligned_frame(instant, offset_west)
        .and_then([&](std::chrono::local_seconds local) {
            return detail::from_aligned_frame(truncate(grouping, local), offset_west);
        });
}

/**
 * @brief Grouping boundary following a boundary
 *
 * Adds exactly one calendar unit in the aligned frame. For any t with
 * `boundary <= t < next_boundary(boundary)`, boundary_at_or_before(t) yields
 * `boundary` again.
 *
 * @param boundary A value previously returned by boundary_at_or_before() or
 *                 next_boundary() for the same grouping and offset
 * @return The next UTC boundary, or out_of_range
 */
[[nodiscard]] constexpr TimeResult<Instant>
next_boundary(const Instant& boundary, Grouping grouping, int32_t offset_west) noexcept {
    return detail::to_aligned_frame(boundary, offset_west)
        .and_then([&](std::chrono::local_seconds local) { return advance(grouping, local); })
        .and_then([&](std::chrono::local_seconds next) {
            return detail::from_aligned_frame(next, offset_west);
        });
}

} // namespace calgrid
