#pragma once

#include "calgrid/duration.hpp"
#include "calgrid/generator_config.hpp"
#include "calgrid/grouping.hpp"
#include "calgrid/instant.hpp"
#include "calgrid/interval.hpp"
#include "calgrid/interval_generator.hpp"

#include <cstdint>

namespace calgrid {

/**
 * @brief Extended UTC intervals with the default precision
 *
 * The first interval starts on the boundary at or before `begin` and the last
 * one ends at or after `end`. Each interval ends 1 ms before the next
 * boundary. Boundaries are shifted by `offset_west_seconds`, e.g. 7200 for
 * days starting at midnight UTC-2.
 */
inline IntervalResult get_extended_utc_intervals(const Instant& begin, const Instant& end,
                                                 Grouping grouping, int32_t offset_west_seconds) {
    return get_intervals(GeneratorConfig::defaults()
                             .with_grouping(grouping)
                             .with_offset_west_secs(offset_west_seconds),
                         begin, end);
}

/**
 * @brief UTC intervals with every option explicit
 *
 * @param precision Gap between an interval's end and the next boundary
 * @param extend_begin Start on the boundary before `begin` instead of after it
 * @param extend_end End at the boundary after `end` instead of before it
 */
inline IntervalResult get_utc_intervals_opts(const Instant& begin, const Instant& end,
                                             Grouping grouping, int32_t offset_west_seconds,
                                             Duration precision, bool extend_begin,
                                             bool extend_end) {
    auto config = GeneratorConfig::defaults()
                      .with_grouping(grouping)
                      .with_offset_west_secs(offset_west_seconds)
                      .with_precision(precision);
    if (!extend_begin) {
        config = config.without_extended_begin();
    }
    if (!extend_end) {
        config = config.without_extended_end();
    }
    return get_intervals(config, begin, end);
}

} // namespace calgrid
