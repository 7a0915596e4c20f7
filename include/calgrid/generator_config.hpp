#pragma once

#include "calgrid/duration.hpp"
#include "calgrid/grouping.hpp"

#include <cstdint>

namespace calgrid {

/**
 * @brief Immutable interval generation settings
 *
 * Every `with_*`/`without_*` call returns an updated copy; the receiver is
 * never modified, so a configuration can be shared freely between threads.
 *
 * Defaults: per_day grouping, no alignment offset, 1 ms precision, both ends
 * extended.
 *
 * Example usage:
 * @code
 *   auto config = GeneratorConfig::defaults()
 *                     .with_grouping(Grouping::per_month)
 *                     .with_offset_west_secs(7 * 3600)    // UTC-7 month starts
 *                     .with_precision(Duration::from_microseconds(1))
 *                     .without_extended_end();
 * @endcode
 */
class GeneratorConfig {
public:
    static constexpr Duration DEFAULT_PRECISION = Duration::from_milliseconds(1);

    constexpr GeneratorConfig() noexcept = default;

    static constexpr GeneratorConfig defaults() noexcept { return GeneratorConfig{}; }

    [[nodiscard]] constexpr GeneratorConfig with_grouping(Grouping grouping) const noexcept {
        GeneratorConfig copy = *this;
        copy.grouping_ = grouping;
        return copy;
    }

    /// Align boundaries to a wall clock `seconds` behind UTC (negative = ahead)
    [[nodiscard]] constexpr GeneratorConfig with_offset_west_secs(int32_t seconds) const noexcept {
        GeneratorConfig copy = *this;
        copy.offset_west_ = seconds;
        return copy;
    }

    /// Gap between one interval's end and the next interval's start (not validated)
    [[nodiscard]] constexpr GeneratorConfig with_precision(Duration precision) const noexcept {
        GeneratorConfig copy = *this;
        copy.precision_ = precision;
        return copy;
    }

    /// First interval starts at the first boundary at or after `begin`
    [[nodiscard]] constexpr GeneratorConfig without_extended_begin() const noexcept {
        GeneratorConfig copy = *this;
        copy.extend_begin_ = false;
        return copy;
    }

    /// Last interval ends before the last boundary at or before `end`
    [[nodiscard]] constexpr GeneratorConfig without_extended_end() const noexcept {
        GeneratorConfig copy = *this;
        copy.extend_end_ = false;
        return copy;
    }

    [[nodiscard]] constexpr GeneratorConfig without_extension() const noexcept {
        return without_extended_begin().without_extended_end();
    }

    constexpr Grouping grouping() const noexcept { return grouping_; }
    constexpr int32_t offset_west_secs() const noexcept { return offset_west_; }
    constexpr Duration precision() const noexcept { return precision_; }
    constexpr bool extend_begin() const noexcept { return extend_begin_; }
    constexpr bool extend_end() const noexcept { return extend_end_; }

    constexpr bool operator==(const GeneratorConfig&) const noexcept = default;

private:
    Grouping grouping_{Grouping::per_day};
    int32_t offset_west_{0};
    Duration precision_{DEFAULT_PRECISION};
    bool extend_begin_{true};
    bool extend_end_{true};
};

/// Default configuration; same as GeneratorConfig::defaults()
constexpr GeneratorConfig new_generator() noexcept {
    return GeneratorConfig::defaults();
}

} // namespace calgrid
