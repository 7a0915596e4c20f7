#pragma once

#include "calgrid/detail/time_math.hpp"

#include <compare>
#include <limits>

#include <cstdint>

namespace calgrid {

/**
 * Signed time span with exact picosecond precision.
 *
 * Used as the gap ("precision") kept between the end of one interval and the
 * start of the next, and as the result of subtracting two instants.
 *
 * ## Storage
 * int32_t seconds + uint64_t picoseconds, giving a range of about ±68 years.
 *
 * ## Negative Value Representation (Floor Semantics)
 * - `-1.5 seconds` = `{seconds: -2, picoseconds: 500,000,000,000}`
 * - `-1 picosecond` = `{seconds: -1, picoseconds: 999,999,999,999}`
 *
 * ## Overflow Policy
 * All factories and arithmetic saturate to min()/max(); use
 * `saturated(duration)` to detect it. No exceptions are thrown.
 */
class Duration {
public:
    static constexpr uint64_t PICOSECONDS_PER_SECOND = detail::PICOS_PER_SEC;
    static constexpr uint64_t PICOSECONDS_PER_MILLISECOND = 1'000'000'000ULL;
    static constexpr uint64_t PICOSECONDS_PER_MICROSECOND = 1'000'000ULL;
    static constexpr uint64_t PICOSECONDS_PER_NANOSECOND = 1'000ULL;

    static constexpr int64_t SECONDS_PER_MINUTE = 60;
    static constexpr int64_t SECONDS_PER_HOUR = 3'600;
    static constexpr int64_t SECONDS_PER_DAY = 86'400;

    static constexpr uint64_t MAX_PICOSECONDS = detail::MAX_PICOS;

    static constexpr Duration min() noexcept {
        return Duration(std::numeric_limits<int32_t>::min(), 0);
    }

    static constexpr Duration max() noexcept {
        return Duration(std::numeric_limits<int32_t>::max(), MAX_PICOSECONDS);
    }

    static constexpr Duration zero() noexcept { return Duration(0, 0); }

    constexpr Duration() noexcept = default;

    static constexpr Duration from_picoseconds(int64_t ps) noexcept {
        auto [sec, picos] = detail::normalize(0, ps);
        return Duration(detail::clamp_to_duration(sec, picos), picos);
    }

    static constexpr Duration from_nanoseconds(int64_t ns) noexcept {
        return scaled(ns, PICOSECONDS_PER_NANOSECOND);
    }

    static constexpr Duration from_microseconds(int64_t us) noexcept {
        return scaled(us, PICOSECONDS_PER_MICROSECOND);
    }

    static constexpr Duration from_milliseconds(int64_t ms) noexcept {
        return scaled(ms, PICOSECONDS_PER_MILLISECOND);
    }

    static constexpr Duration from_seconds(int64_t s) noexcept {
        uint64_t picos = 0;
        int32_t sec = detail::clamp_to_duration(s, picos);
        return Duration(sec, picos);
    }

    static constexpr Duration from_minutes(int64_t m) noexcept {
        return whole_seconds(m, SECONDS_PER_MINUTE);
    }

    static constexpr Duration from_hours(int64_t h) noexcept {
        return whole_seconds(h, SECONDS_PER_HOUR);
    }

    static constexpr Duration from_days(int64_t d) noexcept {
        return whole_seconds(d, SECONDS_PER_DAY);
    }

    constexpr int32_t seconds() const noexcept { return seconds_; }
    constexpr uint64_t picoseconds() const noexcept { return picoseconds_; }

    constexpr bool is_zero() const noexcept { return seconds_ == 0 && picoseconds_ == 0; }
    constexpr bool is_negative() const noexcept { return seconds_ < 0; }
    constexpr bool is_positive() const noexcept {
        return seconds_ > 0 || (seconds_ == 0 && picoseconds_ > 0);
    }

    // Unary negation (saturates for min())
    constexpr Duration operator-() const noexcept {
        if (*this == min()) {
            return max();
        }
        if (picoseconds_ == 0) {
            return Duration(-seconds_, 0);
        }
        return Duration(-seconds_ - 1, PICOSECONDS_PER_SECOND - picoseconds_);
    }

    constexpr Duration& operator+=(Duration other) noexcept {
        auto sum = detail::add_time(seconds_, picoseconds_, other.seconds_, other.picoseconds_);
        // int32 operands cannot overflow int64
        seconds_ = detail::clamp_to_duration(sum->first, sum->second);
        picoseconds_ = sum->second;
        return *this;
    }

    constexpr Duration& operator-=(Duration other) noexcept {
        auto diff = detail::sub_time(seconds_, picoseconds_, other.seconds_, other.picoseconds_);
        seconds_ = detail::clamp_to_duration(diff->first, diff->second);
        picoseconds_ = diff->second;
        return *this;
    }

    constexpr Duration& operator*=(int64_t scalar) noexcept {
        bool negative = (scalar < 0) != is_negative();
        auto product = detail::mul_time(seconds_, picoseconds_, scalar);
        if (!product) {
            *this = negative ? min() : max();
            return *this;
        }
        seconds_ = detail::clamp_to_duration(product->first, product->second);
        picoseconds_ = product->second;
        return *this;
    }

    friend constexpr Duration operator+(Duration lhs, Duration rhs) noexcept {
        lhs += rhs;
        return lhs;
    }

    friend constexpr Duration operator-(Duration lhs, Duration rhs) noexcept {
        lhs -= rhs;
        return lhs;
    }

    friend constexpr Duration operator*(Duration d, int64_t scalar) noexcept {
        d *= scalar;
        return d;
    }

    friend constexpr Duration operator*(int64_t scalar, Duration d) noexcept {
        d *= scalar;
        return d;
    }

    constexpr auto operator<=>(const Duration&) const noexcept = default;
    constexpr bool operator==(const Duration&) const noexcept = default;

private:
    int32_t seconds_{0};
    uint64_t picoseconds_{0}; // Always in [0, PICOSECONDS_PER_SECOND)

    constexpr Duration(int32_t sec, uint64_t picos) noexcept : seconds_(sec), picoseconds_(picos) {}

    // count * unit_picos, saturating before the multiplication can overflow
    static constexpr Duration scaled(int64_t count, uint64_t unit_picos) noexcept {
        const int64_t max_safe = std::numeric_limits<int64_t>::max() / static_cast<int64_t>(unit_picos);
        const int64_t min_safe = std::numeric_limits<int64_t>::min() / static_cast<int64_t>(unit_picos);
        if (count > max_safe)
            return max();
        if (count < min_safe)
            return min();
        return from_picoseconds(count * static_cast<int64_t>(unit_picos));
    }

    static constexpr Duration whole_seconds(int64_t count, int64_t unit_seconds) noexcept {
        if (count > std::numeric_limits<int32_t>::max() / unit_seconds)
            return max();
        if (count < std::numeric_limits<int32_t>::min() / unit_seconds)
            return min();
        return from_seconds(count * unit_seconds);
    }
};

/**
 * Check if a Duration has saturated to min() or max().
 *
 * Note: This cannot distinguish between a legitimate max/min value and
 * overflow saturation.
 */
constexpr bool saturated(const Duration& d) noexcept {
    return d == Duration::max() || d == Duration::min();
}

} // namespace calgrid
