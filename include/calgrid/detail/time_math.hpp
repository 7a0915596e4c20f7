// include/calgrid/detail/time_math.hpp
#pragma once

#include <limits>
#include <optional>
#include <utility>

#include <cstdint>

namespace calgrid::detail {

/**
 * Shared (seconds, picoseconds) arithmetic for Duration and Instant.
 *
 * Both types store a whole-second count plus a picosecond remainder in
 * [0, 10^12). Negative values use floor semantics: -1.5s is {-2, 500e9}.
 * Intermediate results are computed in int64_t; callers decide whether to
 * saturate (Duration) or reject (Instant) values outside their storage range.
 */

/// Picoseconds per second (10^12)
inline constexpr uint64_t PICOS_PER_SEC = 1'000'000'000'000ULL;

/// Maximum valid picoseconds value (one less than a full second)
inline constexpr uint64_t MAX_PICOS = PICOS_PER_SEC - 1;

/**
 * Normalize (seconds, picoseconds) to canonical form with floor semantics.
 *
 * @param sec Seconds (may need adjustment)
 * @param picos Picoseconds (may be out of range, including INT64_MIN)
 * @return Pair of (normalized_sec, normalized_picos) where picos ∈ [0, 10^12)
 */
constexpr auto normalize(int64_t sec, int64_t picos) noexcept -> std::pair<int64_t, uint64_t> {
    if (picos >= static_cast<int64_t>(PICOS_PER_SEC)) {
        int64_t carry = picos / static_cast<int64_t>(PICOS_PER_SEC);
        sec += carry;
        picos %= static_cast<int64_t>(PICOS_PER_SEC);
        return {sec, static_cast<uint64_t>(picos)};
    }

    // Borrow - unsigned math avoids UB on INT64_MIN
    if (picos < 0) {
        uint64_t abs_picos = 0ULL - static_cast<uint64_t>(picos);
        uint64_t borrow = (abs_picos - 1) / PICOS_PER_SEC + 1;
        sec -= static_cast<int64_t>(borrow);
        uint64_t result_picos = borrow * PICOS_PER_SEC - abs_picos;
        return {sec, result_picos};
    }

    return {sec, static_cast<uint64_t>(picos)};
}

/**
 * Add two (seconds, picoseconds) values.
 *
 * Returns nullopt if the seconds sum overflows int64_t. The picosecond part
 * of the result is normalized; the seconds part is NOT range checked.
 */
constexpr auto add_time(int64_t sec_a, uint64_t picos_a, int64_t sec_b,
                        uint64_t picos_b) noexcept -> std::optional<std::pair<int64_t, uint64_t>> {
    int64_t sec = 0;
    if (__builtin_add_overflow(sec_a, sec_b, &sec)) {
        return std::nullopt;
    }
    auto [norm_sec, norm_picos] =
        normalize(0, static_cast<int64_t>(picos_a) + static_cast<int64_t>(picos_b));
    if (__builtin_add_overflow(sec, norm_sec, &sec)) {
        return std::nullopt;
    }
    return std::pair<int64_t, uint64_t>{sec, norm_picos};
}

/**
 * Subtract two (seconds, picoseconds) values: (sec_a, picos_a) - (sec_b, picos_b).
 *
 * Returns nullopt if the seconds difference overflows int64_t.
 */
constexpr auto sub_time(int64_t sec_a, uint64_t picos_a, int64_t sec_b,
                        uint64_t picos_b) noexcept -> std::optional<std::pair<int64_t, uint64_t>> {
    int64_t sec = 0;
    if (__builtin_sub_overflow(sec_a, sec_b, &sec)) {
        return std::nullopt;
    }
    auto [norm_sec, norm_picos] =
        normalize(0, static_cast<int64_t>(picos_a) - static_cast<int64_t>(picos_b));
    if (__builtin_add_overflow(sec, norm_sec, &sec)) {
        return std::nullopt;
    }
    return std::pair<int64_t, uint64_t>{sec, norm_picos};
}

/**
 * Clamp seconds to int32_t range for Duration storage.
 *
 * On overflow/underflow, also sets picoseconds to boundary value so that
 * Duration::max() and Duration::min() are well-defined sentinels.
 */
constexpr int32_t clamp_to_duration(int64_t sec, uint64_t& picos) noexcept {
    if (sec > std::numeric_limits<int32_t>::max()) {
        picos = MAX_PICOS;
        return std::numeric_limits<int32_t>::max();
    }
    if (sec < std::numeric_limits<int32_t>::min()) {
        picos = 0;
        return std::numeric_limits<int32_t>::min();
    }
    return static_cast<int32_t>(sec);
}

/**
 * Multiply a (seconds, picoseconds) value by a scalar.
 *
 * Returns nullopt when the product does not fit int64_t seconds.
 */
constexpr auto mul_time(int64_t sec, uint64_t picos, int64_t scalar) noexcept
    -> std::optional<std::pair<int64_t, uint64_t>> {
    if (scalar == 0) {
        return std::pair<int64_t, uint64_t>{0, 0};
    }

    // Total picoseconds in 128 bits keeps floor representation exact
    __int128_t total = static_cast<__int128_t>(sec) * static_cast<__int128_t>(PICOS_PER_SEC) +
                       static_cast<__int128_t>(picos);
    constexpr __int128_t max_i128 = static_cast<__int128_t>(~static_cast<__uint128_t>(0) >> 1);
    __int128_t abs_total = total < 0 ? -total : total;
    __int128_t abs_scalar = scalar < 0 ? -static_cast<__int128_t>(scalar) : scalar;
    if (abs_total > max_i128 / abs_scalar) {
        return std::nullopt;
    }
    __int128_t product = total * static_cast<__int128_t>(scalar);

    __int128_t q = product / static_cast<__int128_t>(PICOS_PER_SEC);
    __int128_t r = product % static_cast<__int128_t>(PICOS_PER_SEC);
    if (r < 0) {
        r += static_cast<__int128_t>(PICOS_PER_SEC);
        q -= 1;
    }
    if (q > std::numeric_limits<int64_t>::max() || q < std::numeric_limits<int64_t>::min()) {
        return std::nullopt;
    }
    return std::pair<int64_t, uint64_t>{static_cast<int64_t>(q), static_cast<uint64_t>(r)};
}

} // namespace calgrid::detail
