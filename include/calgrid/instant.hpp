#pragma once

#include "calgrid/detail/time_math.hpp"
#include "calgrid/duration.hpp"
#include "calgrid/time_error.hpp"

#include <chrono>
#include <compare>
#include <limits>
#include <optional>
#include <utility>

#include <cstdint>

namespace calgrid {

/**
 * Absolute point in time with a fixed display offset.
 *
 * ## Storage
 * int64_t seconds since 1970-01-01T00:00:00Z + uint64_t picoseconds in
 * [0, 10^12), plus the offset (seconds east of UTC) the instant was expressed
 * in. The offset only affects presentation: two instants naming the same
 * absolute point compare equal regardless of their offsets.
 *
 * ## Range
 * Limited to the std::chrono::year range, -32767-01-01T00:00:00Z through
 * 32767-12-31T23:59:59.999999999999Z, so every instant can be broken down
 * into calendar fields.
 *
 * ## Overflow Policy
 * Unlike Duration, instant arithmetic does not saturate: plus()/minus()
 * return TimeErrorCode::out_of_range when the result leaves the range.
 */
class Instant {
public:
    static constexpr uint64_t PICOSECONDS_PER_SECOND = detail::PICOS_PER_SEC;
    static constexpr uint64_t MAX_FRACTIONAL = detail::MAX_PICOS;

    /// Fixed offsets must stay strictly within one day
    static constexpr int32_t MAX_OFFSET_SECONDS = 86'399;

    static constexpr int64_t MIN_UTC_SECONDS =
        std::chrono::sys_seconds{std::chrono::sys_days{std::chrono::year::min() /
                                                       std::chrono::January / 1}}
            .time_since_epoch()
            .count();

    static constexpr int64_t MAX_UTC_SECONDS =
        std::chrono::sys_seconds{std::chrono::sys_days{std::chrono::year::max() /
                                                       std::chrono::December / 31}}
            .time_since_epoch()
            .count() +
        86'399;

    /// Unix epoch, UTC
    constexpr Instant() noexcept = default;

    static constexpr Instant min() noexcept { return Instant(MIN_UTC_SECONDS, 0, 0); }
    static constexpr Instant max() noexcept { return Instant(MAX_UTC_SECONDS, MAX_FRACTIONAL, 0); }

    // === Factories (all range checked) ===

    /// From seconds + picoseconds since the Unix epoch; picos may exceed one second
    static constexpr TimeResult<Instant> from_utc_seconds(int64_t seconds,
                                                          uint64_t picos = 0) noexcept {
        auto sum = detail::add_time(seconds, 0, static_cast<int64_t>(picos / PICOSECONDS_PER_SECOND),
                                    picos % PICOSECONDS_PER_SECOND);
        if (!sum || !in_range(sum->first)) {
            return make_time_error(TimeErrorCode::out_of_range);
        }
        return Instant(sum->first, sum->second, 0);
    }

    template <typename Dur>
    static constexpr TimeResult<Instant> from_sys_time(std::chrono::sys_time<Dur> tp) noexcept {
        auto secs = std::chrono::floor<std::chrono::seconds>(tp);
        auto sub = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - secs);
        return from_utc_seconds(secs.time_since_epoch().count(),
                                static_cast<uint64_t>(sub.count()) *
                                    Duration::PICOSECONDS_PER_NANOSECOND);
    }

    /**
     * From wall-clock calendar fields observed at a fixed UTC offset.
     *
     * Example: 2022-06-10T12:23:45-07:00 is
     * `from_civil(2022, 6, 10, 12, 23, 45, 0, -7 * 3600)`.
     *
     * @param offset_east Seconds east of UTC the fields are expressed in
     * @return invalid_civil_time for impossible fields or offsets,
     *         out_of_range if the UTC point leaves the representable range
     */
    static constexpr TimeResult<Instant> from_civil(int year, unsigned month, unsigned day,
                                                    unsigned hour = 0, unsigned minute = 0,
                                                    unsigned second = 0, uint64_t picos = 0,
                                                    int32_t offset_east = 0) noexcept {
        using namespace std::chrono;
        if (year < static_cast<int>(std::chrono::year::min()) ||
            year > static_cast<int>(std::chrono::year::max())) {
            return make_time_error(TimeErrorCode::invalid_civil_time);
        }
        year_month_day ymd{std::chrono::year{year}, std::chrono::month{month},
                           std::chrono::day{day}};
        if (!ymd.ok() || hour > 23 || minute > 59 || second > 59 || picos > MAX_FRACTIONAL ||
            !valid_offset(offset_east)) {
            return make_time_error(TimeErrorCode::invalid_civil_time);
        }
        local_seconds local = local_days{ymd} + hours{hour} + minutes{minute} + seconds{second};
        int64_t utc = local.time_since_epoch().count() - offset_east;
        if (!in_range(utc)) {
            return make_time_error(TimeErrorCode::out_of_range);
        }
        return Instant(utc, picos, offset_east);
    }

    // === Accessors ===

    constexpr int64_t utc_seconds() const noexcept { return seconds_; }
    constexpr uint64_t picoseconds() const noexcept { return picoseconds_; }
    constexpr int32_t offset_east_seconds() const noexcept { return offset_east_; }
    constexpr bool is_utc() const noexcept { return offset_east_ == 0; }

    /// Whole UTC seconds (sub-second part dropped)
    constexpr std::chrono::sys_seconds to_sys_seconds() const noexcept {
        return std::chrono::sys_seconds{std::chrono::seconds{seconds_}};
    }

    /// Wall-clock seconds in this instant's own offset
    constexpr std::chrono::local_seconds to_local_seconds() const noexcept {
        return std::chrono::local_seconds{std::chrono::seconds{seconds_ + offset_east_}};
    }

    /// Same absolute point, expressed in UTC
    constexpr Instant to_utc() const noexcept { return Instant(seconds_, picoseconds_, 0); }

    /// Same absolute point, expressed at another fixed offset
    constexpr TimeResult<Instant> with_offset_east(int32_t offset_east) const noexcept {
        if (!valid_offset(offset_east)) {
            return make_time_error(TimeErrorCode::invalid_civil_time);
        }
        return Instant(seconds_, picoseconds_, offset_east);
    }

    // === Checked arithmetic (offset is preserved) ===

    constexpr TimeResult<Instant> plus(Duration d) const noexcept {
        return checked(detail::add_time(seconds_, picoseconds_, d.seconds(), d.picoseconds()));
    }

    constexpr TimeResult<Instant> minus(Duration d) const noexcept {
        return checked(detail::sub_time(seconds_, picoseconds_, d.seconds(), d.picoseconds()));
    }

    /// Difference between two instants; saturates like Duration arithmetic
    friend constexpr Duration operator-(const Instant& lhs, const Instant& rhs) noexcept {
        // Both operands are range limited, so the subtraction cannot overflow int64_t
        auto diff = detail::sub_time(lhs.seconds_, lhs.picoseconds_, rhs.seconds_,
                                     rhs.picoseconds_);
        uint64_t picos = diff->second;
        int32_t sec = detail::clamp_to_duration(diff->first, picos);
        return Duration::from_seconds(sec) + Duration::from_picoseconds(static_cast<int64_t>(picos));
    }

    // Comparison ignores the display offset
    constexpr bool operator==(const Instant& other) const noexcept {
        return seconds_ == other.seconds_ && picoseconds_ == other.picoseconds_;
    }

    constexpr std::strong_ordering operator<=>(const Instant& other) const noexcept {
        if (seconds_ != other.seconds_) {
            return seconds_ <=> other.seconds_;
        }
        return picoseconds_ <=> other.picoseconds_;
    }

    static constexpr bool in_range(int64_t utc_seconds) noexcept {
        return utc_seconds >= MIN_UTC_SECONDS && utc_seconds <= MAX_UTC_SECONDS;
    }

private:
    int64_t seconds_{0};
    uint64_t picoseconds_{0}; // Always in [0, PICOSECONDS_PER_SECOND)
    int32_t offset_east_{0};

    constexpr Instant(int64_t sec, uint64_t picos, int32_t offset_east) noexcept
        : seconds_(sec),
          picoseconds_(picos),
          offset_east_(offset_east) {}

    static constexpr bool valid_offset(int32_t offset) noexcept {
        return offset >= -MAX_OFFSET_SECONDS && offset <= MAX_OFFSET_SECONDS;
    }

    constexpr TimeResult<Instant>
    checked(const std::optional<std::pair<int64_t, uint64_t>>& result) const noexcept {
        if (!result || !in_range(result->first)) {
            return make_time_error(TimeErrorCode::out_of_range);
        }
        return Instant(result->first, result->second, offset_east_);
    }
};

} // namespace calgrid
