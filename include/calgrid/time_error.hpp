#pragma once

#include "calgrid/expected.hpp"

#include <cstdint>

namespace calgrid {

/**
 * @brief Reasons a time computation can fail
 */
enum class TimeErrorCode : uint8_t {
    out_of_range,      ///< Result falls outside the representable calendar range
    invalid_range,     ///< Requested range ends before it begins
    invalid_civil_time ///< Calendar fields do not name a real date/time
};

[[nodiscard]] constexpr const char* time_error_string(TimeErrorCode code) noexcept {
    switch (code) {
        case TimeErrorCode::out_of_range:
            return "Instant outside representable calendar range";
        case TimeErrorCode::invalid_range:
            return "Range end is before range begin";
        case TimeErrorCode::invalid_civil_time:
            return "Invalid calendar date or time of day";
    }
    return "Unknown time error";
}

/**
 * @brief Error information from a failed time computation
 *
 * Trivially copyable; carried as the error alternative of TimeResult.
 */
struct TimeError {
    TimeErrorCode code;

    /**
     * @brief Get a human-readable error message
     * @return Static string describing the error
     */
    [[nodiscard]] const char* message() const noexcept { return time_error_string(code); }

    constexpr bool operator==(const TimeError&) const noexcept = default;
};

/**
 * @brief Result type for fallible time operations
 *
 * @tparam T The type of the successfully computed value
 */
template <typename T>
using TimeResult = expected<T, TimeError>;

/**
 * @brief Factory function for creating time errors
 *
 * Usage:
 * @code
 *   return make_time_error(TimeErrorCode::out_of_range);
 * @endcode
 */
constexpr auto make_time_error(TimeErrorCode code) noexcept {
    return unexpected(TimeError{.code = code});
}

} // namespace calgrid
