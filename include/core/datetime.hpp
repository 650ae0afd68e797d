#pragma once

#include "core/error.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace orabridge::datetime {

/// Strict "%Y-%m-%d" → "YYYY-MM-DD" (calendar-validated)
[[nodiscard]] Result<std::string> normalize_date(std::string_view text);

/// Strict "%Y-%m-%dT%H:%M:%S" → "YYYY-MM-DD HH:MM:SS"
[[nodiscard]] Result<std::string> normalize_datetime(std::string_view text);

/**
 * @brief Parse a DATE column rendering into the generic datetime form
 *
 * Accepts "YYYY-MM-DD", "YYYY-MM-DD HH:MM:SS[.f]" and the 'T'-separated
 * variant. Output is always "YYYY-MM-DDTHH:MM:SS", with the fractional part
 * appended (trailing zeros trimmed) when non-zero.
 */
[[nodiscard]] Result<std::string> parse_native_datetime(std::string_view text);

/// Broken-down timestamp as the native client reports it
struct TimestampFields {
    int year = 0;
    unsigned month = 0;
    unsigned day = 0;
    unsigned hour = 0;
    unsigned minute = 0;
    unsigned second = 0;
    uint32_t fsecond = 0;                   // nanoseconds
    std::optional<int> tz_offset_minutes;   // set only for zoned columns
};

/**
 * @brief Text rendering of a native timestamp
 *
 * "YYYY-MM-DD HH:MM:SS", then ".fffffffff" when the fraction is non-zero,
 * then " +HH:MM" / " -HH:MM" when the value carries a zone offset.
 */
[[nodiscard]] std::string format_timestamp(const TimestampFields& ts);

} // namespace orabridge::datetime
