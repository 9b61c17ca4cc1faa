/**
 * @file DateTime.hpp
 * @brief Date-time literal parsing
 *
 * Accepted forms:
 * - 1979-05-27
 * - 1979-05-27T07:32:00
 * - 1979-05-27T07:32:00.999999
 * - 1979-05-27T07:32:00Z
 * - 1979-05-27T00:32:00-07:00
 *
 * The 'T' and 'Z' designators are case-insensitive. Decoding and
 * rendering are delegated to toml++.
 */

#ifndef TOMLET_DATETIME_HPP
#define TOMLET_DATETIME_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace tomlet {

struct DateTime {
    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;
    std::uint32_t nanosecond = 0;

    /// Offset from UTC in minutes; only meaningful if has_offset
    int offset_minutes = 0;

    bool has_time = false;
    bool has_offset = false;

    bool operator==(const DateTime& other) const noexcept;
    bool operator!=(const DateTime& other) const noexcept { return !(*this == other); }

    /**
     * @brief Canonical text form, e.g. "1979-05-27T07:32:00Z"
     *
     * Fractional seconds are written with trailing zeros removed, and a
     * zero offset is written as 'Z'.
     */
    std::string to_string() const;
};

/**
 * @brief Parse a date-time literal
 *
 * Local times without a date are not date-time literals.
 *
 * @return The decoded value, or nullopt if the text is not a valid literal
 */
std::optional<DateTime> parse_date_time(const std::string& text);

} // namespace tomlet

#endif // TOMLET_DATETIME_HPP
