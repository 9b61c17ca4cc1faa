/**
 * @file DateTime.cpp
 * @brief Implementation of date-time literal parsing
 */

#include "tomlet/DateTime.hpp"
#include <toml++/toml.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace tomlet {

namespace {
    /**
     * @brief Characters a date-time literal may contain
     *
     * Anything else (whitespace, '#', '=', a newline) would let the wrapped
     * document carry more than the single value.
     */
    bool is_date_time_char(unsigned char c) {
        return std::isdigit(c) || c == '-' || c == ':' || c == '.' || c == '+'
            || c == 'T' || c == 't' || c == 'Z' || c == 'z';
    }

    DateTime from_toml(const toml::date& d) {
        DateTime dt;
        dt.year = d.year;
        dt.month = d.month;
        dt.day = d.day;
        return dt;
    }

    DateTime from_toml(const toml::date_time& value) {
        DateTime dt = from_toml(value.date);
        dt.hour = value.time.hour;
        dt.minute = value.time.minute;
        dt.second = value.time.second;
        dt.nanosecond = value.time.nanosecond;
        dt.has_time = true;
        if (value.offset) {
            dt.has_offset = true;
            dt.offset_minutes = value.offset->minutes;
        }
        return dt;
    }
}

bool DateTime::operator==(const DateTime& other) const noexcept {
    return year == other.year && month == other.month && day == other.day
        && hour == other.hour && minute == other.minute && second == other.second
        && nanosecond == other.nanosecond && has_time == other.has_time
        && has_offset == other.has_offset && offset_minutes == other.offset_minutes;
}

std::string DateTime::to_string() const {
    const toml::date date{year, month, day};

    std::ostringstream ss;
    if (!has_time) {
        ss << date;
        return ss.str();
    }

    const toml::time time{hour, minute, second, nanosecond};
    if (has_offset) {
        ss << toml::date_time{date, time, toml::time_offset{0, offset_minutes}};
    } else {
        ss << toml::date_time{date, time};
    }
    return ss.str();
}

std::optional<DateTime> parse_date_time(const std::string& text) {
    if (text.empty() ||
        !std::all_of(text.begin(), text.end(),
                     [](char c) { return is_date_time_char(static_cast<unsigned char>(c)); })) {
        return std::nullopt;
    }

    // Decode as the single value of a one-key document
    toml::table table;
    try {
        table = toml::parse("v = " + text);
    } catch (const toml::parse_error&) {
        return std::nullopt;
    }

    const toml::node* node = table.get("v");
    if (node == nullptr) {
        return std::nullopt;
    }
    if (const auto* date = node->as_date()) {
        return from_toml(date->get());
    }
    if (const auto* date_time = node->as_date_time()) {
        return from_toml(date_time->get());
    }
    return std::nullopt;
}

} // namespace tomlet
