/**
 * @file Convert.cpp
 * @brief Implementation of string-to-type conversion
 */

#include "tomlet/Convert.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <regex>

namespace tomlet {

namespace {
    /**
     * @brief Convert string to lowercase
     */
    std::string to_lower(const std::string& str) {
        std::string result = str;
        std::transform(result.begin(), result.end(), result.begin(),
                      [](unsigned char c) { return std::tolower(c); });
        return result;
    }

    /**
     * @brief Parse a whole string as a decimal int64
     */
    std::optional<std::int64_t> parse_int64(const std::string& str) {
        if (str.empty()) {
            return std::nullopt;
        }
        const char* first = str.data();
        const char* last = str.data() + str.size();
        if (*first == '+') {
            ++first;
            if (first == last || *first == '-') {
                return std::nullopt;
            }
        }

        std::int64_t value = 0;
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc() || ptr != last) {
            return std::nullopt;
        }
        return value;
    }

    template <typename T>
    std::optional<T> parse_ranged(const std::string& str) {
        auto value = parse_int64(str);
        if (!value) {
            return std::nullopt;
        }
        if (*value < static_cast<std::int64_t>(std::numeric_limits<T>::min()) ||
            *value > static_cast<std::int64_t>(std::numeric_limits<T>::max())) {
            return std::nullopt;
        }
        return static_cast<T>(*value);
    }

    /**
     * @brief Check if string matches regex pattern
     */
    bool matches_regex(const std::string& str, const std::regex& re) {
        try {
            return std::regex_match(str, re);
        } catch (const std::regex_error&) {
            return false;
        }
    }

    int hex_value(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
}

std::string Uuid::to_string() const {
    char buf[37];
    std::snprintf(buf, sizeof(buf),
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5],
                  bytes[6], bytes[7], bytes[8], bytes[9], bytes[10], bytes[11],
                  bytes[12], bytes[13], bytes[14], bytes[15]);
    return buf;
}

std::optional<std::string> ValueConverter<std::string>::convert(const std::string& text) {
    return text;
}

std::optional<bool> ValueConverter<bool>::convert(const std::string& text) {
    const std::string lower = to_lower(text);
    if (lower == "true") {
        return true;
    }
    if (lower == "false") {
        return false;
    }
    return std::nullopt;
}

std::optional<std::int64_t> ValueConverter<std::int64_t>::convert(const std::string& text) {
    return parse_int64(text);
}

std::optional<int> ValueConverter<int>::convert(const std::string& text) {
    return parse_ranged<int>(text);
}

std::optional<std::uint16_t> ValueConverter<std::uint16_t>::convert(const std::string& text) {
    return parse_ranged<std::uint16_t>(text);
}

std::optional<std::uint32_t> ValueConverter<std::uint32_t>::convert(const std::string& text) {
    return parse_ranged<std::uint32_t>(text);
}

std::optional<double> ValueConverter<double>::convert(const std::string& text) {
    static const std::regex pattern("^[-+]?[0-9]+(\\.[0-9]+)?([eE][+-]?[0-9]+)?$");
    if (!matches_regex(text, pattern)) {
        return std::nullopt;
    }

    errno = 0;
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || errno == ERANGE) {
        return std::nullopt;
    }
    return value;
}

std::optional<float> ValueConverter<float>::convert(const std::string& text) {
    auto value = ValueConverter<double>::convert(text);
    if (!value) {
        return std::nullopt;
    }
    if (std::fabs(*value) > static_cast<double>(std::numeric_limits<float>::max())) {
        return std::nullopt;
    }
    return static_cast<float>(*value);
}

std::optional<DateTime> ValueConverter<DateTime>::convert(const std::string& text) {
    return parse_date_time(text);
}

std::optional<Uuid> ValueConverter<Uuid>::convert(const std::string& text) {
    std::string body = text;
    if (body.size() == 38 && body.front() == '{' && body.back() == '}') {
        body = body.substr(1, 36);
    }
    if (body.size() != 36) {
        return std::nullopt;
    }

    Uuid uuid;
    std::size_t byte = 0;
    for (std::size_t i = 0; i < body.size();) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (body[i] != '-') {
                return std::nullopt;
            }
            ++i;
            continue;
        }
        const int hi = hex_value(body[i]);
        const int lo = hex_value(body[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        uuid.bytes[byte++] = static_cast<std::uint8_t>(hi * 16 + lo);
        i += 2;
    }
    return uuid;
}

} // namespace tomlet
