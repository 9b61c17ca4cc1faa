/**
 * @file Convert.hpp
 * @brief String-to-type conversion used by the typed accessors
 *
 * ValueConverter<T>::convert takes the raw source text of an entry and
 * produces a T, or nullopt when the text cannot be represented as T.
 * Converters never throw; the strict accessors turn nullopt into a
 * ConversionError and the try_* accessors into a false return.
 *
 * Supported targets:
 * - std::string: the text itself
 * - bool: "true" / "false" (case-insensitive)
 * - std::int64_t, int, std::uint16_t, std::uint32_t: decimal integers,
 *   range checked
 * - double, float: ^[-+]?[0-9]+(\.[0-9]+)?([eE][+-]?[0-9]+)?$
 * - DateTime: see DateTime.hpp
 * - Uuid: 8-4-4-4-12 hex digits, optionally wrapped in braces
 *
 * Requesting any other T fails to compile.
 */

#ifndef TOMLET_CONVERT_HPP
#define TOMLET_CONVERT_HPP

#include "tomlet/DateTime.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace tomlet {

/**
 * @brief 128-bit universally unique identifier
 */
struct Uuid {
    std::array<std::uint8_t, 16> bytes{};

    bool operator==(const Uuid& other) const noexcept { return bytes == other.bytes; }
    bool operator!=(const Uuid& other) const noexcept { return bytes != other.bytes; }

    /// Lower-case 8-4-4-4-12 form
    std::string to_string() const;
};

/**
 * @brief Converter from source text to T; specialized per supported type
 */
template <typename T>
struct ValueConverter;

template <>
struct ValueConverter<std::string> {
    static constexpr const char* name = "string";
    static std::optional<std::string> convert(const std::string& text);
};

template <>
struct ValueConverter<bool> {
    static constexpr const char* name = "bool";
    static std::optional<bool> convert(const std::string& text);
};

template <>
struct ValueConverter<std::int64_t> {
    static constexpr const char* name = "int64";
    static std::optional<std::int64_t> convert(const std::string& text);
};

template <>
struct ValueConverter<int> {
    static constexpr const char* name = "int";
    static std::optional<int> convert(const std::string& text);
};

template <>
struct ValueConverter<std::uint16_t> {
    static constexpr const char* name = "uint16";
    static std::optional<std::uint16_t> convert(const std::string& text);
};

template <>
struct ValueConverter<std::uint32_t> {
    static constexpr const char* name = "uint32";
    static std::optional<std::uint32_t> convert(const std::string& text);
};

template <>
struct ValueConverter<double> {
    static constexpr const char* name = "double";
    static std::optional<double> convert(const std::string& text);
};

template <>
struct ValueConverter<float> {
    static constexpr const char* name = "float";
    static std::optional<float> convert(const std::string& text);
};

template <>
struct ValueConverter<DateTime> {
    static constexpr const char* name = "datetime";
    static std::optional<DateTime> convert(const std::string& text);
};

template <>
struct ValueConverter<Uuid> {
    static constexpr const char* name = "uuid";
    static std::optional<Uuid> convert(const std::string& text);
};

/**
 * @brief Convert source text to T
 *
 * Examples:
 * ```cpp
 * convert_value<std::int64_t>("-17")   // → -17
 * convert_value<double>("3.14")        // → 3.14
 * convert_value<bool>("TRUE")          // → true
 * convert_value<int>("99999999999")    // → nullopt (out of range)
 * convert_value<Uuid>("not-a-uuid")    // → nullopt
 * ```
 */
template <typename T>
std::optional<T> convert_value(const std::string& text) {
    return ValueConverter<T>::convert(text);
}

} // namespace tomlet

#endif // TOMLET_CONVERT_HPP
