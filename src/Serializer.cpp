/**
 * @file Serializer.cpp
 * @brief Implementation of the object graph writer
 */

#include "tomlet/Serializer.hpp"
#include "tomlet/DotPath.hpp"
#include "tomlet/Entry.hpp"
#include "tomlet/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <locale>
#include <sstream>

namespace tomlet {

namespace {

bool is_valid_key(const std::string& key) {
    if (key.empty()) {
        return false;
    }
    const unsigned char first = static_cast<unsigned char>(key[0]);
    if (!std::isalpha(first) && first != '_') {
        return false;
    }
    return std::all_of(key.begin(), key.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-';
    });
}

bool is_scalar(const nlohmann::json& v) {
    return v.is_string() || v.is_boolean() || v.is_number();
}

std::string print_double(double value, std::ios_base::fmtflags flags, int precision) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss.flags(flags);
    oss << std::setprecision(precision) << value;
    return oss.str();
}

} // anonymous namespace

std::string Serializer::trim_key_group(const std::string& key_group) {
    std::size_t first = 0;
    std::size_t last = key_group.size();
    while (first < last && (key_group[first] == '[' || std::isspace(static_cast<unsigned char>(key_group[first])))) ++first;
    while (last > first && (key_group[last - 1] == ']' || std::isspace(static_cast<unsigned char>(key_group[last - 1])))) --last;
    while (first < last && key_group[first] == kKeySeparator) ++first;
    while (last > first && key_group[last - 1] == kKeySeparator) --last;
    return key_group.substr(first, last - first);
}

std::string Serializer::format_float(double value, const std::string& path) {
    if (!std::isfinite(value)) {
        throw SerializeError(path, "non-finite floats cannot be written");
    }

    // Shortest general form that reads back to the same value
    std::string text;
    for (int precision = 15; precision <= 17; ++precision) {
        text = print_double(value, std::ios_base::fmtflags(), precision);
        if (std::strtod(text.c_str(), nullptr) == value) {
            break;
        }
    }

    if (text.find_first_of("eE") != std::string::npos) {
        // The grammar has no exponents: spell the value out with the
        // fewest decimals that still read back to the same value
        for (int decimals = 1; decimals <= 340; ++decimals) {
            text = print_double(value, std::ios_base::fixed, decimals);
            if (std::strtod(text.c_str(), nullptr) == value) {
                break;
            }
        }
    }

    if (text.find('.') == std::string::npos) {
        text += ".0";
    }
    return text;
}

std::string Serializer::literal(const nlohmann::json& value, const std::string& path) {
    if (value.is_string()) {
        return quote_string(value.get<std::string>());
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "true" : "false";
    }
    if (value.is_number_unsigned()) {
        return std::to_string(value.get<std::uint64_t>());
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<std::int64_t>());
    }
    if (value.is_number_float()) {
        return format_float(value.get<double>(), path);
    }
    if (value.is_array()) {
        std::string text = "[";
        bool first = true;
        for (std::size_t i = 0; i < value.size(); ++i) {
            const auto& element = value[i];
            const std::string element_path = path + "." + std::to_string(i);
            if (element.is_object()) {
                throw SerializeError(element_path, "Cannot serialize complex types in an array");
            }
            if (element.is_null()) {
                throw SerializeError(element_path, "Cannot serialize null in an array");
            }
            if (!first) {
                text += ", ";
            }
            text += literal(element, element_path);
            first = false;
        }
        text += "]";
        return text;
    }
    throw SerializeError(path, std::string("unsupported value type ") + value.type_name());
}

void Serializer::write_json(const nlohmann::json& object, const std::string& root_key_group,
                            std::ostream& out) {
    const std::string key_group = trim_key_group(root_key_group);

    if (!object.is_object()) {
        throw SerializeError(key_group, "the root of a document must be an object");
    }

    if (!key_group.empty()) {
        out << '[' << key_group << "]\n";
    }

    for (auto it = object.begin(); it != object.end(); ++it) {
        if (!is_valid_key(it.key())) {
            throw SerializeError(append_dot_path(key_group, it.key()), "invalid key");
        }
    }

    // native values
    for (auto it = object.begin(); it != object.end(); ++it) {
        if (is_scalar(it.value())) {
            const std::string path = append_dot_path(key_group, it.key());
            out << it.key() << " = " << literal(it.value(), path) << "\n";
        }
    }

    // arrays
    for (auto it = object.begin(); it != object.end(); ++it) {
        if (it.value().is_array()) {
            const std::string path = append_dot_path(key_group, it.key());
            out << it.key() << " = " << literal(it.value(), path) << "\n";
        }
    }

    // nested groups
    for (auto it = object.begin(); it != object.end(); ++it) {
        if (it.value().is_object()) {
            out << "\n";
            write_json(it.value(), append_dot_path(key_group, it.key()), out);
        }
    }
}

std::string Serializer::to_string(const nlohmann::json& object, const std::string& root_key_group) {
    std::ostringstream oss;
    write_json(object, root_key_group, oss);
    return oss.str();
}

} // namespace tomlet
