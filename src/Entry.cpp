/**
 * @file Entry.cpp
 * @brief Implementation of the value token
 */

#include "tomlet/Entry.hpp"
#include "tomlet/DotPath.hpp"

namespace tomlet {

const char* type_name(ValueType type) noexcept {
    switch (type) {
        case ValueType::String: return "String";
        case ValueType::Int: return "Int";
        case ValueType::Float: return "Float";
        case ValueType::DateTime: return "DateTime";
        case ValueType::Boolean: return "Boolean";
        case ValueType::Array: return "Array";
    }
    return "Unknown";
}

std::string quote_string(const std::string& payload) {
    std::string result;
    result.reserve(payload.size() + 2);
    result += '"';
    for (char c : payload) {
        switch (c) {
            case '\\': result += "\\\\"; break;
            case '"': result += "\\\""; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            case '\0': result += "\\0"; break;
            default: result += c; break;
        }
    }
    result += '"';
    return result;
}

Entry::Entry(std::string group, std::string name, std::string source,
             std::size_t line, std::size_t column, ValueType type,
             bool in_array)
    : group_(std::move(group))
    , name_(std::move(name))
    , source_(std::move(source))
    , line_(line)
    , column_(column)
    , type_(type)
    , in_array_(in_array)
{}

std::string Entry::full_name() const {
    return append_dot_path(group_, name_);
}

std::string Entry::literal() const {
    if (type_ == ValueType::String) {
        return quote_string(source_);
    }
    return source_;
}

std::string Entry::to_string() const {
    if (in_array_) {
        return literal();
    }
    return std::string(type_name(type_)) + " " + full_name() + " = " + literal();
}

} // namespace tomlet
