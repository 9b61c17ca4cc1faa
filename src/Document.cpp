/**
 * @file Document.cpp
 * @brief Implementation of the document root and its JSON mirror
 */

#include "tomlet/Document.hpp"

namespace tomlet {

namespace {

nlohmann::json entry_to_json(const Entry& entry) {
    switch (entry.type()) {
        case ValueType::Int: {
            auto value = convert_value<std::int64_t>(entry.source_text());
            if (value) {
                return nlohmann::json(*value);
            }
            // Out of int64 range: keep the literal
            return nlohmann::json(entry.source_text());
        }

        case ValueType::Float: {
            auto value = convert_value<double>(entry.source_text());
            if (value) {
                return nlohmann::json(*value);
            }
            return nlohmann::json(entry.source_text());
        }

        case ValueType::Boolean:
            return nlohmann::json(entry.source_text() == "true");

        case ValueType::String:
        case ValueType::DateTime:
            return nlohmann::json(entry.source_text());

        case ValueType::Array: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& child : static_cast<const Array&>(entry).children()) {
                arr.push_back(entry_to_json(*child));
            }
            return arr;
        }
    }
    return nlohmann::json(nullptr);
}

nlohmann::json group_to_json(const Group& group) {
    nlohmann::json obj = nlohmann::json::object();
    for (const auto& item : group.items()) {
        obj[item->name()] = entry_to_json(*item);
    }
    for (const auto& child : group.children()) {
        obj[child->key()] = group_to_json(*child);
    }
    return obj;
}

} // anonymous namespace

Document::Document()
    : Group(std::string())
{}

const Array& Document::get_array(const std::string& path) const {
    const Entry& entry = get_value(path);
    if (entry.type() != ValueType::Array) {
        throw InvalidOperationError(path,
            std::string("Expected Array, found ") + type_name(entry.type()));
    }
    return static_cast<const Array&>(entry);
}

ArrayType Document::get_array_type(const std::string& path) const {
    return get_array(path).element_type();
}

nlohmann::json Document::to_json() const {
    return group_to_json(*this);
}

} // namespace tomlet
