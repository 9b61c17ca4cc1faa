/**
 * @file Array.cpp
 * @brief Implementation of the array entry and type unification
 */

#include "tomlet/Array.hpp"
#include <algorithm>

namespace tomlet {

const char* native_type_name(NativeType type) noexcept {
    switch (type) {
        case NativeType::None: return "None";
        case NativeType::Int64: return "Int64";
        case NativeType::Double: return "Double";
        case NativeType::Bool: return "Bool";
        case NativeType::Timestamp: return "Timestamp";
        case NativeType::Text: return "Text";
        case NativeType::Object: return "Object";
    }
    return "Object";
}

NativeType to_native_type(ValueType type) noexcept {
    switch (type) {
        case ValueType::Int: return NativeType::Int64;
        case ValueType::Float: return NativeType::Double;
        case ValueType::Boolean: return NativeType::Bool;
        case ValueType::DateTime: return NativeType::Timestamp;
        case ValueType::String: return NativeType::Text;
        case ValueType::Array: return NativeType::Object;
    }
    return NativeType::Object;
}

std::string ArrayType::to_string() const {
    std::string result = native_type_name(element);
    for (std::size_t i = 0; i < rank; ++i) {
        result += "[]";
    }
    return result;
}

bool fold_native_type(NativeType& current, NativeType next) noexcept {
    switch (next) {
        case NativeType::Int64:
            if (current == NativeType::None || current == NativeType::Int64) {
                current = NativeType::Int64;
                return true;
            }
            // Double already established: the integer is promoted
            return current == NativeType::Double;

        case NativeType::Double:
            if (current == NativeType::None || current == NativeType::Double ||
                current == NativeType::Int64) {
                current = NativeType::Double;
                return true;
            }
            return false;

        case NativeType::Bool:
            if (current == NativeType::None || current == NativeType::Bool) {
                current = NativeType::Bool;
                return true;
            }
            return false;

        case NativeType::Timestamp:
            if (current == NativeType::None || current == NativeType::Timestamp) {
                current = NativeType::Timestamp;
                return true;
            }
            // Text absorbs date-times
            return current == NativeType::Text;

        case NativeType::Text:
            if (current == NativeType::Int64 || current == NativeType::Double) {
                return false;
            }
            current = NativeType::Text;
            return true;

        case NativeType::None:
        case NativeType::Object:
            return false;
    }
    return false;
}

Array::Array(std::string group, std::string name, std::size_t line, std::size_t column)
    : Entry(std::move(group), std::move(name), std::string(), line, column,
            ValueType::Array, false)
{}

Array::Array(std::string group, std::size_t index, std::size_t line, std::size_t column)
    : Entry(std::move(group), std::to_string(index), std::string(), line, column,
            ValueType::Array, true)
{}

Entry& Array::add_entry(std::unique_ptr<Entry> entry) {
    children_.push_back(std::move(entry));
    return *children_.back();
}

void Array::finalize() {
    std::string text = "[";
    for (std::size_t i = 0; i < children_.size(); ++i) {
        if (i > 0) text += ',';
        text += children_[i]->literal();
    }
    text += ']';
    set_source_text(std::move(text));
    finalized_ = true;
}

std::size_t Array::max_depth() const {
    std::size_t deepest = 0;
    for (const auto& child : children_) {
        if (child->type() == ValueType::Array) {
            deepest = std::max(deepest, static_cast<const Array&>(*child).max_depth());
        }
    }
    return deepest + 1;
}

std::size_t Array::max_length() const {
    std::size_t longest = 0;
    for (const auto& child : children_) {
        if (child->type() == ValueType::Array) {
            longest = std::max(longest, static_cast<const Array&>(*child).max_length());
        }
    }
    return std::max(children_.size(), longest);
}

Array::Dimensions Array::dimensions() const {
    Dimensions dims;
    dims.depth = max_depth();
    dims.length = max_length();
    return dims;
}

ArrayType Array::element_type() const {
    const ArrayType fallback{NativeType::Object, 1};
    if (children_.empty()) {
        return fallback;
    }

    if (dimensions().depth == 1) {
        NativeType current = NativeType::None;
        for (const auto& child : children_) {
            if (!fold_native_type(current, to_native_type(child->type()))) {
                return fallback;
            }
        }
        return ArrayType{current, 1};
    }

    // Array of arrays: every child must be an array and all must agree
    bool first = true;
    ArrayType common;
    for (const auto& child : children_) {
        if (child->type() != ValueType::Array) {
            return fallback;
        }
        ArrayType child_type = static_cast<const Array&>(*child).element_type();
        if (first) {
            common = child_type;
            first = false;
        } else if (child_type != common) {
            return fallback;
        }
    }
    return ArrayType{common.element, common.rank + 1};
}

std::string Array::to_string() const {
    std::string text;
    if (!in_array()) {
        text = std::string(type_name(type())) + " " + full_name() + " = ";
    }
    text += '[';
    for (std::size_t i = 0; i < children_.size(); ++i) {
        if (i > 0) text += ", ";
        text += children_[i]->to_string();
    }
    text += ']';
    return text;
}

} // namespace tomlet
