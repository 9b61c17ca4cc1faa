/**
 * @file Document.hpp
 * @brief Root group of a parsed source, with typed accessors
 *
 * Accessor rules:
 * - get_value() throws KeyError if the path doesn't name a value
 * - get_field_value<T>() additionally throws ConversionError if the
 *   source text can't be converted to T
 * - try_get_value() / try_get_field_value<T>() report a missing path or
 *   a failed conversion through their return value
 * - get_array_value<T>() throws InvalidOperationError if the path
 *   doesn't name an array
 *
 * A Document is not modified after parsing; concurrent readers are safe.
 */

#ifndef TOMLET_DOCUMENT_HPP
#define TOMLET_DOCUMENT_HPP

#include "tomlet/Array.hpp"
#include "tomlet/Convert.hpp"
#include "tomlet/Errors.hpp"
#include "tomlet/Group.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <type_traits>
#include <vector>

namespace tomlet {

namespace detail {

template <typename T>
struct is_vector : std::false_type {};

template <typename U, typename A>
struct is_vector<std::vector<U, A>> : std::true_type {};

/**
 * @brief Convert every child of an array to T
 *
 * T = std::vector<U> descends into nested arrays.
 */
template <typename T>
std::vector<T> convert_array(const Array& array, const std::string& path) {
    std::vector<T> result;
    result.reserve(array.size());

    for (std::size_t i = 0; i < array.size(); ++i) {
        const Entry& child = *array.children()[i];
        const std::string child_path = path + "." + std::to_string(i);

        if constexpr (is_vector<T>::value) {
            if (child.type() != ValueType::Array) {
                throw InvalidOperationError(child_path, "Element is not an array");
            }
            result.push_back(convert_array<typename T::value_type>(
                static_cast<const Array&>(child), child_path));
        } else {
            auto value = ValueConverter<T>::convert(child.source_text());
            if (!value) {
                throw ConversionError(child_path, child.source_text(), ValueConverter<T>::name);
            }
            result.push_back(std::move(*value));
        }
    }
    return result;
}

} // namespace detail

class Document : public Group {
public:
    Document();

    /**
     * @brief Convert the value at path to T
     * @throws KeyError if the path is absent
     * @throws ConversionError if the converter rejects the source text
     */
    template <typename T>
    T get_field_value(const std::string& path) const {
        const Entry& entry = get_value(path);
        auto value = ValueConverter<T>::convert(entry.source_text());
        if (!value) {
            throw ConversionError(path, entry.source_text(), ValueConverter<T>::name);
        }
        return std::move(*value);
    }

    /**
     * @brief Convert the value at path to T without throwing
     * @return false if the path is absent or the conversion fails;
     *         result is left untouched in that case
     */
    template <typename T>
    bool try_get_field_value(const std::string& path, T& result) const {
        const Entry* entry = find_value(path);
        if (entry == nullptr) {
            return false;
        }
        auto value = ValueConverter<T>::convert(entry->source_text());
        if (!value) {
            return false;
        }
        result = std::move(*value);
        return true;
    }

    /**
     * @brief Convert every element of the array at path to T
     *
     * Nested arrays are requested as vectors of vectors:
     * ```cpp
     * auto matrix = doc.get_array_value<std::vector<std::int64_t>>("m");
     * ```
     *
     * @throws KeyError if the path is absent
     * @throws InvalidOperationError if the value is not an array
     * @throws ConversionError if an element can't be converted
     */
    template <typename T>
    std::vector<T> get_array_value(const std::string& path) const {
        return detail::convert_array<T>(get_array(path), path);
    }

    /**
     * @brief Resolve the array at path
     * @throws KeyError if the path is absent
     * @throws InvalidOperationError if the value is not an array
     */
    const Array& get_array(const std::string& path) const;

    /**
     * @brief Unified element type of the array at path
     */
    ArrayType get_array_type(const std::string& path) const;

    /**
     * @brief JSON mirror of the tree
     *
     * Groups become objects, arrays become arrays; Int, Float and Boolean
     * become JSON numbers and booleans; String and DateTime become strings.
     */
    nlohmann::json to_json() const;
};

} // namespace tomlet

#endif // TOMLET_DOCUMENT_HPP
