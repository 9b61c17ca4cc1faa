/**
 * @file Array.hpp
 * @brief Array entry and element type unification
 *
 * An Array owns an ordered sequence of child entries, which may be
 * arrays themselves. Element type unification folds the children's
 * tags into one native element type, or falls back to Object:
 *
 * | element  | established        | result    |
 * |----------|--------------------|-----------|
 * | Int      | none, Int64        | Int64     |
 * | Int      | Double             | Double    |
 * | Float    | none, Double, Int64| Double    |
 * | Boolean  | none, Bool         | Bool      |
 * | DateTime | none, Timestamp    | Timestamp |
 * | DateTime | Text               | Text      |
 * | String   | anything but Int64/Double | Text |
 *
 * Any other combination rejects the fold and the whole array becomes
 * an array of Object.
 */

#ifndef TOMLET_ARRAY_HPP
#define TOMLET_ARRAY_HPP

#include "tomlet/Entry.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace tomlet {

/**
 * @brief Native element type of an array
 */
enum class NativeType {
    None,
    Int64,
    Double,
    Bool,
    Timestamp,
    Text,
    Object
};

/**
 * @brief Get human-readable name of a native type
 */
const char* native_type_name(NativeType type) noexcept;

/**
 * @brief Map a lexer tag to its native type (Array maps to Object)
 */
NativeType to_native_type(ValueType type) noexcept;

/**
 * @brief Unified type of an array
 *
 * rank is the number of array levels: [1, 2] is {Int64, 1},
 * [[1], [2]] is {Int64, 2}. The fallback is {Object, 1}.
 */
struct ArrayType {
    NativeType element = NativeType::Object;
    std::size_t rank = 1;

    bool operator==(const ArrayType& other) const noexcept {
        return element == other.element && rank == other.rank;
    }
    bool operator!=(const ArrayType& other) const noexcept {
        return !(*this == other);
    }

    /// e.g. "Int64[]" or "Text[][]"
    std::string to_string() const;
};

/**
 * @brief Fold one element's native type into the established type
 *
 * @param current Established type, updated on success (None at start)
 * @param next Native type of the next element
 * @return false if the element cannot be unified with current
 */
bool fold_native_type(NativeType& current, NativeType next) noexcept;

/**
 * @brief An array value owning its children
 */
class Array : public Entry {
public:
    struct Dimensions {
        std::size_t depth = 0;
        std::size_t length = 0;
    };

    /**
     * @brief Construct an array assigned to a key
     */
    Array(std::string group, std::string name, std::size_t line, std::size_t column);

    /**
     * @brief Construct an array that is an element of another array
     *
     * @param group Full key of the group owning the outermost array
     * @param index Position within the parent array
     */
    Array(std::string group, std::size_t index, std::size_t line, std::size_t column);

    const std::vector<std::unique_ptr<Entry>>& children() const noexcept {
        return children_;
    }

    std::size_t size() const noexcept { return children_.size(); }
    bool empty() const noexcept { return children_.empty(); }

    /**
     * @brief Append a child; returns a reference to the stored child
     */
    Entry& add_entry(std::unique_ptr<Entry> entry);

    /**
     * @brief Name the next appended child will get
     */
    std::string next_entry_name() const { return std::to_string(children_.size()); }

    /**
     * @brief Materialize the source text from the children
     *
     * Called once when the closing bracket is recognized, innermost
     * array first. Produces "[a,b,c]" with each child's literal, so each
     * nesting level copies its children's text; the parser bounds the
     * nesting at Parser::kMaxArrayDepth.
     */
    void finalize();

    bool finalized() const noexcept { return finalized_; }

    /**
     * @brief Depth (1 + deepest child array) and length
     *        (max of own size and the longest child array)
     */
    Dimensions dimensions() const;

    /**
     * @brief Unified element type
     */
    ArrayType element_type() const;

    std::string to_string() const override;

private:
    std::vector<std::unique_ptr<Entry>> children_;
    bool finalized_ = false;

    std::size_t max_depth() const;
    std::size_t max_length() const;
};

} // namespace tomlet

#endif // TOMLET_ARRAY_HPP
