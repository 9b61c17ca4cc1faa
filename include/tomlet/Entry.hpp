/**
 * @file Entry.hpp
 * @brief Value token produced by the parser
 *
 * An Entry is one parsed literal: a scalar, or the marker of an Array
 * (see Array.hpp). It remembers where it was found and which type the
 * lexer resolved it to. Entries are immutable once constructed.
 */

#ifndef TOMLET_ENTRY_HPP
#define TOMLET_ENTRY_HPP

#include <cstddef>
#include <string>

namespace tomlet {

/**
 * @brief Type tag resolved by the lexer
 */
enum class ValueType {
    String,
    Int,
    Float,
    DateTime,
    Boolean,
    Array
};

/**
 * @brief Get human-readable name of a type tag
 * @return "String", "Int", "Float", "DateTime", "Boolean" or "Array"
 */
const char* type_name(ValueType type) noexcept;

/**
 * @brief Quote a string payload and escape it with the escape table
 *
 * Backslash, quote, LF, CR, TAB and NUL are written as \\ \" \n \r \t \0.
 */
std::string quote_string(const std::string& payload);

/**
 * @brief One parsed value
 *
 * The source text of a String entry is the unescaped payload; of every
 * other scalar it is the literal as written (booleans lower-cased).
 */
class Entry {
public:
    /**
     * @brief Construct a value token
     * @param group Full key of the owning group ("" for root-level)
     * @param name Local name (array index for array elements)
     * @param source Source text / unescaped payload
     * @param line 1-based line number the value starts on
     * @param column 0-based column the value starts at
     * @param type Resolved type tag
     * @param in_array true if the entry is an element of an Array
     */
    Entry(std::string group, std::string name, std::string source,
          std::size_t line, std::size_t column, ValueType type,
          bool in_array = false);

    virtual ~Entry() = default;

    Entry(const Entry&) = delete;
    Entry& operator=(const Entry&) = delete;

    const std::string& group() const noexcept { return group_; }
    const std::string& name() const noexcept { return name_; }
    const std::string& source_text() const noexcept { return source_; }
    std::size_t line() const noexcept { return line_; }
    std::size_t column() const noexcept { return column_; }
    ValueType type() const noexcept { return type_; }
    bool in_array() const noexcept { return in_array_; }

    /**
     * @brief Full dotted name: group + "." + name, or name if group is empty
     */
    std::string full_name() const;

    /**
     * @brief The value written back in grammar form
     *
     * Strings are quoted and escaped; everything else is the source text.
     */
    std::string literal() const;

    /**
     * @brief Diagnostic rendering
     *
     * Group-level entries render as "Int owner.age = 42"; array elements
     * render as their literal only.
     */
    virtual std::string to_string() const;

protected:
    // Arrays only know their source text once the closing bracket is seen.
    void set_source_text(std::string source) { source_ = std::move(source); }

private:
    std::string group_;
    std::string name_;
    std::string source_;
    std::size_t line_;
    std::size_t column_;
    ValueType type_;
    bool in_array_;
};

} // namespace tomlet

#endif // TOMLET_ENTRY_HPP
