/**
 * @file Parser.hpp
 * @brief Incremental line-by-line parsing state machine
 *
 * The Parser is a pull-based producer: every call to next() consumes
 * characters (and as many physical lines as needed) until a group
 * header or a complete top-level value has been recognized, and returns
 * it as a Token. Values, arrays and multi-line strings may span lines;
 * the cursor state carries over from one line to the next.
 *
 * Grammar:
 * - Comments: '#' to end of line, outside quotes
 * - Group headers: [dotted.key]
 * - Assignments: key = value, key matching [A-Za-z_][A-Za-z0-9_-]*,
 *   dotted keys select nested groups
 * - Scalars: true/false (case-insensitive), integers, floats (single '.'),
 *   date-times, "strings" with \n \r \t \0 \\ \" escapes, """multi-line"""
 * - Arrays: [v, v, ...], arbitrarily nested, may span lines
 *
 * Any syntax error throws ParseError and ends the parse.
 */

#ifndef TOMLET_PARSER_HPP
#define TOMLET_PARSER_HPP

#include "tomlet/Array.hpp"
#include "tomlet/Document.hpp"
#include "tomlet/Entry.hpp"
#include "tomlet/LineSource.hpp"

#include <cstddef>
#include <functional>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tomlet {

enum class TokenKind {
    Group,   ///< A [group.header] was read
    Value    ///< A top-level value (scalar or whole array) was completed
};

/**
 * @brief One unit produced by the parser
 */
struct Token {
    TokenKind kind = TokenKind::Value;

    /// Full key of the header (Group) or of the owning group (Value)
    std::string group;

    std::size_t line = 0;
    std::size_t column = 0;

    /// The completed value; null for Group tokens
    std::unique_ptr<Entry> entry;
};

class Parser {
public:
    /**
     * @brief Lexical mode of the cursor
     */
    enum class Mode {
        Scanning,                    ///< Looking for a group header, key or comment
        ReadingValueName,            ///< Inside a key
        SearchingForValueSeparator,  ///< Expecting '='
        ReadingValue,                ///< Dispatching on the first character of a value
        ReadingStringValue,          ///< Inside "..."
        ReadingMultiLineStringValue, ///< Inside """..."""
        SearchingForArraySeparator,  ///< Expecting ',' or ']' after an element
        ReadingArrayEnd              ///< At the ']' closing the innermost array
    };

    /// Deepest array nesting accepted; opening one more is a ParseError
    static constexpr std::size_t kMaxArrayDepth = 256;

    /**
     * @brief Take ownership of the input
     *
     * The source is closed and released exactly once: when input runs
     * out, when a ParseError is thrown, or when the Parser is destroyed.
     */
    explicit Parser(std::unique_ptr<LineSource> source);
    ~Parser();

    Parser(const Parser&) = delete;
    Parser& operator=(const Parser&) = delete;

    /**
     * @brief Produce the next token
     * @return The token, or nullopt once input is exhausted
     * @throws ParseError on malformed input (the parser is then exhausted)
     */
    std::optional<Token> next();

    Mode mode() const noexcept { return cursor_.mode; }

    /// 1-based number of the line being read (0 before the first line)
    std::size_t line_number() const noexcept { return cursor_.line_number; }

    std::size_t column() const noexcept { return cursor_.column; }

    /// Full key of the group assignments currently go to
    const std::string& current_group() const noexcept { return current_group_; }

    bool exhausted() const noexcept { return exhausted_; }

    /// true once the input has been released
    bool source_released() const noexcept { return !source_; }

private:
    struct Cursor {
        std::string line;
        std::size_t line_number = 0;
        std::size_t column = 0;
        Mode mode = Mode::Scanning;
    };

    std::unique_ptr<LineSource> source_;
    Cursor cursor_;
    bool exhausted_ = false;

    std::string current_group_;

    // Key of the assignment in progress (may be dotted)
    std::string value_key_;
    std::size_t separator_column_ = 0;

    // String value in progress
    std::string value_buffer_;
    std::size_t value_line_ = 0;
    std::size_t value_column_ = 0;
    bool escaping_ = false;
    bool skip_leading_newline_ = false;

    // Outermost array owned here until it closes; the stack holds
    // non-owning pointers to every open array, innermost last.
    std::unique_ptr<Array> root_array_;
    std::vector<Array*> open_arrays_;

    std::optional<Token> ready_;

    bool advance_line();
    void end_of_line();
    void finish();
    void step();

    void scan();
    void read_group_header();
    void read_value_name();
    void search_value_separator();
    void read_value();
    void read_string();
    void read_multiline_string();
    void search_array_separator();
    void read_array_end();

    void open_array();
    void read_boolean();
    void read_number_or_date();

    std::size_t token_end(std::size_t pos) const noexcept;
    void validate_key(const std::string& key, std::size_t column);
    void split_value_key(std::string& group, std::string& name) const;
    void complete_value(ValueType type, std::string text,
                        std::size_t line, std::size_t column);

    [[noreturn]] void fail(const std::string& message);
    [[noreturn]] void fail_at(std::size_t column, const std::string& message);
    void release_source() noexcept;
};

/**
 * @brief Get human-readable name of a parser mode
 */
const char* mode_name(Parser::Mode mode) noexcept;

/**
 * @brief Called with every token before it is inserted into the Document
 */
using TokenObserver = std::function<void(const Token&)>;

/**
 * @brief Drive a parser to exhaustion, inserting every token
 *
 * @throws ParseError on malformed input
 * @throws DuplicateKeyError if two values resolve to the same full key
 */
Document build_document(Parser& parser, const TokenObserver& observer = TokenObserver());

/**
 * @brief Parse a whole source into a Document
 */
Document parse(std::unique_ptr<LineSource> source,
               const TokenObserver& observer = TokenObserver());

/**
 * @brief Parse a caller-owned stream
 */
Document parse(std::istream& in);

/**
 * @brief Parse an in-memory string
 */
Document parse_string(const std::string& text);

/**
 * @brief Parse a file
 * @throws FileNotFoundError if the file cannot be opened
 */
Document parse_file(const std::string& path);

} // namespace tomlet

#endif // TOMLET_PARSER_HPP
