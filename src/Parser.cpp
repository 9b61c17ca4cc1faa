/**
 * @file Parser.cpp
 * @brief Implementation of the parsing state machine
 *
 * The machine never recurses: next() repeatedly applies one transition
 * to the cursor (one character, or one whole bare token) until a token
 * is ready or input is exhausted. End of line is a transition of its
 * own, handled per mode.
 */

#include "tomlet/Parser.hpp"
#include "tomlet/DateTime.hpp"
#include "tomlet/DotPath.hpp"
#include "tomlet/Errors.hpp"

#include <algorithm>
#include <cctype>

namespace tomlet {

namespace {
    constexpr char kComment = '#';
    constexpr char kValueSeparator = '=';
    constexpr char kArrayStart = '[';
    constexpr char kArrayEnd = ']';
    constexpr char kArraySeparator = ',';
    constexpr char kQuote = '"';
    constexpr char kEscape = '\\';
    const char* const kTripleQuote = "\"\"\"";

    bool is_space(char c) {
        return c == ' ' || c == '\t';
    }

    bool is_digit(char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    }

    bool is_key_start(char c) {
        return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
    }

    bool is_key_char(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '-';
    }

    /**
     * @brief Characters that end a bare (unquoted) token
     */
    bool is_terminator(char c) {
        return is_space(c) || c == kArraySeparator || c == kArrayEnd ||
               c == kComment || c == kArrayStart;
    }

    /**
     * @brief Resolve the character following a backslash
     * @return false for characters outside the escape table
     */
    bool unescape(char c, char& out) {
        switch (c) {
            case 'n': out = '\n'; return true;
            case 'r': out = '\r'; return true;
            case 't': out = '\t'; return true;
            case '0': out = '\0'; return true;
            case '\\': out = '\\'; return true;
            case '"': out = '"'; return true;
            default: return false;
        }
    }

    std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        return s;
    }
}

const char* mode_name(Parser::Mode mode) noexcept {
    switch (mode) {
        case Parser::Mode::Scanning: return "Scanning";
        case Parser::Mode::ReadingValueName: return "ReadingValueName";
        case Parser::Mode::SearchingForValueSeparator: return "SearchingForValueSeparator";
        case Parser::Mode::ReadingValue: return "ReadingValue";
        case Parser::Mode::ReadingStringValue: return "ReadingStringValue";
        case Parser::Mode::ReadingMultiLineStringValue: return "ReadingMultiLineStringValue";
        case Parser::Mode::SearchingForArraySeparator: return "SearchingForArraySeparator";
        case Parser::Mode::ReadingArrayEnd: return "ReadingArrayEnd";
    }
    return "Unknown";
}

Parser::Parser(std::unique_ptr<LineSource> source)
    : source_(std::move(source))
{
    if (!source_) {
        exhausted_ = true;
    }
}

Parser::~Parser() {
    release_source();
}

void Parser::release_source() noexcept {
    if (source_) {
        source_->close();
        source_.reset();
    }
}

// ============================================================================
// Driving loop
// ============================================================================

std::optional<Token> Parser::next() {
    if (exhausted_) {
        return std::nullopt;
    }

    for (;;) {
        if (ready_) {
            std::optional<Token> token(std::move(*ready_));
            ready_.reset();
            return token;
        }

        if (cursor_.column >= cursor_.line.size()) {
            if (cursor_.line_number > 0) {
                end_of_line();
            }
            if (!advance_line()) {
                finish();
                return std::nullopt;
            }
            continue;
        }

        step();
    }
}

bool Parser::advance_line() {
    if (!source_) {
        return false;
    }
    std::string line;
    if (!source_->read_line(line)) {
        release_source();
        return false;
    }
    cursor_.line = std::move(line);
    ++cursor_.line_number;
    cursor_.column = 0;
    return true;
}

void Parser::finish() {
    // unfinished keys and values outside an array already failed in end_of_line()
    switch (cursor_.mode) {
        case Mode::Scanning:
            exhausted_ = true;
            return;
        case Mode::ReadingMultiLineStringValue:
            fail_at(cursor_.line.size(), "incomplete token: unterminated string");
        default:
            fail_at(cursor_.line.size(), "incomplete token: unterminated array");
    }
}

void Parser::end_of_line() {
    switch (cursor_.mode) {
        case Mode::Scanning:
        case Mode::SearchingForArraySeparator:
        case Mode::ReadingArrayEnd:
            return;

        case Mode::ReadingValueName:
            fail("identifier cannot span multiple lines");

        case Mode::SearchingForValueSeparator:
            fail_at(separator_column_, "expected value separator '='");

        case Mode::ReadingValue:
            // arrays may continue on the next line; a bare "key =" may not
            if (open_arrays_.empty()) {
                fail("expected value");
            }
            return;

        case Mode::ReadingStringValue:
            fail("unexpected newline in string");

        case Mode::ReadingMultiLineStringValue:
            if (skip_leading_newline_) {
                // line break right after the opening quotes is dropped
                skip_leading_newline_ = false;
            } else if (escaping_) {
                // backslash at end of line: continuation, no newline
                escaping_ = false;
            } else {
                value_buffer_ += '\n';
            }
            return;
    }
}

void Parser::step() {
    switch (cursor_.mode) {
        case Mode::Scanning: scan(); return;
        case Mode::ReadingValueName: read_value_name(); return;
        case Mode::SearchingForValueSeparator: search_value_separator(); return;
        case Mode::ReadingValue: read_value(); return;
        case Mode::ReadingStringValue: read_string(); return;
        case Mode::ReadingMultiLineStringValue: read_multiline_string(); return;
        case Mode::SearchingForArraySeparator: search_array_separator(); return;
        case Mode::ReadingArrayEnd: read_array_end(); return;
    }
}

// ============================================================================
// Keys and group headers
// ============================================================================

void Parser::scan() {
    const char c = cursor_.line[cursor_.column];

    if (is_space(c)) {
        ++cursor_.column;
        return;
    }
    if (c == kComment) {
        cursor_.column = cursor_.line.size();
        return;
    }
    if (c == kArrayStart) {
        read_group_header();
        return;
    }
    if (is_key_start(c)) {
        value_key_.clear();
        cursor_.mode = Mode::ReadingValueName;
        return;
    }
    if (is_digit(c)) {
        fail("identifier cannot start with a digit");
    }
    if (c == kValueSeparator) {
        fail("identifier cannot be empty");
    }
    if (c == kArrayEnd) {
        fail("unexpected array terminator");
    }
    fail("invalid character in identifier");
}

void Parser::read_group_header() {
    const std::size_t open = cursor_.column;
    const std::size_t close = cursor_.line.find(kArrayEnd, open + 1);
    if (close == std::string::npos) {
        fail_at(open, "group name cannot span multiple lines");
    }

    std::size_t first = open + 1;
    std::size_t last = close;
    while (first < last && is_space(cursor_.line[first])) ++first;
    while (last > first && is_space(cursor_.line[last - 1])) --last;

    const std::string name = cursor_.line.substr(first, last - first);
    if (name.empty()) {
        fail_at(open + 1, "identifier cannot be empty");
    }
    validate_key(name, first);

    current_group_ = name;

    Token token;
    token.kind = TokenKind::Group;
    token.group = name;
    token.line = cursor_.line_number;
    token.column = open;
    ready_ = std::move(token);

    // the rest of the line is scanned again from Scanning
    cursor_.column = close + 1;
}

void Parser::validate_key(const std::string& key, std::size_t column) {
    std::size_t segment_length = 0;
    for (std::size_t i = 0; i < key.size(); ++i) {
        const char c = key[i];
        if (c == kKeySeparator) {
            if (segment_length == 0) {
                fail_at(column + i, "identifier cannot be empty");
            }
            segment_length = 0;
            continue;
        }
        if (segment_length == 0 && is_digit(c)) {
            fail_at(column + i, "identifier cannot start with a digit");
        }
        if (segment_length == 0 ? !is_key_start(c) : !is_key_char(c)) {
            fail_at(column + i, "invalid character in identifier");
        }
        ++segment_length;
    }
    if (segment_length == 0) {
        fail_at(column + key.size(), "identifier cannot be empty");
    }
}

void Parser::read_value_name() {
    const char c = cursor_.line[cursor_.column];
    const bool segment_start = value_key_.empty() || value_key_.back() == kKeySeparator;

    if (c == kKeySeparator) {
        if (segment_start) {
            fail("identifier cannot be empty");
        }
        value_key_ += c;
        ++cursor_.column;
        return;
    }

    if (is_key_char(c)) {
        if (segment_start && is_digit(c)) {
            fail("identifier cannot start with a digit");
        }
        if (segment_start && !is_key_start(c)) {
            fail("invalid character in identifier");
        }
        value_key_ += c;
        ++cursor_.column;
        return;
    }

    if (is_space(c) || c == kValueSeparator) {
        if (segment_start) {
            fail("identifier cannot be empty");
        }
        separator_column_ = cursor_.column;
        cursor_.mode = Mode::SearchingForValueSeparator;
        return;
    }

    if (c == kComment) {
        fail("unexpected comment, expected value separator '='");
    }
    fail("invalid character in identifier");
}

void Parser::search_value_separator() {
    const char c = cursor_.line[cursor_.column];

    if (is_space(c)) {
        ++cursor_.column;
        return;
    }
    if (c == kValueSeparator) {
        ++cursor_.column;
        cursor_.mode = Mode::ReadingValue;
        return;
    }
    if (c == kComment) {
        fail_at(separator_column_, "unexpected comment, expected value separator '='");
    }
    fail_at(separator_column_, "expected value separator '='");
}

// ============================================================================
// Values
// ============================================================================

void Parser::read_value() {
    const char c = cursor_.line[cursor_.column];

    if (is_space(c)) {
        ++cursor_.column;
        return;
    }

    if (c == kComment) {
        if (open_arrays_.empty()) {
            fail("expected value");
        }
        cursor_.column = cursor_.line.size();
        return;
    }

    if (c == kArrayStart) {
        open_array();
        return;
    }

    if (c == kArrayEnd) {
        if (open_arrays_.empty()) {
            fail("unexpected array terminator");
        }
        cursor_.mode = Mode::ReadingArrayEnd;
        return;
    }

    if (c == kQuote) {
        value_buffer_.clear();
        value_line_ = cursor_.line_number;
        value_column_ = cursor_.column;
        escaping_ = false;

        if (cursor_.line.compare(cursor_.column, 3, kTripleQuote) == 0) {
            cursor_.column += 3;
            skip_leading_newline_ = true;
            cursor_.mode = Mode::ReadingMultiLineStringValue;
            return;
        }
        if (cursor_.column + 1 < cursor_.line.size() &&
            cursor_.line[cursor_.column + 1] == kQuote) {
            cursor_.column += 2;
            complete_value(ValueType::String, std::string(), value_line_, value_column_);
            return;
        }
        ++cursor_.column;
        cursor_.mode = Mode::ReadingStringValue;
        return;
    }

    if (c == 't' || c == 'T' || c == 'f' || c == 'F') {
        read_boolean();
        return;
    }

    if (is_digit(c) || c == '-') {
        read_number_or_date();
        return;
    }

    if (c == kArraySeparator) {
        fail("expected value");
    }
    fail("invalid value");
}

void Parser::read_string() {
    const char c = cursor_.line[cursor_.column];

    if (escaping_) {
        char resolved = 0;
        if (!unescape(c, resolved)) {
            fail("invalid escape character");
        }
        value_buffer_ += resolved;
        escaping_ = false;
        ++cursor_.column;
        return;
    }

    if (c == kEscape) {
        escaping_ = true;
        ++cursor_.column;
        return;
    }

    if (c == kQuote) {
        ++cursor_.column;
        complete_value(ValueType::String, std::move(value_buffer_), value_line_, value_column_);
        value_buffer_.clear();
        return;
    }

    value_buffer_ += c;
    ++cursor_.column;
}

void Parser::read_multiline_string() {
    const char c = cursor_.line[cursor_.column];
    skip_leading_newline_ = false;

    if (escaping_) {
        char resolved = 0;
        if (!unescape(c, resolved)) {
            fail("invalid escape character");
        }
        // an escaped quote is content and never starts the closing run
        value_buffer_ += resolved;
        escaping_ = false;
        ++cursor_.column;
        return;
    }

    if (c == kEscape) {
        escaping_ = true;
        ++cursor_.column;
        return;
    }

    if (cursor_.line.compare(cursor_.column, 3, kTripleQuote) == 0) {
        cursor_.column += 3;
        complete_value(ValueType::String, std::move(value_buffer_), value_line_, value_column_);
        value_buffer_.clear();
        return;
    }

    value_buffer_ += c;
    ++cursor_.column;
}

std::size_t Parser::token_end(std::size_t pos) const noexcept {
    while (pos < cursor_.line.size() && !is_terminator(cursor_.line[pos])) {
        ++pos;
    }
    return pos;
}

void Parser::read_boolean() {
    const std::size_t start = cursor_.column;
    const std::size_t end = token_end(start);
    const std::string word = to_lower(cursor_.line.substr(start, end - start));

    if (word != "true" && word != "false") {
        fail_at(start, "invalid boolean literal");
    }

    cursor_.column = end;
    complete_value(ValueType::Boolean, word, cursor_.line_number, start);
}

void Parser::read_number_or_date() {
    const std::size_t start = cursor_.column;
    std::size_t pos = start;
    std::size_t digits = 0;
    std::size_t fraction_digits = 0;
    bool has_sign = false;
    bool has_point = false;

    while (pos < cursor_.line.size() && !is_terminator(cursor_.line[pos])) {
        const char c = cursor_.line[pos];

        if (is_digit(c)) {
            ++digits;
            if (has_point) {
                ++fraction_digits;
            }
        } else if (c == '-') {
            if (pos == start) {
                has_sign = true;
            } else if (!has_sign && !has_point && digits == 4) {
                // YYYY- : the rest of the token is a date-time literal
                const std::size_t end = token_end(pos);
                std::string text = cursor_.line.substr(start, end - start);
                if (!parse_date_time(text)) {
                    fail_at(start, "invalid date-time literal");
                }
                cursor_.column = end;
                complete_value(ValueType::DateTime, std::move(text), cursor_.line_number, start);
                return;
            } else {
                fail_at(pos, "invalid character in number");
            }
        } else if (c == '.') {
            if (has_point) {
                fail_at(pos, "multiple decimal points in number");
            }
            if (digits == 0) {
                fail_at(pos, "expected digit before decimal point");
            }
            has_point = true;
        } else {
            fail_at(pos, "invalid character in number");
        }
        ++pos;
    }

    if (digits == 0) {
        fail_at(start, "invalid number");
    }
    if (has_point && fraction_digits == 0) {
        fail_at(pos, "expected digit after decimal point");
    }

    std::string text = cursor_.line.substr(start, pos - start);
    cursor_.column = pos;
    complete_value(has_point ? ValueType::Float : ValueType::Int,
                   std::move(text), cursor_.line_number, start);
}

// ============================================================================
// Arrays
// ============================================================================

void Parser::open_array() {
    const std::size_t line = cursor_.line_number;
    const std::size_t column = cursor_.column;

    if (open_arrays_.empty()) {
        std::string group;
        std::string name;
        split_value_key(group, name);
        root_array_ = std::make_unique<Array>(std::move(group), std::move(name), line, column);
        open_arrays_.push_back(root_array_.get());
    } else {
        if (open_arrays_.size() >= kMaxArrayDepth) {
            fail("array nesting too deep");
        }
        Array* parent = open_arrays_.back();
        auto child = std::make_unique<Array>(parent->group(), parent->size(), line, column);
        Array* raw = child.get();
        parent->add_entry(std::move(child));
        open_arrays_.push_back(raw);
    }

    ++cursor_.column;
}

void Parser::search_array_separator() {
    const char c = cursor_.line[cursor_.column];

    if (is_space(c)) {
        ++cursor_.column;
        return;
    }
    if (c == kComment) {
        cursor_.column = cursor_.line.size();
        return;
    }
    if (c == kArraySeparator) {
        ++cursor_.column;
        cursor_.mode = Mode::ReadingValue;
        return;
    }
    if (c == kArrayEnd) {
        cursor_.mode = Mode::ReadingArrayEnd;
        return;
    }
    fail("expected array separator");
}

void Parser::read_array_end() {
    if (open_arrays_.empty()) {
        fail("unexpected array terminator");
    }

    Array* closed = open_arrays_.back();
    closed->finalize();
    open_arrays_.pop_back();
    ++cursor_.column;

    if (!open_arrays_.empty()) {
        cursor_.mode = Mode::SearchingForArraySeparator;
        return;
    }

    Token token;
    token.kind = TokenKind::Value;
    token.group = root_array_->group();
    token.line = root_array_->line();
    token.column = root_array_->column();
    token.entry = std::move(root_array_);
    ready_ = std::move(token);
    cursor_.mode = Mode::Scanning;
}

// ============================================================================
// Token completion and errors
// ============================================================================

void Parser::split_value_key(std::string& group, std::string& name) const {
    const std::size_t dot = value_key_.rfind(kKeySeparator);
    if (dot == std::string::npos) {
        group = current_group_;
        name = value_key_;
        return;
    }
    group = append_dot_path(current_group_, value_key_.substr(0, dot));
    name = value_key_.substr(dot + 1);
}

void Parser::complete_value(ValueType type, std::string text,
                            std::size_t line, std::size_t column) {
    if (!open_arrays_.empty()) {
        Array* owner = open_arrays_.back();
        owner->add_entry(std::make_unique<Entry>(owner->group(), owner->next_entry_name(),
                                                 std::move(text), line, column, type, true));
        cursor_.mode = Mode::SearchingForArraySeparator;
        return;
    }

    std::string group;
    std::string name;
    split_value_key(group, name);

    Token token;
    token.kind = TokenKind::Value;
    token.group = group;
    token.line = line;
    token.column = column;
    token.entry = std::make_unique<Entry>(std::move(group), std::move(name),
                                          std::move(text), line, column, type);
    ready_ = std::move(token);
    cursor_.mode = Mode::Scanning;
}

void Parser::fail(const std::string& message) {
    fail_at(cursor_.column, message);
}

void Parser::fail_at(std::size_t column, const std::string& message) {
    release_source();
    exhausted_ = true;
    throw ParseError(cursor_.line_number, column, cursor_.line, message);
}

// ============================================================================
// Document construction
// ============================================================================

Document build_document(Parser& parser, const TokenObserver& observer) {
    Document document;
    while (auto token = parser.next()) {
        if (observer) {
            observer(*token);
        }
        if (token->kind == TokenKind::Group) {
            document.create_group(token->group);
        } else {
            document.add_value(std::move(token->entry));
        }
    }
    return document;
}

Document parse(std::unique_ptr<LineSource> source, const TokenObserver& observer) {
    Parser parser(std::move(source));
    return build_document(parser, observer);
}

Document parse(std::istream& in) {
    return parse(std::make_unique<StreamLineSource>(in));
}

Document parse_string(const std::string& text) {
    return parse(std::make_unique<StringLineSource>(text));
}

Document parse_file(const std::string& path) {
    return parse(std::make_unique<FileLineSource>(path));
}

} // namespace tomlet
