/**
 * @file Errors.hpp
 * @brief Exception types for tomlet parse, lookup and conversion errors
 *
 * Error taxonomy:
 * - TomlError: Base class
 * - ParseError: Lexical/structural failure, aborts the parse
 * - KeyError: Dot-path segment not found
 * - DuplicateKeyError: Two entries resolve to the same full path
 * - InvalidOperationError: Operation not valid for the entry's type
 * - ConversionError: Raw literal could not be converted to the requested type
 * - FileNotFoundError: Input file could not be opened
 * - SerializeError: Object graph shape cannot be written as TOML
 */

#ifndef TOMLET_ERRORS_HPP
#define TOMLET_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <sstream>

namespace tomlet {

/**
 * @brief Base class for all tomlet exceptions
 */
class TomlError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Syntax error raised by the parser
 *
 * Carries the position of the failure and the full text of the
 * offending line. Parsing never resumes after a ParseError.
 */
class ParseError : public TomlError {
public:
    /**
     * @brief Construct with position and message
     * @param line 1-based line number
     * @param column 0-based column at the point of failure
     * @param line_text Full text of the offending line
     * @param message Violated expectation (e.g. "expected array separator")
     */
    ParseError(std::size_t line, std::size_t column,
               std::string line_text, std::string message)
        : TomlError(format_message(line, column, line_text, message))
        , line_(line)
        , column_(column)
        , line_text_(std::move(line_text))
        , message_(std::move(message))
    {}

    /**
     * @brief Get the 1-based line number
     */
    std::size_t line() const noexcept {
        return line_;
    }

    /**
     * @brief Get the 0-based column
     */
    std::size_t column() const noexcept {
        return column_;
    }

    /**
     * @brief Get the text of the offending line
     */
    const std::string& line_text() const noexcept {
        return line_text_;
    }

    /**
     * @brief Get the message without position information
     */
    const std::string& message() const noexcept {
        return message_;
    }

private:
    std::size_t line_;
    std::size_t column_;
    std::string line_text_;
    std::string message_;

    static std::string format_message(std::size_t line, std::size_t column,
                                      const std::string& line_text,
                                      const std::string& message) {
        std::ostringstream oss;
        oss << "line " << line << ", column " << column << ": " << message;
        if (!line_text.empty()) {
            oss << "\n    " << line_text;
        }
        return oss.str();
    }
};

/**
 * @brief Key not found during dot-path traversal
 */
class KeyError : public TomlError {
public:
    /**
     * @brief Construct with full path and failing segment
     * @param path Full dot-path being accessed (e.g., "owner.name")
     * @param segment The specific segment that doesn't exist (e.g., "name")
     */
    KeyError(std::string path, std::string segment)
        : TomlError("Key not found: '" + segment + "' in path '" + path + "'")
        , path_(std::move(path))
        , segment_(std::move(segment))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& segment() const noexcept {
        return segment_;
    }

private:
    std::string path_;
    std::string segment_;
};

/**
 * @brief A value or group already exists under the same full key
 */
class DuplicateKeyError : public TomlError {
public:
    explicit DuplicateKeyError(std::string path)
        : TomlError("Duplicate key: '" + path + "'")
        , path_(std::move(path))
    {}

    /**
     * @brief Get the full key that collided
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Operation is not valid for the entry found at a path
 */
class InvalidOperationError : public TomlError {
public:
    InvalidOperationError(std::string path, const std::string& message)
        : TomlError(message + " at path '" + path + "'")
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Source text could not be converted to the requested type
 */
class ConversionError : public TomlError {
public:
    /**
     * @brief Construct with path, raw text and target type name
     * @param path Full dot-path of the entry
     * @param text Raw source text handed to the converter
     * @param target Name of the requested type (e.g., "uuid")
     */
    ConversionError(std::string path, std::string text, std::string target)
        : TomlError("Cannot convert '" + text + "' to " + target +
                    " at path '" + path + "'")
        , path_(std::move(path))
        , text_(std::move(text))
        , target_(std::move(target))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& text() const noexcept {
        return text_;
    }

    const std::string& target() const noexcept {
        return target_;
    }

private:
    std::string path_;
    std::string text_;
    std::string target_;
};

/**
 * @brief Input file not found or not readable
 */
class FileNotFoundError : public TomlError {
public:
    explicit FileNotFoundError(std::string path)
        : TomlError("File not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Object graph cannot be serialized
 */
class SerializeError : public TomlError {
public:
    SerializeError(std::string path, const std::string& message)
        : TomlError("Cannot serialize '" + path + "': " + message)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

} // namespace tomlet

#endif // TOMLET_ERRORS_HPP
