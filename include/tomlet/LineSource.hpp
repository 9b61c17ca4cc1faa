/**
 * @file LineSource.hpp
 * @brief Physical line input for the parser
 *
 * A LineSource hands out one physical line at a time, without the line
 * terminator (a trailing CR of a CRLF pair is dropped as well). The
 * parser owns its source and calls close() exactly once, when input is
 * exhausted or when parsing fails.
 */

#ifndef TOMLET_LINESOURCE_HPP
#define TOMLET_LINESOURCE_HPP

#include <fstream>
#include <istream>
#include <sstream>
#include <string>

namespace tomlet {

class LineSource {
public:
    virtual ~LineSource() = default;

    /**
     * @brief Read the next physical line
     * @param line Receives the line text without terminator
     * @return false when input is exhausted
     */
    virtual bool read_line(std::string& line) = 0;

    /**
     * @brief Release the underlying input
     */
    virtual void close() noexcept {}

    /**
     * @brief Name used in diagnostics (file path or "<stream>")
     */
    virtual const std::string& name() const noexcept = 0;
};

/**
 * @brief Lines from a caller-owned stream
 */
class StreamLineSource : public LineSource {
public:
    explicit StreamLineSource(std::istream& in, std::string name = "<stream>");

    bool read_line(std::string& line) override;
    const std::string& name() const noexcept override { return name_; }

private:
    std::istream* in_;
    std::string name_;
};

/**
 * @brief Lines from an in-memory string
 */
class StringLineSource : public LineSource {
public:
    explicit StringLineSource(const std::string& text, std::string name = "<string>");

    bool read_line(std::string& line) override;
    const std::string& name() const noexcept override { return name_; }

private:
    std::istringstream in_;
    std::string name_;
};

/**
 * @brief Lines from a file opened on construction and closed by close()
 */
class FileLineSource : public LineSource {
public:
    /**
     * @brief Open the file
     * @throws FileNotFoundError if the file doesn't exist or can't be read
     */
    explicit FileLineSource(std::string path);
    ~FileLineSource() override;

    bool read_line(std::string& line) override;
    void close() noexcept override;
    const std::string& name() const noexcept override { return path_; }

    bool is_open() const noexcept { return file_.is_open(); }

private:
    std::string path_;
    std::ifstream file_;
};

} // namespace tomlet

#endif // TOMLET_LINESOURCE_HPP
