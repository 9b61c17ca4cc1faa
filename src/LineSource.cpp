/**
 * @file LineSource.cpp
 * @brief Implementation of the line sources
 */

#include "tomlet/LineSource.hpp"
#include "tomlet/Errors.hpp"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace tomlet {

namespace {

/**
 * @brief getline that also strips the CR of a CRLF terminator
 */
bool next_line(std::istream& in, std::string& line) {
    if (!std::getline(in, line)) {
        return false;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}

/**
 * @brief Check if file exists.
 */
bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

} // anonymous namespace

StreamLineSource::StreamLineSource(std::istream& in, std::string name)
    : in_(&in)
    , name_(std::move(name))
{}

bool StreamLineSource::read_line(std::string& line) {
    return next_line(*in_, line);
}

StringLineSource::StringLineSource(const std::string& text, std::string name)
    : in_(text)
    , name_(std::move(name))
{}

bool StringLineSource::read_line(std::string& line) {
    return next_line(in_, line);
}

FileLineSource::FileLineSource(std::string path)
    : path_(std::move(path))
{
    if (!file_exists(path_)) {
        throw FileNotFoundError(path_);
    }
    file_.open(path_, std::ios::binary);
    if (!file_) {
        throw FileNotFoundError(path_);
    }
}

FileLineSource::~FileLineSource() {
    close();
}

bool FileLineSource::read_line(std::string& line) {
    if (!file_.is_open()) {
        return false;
    }
    return next_line(file_, line);
}

void FileLineSource::close() noexcept {
    if (file_.is_open()) {
        file_.close();
    }
}

} // namespace tomlet
