/**
 * @file DotPath.cpp
 * @brief Implementation of dot-path utilities
 */

#include "tomlet/DotPath.hpp"
#include <sstream>

namespace tomlet {

std::vector<std::string> split_dot_path(const std::string& path) {
    if (path.empty()) {
        return {};
    }

    std::vector<std::string> segments;
    std::string current;

    for (char c : path) {
        if (c == kKeySeparator) {
            segments.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }

    // Add final segment
    segments.push_back(current);

    return segments;
}

std::string join_dot_path(const std::vector<std::string>& segments) {
    if (segments.empty()) {
        return "";
    }

    std::ostringstream oss;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) oss << kKeySeparator;
        oss << segments[i];
    }
    return oss.str();
}

std::string append_dot_path(const std::string& parent, const std::string& segment) {
    if (parent.empty()) {
        return segment;
    }
    return parent + kKeySeparator + segment;
}

} // namespace tomlet
