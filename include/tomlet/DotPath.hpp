/**
 * @file DotPath.hpp
 * @brief Dot-notation path utilities for group and entry keys
 *
 * Full keys address groups and entries in a Document using
 * dot-separated paths like "servers.alpha.ip".
 */

#ifndef TOMLET_DOTPATH_HPP
#define TOMLET_DOTPATH_HPP

#include <string>
#include <vector>

namespace tomlet {

/// Separator between the segments of a full key.
constexpr char kKeySeparator = '.';

/**
 * @brief Split a dot-path into segments
 *
 * @param path Dot-separated path like "a.b.c"
 * @return Vector of segments ["a", "b", "c"]
 *
 * Empty segments are kept so that malformed paths never resolve
 * to an existing key:
 * - "database.host" → ["database", "host"]
 * - "a..b" → ["a", "", "b"]
 * - "" → []
 * - "single" → ["single"]
 */
std::vector<std::string> split_dot_path(const std::string& path);

/**
 * @brief Join path segments with dots
 *
 * @param segments Vector of path segments
 * @return Dot-joined path string
 *
 * Examples:
 * - ["a", "b", "c"] → "a.b.c"
 * - [] → ""
 */
std::string join_dot_path(const std::vector<std::string>& segments);

/**
 * @brief Append a segment to a (possibly empty) parent path
 *
 * - ("", "a") → "a"
 * - ("a.b", "c") → "a.b.c"
 */
std::string append_dot_path(const std::string& parent, const std::string& segment);

} // namespace tomlet

#endif // TOMLET_DOTPATH_HPP
