#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace notestore
{
// API paths are what callers pass in: slash separated, with or without surrounding slashes, and
// "" for the root. The database stores directories as "/a/b/" (root is "/") and files as a
// (directory, leaf name) pair or, for checkpoints, as the full path "/a/b/c.txt".

/// @brief "a/b" -> "/a/b/", "" -> "/".
std::string from_api_dirname(std::string_view api_dirname);

/// @brief "a/b/c.txt" -> "/a/b/c.txt". Throws `std::invalid_argument` on a trailing slash.
std::string from_api_filename(std::string_view api_path);

/// @brief "/a/b/" -> "a/b".
std::string to_api_path(std::string_view db_path);

/// @brief "a/b/c.txt" -> {"/a/b/", "c.txt"}, "c.txt" -> {"/", "c.txt"}.
std::pair<std::string, std::string> split_api_filepath(std::string_view api_path);

/// @brief The canonical parent of a canonical directory name. "/a/b/" -> "/a/".
/// Must not be called on the root.
std::string parent_of_db_dirname(std::string_view db_dirname);

/// @brief Resolve "." and ".." segments and drop empty ones.
///
/// Throws `PathOutsideRoot` if the path climbs above the root.
std::string normalize_api_path(std::string_view api_path);

/// @brief Every ancestor directory of `api_path`, root first. "a/b/c" -> {"", "a", "a/b"}.
std::vector<std::string> prefix_dirs(std::string_view api_path);
}    // namespace notestore
