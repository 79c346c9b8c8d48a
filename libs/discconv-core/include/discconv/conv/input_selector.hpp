#pragma once

/**
@file
@brief Input file selection for batch conversions.
*/

#include <filesystem>
#include <string_view>
#include <system_error>
#include <vector>

namespace discconv::conv {

// Lists the regular files directly under `root` (or anywhere below it if `recursive` is set) whose extension matches
// `extension`, ignoring case. `extension` may be given with or without the leading dot.
// The result is sorted. On failure to open `root`, returns an empty list and sets `error`.
std::vector<std::filesystem::path> CollectDirectory(const std::filesystem::path &root, std::string_view extension,
                                                    bool recursive, std::error_code &error);

// Expands a path whose final component may contain `*` and `?` wildcards.
// A pattern without wildcards yields itself if the file exists.
// Only regular files are returned, sorted. Returns an empty list if nothing matches.
std::vector<std::filesystem::path> ExpandPattern(const std::filesystem::path &pattern);

// Matches `name` against a wildcard pattern where `*` matches any run of characters and `?` matches one character.
bool WildcardMatch(std::string_view pattern, std::string_view name);

} // namespace discconv::conv
