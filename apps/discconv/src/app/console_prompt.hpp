#pragma once

#include <filesystem>
#include <iosfwd>

namespace app {

// Asks on the terminal whether the existing file at `path` may be overwritten.
// Accepts y/yes and n/no in any case; an empty answer or end of input means no. Other answers repeat the question.
bool AskOverwrite(const std::filesystem::path &path);

// Same as AskOverwrite, reading answers from `in`.
bool AskOverwrite(const std::filesystem::path &path, std::istream &in);

} // namespace app
