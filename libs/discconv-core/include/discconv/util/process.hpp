#pragma once

/**
@file
@brief Process utilities: executable lookup and synchronous child process execution.
*/

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace util {

/// @brief Searches the directories listed in the `PATH` environment variable for an executable.
///
/// On Windows, the extensions listed in `PATHEXT` are tried if `name` has no extension.
///
/// @param[in] name the executable name
/// @return the full path to the executable, or `std::nullopt` if not found
std::optional<std::filesystem::path> FindExecutableInPath(std::string_view name);

/// @brief Runs a program with the given arguments and waits for it to exit.
///
/// The program is started directly, without a shell, and inherits the standard streams of this process.
///
/// @param[in] program the path to the executable
/// @param[in] args the arguments, not including the program name
/// @param[out] error set if the process could not be started or waited on
/// @return the exit code of the process, or -1 if it could not be run or was terminated by a signal
int RunProcess(const std::filesystem::path &program, const std::vector<std::string> &args, std::error_code &error);

} // namespace util
