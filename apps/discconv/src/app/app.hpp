#pragma once

#include "cmdline_opts.hpp"

#include <discconv/core/configuration.hpp>

#include <filesystem>
#include <vector>

namespace app {

/// @brief Process exit codes.
namespace exit_code {
    inline constexpr int kSuccess = 0;   ///< Every job succeeded or was skipped
    inline constexpr int kJobFailed = 1; ///< At least one job failed
    inline constexpr int kUsage = 2;     ///< Invalid arguments or configuration
} // namespace exit_code

class App {
public:
    int Run(const CommandLineOptions &options);

private:
    discconv::core::Configuration m_config;

    // Applies command line overrides on top of the loaded configuration.
    void ApplyOptions(const CommandLineOptions &options);

    // Builds the input list from the directory and pattern options.
    // Returns false after printing an error if the options are inconsistent.
    bool CollectInputs(const CommandLineOptions &options, std::vector<std::filesystem::path> &inputs) const;
};

} // namespace app
