#pragma once

/**
@file
@brief Defines `discconv::core::Configuration` for configuring conversions.
*/

#include "configuration_defs.hpp"

#include <filesystem>
#include <functional>

namespace discconv::core {

/// @brief Conversion configuration.
///
/// The configuration is read by the dispatcher at the start of every job, so changes made between jobs apply to the
/// following ones.
struct Configuration {
    /// @brief Sector conversion and job orchestration settings.
    struct Conversion {
        /// @brief Existing destination handling.
        config::conv::OverwritePolicy overwritePolicy = config::conv::OverwritePolicy::Fail;

        /// @brief Handling of sources that end with a partial sector.
        ///
        /// The default matches the behavior of most disc tools: the trailing bytes are treated as the end of the
        /// stream.
        config::conv::PartialSectorPolicy partialSectorPolicy = config::conv::PartialSectorPolicy::TreatAsEndOfStream;

        /// @brief Whether a failed job stops the batch.
        config::conv::BatchErrorPolicy batchErrorPolicy = config::conv::BatchErrorPolicy::ContinueOnError;

        /// @brief Output format for CUE, ISO and BIN inputs.
        config::conv::TargetFormat target = config::conv::TargetFormat::Auto;
    } conversion;

    /// @brief External tools.
    struct Tools {
        /// @brief Path to the chdman executable. Leave empty to search `PATH`.
        std::filesystem::path chdmanPath;
    } tools;

    /// @brief Asks whether the existing file at the given path may be overwritten.
    ///
    /// Used only with `OverwritePolicy::Prompt`. An empty function answers "no".
    std::function<bool(const std::filesystem::path &)> confirmOverwrite;
};

} // namespace discconv::core
