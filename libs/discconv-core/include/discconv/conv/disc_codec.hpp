#pragma once

/**
@file
@brief Interface to an external compressed disc container codec.
*/

#include "conversion_result.hpp"

#include <filesystem>

namespace discconv::conv {

/// @brief Converts disc images to and from a compressed container format.
///
/// Implementations are expected to run an external tool. The dispatcher has already applied the overwrite policy to
/// every destination when these functions are called; `overwrite` tells the implementation that existing outputs may
/// be replaced.
class IDiscCodec {
public:
    virtual ~IDiscCodec() = default;

    /// @brief Compresses a CUE, ISO or BIN image at `source` into a container at `dest`.
    virtual ConversionResult Compress(const std::filesystem::path &source, const std::filesystem::path &dest,
                                      bool overwrite) = 0;

    /// @brief Extracts the container at `source` into a CUE sheet at `dest` and its companion binary.
    virtual ConversionResult Extract(const std::filesystem::path &source, const std::filesystem::path &dest,
                                     bool overwrite) = 0;

    /// @brief Checks that the container at `path` can be extracted into a single-track MODE1 image.
    virtual ConversionResult Inspect(const std::filesystem::path &path) = 0;
};

} // namespace discconv::conv
