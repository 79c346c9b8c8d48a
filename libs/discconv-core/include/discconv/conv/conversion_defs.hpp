#pragma once

/**
@file
@brief Conversion job definitions.
*/

#include <filesystem>
#include <string_view>

namespace discconv::conv {

/// @brief Image formats recognized by file extension.
enum class ImageFormat { Unknown, Cue, Iso, Bin, Chd };

/// @brief The conversion performed by a job.
enum class Direction {
    Skip,        ///< Unsupported input; nothing is done
    CueToIso,    ///< Parse the sheet, extract user data from its binary
    IsoToBinCue, ///< Wrap user data into raw sectors and write a companion sheet
    BinToIso,    ///< Extract user data from a raw 2352-byte binary
    ToChd,       ///< Compress a CUE, ISO or BIN image with the external codec
    ChdToCue,    ///< Extract a CHD container into CUE + BIN with the external codec
};

/// @brief A single conversion, created right before it runs.
struct ConversionJob {
    std::filesystem::path inputPath;
    std::filesystem::path outputPath;
    Direction direction = Direction::Skip;
};

// Determines the image format from the extension of `path`, ignoring case.
ImageFormat FormatFromPath(const std::filesystem::path &path);

std::string_view ToString(ImageFormat format);
std::string_view ToString(Direction direction);

} // namespace discconv::conv
