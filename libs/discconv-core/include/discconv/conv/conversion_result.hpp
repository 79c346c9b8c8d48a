#pragma once

/**
@file
@brief The outcome of a conversion job.
*/

#include <discconv/media/cue_sheet.hpp>
#include <discconv/media/sector_transcoder.hpp>

#include <filesystem>
#include <string>
#include <system_error>

namespace discconv::conv {

struct ConversionResult {
    enum class Type {
        Success,
        Skipped,               ///< Unsupported input extension
        InvalidCue,            ///< CUE sheet without exactly one FILE and one TRACK
        UnsupportedTrack,      ///< Audio or multi-track content
        UnsupportedSectorMode, ///< Track type other than MODE1/2352 or MODE1/2048
        MisalignedSource,      ///< Source size is not a whole number of sectors under the strict policy
        DestinationExists,     ///< Destination exists and overwriting was not allowed
        DestinationIsSource,   ///< Destination resolves to the source file
        IOError,               ///< Read or write failure
        ToolUnavailable,       ///< The external codec executable was not found
        ToolFailed,            ///< The external codec failed or produced an unreadable container
        InvalidContainer,      ///< A CHD input could not be opened
    };

    static ConversionResult Success() {
        return {.type = Type::Success};
    }

    static ConversionResult Skipped(std::filesystem::path path) {
        return {.type = Type::Skipped, .path = std::move(path)};
    }

    static ConversionResult InvalidCue(std::filesystem::path path) {
        return {.type = Type::InvalidCue, .path = std::move(path)};
    }

    static ConversionResult UnsupportedTrack(std::filesystem::path path) {
        return {.type = Type::UnsupportedTrack, .path = std::move(path)};
    }

    static ConversionResult UnsupportedSectorMode(std::filesystem::path path) {
        return {.type = Type::UnsupportedSectorMode, .path = std::move(path)};
    }

    static ConversionResult MisalignedSource(std::filesystem::path path) {
        return {.type = Type::MisalignedSource, .path = std::move(path)};
    }

    static ConversionResult DestinationExists(std::filesystem::path path) {
        return {.type = Type::DestinationExists, .path = std::move(path)};
    }

    static ConversionResult DestinationIsSource(std::filesystem::path path) {
        return {.type = Type::DestinationIsSource, .path = std::move(path)};
    }

    static ConversionResult IOError(std::filesystem::path path, std::error_code error) {
        return {.type = Type::IOError, .path = std::move(path), .error = error};
    }

    static ConversionResult ToolUnavailable(std::filesystem::path tool) {
        return {.type = Type::ToolUnavailable, .path = std::move(tool)};
    }

    static ConversionResult ToolFailed(std::filesystem::path path, int exitCode) {
        return {.type = Type::ToolFailed, .path = std::move(path), .exitCode = exitCode};
    }

    static ConversionResult InvalidContainer(std::filesystem::path path) {
        return {.type = Type::InvalidContainer, .path = std::move(path)};
    }

    // Maps a CUE parse failure of the sheet at `path` to a conversion result.
    static ConversionResult FromCueParseResult(media::CueParseResult result, std::filesystem::path path,
                                               std::error_code error);

    // Maps a transcoding failure to a conversion result.
    // `source` and `dest` identify which side a read or write error refers to.
    static ConversionResult FromTranscodeResult(media::TranscodeResult result, std::filesystem::path source,
                                                std::filesystem::path dest, std::error_code error);

    /// @brief Whether the job completed. Skipped jobs are not failures but did not produce anything.
    bool Succeeded() const {
        return type == Type::Success;
    }

    /// @brief Whether the job is considered failed for batch error handling.
    bool Failed() const {
        return type != Type::Success && type != Type::Skipped;
    }

    operator bool() const {
        return Succeeded();
    }

    // Returns a single-line description of the result.
    std::string string() const;

    Type type;
    std::filesystem::path path;
    std::error_code error;
    int exitCode = 0;
};

} // namespace discconv::conv
