#pragma once

/**
@file
@brief Minimal CUE sheet reader and writer for single-track MODE1 data discs.

The reader is a single linear scan that only understands the `FILE` and `TRACK` commands. It accepts exactly one FILE
and one TRACK of type `MODE1/2352` or `MODE1/2048` and rejects everything else. Other commands (`INDEX`, `REM`,
`PREGAP`, ...) are ignored.

The writer produces the companion sheet of a raw image synthesized from an ISO:

```
FILE "<name>" BINARY
  TRACK 01 MODE1/2352
    INDEX 01 00:00:00
```
*/

#include "sector_defs.hpp"

#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>
#include <system_error>

namespace discconv::media {

/// @brief The parsed contents of a single-track CUE sheet.
struct CueDescriptor {
    std::string binFileName; ///< Binary file name as written in the sheet, relative to the sheet's directory
    SectorMode mode;         ///< Sector layout of the binary file
};

enum class CueParseResult {
    Success,
    InvalidCue,            ///< Missing FILE or TRACK, or more than one of either
    UnsupportedTrack,      ///< The sheet declares an AUDIO track
    UnsupportedSectorMode, ///< A TRACK type other than MODE1/2352 or MODE1/2048
    IOError,               ///< The sheet could not be read
};

/// @brief Returns a short description of the parse result.
std::string_view ToString(CueParseResult result);

// Parses a CUE sheet from a text stream.
// `descriptor` is only written to when the result is CueParseResult::Success.
CueParseResult ParseCueSheet(std::istream &in, CueDescriptor &descriptor);

// Parses the CUE sheet at cuePath.
// Returns CueParseResult::IOError if the file cannot be opened or read; `error` contains the cause.
CueParseResult ParseCueSheet(const std::filesystem::path &cuePath, CueDescriptor &descriptor, std::error_code &error);

// Formats the three-line CUE sheet describing a single MODE1/2352 track stored in binFileName.
std::string FormatCueSheet(std::string_view binFileName);

// Writes the sheet produced by FormatCueSheet to cuePath, replacing any existing file.
// Returns false and sets `error` if the file could not be written.
bool WriteCueSheet(const std::filesystem::path &cuePath, std::string_view binFileName, std::error_code &error);

} // namespace discconv::media
