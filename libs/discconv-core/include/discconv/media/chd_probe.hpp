#pragma once

#include <discconv/core/types.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

// CHD (Compressed Hunks of Data) is the compressed container format created by MAME authors, produced and consumed
// here by chdman.
//
// This module uses libchdr (https://github.com/rtissera/libchdr) to inspect the track list of a CHD file without
// decompressing it.

namespace discconv::media::chd {

struct TrackInfo {
    uint32 number = 0;
    std::string type;    // MODE1, MODE1_RAW, MODE2_FORM1, AUDIO, ...
    std::string subtype; // NONE, RW, RW_RAW
    uint32 frames = 0;
};

struct ContainerInfo {
    uint32 hunkBytes = 0;
    uint32 unitBytes = 0;
    uint64 logicalBytes = 0;
    std::vector<TrackInfo> tracks;
};

enum class ProbeResult {
    Success,
    OpenFailed,      ///< libchdr could not open the file
    MetadataError,   ///< The track metadata could not be read or parsed
};

// Opens the CHD file at chdPath and reads its header and CD track metadata into `info`.
// `message` receives libchdr's error description on failure.
ProbeResult Probe(const std::filesystem::path &chdPath, ContainerInfo &info, std::string &message);

// Returns true if the container holds exactly one track and it is a MODE1 data track.
bool IsSingleMode1Track(const ContainerInfo &info);

} // namespace discconv::media::chd
