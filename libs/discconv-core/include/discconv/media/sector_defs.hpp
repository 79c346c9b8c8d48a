#pragma once

/**
@file
@brief CD-ROM MODE1 sector layout definitions.
*/

#include <discconv/core/types.hpp>

#include <string_view>

namespace discconv::media {

/// @brief Size of a raw CD-ROM sector: sync pattern, header, user data and EDC/ECC.
inline constexpr uint32 kRawSectorSize = 2352;

/// @brief Size of the user data area of a MODE1 sector.
inline constexpr uint32 kUserDataSize = 2048;

/// @brief Offset of the user data area within a raw MODE1 sector (12 sync bytes + 4 header bytes).
inline constexpr uint32 kRawUserDataOffset = 16;

static_assert(kRawUserDataOffset + kUserDataSize <= kRawSectorSize);

/// @brief Sector layouts of a single-track MODE1 image.
enum class SectorMode {
    /// @brief Full 2352-byte raw sectors. User data is at offset 16; everything else is discarded on read and
    /// zero-filled on synthesis.
    Raw2352,

    /// @brief 2048-byte user data sectors with no envelope.
    User2048,
};

/// @brief Returns the size in bytes of one sector in the given layout.
constexpr uint32 SectorSize(SectorMode mode) {
    return mode == SectorMode::Raw2352 ? kRawSectorSize : kUserDataSize;
}

/// @brief Returns the offset of the user data area within a sector in the given layout.
constexpr uint32 UserDataOffset(SectorMode mode) {
    return mode == SectorMode::Raw2352 ? kRawUserDataOffset : 0;
}

/// @brief Returns the CUE sheet track type string for the given layout.
constexpr std::string_view ToCueTrackType(SectorMode mode) {
    return mode == SectorMode::Raw2352 ? "MODE1/2352" : "MODE1/2048";
}

} // namespace discconv::media
