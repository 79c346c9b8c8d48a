#pragma once

/**
@file
@brief Streaming conversion between raw MODE1 sectors and 2048-byte user data sectors.

Both directions read one sector at a time and write it before reading the next, so sector N of the source always
becomes sector N of the destination.

Raw sectors synthesized by `UserToRaw` carry the user data at offset 16 and zeroes everywhere else. The sync pattern,
header, EDC and ECC are not generated, so tools that validate raw sectors will flag them even though the user data is
intact.
*/

#include "sector_defs.hpp"

#include <discconv/core/configuration_defs.hpp>

#include <iosfwd>
#include <string_view>

namespace discconv::media {

enum class TranscodeResult {
    Success,
    ReadError,        ///< The source stream failed
    WriteError,       ///< The destination stream failed
    MisalignedSource, ///< The source ends with a partial sector and the policy rejects it
};

std::string_view ToString(TranscodeResult result);

/// @brief Counters collected while transcoding.
struct TranscodeStats {
    uint64 sectors = 0;       ///< Whole sectors converted
    uint64 bytesRead = 0;     ///< Bytes consumed from the source
    uint64 bytesWritten = 0;  ///< Bytes written to the destination
    uint32 trailingBytes = 0; ///< Size of a partial final sector, if any
};

struct TranscodeOptions {
    core::config::conv::PartialSectorPolicy partialSectorPolicy =
        core::config::conv::PartialSectorPolicy::TreatAsEndOfStream;
};

// Extracts the user data of every sector in `in` into `out`.
//
// With SectorMode::Raw2352, bytes [16, 2064) of each 2352-byte sector are copied and the rest is dropped.
// With SectorMode::User2048, sectors are copied unchanged.
//
// A partial final sector ends the stream under PartialSectorPolicy::TreatAsEndOfStream and is not copied.
// Under PartialSectorPolicy::Reject it returns TranscodeResult::MisalignedSource; everything before it has already
// been written by then.
TranscodeResult RawToUser(std::istream &in, std::ostream &out, SectorMode mode, const TranscodeOptions &options,
                          TranscodeStats &stats);

// Wraps every 2048-byte block of `in` into a zero-filled 2352-byte raw sector at offset 16 and writes it to `out`.
//
// A partial final block is padded with zeroes under PartialSectorPolicy::TreatAsEndOfStream, so no user data is lost.
// Under PartialSectorPolicy::Reject it returns TranscodeResult::MisalignedSource.
TranscodeResult UserToRaw(std::istream &in, std::ostream &out, const TranscodeOptions &options, TranscodeStats &stats);

} // namespace discconv::media
