#include <discconv/media/sector_transcoder.hpp>

#include <discconv/util/dev_log.hpp>

#include <algorithm>
#include <array>
#include <istream>
#include <ostream>

namespace discconv::media {

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // transcoder
    //   raw_to_user
    //   user_to_raw

    struct transcoder {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Transcoder";
    };

    struct raw_to_user : public transcoder {
        static constexpr std::string_view name = "Transcoder-R2U";
    };

    struct user_to_raw : public transcoder {
        static constexpr std::string_view name = "Transcoder-U2R";
    };

} // namespace grp

using core::config::conv::PartialSectorPolicy;

namespace {

    // Reads up to buffer.size() bytes, retrying until the buffer is full or the stream ends.
    // Returns the number of bytes read. Sets `failed` if the stream reported an error other than end of file.
    template <size_t N>
    uint32 ReadChunk(std::istream &in, std::array<uint8, N> &buffer, uint32 size, bool &failed) {
        uint32 total = 0;
        while (total < size) {
            in.read(reinterpret_cast<char *>(buffer.data() + total), size - total);
            const auto count = in.gcount();
            total += static_cast<uint32>(count);
            if (in.bad()) {
                failed = true;
                return total;
            }
            if (count == 0 || in.eof()) {
                break;
            }
        }
        return total;
    }

} // namespace

std::string_view ToString(TranscodeResult result) {
    switch (result) {
    case TranscodeResult::Success: return "success";
    case TranscodeResult::ReadError: return "read error";
    case TranscodeResult::WriteError: return "write error";
    case TranscodeResult::MisalignedSource: return "source size is not a multiple of the sector size";
    default: return "unknown error";
    }
}

TranscodeResult RawToUser(std::istream &in, std::ostream &out, SectorMode mode, const TranscodeOptions &options,
                          TranscodeStats &stats) {
    const uint32 sectorSize = SectorSize(mode);
    const uint32 dataOffset = UserDataOffset(mode);

    devlog::debug<grp::raw_to_user>("Sector size {}, user data at offset {}", sectorSize, dataOffset);

    std::array<uint8, kRawSectorSize> sector{};
    while (true) {
        bool failed = false;
        const uint32 readSize = ReadChunk(in, sector, sectorSize, failed);
        stats.bytesRead += readSize;
        if (failed) {
            devlog::error<grp::raw_to_user>("Read failed at sector {}", stats.sectors);
            return TranscodeResult::ReadError;
        }
        if (readSize == 0) {
            break;
        }

        if (readSize < sectorSize) {
            stats.trailingBytes = readSize;
            if (options.partialSectorPolicy == PartialSectorPolicy::Reject) {
                devlog::error<grp::raw_to_user>("Partial sector of {} bytes after sector {}", readSize,
                                                stats.sectors);
                return TranscodeResult::MisalignedSource;
            }
            devlog::warn<grp::raw_to_user>("Ignoring partial sector of {} bytes after sector {}", readSize,
                                           stats.sectors);
            break;
        }

        out.write(reinterpret_cast<const char *>(sector.data() + dataOffset), kUserDataSize);
        if (!out) {
            devlog::error<grp::raw_to_user>("Write failed at sector {}", stats.sectors);
            return TranscodeResult::WriteError;
        }
        stats.bytesWritten += kUserDataSize;
        stats.sectors++;
    }

    out.flush();
    if (!out) {
        return TranscodeResult::WriteError;
    }

    devlog::debug<grp::raw_to_user>("Converted {} sectors, {} bytes", stats.sectors, stats.bytesWritten);
    return TranscodeResult::Success;
}

TranscodeResult UserToRaw(std::istream &in, std::ostream &out, const TranscodeOptions &options, TranscodeStats &stats) {
    std::array<uint8, kUserDataSize> block{};
    std::array<uint8, kRawSectorSize> frame{};

    while (true) {
        bool failed = false;
        const uint32 readSize = ReadChunk(in, block, kUserDataSize, failed);
        stats.bytesRead += readSize;
        if (failed) {
            devlog::error<grp::user_to_raw>("Read failed at sector {}", stats.sectors);
            return TranscodeResult::ReadError;
        }
        if (readSize == 0) {
            break;
        }

        const bool partial = readSize < kUserDataSize;
        if (partial) {
            stats.trailingBytes = readSize;
            if (options.partialSectorPolicy == PartialSectorPolicy::Reject) {
                devlog::error<grp::user_to_raw>("Partial block of {} bytes after sector {}", readSize, stats.sectors);
                return TranscodeResult::MisalignedSource;
            }
            devlog::warn<grp::user_to_raw>("Padding partial block of {} bytes after sector {}", readSize,
                                           stats.sectors);
        }

        frame.fill(0);
        std::copy_n(block.begin(), readSize, frame.begin() + kRawUserDataOffset);

        out.write(reinterpret_cast<const char *>(frame.data()), frame.size());
        if (!out) {
            devlog::error<grp::user_to_raw>("Write failed at sector {}", stats.sectors);
            return TranscodeResult::WriteError;
        }
        stats.bytesWritten += frame.size();
        stats.sectors++;

        if (partial) {
            break;
        }
    }

    out.flush();
    if (!out) {
        return TranscodeResult::WriteError;
    }

    devlog::debug<grp::user_to_raw>("Converted {} sectors, {} bytes", stats.sectors, stats.bytesWritten);
    return TranscodeResult::Success;
}

} // namespace discconv::media
