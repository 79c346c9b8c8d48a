#include <discconv/media/chd_probe.hpp>

#include <discconv/util/dev_log.hpp>
#include <discconv/util/scope_guard.hpp>

#include <libchdr/chd.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <string_view>

namespace discconv::media::chd {

namespace grp {

    struct chd {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "CHD";
    };

} // namespace grp

namespace {

    bool ParseUInt(std::string_view str, uint32 &out) {
        auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), out);
        return ec == std::errc{} && ptr == str.data() + str.size();
    }

    // Parses CD track metadata:
    // CHTR: "TRACK:%d TYPE:%s SUBTYPE:%s FRAMES:%d"
    // CHT2: "TRACK:%d TYPE:%s SUBTYPE:%s FRAMES:%d PREGAP:%d PGTYPE:%s PGSUB:%s POSTGAP:%d"
    // The fields past FRAMES are not needed and are skipped.
    bool ParseTrackMetadata(std::string_view text, TrackInfo &track) {
        bool hasTrack = false;
        bool hasType = false;
        bool hasFrames = false;
        while (!text.empty()) {
            const auto end = text.find(' ');
            const std::string_view field = text.substr(0, end);
            text = end == std::string_view::npos ? std::string_view{} : text.substr(end + 1);

            const auto colon = field.find(':');
            if (colon == std::string_view::npos) {
                continue;
            }
            const auto key = field.substr(0, colon);
            const auto value = field.substr(colon + 1);
            if (key == "TRACK") {
                hasTrack = ParseUInt(value, track.number);
            } else if (key == "TYPE") {
                track.type = value;
                hasType = !value.empty();
            } else if (key == "SUBTYPE") {
                track.subtype = value;
            } else if (key == "FRAMES") {
                hasFrames = ParseUInt(value, track.frames);
            }
        }
        return hasTrack && hasType && hasFrames;
    }

} // namespace

ProbeResult Probe(const std::filesystem::path &chdPath, ContainerInfo &info, std::string &message) {
    chd_file *file = nullptr;
    chd_error error = chd_open(chdPath.string().c_str(), CHD_OPEN_READ, nullptr, &file);
    if (error != CHDERR_NONE) {
        message = chd_error_string(error);
        devlog::debug<grp::chd>("Failed to open {}: {}", chdPath.string(), message);
        return ProbeResult::OpenFailed;
    }
    util::ScopeGuard sgCloseFile{[&] { chd_close(file); }};

    const chd_header *header = chd_get_header(file);
    info.hunkBytes = header->hunkbytes;
    info.unitBytes = header->unitbytes;
    info.logicalBytes = header->logicalbytes;
    info.tracks.clear();

    std::array<char, 256> metabuf{};
    for (uint32 metaIndex = 0;; metaIndex++) {
        uint32 resultlen = 0;
        uint32 resulttag = 0;
        uint8 resultflags = 0;
        error = chd_get_metadata(file, CHDMETATAG_WILDCARD, metaIndex, metabuf.data(), metabuf.size() - 1,
                                 &resultlen, &resulttag, &resultflags);
        if (error == CHDERR_METADATA_NOT_FOUND) {
            break;
        }
        if (error != CHDERR_NONE) {
            message = chd_error_string(error);
            devlog::debug<grp::chd>("Failed to read metadata {}: {}", metaIndex, message);
            return ProbeResult::MetadataError;
        }
        if (resulttag != CDROM_TRACK_METADATA_TAG && resulttag != CDROM_TRACK_METADATA2_TAG) {
            continue;
        }

        const size_t length = std::min<size_t>(resultlen, metabuf.size() - 1);
        metabuf[length] = '\0';
        std::string_view text{metabuf.data(), length};
        while (!text.empty() && text.back() == '\0') {
            text.remove_suffix(1);
        }

        TrackInfo &track = info.tracks.emplace_back();
        if (!ParseTrackMetadata(text, track)) {
            message = "malformed track metadata";
            devlog::debug<grp::chd>("Malformed track metadata: {}", text);
            return ProbeResult::MetadataError;
        }
        devlog::debug<grp::chd>("Track {:02d}: {} {} - {} frames", track.number, track.type, track.subtype,
                                track.frames);
    }

    return ProbeResult::Success;
}

bool IsSingleMode1Track(const ContainerInfo &info) {
    if (info.tracks.size() != 1) {
        return false;
    }
    const std::string &type = info.tracks.front().type;
    return type == "MODE1" || type == "MODE1_RAW" || type == "MODE1/2048" || type == "MODE1/2352";
}

} // namespace discconv::media::chd
