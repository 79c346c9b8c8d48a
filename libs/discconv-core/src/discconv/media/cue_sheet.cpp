#include <discconv/media/cue_sheet.hpp>

#include <discconv/util/dev_log.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <optional>
#include <sstream>

namespace discconv::media {

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    struct cue {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "CUE";
    };

} // namespace grp

namespace {

    std::string_view Trim(std::string_view str) {
        const auto isSpace = [](char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; };
        while (!str.empty() && isSpace(str.front())) {
            str.remove_prefix(1);
        }
        while (!str.empty() && isSpace(str.back())) {
            str.remove_suffix(1);
        }
        return str;
    }

    std::string ToUpper(std::string_view str) {
        std::string out{str};
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
        return out;
    }

    bool HasToken(std::string_view line, std::string_view token) {
        std::istringstream ins{std::string{line}};
        std::string word{};
        while (ins >> word) {
            if (word == token) {
                return true;
            }
        }
        return false;
    }

    // FILE "name with spaces.bin" BINARY
    // FILE name.bin BINARY
    std::optional<std::string> ExtractFileName(std::string_view line) {
        std::string_view rest = Trim(line.substr(4));

        const auto quoteStart = rest.find('"');
        if (quoteStart != std::string_view::npos) {
            const auto quoteEnd = rest.find('"', quoteStart + 1);
            if (quoteEnd == std::string_view::npos) {
                return std::nullopt;
            }
            auto name = rest.substr(quoteStart + 1, quoteEnd - quoteStart - 1);
            if (name.empty()) {
                return std::nullopt;
            }
            return std::string{name};
        }

        // Unquoted: everything up to the file type
        const auto lastSpace = rest.find_last_of(" \t");
        if (lastSpace == std::string_view::npos) {
            return std::nullopt;
        }
        auto name = Trim(rest.substr(0, lastSpace));
        if (name.empty()) {
            return std::nullopt;
        }
        return std::string{name};
    }

} // namespace

std::string_view ToString(CueParseResult result) {
    switch (result) {
    case CueParseResult::Success: return "success";
    case CueParseResult::InvalidCue: return "invalid or unsupported CUE file";
    case CueParseResult::UnsupportedTrack: return "audio tracks are not supported";
    case CueParseResult::UnsupportedSectorMode: return "unsupported track mode";
    case CueParseResult::IOError: return "could not read CUE file";
    default: return "unknown error";
    }
}

CueParseResult ParseCueSheet(std::istream &in, CueDescriptor &descriptor) {
    std::optional<std::string> binFileName{};
    std::optional<SectorMode> mode{};
    uint32 fileCount = 0;
    uint32 trackCount = 0;
    bool unsupportedMode = false;

    uint32 lineNum = 0;
    std::string rawLine{};
    while (std::getline(in, rawLine)) {
        lineNum++;
        std::string_view view{rawLine};
        if (lineNum == 1 && view.starts_with("\xEF\xBB\xBF")) {
            view.remove_prefix(3);
        }

        const std::string_view line = Trim(view);
        const std::string upper = ToUpper(line);

        if (upper.starts_with("FILE")) {
            fileCount++;
            if (auto name = ExtractFileName(line)) {
                binFileName = std::move(*name);
                devlog::debug<grp::cue>("Line {}: FILE {}", lineNum, *binFileName);
            } else {
                devlog::debug<grp::cue>("Line {}: FILE without a file name", lineNum);
            }
        } else if (upper.starts_with("TRACK")) {
            trackCount++;
            if (HasToken(upper, "AUDIO")) {
                devlog::debug<grp::cue>("Line {}: audio track", lineNum);
                return CueParseResult::UnsupportedTrack;
            }

            if (upper.find("MODE1/2352") != std::string::npos) {
                mode = SectorMode::Raw2352;
            } else if (upper.find("MODE1/2048") != std::string::npos) {
                mode = SectorMode::User2048;
            } else {
                // Keep scanning; an audio track further down takes precedence
                devlog::debug<grp::cue>("Line {}: unsupported track type: {}", lineNum, line);
                unsupportedMode = true;
            }
        }
    }

    if (in.bad()) {
        return CueParseResult::IOError;
    }
    if (unsupportedMode) {
        return CueParseResult::UnsupportedSectorMode;
    }
    if (!binFileName || !mode || fileCount != 1 || trackCount != 1) {
        devlog::debug<grp::cue>("Rejected: {} FILE and {} TRACK entries", fileCount, trackCount);
        return CueParseResult::InvalidCue;
    }

    descriptor.binFileName = std::move(*binFileName);
    descriptor.mode = *mode;
    return CueParseResult::Success;
}

CueParseResult ParseCueSheet(const std::filesystem::path &cuePath, CueDescriptor &descriptor, std::error_code &error) {
    std::ifstream in{cuePath, std::ios::binary};
    if (!in) {
        error.assign(errno, std::generic_category());
        return CueParseResult::IOError;
    }

    const CueParseResult result = ParseCueSheet(in, descriptor);
    if (result == CueParseResult::IOError) {
        error.assign(errno, std::generic_category());
    }
    return result;
}

std::string FormatCueSheet(std::string_view binFileName) {
    return fmt::format("FILE \"{}\" BINARY\n"
                       "  TRACK 01 {}\n"
                       "    INDEX 01 00:00:00\n",
                       binFileName, ToCueTrackType(SectorMode::Raw2352));
}

bool WriteCueSheet(const std::filesystem::path &cuePath, std::string_view binFileName, std::error_code &error) {
    std::ofstream out{cuePath, std::ios::binary | std::ios::trunc};
    if (!out) {
        error.assign(errno, std::generic_category());
        return false;
    }

    const std::string sheet = FormatCueSheet(binFileName);
    out.write(sheet.data(), sheet.size());
    out.flush();
    if (!out) {
        error.assign(errno, std::generic_category());
        return false;
    }
    return true;
}

} // namespace discconv::media
