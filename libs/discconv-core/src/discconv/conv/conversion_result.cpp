#include <discconv/conv/conversion_defs.hpp>
#include <discconv/conv/conversion_result.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>

namespace discconv::conv {

ImageFormat FormatFromPath(const std::filesystem::path &path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    if (ext == ".cue") {
        return ImageFormat::Cue;
    } else if (ext == ".iso") {
        return ImageFormat::Iso;
    } else if (ext == ".bin") {
        return ImageFormat::Bin;
    } else if (ext == ".chd") {
        return ImageFormat::Chd;
    }
    return ImageFormat::Unknown;
}

std::string_view ToString(ImageFormat format) {
    switch (format) {
    case ImageFormat::Cue: return "CUE";
    case ImageFormat::Iso: return "ISO";
    case ImageFormat::Bin: return "BIN";
    case ImageFormat::Chd: return "CHD";
    default: return "unknown";
    }
}

std::string_view ToString(Direction direction) {
    switch (direction) {
    case Direction::CueToIso: return "CUE/BIN → ISO";
    case Direction::IsoToBinCue: return "ISO → BIN+CUE";
    case Direction::BinToIso: return "BIN → ISO";
    case Direction::ToChd: return "Image → CHD";
    case Direction::ChdToCue: return "CHD → CUE/BIN";
    default: return "skip";
    }
}

ConversionResult ConversionResult::FromCueParseResult(media::CueParseResult result, std::filesystem::path path,
                                                      std::error_code error) {
    using media::CueParseResult;
    switch (result) {
    case CueParseResult::Success: return Success();
    case CueParseResult::UnsupportedTrack: return UnsupportedTrack(std::move(path));
    case CueParseResult::UnsupportedSectorMode: return UnsupportedSectorMode(std::move(path));
    case CueParseResult::IOError: return IOError(std::move(path), error);
    case CueParseResult::InvalidCue: [[fallthrough]];
    default: return InvalidCue(std::move(path));
    }
}

ConversionResult ConversionResult::FromTranscodeResult(media::TranscodeResult result, std::filesystem::path source,
                                                       std::filesystem::path dest, std::error_code error) {
    using media::TranscodeResult;
    switch (result) {
    case TranscodeResult::Success: return Success();
    case TranscodeResult::ReadError: return IOError(std::move(source), error);
    case TranscodeResult::MisalignedSource: return MisalignedSource(std::move(source));
    case TranscodeResult::WriteError: [[fallthrough]];
    default: return IOError(std::move(dest), error);
    }
}

std::string ConversionResult::string() const {
    const std::string p = path.string();
    switch (type) {
    case Type::Success: return "Success";
    case Type::Skipped: return fmt::format("Skipping unsupported file: {}", p);
    case Type::InvalidCue: return fmt::format("{}: invalid or unsupported CUE file", p);
    case Type::UnsupportedTrack: return fmt::format("{}: audio and multi-track images are not supported", p);
    case Type::UnsupportedSectorMode: return fmt::format("{}: unsupported track mode", p);
    case Type::MisalignedSource: return fmt::format("{}: size is not a multiple of the sector size", p);
    case Type::DestinationExists: return fmt::format("{} already exists (use -f or -a)", p);
    case Type::DestinationIsSource: return fmt::format("{}: output would overwrite the input file", p);
    case Type::IOError:
        if (error) {
            return fmt::format("{}: I/O error: {}", p, error.message());
        }
        return fmt::format("{}: I/O error", p);
    case Type::ToolUnavailable:
        if (path.has_parent_path()) {
            return fmt::format("{} not found or not executable", p);
        }
        return fmt::format("{} not found in PATH (please install MAME/chdman)", p);
    case Type::ToolFailed:
        if (exitCode != 0) {
            return fmt::format("chdman failed on {} (exit code {})", p, exitCode);
        }
        return fmt::format("chdman failed on {}", p);
    case Type::InvalidContainer: return fmt::format("{}: not a readable CHD file", p);
    default: return "Unspecified error";
    }
}

} // namespace discconv::conv
