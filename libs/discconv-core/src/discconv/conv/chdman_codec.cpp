#include <discconv/conv/chdman_codec.hpp>

#include <discconv/media/chd_probe.hpp>

#include <discconv/util/dev_log.hpp>
#include <discconv/util/process.hpp>

#include <fmt/ranges.h>

namespace discconv::conv {

namespace grp {

    struct codec {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "chdman";
    };

} // namespace grp

ChdmanCodec::ChdmanCodec(std::filesystem::path chdmanPath)
    : m_configuredPath(std::move(chdmanPath)) {}

std::optional<std::filesystem::path> ChdmanCodec::Locate() {
    if (!m_resolvedPath) {
        const std::string name = m_configuredPath.empty() ? std::string{"chdman"} : m_configuredPath.string();
        m_resolvedPath = util::FindExecutableInPath(name);
        if (m_resolvedPath) {
            devlog::debug<grp::codec>("Using {}", m_resolvedPath->string());
        }
    }
    return m_resolvedPath;
}

ConversionResult ChdmanCodec::Run(const std::vector<std::string> &args, const std::filesystem::path &subject) {
    auto chdman = Locate();
    if (!chdman) {
        return ConversionResult::ToolUnavailable(m_configuredPath.empty() ? std::filesystem::path{"chdman"}
                                                                         : m_configuredPath);
    }

    devlog::info<grp::codec>("Running {} {}", chdman->string(), fmt::join(args, " "));

    std::error_code err{};
    const int exitCode = util::RunProcess(*chdman, args, err);
    if (err) {
        devlog::error<grp::codec>("Could not run {}: {}", chdman->string(), err.message());
        return ConversionResult::IOError(*chdman, err);
    }
    if (exitCode != 0) {
        devlog::error<grp::codec>("Exited with code {}", exitCode);
        return ConversionResult::ToolFailed(subject, exitCode);
    }
    return ConversionResult::Success();
}

ConversionResult ChdmanCodec::Compress(const std::filesystem::path &source, const std::filesystem::path &dest,
                                       bool overwrite) {
    std::vector<std::string> args{"createcd", "-i", source.string(), "-o", dest.string()};
    if (overwrite) {
        args.emplace_back("--force");
    }

    auto result = Run(args, source);
    if (!result) {
        return result;
    }

    // The container must be readable
    media::chd::ContainerInfo info{};
    std::string message{};
    if (media::chd::Probe(dest, info, message) != media::chd::ProbeResult::Success) {
        devlog::error<grp::codec>("Output {} is unreadable: {}", dest.string(), message);
        return ConversionResult::ToolFailed(source, 0);
    }
    return ConversionResult::Success();
}

ConversionResult ChdmanCodec::Extract(const std::filesystem::path &source, const std::filesystem::path &dest,
                                      bool overwrite) {
    std::filesystem::path binPath = dest;
    binPath.replace_extension(".bin");

    std::vector<std::string> args{"extractcd", "-i", source.string(), "-o", dest.string(), "-ob", binPath.string()};
    if (overwrite) {
        args.emplace_back("--force");
    }
    return Run(args, source);
}

ConversionResult ChdmanCodec::Inspect(const std::filesystem::path &path) {
    media::chd::ContainerInfo info{};
    std::string message{};
    const auto result = media::chd::Probe(path, info, message);
    if (result != media::chd::ProbeResult::Success) {
        devlog::debug<grp::codec>("{}: {}", path.string(), message);
        return ConversionResult::InvalidContainer(path);
    }
    if (!media::chd::IsSingleMode1Track(info)) {
        devlog::debug<grp::codec>("{}: {} track(s), first is {}", path.string(), info.tracks.size(),
                                  info.tracks.empty() ? "none" : info.tracks.front().type);
        return ConversionResult::UnsupportedTrack(path);
    }
    return ConversionResult::Success();
}

} // namespace discconv::conv
