#pragma once

#include "disc_codec.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace discconv::conv {

/// @brief `IDiscCodec` implementation backed by MAME's chdman tool.
///
/// chdman is started once per conversion:
/// - `chdman createcd -i <source> -o <dest> [--force]`
/// - `chdman extractcd -i <source> -o <dest.cue> -ob <dest.bin> [--force]`
///
/// Containers are inspected with libchdr, both before extraction and after compression.
/// This class never installs chdman; a missing executable is reported as `ToolUnavailable`.
class ChdmanCodec final : public IDiscCodec {
public:
    /// @brief Creates a codec that runs the executable at `chdmanPath`, or searches `PATH` for `chdman` if empty.
    explicit ChdmanCodec(std::filesystem::path chdmanPath = {});

    ConversionResult Compress(const std::filesystem::path &source, const std::filesystem::path &dest,
                              bool overwrite) final;

    ConversionResult Extract(const std::filesystem::path &source, const std::filesystem::path &dest,
                             bool overwrite) final;

    ConversionResult Inspect(const std::filesystem::path &path) final;

    // Locates the chdman executable. The result is cached after the first successful lookup.
    std::optional<std::filesystem::path> Locate();

private:
    ConversionResult Run(const std::vector<std::string> &args, const std::filesystem::path &subject);

    std::filesystem::path m_configuredPath;
    std::optional<std::filesystem::path> m_resolvedPath;
};

} // namespace discconv::conv
