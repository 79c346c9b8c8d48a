#include "settings.hpp"

#include <discconv/util/dev_log.hpp>

#include <cerrno>
#include <fstream>

using namespace std::literals;

using namespace discconv;

namespace app {

// Increment this version and implement a new LoadV<n> whenever there's a breaking change to the configuration file
// structure.
inline constexpr int kConfigVersion = 1;

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    struct settings {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Settings";
    };

} // namespace grp

// -------------------------------------------------------------------------------------------------
// Enum parsers

static void Parse(toml::node_view<toml::node> &node, core::config::conv::OverwritePolicy &value) {
    value = core::config::conv::OverwritePolicy::Fail;
    if (auto opt = node.value<std::string>()) {
        if (*opt == "Fail"s) {
            value = core::config::conv::OverwritePolicy::Fail;
        } else if (*opt == "Force"s) {
            value = core::config::conv::OverwritePolicy::Force;
        } else if (*opt == "Prompt"s) {
            value = core::config::conv::OverwritePolicy::Prompt;
        }
    }
}

static void Parse(toml::node_view<toml::node> &node, core::config::conv::PartialSectorPolicy &value) {
    value = core::config::conv::PartialSectorPolicy::TreatAsEndOfStream;
    if (auto opt = node.value<std::string>()) {
        if (*opt == "EndOfStream"s) {
            value = core::config::conv::PartialSectorPolicy::TreatAsEndOfStream;
        } else if (*opt == "Reject"s) {
            value = core::config::conv::PartialSectorPolicy::Reject;
        }
    }
}

static void Parse(toml::node_view<toml::node> &node, core::config::conv::BatchErrorPolicy &value) {
    value = core::config::conv::BatchErrorPolicy::ContinueOnError;
    if (auto opt = node.value<std::string>()) {
        if (*opt == "ContinueOnError"s) {
            value = core::config::conv::BatchErrorPolicy::ContinueOnError;
        } else if (*opt == "StopOnError"s) {
            value = core::config::conv::BatchErrorPolicy::StopOnError;
        }
    }
}

static void Parse(toml::node_view<toml::node> &node, core::config::conv::TargetFormat &value) {
    value = core::config::conv::TargetFormat::Auto;
    if (auto opt = node.value<std::string>()) {
        if (*opt == "Auto"s) {
            value = core::config::conv::TargetFormat::Auto;
        } else if (*opt == "CHD"s) {
            value = core::config::conv::TargetFormat::CHD;
        }
    }
}

// -------------------------------------------------------------------------------------------------
// Enum converters

static const char *ToTOML(const core::config::conv::OverwritePolicy value) {
    switch (value) {
    default: [[fallthrough]];
    case core::config::conv::OverwritePolicy::Fail: return "Fail";
    case core::config::conv::OverwritePolicy::Force: return "Force";
    case core::config::conv::OverwritePolicy::Prompt: return "Prompt";
    }
}

static const char *ToTOML(const core::config::conv::PartialSectorPolicy value) {
    switch (value) {
    default: [[fallthrough]];
    case core::config::conv::PartialSectorPolicy::TreatAsEndOfStream: return "EndOfStream";
    case core::config::conv::PartialSectorPolicy::Reject: return "Reject";
    }
}

static const char *ToTOML(const core::config::conv::BatchErrorPolicy value) {
    switch (value) {
    default: [[fallthrough]];
    case core::config::conv::BatchErrorPolicy::ContinueOnError: return "ContinueOnError";
    case core::config::conv::BatchErrorPolicy::StopOnError: return "StopOnError";
    }
}

static const char *ToTOML(const core::config::conv::TargetFormat value) {
    switch (value) {
    default: [[fallthrough]];
    case core::config::conv::TargetFormat::Auto: return "Auto";
    case core::config::conv::TargetFormat::CHD: return "CHD";
    }
}

// -------------------------------------------------------------------------------------------------
// Parsers

template <typename T>
static void Parse(toml::node_view<toml::node> &node, const char *name, T &value) {
    toml::node_view view{node[name]};
    Parse(view, value);
}

static void Parse(toml::node_view<toml::node> &node, const char *name, std::filesystem::path &value) {
    if (auto opt = node[name].value<std::string>()) {
        value = *opt;
    }
}

// -------------------------------------------------------------------------------------------------
// Implementation

Settings::Settings(core::Configuration &config) noexcept
    : m_config(config) {}

void Settings::ResetToDefaults() {
    m_config.conversion = {};
    m_config.tools = {};
}

SettingsLoadResult Settings::Load(const std::filesystem::path &path) {
    // Use defaults if configuration file does not exist
    if (!std::filesystem::is_regular_file(path)) {
        devlog::debug<grp::settings>("{} not found; using defaults", path.string());
        ResetToDefaults();
        this->path = path;
        return SettingsLoadResult::Success();
    }

    auto parseResult = toml::parse_file(path.string());
    if (parseResult.failed()) {
        return SettingsLoadResult::TOMLParseError(parseResult.error());
    }
    auto &data = parseResult.table();

    ResetToDefaults();

    int configVersion = 0;
    if (auto opt = data["ConfigVersion"].value<int>()) {
        configVersion = *opt;
    }
    if (configVersion > kConfigVersion) {
        return SettingsLoadResult::UnsupportedConfigVersion(configVersion);
    }

    if (auto tblConversion = data["Conversion"]) {
        Parse(tblConversion, "OverwritePolicy", m_config.conversion.overwritePolicy);
        Parse(tblConversion, "PartialSectorPolicy", m_config.conversion.partialSectorPolicy);
        Parse(tblConversion, "BatchErrorPolicy", m_config.conversion.batchErrorPolicy);
        Parse(tblConversion, "Target", m_config.conversion.target);
    }

    if (auto tblTools = data["Tools"]) {
        Parse(tblTools, "ChdmanPath", m_config.tools.chdmanPath);
    }

    devlog::debug<grp::settings>("Loaded {} (version {})", path.string(), configVersion);

    this->path = path;
    return SettingsLoadResult::Success();
}

SettingsSaveResult Settings::Save() {
    if (path.empty()) {
        path = "discconv.toml";
    }

    // clang-format off
    auto tbl = toml::table{{
        {"ConfigVersion", kConfigVersion},

        {"Conversion", toml::table{{
            {"OverwritePolicy", ToTOML(m_config.conversion.overwritePolicy)},
            {"PartialSectorPolicy", ToTOML(m_config.conversion.partialSectorPolicy)},
            {"BatchErrorPolicy", ToTOML(m_config.conversion.batchErrorPolicy)},
            {"Target", ToTOML(m_config.conversion.target)},
        }}},

        {"Tools", toml::table{{
            {"ChdmanPath", m_config.tools.chdmanPath.string()},
        }}},
    }};
    // clang-format on

    std::ofstream out{path, std::ios::binary | std::ios::trunc};
    out << tbl;
    if (!out) {
        std::error_code error{errno, std::generic_category()};
        return SettingsSaveResult::FilesystemError(error);
    }

    devlog::debug<grp::settings>("Saved {}", path.string());
    return SettingsSaveResult::Success();
}

} // namespace app
