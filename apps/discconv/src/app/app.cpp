#include "app.hpp"

#include "console_prompt.hpp"
#include "settings.hpp"

#include <discconv/conv/chdman_codec.hpp>
#include <discconv/conv/dispatcher.hpp>
#include <discconv/conv/input_selector.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cstdio>

using namespace discconv;

namespace app {

namespace {

    template <typename... T>
    void PrintWarning(fmt::format_string<T...> msg, T &&...args) {
        fmt::print(stderr, "[WARN] {}\n", fmt::format(msg, std::forward<T>(args)...));
    }

    template <typename... T>
    void PrintError(fmt::format_string<T...> msg, T &&...args) {
        fmt::print(stderr, "[ERR] {}\n", fmt::format(msg, std::forward<T>(args)...));
    }

    void PrintReport(const conv::JobReport &report) {
        if (report.result.Succeeded()) {
            std::vector<std::string> outputs{};
            for (const auto &output : report.outputs) {
                outputs.push_back(output.string());
            }
            fmt::print("[OK] {}: {}\n", conv::ToString(report.job.direction), fmt::join(outputs, ", "));
        } else if (report.result.type == conv::ConversionResult::Type::Skipped) {
            PrintWarning("{}", report.result.string());
        } else {
            PrintError("{}", report.result.string());
        }
    }

} // namespace

int App::Run(const CommandLineOptions &options) {
    Settings settings{m_config};
    if (!options.configPath.empty()) {
        auto result = settings.Load(options.configPath);
        if (!result) {
            PrintError("Could not load {}: {}", options.configPath, result.string());
            return exit_code::kUsage;
        }
    }

    if (options.force && options.ask) {
        PrintError("-f and -a cannot be used together");
        return exit_code::kUsage;
    }
    ApplyOptions(options);

    if (options.saveConfig) {
        auto result = settings.Save();
        if (!result) {
            PrintError("Could not save {}: {}", settings.path.string(), result.string());
            return exit_code::kJobFailed;
        }
        fmt::print("Configuration saved to {}\n", settings.path.string());

        if (options.inputPatterns.empty() && options.dirExtension.empty()) {
            return exit_code::kSuccess;
        }
    }

    std::vector<std::filesystem::path> inputs{};
    if (!CollectInputs(options, inputs)) {
        return exit_code::kUsage;
    }

    if (m_config.conversion.overwritePolicy == core::config::conv::OverwritePolicy::Prompt) {
        m_config.confirmOverwrite = [](const std::filesystem::path &path) { return AskOverwrite(path); };
    }

    conv::ChdmanCodec codec{m_config.tools.chdmanPath};
    conv::Dispatcher dispatcher{m_config, codec};

    const auto reports = dispatcher.RunBatch(inputs, std::filesystem::path{options.outputPath}, PrintReport);

    size_t failed = 0;
    for (const auto &report : reports) {
        if (report.result.Failed()) {
            ++failed;
        }
    }
    if (reports.size() < inputs.size()) {
        PrintWarning("Stopped after {} of {} inputs", reports.size(), inputs.size());
    }
    if (failed > 0) {
        if (inputs.size() > 1) {
            PrintError("{} of {} conversions failed", failed, inputs.size());
        }
        return exit_code::kJobFailed;
    }
    return exit_code::kSuccess;
}

void App::ApplyOptions(const CommandLineOptions &options) {
    using namespace core::config::conv;

    if (options.force) {
        m_config.conversion.overwritePolicy = OverwritePolicy::Force;
    } else if (options.ask) {
        m_config.conversion.overwritePolicy = OverwritePolicy::Prompt;
    }
    if (options.toChd) {
        m_config.conversion.target = TargetFormat::CHD;
    }
    if (options.strict) {
        m_config.conversion.partialSectorPolicy = PartialSectorPolicy::Reject;
    }
    if (options.stopOnError) {
        m_config.conversion.batchErrorPolicy = BatchErrorPolicy::StopOnError;
    }
    if (!options.chdmanPath.empty()) {
        m_config.tools.chdmanPath = options.chdmanPath;
    }
}

bool App::CollectInputs(const CommandLineOptions &options, std::vector<std::filesystem::path> &inputs) const {
    if (!options.dirExtension.empty()) {
        if (options.dirPath.empty()) {
            PrintError("-d requires a directory path");
            return false;
        }
        std::error_code err{};
        auto files = conv::CollectDirectory(options.dirPath, options.dirExtension, options.recursive, err);
        if (err) {
            PrintError("Cannot read directory {}: {}", options.dirPath, err.message());
            return false;
        }
        inputs.insert(inputs.end(), files.begin(), files.end());
    } else if (options.recursive) {
        PrintError("-r can only be used together with -d");
        return false;
    }

    for (const auto &pattern : options.inputPatterns) {
        auto matches = conv::ExpandPattern(pattern);
        if (matches.empty()) {
            PrintWarning("No match for pattern: {}", pattern);
        }
        inputs.insert(inputs.end(), matches.begin(), matches.end());
    }

    if (inputs.empty()) {
        PrintError("No input files specified");
        return false;
    }
    if (!options.outputPath.empty() && inputs.size() > 1) {
        PrintError("-o can only be used with a single input file");
        return false;
    }
    return true;
}

} // namespace app
