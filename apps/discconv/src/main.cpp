#include "app/app.hpp"

#include <discconv/version.hpp>

#include <cxxopts.hpp>
#include <fmt/format.h>

#include <cstdio>
#include <memory>

static constexpr const char *kExamples = R"(
Examples:
  discconv -i cd.iso
  discconv -i cd_001.cue -i cd_002.cue
  discconv -i cd_game.cue -o game.iso
  discconv -i "*.cue"
  discconv -d cue dumps/ -r -a
  discconv --chd -i game.cue
  discconv -i game.chd
)";

int main(int argc, char **argv) {
    bool showHelp = false;
    bool showVersion = false;

    app::CommandLineOptions progOpts{};
    cxxopts::Options options("discconv", "discconv - CUE/BIN, ISO and CHD disc image converter\nVersion " +
                                             std::string{discconv::version::fullstring});
    options.add_options()("i,input", "Input file(s): CUE, ISO, BIN or CHD. Wildcards are allowed.",
                          cxxopts::value(progOpts.inputPatterns), "path");
    options.add_options()("o,output", "Output file (single input only)", cxxopts::value(progOpts.outputPath), "path");
    options.add_options()("d,dir", "Process a directory, selecting files by extension (e.g. cue, iso)",
                          cxxopts::value(progOpts.dirExtension), "ext");
    options.add_options()("path", "Directory path (required with -d)", cxxopts::value(progOpts.dirPath));
    options.add_options()("r,recursive", "Recursive directory processing (requires -d)",
                          cxxopts::value(progOpts.recursive)->default_value("false"));
    options.add_options()("f,force", "Overwrite existing files without asking",
                          cxxopts::value(progOpts.force)->default_value("false"));
    options.add_options()("a,ask", "Ask before overwriting existing files",
                          cxxopts::value(progOpts.ask)->default_value("false"));
    options.add_options()("chd", "Compress CUE, ISO and BIN inputs into CHD containers",
                          cxxopts::value(progOpts.toChd)->default_value("false"));
    options.add_options()("strict", "Reject sources that end with a partial sector",
                          cxxopts::value(progOpts.strict)->default_value("false"));
    options.add_options()("stop-on-error", "Stop at the first failed conversion",
                          cxxopts::value(progOpts.stopOnError)->default_value("false"));
    options.add_options()("c,config", "Path to configuration file", cxxopts::value(progOpts.configPath), "path");
    options.add_options()("save-config", "Write the effective configuration to the configuration file",
                          cxxopts::value(progOpts.saveConfig)->default_value("false"));
    options.add_options()("chdman", "Path to the chdman executable", cxxopts::value(progOpts.chdmanPath), "path");
    options.add_options()("V,version", "Display version", cxxopts::value(showVersion)->default_value("false"));
    options.add_options()("h,help", "Display this help text", cxxopts::value(showHelp)->default_value("false"));
    options.parse_positional({"path"});
    options.positional_help("[path]");

    if (argc < 2) {
        fmt::print("{}{}", options.help(), kExamples);
        return 0;
    }

    try {
        auto result = options.parse(argc, argv);
        if (showHelp) {
            fmt::print("{}{}", options.help(), kExamples);
            return 0;
        }
        if (showVersion) {
            fmt::print("discconv {}\n", discconv::version::fullstring);
            return 0;
        }
        if (!result.unmatched().empty()) {
            fmt::print(stderr, "[ERR] Unexpected argument: {}\n", result.unmatched().front());
            return app::exit_code::kUsage;
        }

        auto app = std::make_unique<app::App>();
        return app->Run(progOpts);
    } catch (const cxxopts::exceptions::exception &e) {
        fmt::print(stderr, "[ERR] Failed to parse arguments: {}\n", e.what());
        return app::exit_code::kUsage;
    } catch (const std::system_error &e) {
        fmt::print(stderr, "[ERR] System error: {}\n", e.what());
        return app::exit_code::kJobFailed;
    } catch (const std::exception &e) {
        fmt::print(stderr, "[ERR] Unhandled exception: {}\n", e.what());
        return app::exit_code::kJobFailed;
    }
}
