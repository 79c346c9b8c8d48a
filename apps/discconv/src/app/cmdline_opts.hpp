#pragma once

#include <string>
#include <vector>

namespace app {

struct CommandLineOptions {
    std::vector<std::string> inputPatterns;
    std::string outputPath;
    std::string dirExtension;
    std::string dirPath;
    bool recursive;
    bool force;
    bool ask;
    bool toChd;
    bool strict;
    bool stopOnError;
    std::string configPath;
    bool saveConfig;
    std::string chdmanPath;
};

} // namespace app
