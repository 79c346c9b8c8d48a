#include "console_prompt.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iostream>
#include <string>

namespace app {

bool AskOverwrite(const std::filesystem::path &path) {
    return AskOverwrite(path, std::cin);
}

bool AskOverwrite(const std::filesystem::path &path, std::istream &in) {
    std::string answer{};
    while (true) {
        fmt::print("Overwrite \"{}\"? [y/N]: ", path.string());
        std::fflush(stdout);

        if (!std::getline(in, answer)) {
            fmt::print("\n");
            return false;
        }

        auto notSpace = [](unsigned char ch) { return !std::isspace(ch); };
        answer.erase(answer.begin(), std::find_if(answer.begin(), answer.end(), notSpace));
        answer.erase(std::find_if(answer.rbegin(), answer.rend(), notSpace).base(), answer.end());
        std::transform(answer.begin(), answer.end(), answer.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

        if (answer == "y" || answer == "yes") {
            return true;
        }
        if (answer == "n" || answer == "no" || answer.empty()) {
            return false;
        }
    }
}

} // namespace app
