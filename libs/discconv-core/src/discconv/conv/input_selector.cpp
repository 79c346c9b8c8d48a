#include <discconv/conv/input_selector.hpp>

#include <discconv/util/dev_log.hpp>

#include <algorithm>
#include <cctype>
#include <string>

namespace fs = std::filesystem;

namespace discconv::conv {

namespace grp {

    struct inputs {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Inputs";
    };

} // namespace grp

namespace {

    bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs) {
        return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), [](unsigned char a, unsigned char b) {
            return std::tolower(a) == std::tolower(b);
        });
    }

    template <typename TIterator>
    void Collect(TIterator it, std::string_view extension, std::vector<fs::path> &out, std::error_code &error) {
        for (auto end = TIterator{}; it != end; it.increment(error)) {
            if (error) {
                return;
            }
            std::error_code statErr{};
            if (!it->is_regular_file(statErr)) {
                continue;
            }
            const std::string ext = it->path().extension().string();
            if (ext.size() > 1 && EqualsIgnoreCase(std::string_view{ext}.substr(1), extension)) {
                out.push_back(it->path());
            }
        }
    }

} // namespace

std::vector<fs::path> CollectDirectory(const fs::path &root, std::string_view extension, bool recursive,
                                       std::error_code &error) {
    if (extension.starts_with('.')) {
        extension.remove_prefix(1);
    }

    std::vector<fs::path> out{};
    if (recursive) {
        fs::recursive_directory_iterator it{root, fs::directory_options::skip_permission_denied, error};
        if (error) {
            return {};
        }
        Collect(std::move(it), extension, out, error);
    } else {
        fs::directory_iterator it{root, fs::directory_options::skip_permission_denied, error};
        if (error) {
            return {};
        }
        Collect(std::move(it), extension, out, error);
    }
    if (error) {
        return {};
    }

    std::sort(out.begin(), out.end());
    devlog::debug<grp::inputs>("{}: {} .{} file(s){}", root.string(), out.size(), extension,
                               recursive ? " (recursive)" : "");
    return out;
}

bool WildcardMatch(std::string_view pattern, std::string_view name) {
    // Iterative matcher with single-star backtracking
    size_t p = 0;
    size_t n = 0;
    size_t starPos = std::string_view::npos;
    size_t starMatch = 0;
    while (n < name.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == name[n])) {
            p++;
            n++;
        } else if (p < pattern.size() && pattern[p] == '*') {
            starPos = p++;
            starMatch = n;
        } else if (starPos != std::string_view::npos) {
            p = starPos + 1;
            n = ++starMatch;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') {
        p++;
    }
    return p == pattern.size();
}

std::vector<fs::path> ExpandPattern(const fs::path &pattern) {
    const std::string filePattern = pattern.filename().string();
    if (filePattern.find_first_of("*?") == std::string::npos) {
        std::error_code err{};
        if (fs::is_regular_file(pattern, err)) {
            return {pattern};
        }
        return {};
    }

    fs::path dir = pattern.parent_path();
    const bool relative = dir.empty();
    if (relative) {
        dir = ".";
    }

    std::vector<fs::path> out{};
    std::error_code err{};
    for (fs::directory_iterator it{dir, err}, end{}; !err && it != end; it.increment(err)) {
        std::error_code statErr{};
        if (!it->is_regular_file(statErr)) {
            continue;
        }
        const fs::path name = it->path().filename();
        if (WildcardMatch(filePattern, name.string())) {
            out.push_back(relative ? name : it->path());
        }
    }

    std::sort(out.begin(), out.end());
    devlog::debug<grp::inputs>("Pattern {} matched {} file(s)", pattern.string(), out.size());
    return out;
}

} // namespace discconv::conv
