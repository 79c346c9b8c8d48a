#include <discconv/util/process.hpp>

#include <cstdlib>

#ifdef _WIN32
    #ifndef WIN32_LEAN_AND_MEAN
        #define WIN32_LEAN_AND_MEAN
    #endif
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
    #include <Windows.h>
#else
    #include <cerrno>
    #include <spawn.h>
    #include <sys/stat.h>
    #include <sys/wait.h>
    #include <unistd.h>

extern char **environ;
#endif

namespace util {

namespace {

#ifdef _WIN32
    constexpr char kPathSeparator = ';';
#else
    constexpr char kPathSeparator = ':';
#endif

    bool IsExecutableFile(const std::filesystem::path &path) {
        std::error_code err{};
        if (!std::filesystem::is_regular_file(path, err)) {
            return false;
        }
#ifdef _WIN32
        return true;
#else
        return access(path.c_str(), X_OK) == 0;
#endif
    }

    std::vector<std::string> SplitList(std::string_view list, char separator) {
        std::vector<std::string> out{};
        while (!list.empty()) {
            const auto pos = list.find(separator);
            auto item = list.substr(0, pos);
            if (!item.empty()) {
                out.emplace_back(item);
            }
            if (pos == std::string_view::npos) {
                break;
            }
            list.remove_prefix(pos + 1);
        }
        return out;
    }

#ifdef _WIN32
    // Quotes an argument following the rules of CommandLineToArgvW
    std::wstring QuoteArgument(const std::wstring &arg) {
        if (!arg.empty() && arg.find_first_of(L" \t\n\v\"") == std::wstring::npos) {
            return arg;
        }
        std::wstring out = L"\"";
        size_t backslashes = 0;
        for (wchar_t ch : arg) {
            if (ch == L'\\') {
                backslashes++;
            } else if (ch == L'"') {
                out.append(backslashes * 2 + 1, L'\\');
                out.push_back(ch);
                backslashes = 0;
            } else {
                out.append(backslashes, L'\\');
                out.push_back(ch);
                backslashes = 0;
            }
        }
        out.append(backslashes * 2, L'\\');
        out.push_back(L'"');
        return out;
    }
#endif

} // namespace

std::optional<std::filesystem::path> FindExecutableInPath(std::string_view name) {
    const std::filesystem::path namePath{name};
    if (namePath.has_parent_path()) {
        if (IsExecutableFile(namePath)) {
            return namePath;
        }
        return std::nullopt;
    }

    const char *pathEnv = std::getenv("PATH");
    if (pathEnv == nullptr) {
        return std::nullopt;
    }

    std::vector<std::string> extensions{""};
#ifdef _WIN32
    if (!namePath.has_extension()) {
        const char *pathExtEnv = std::getenv("PATHEXT");
        extensions = SplitList(pathExtEnv != nullptr ? pathExtEnv : ".EXE;.COM;.BAT;.CMD", ';');
    }
#endif

    for (const auto &dir : SplitList(pathEnv, kPathSeparator)) {
        for (const auto &ext : extensions) {
            std::filesystem::path candidate = std::filesystem::path{dir} / name;
            candidate += ext;
            if (IsExecutableFile(candidate)) {
                return candidate;
            }
        }
    }
    return std::nullopt;
}

int RunProcess(const std::filesystem::path &program, const std::vector<std::string> &args, std::error_code &error) {
#ifdef _WIN32
    std::wstring cmdline = QuoteArgument(program.wstring());
    for (const auto &arg : args) {
        cmdline += L' ';
        cmdline += QuoteArgument(std::filesystem::path{arg}.wstring());
    }

    STARTUPINFOW si{};
    si.cb = sizeof(si);
    PROCESS_INFORMATION pi{};
    if (!CreateProcessW(program.c_str(), cmdline.data(), nullptr, nullptr, FALSE, 0, nullptr, nullptr, &si, &pi)) {
        error.assign(static_cast<int>(GetLastError()), std::system_category());
        return -1;
    }

    WaitForSingleObject(pi.hProcess, INFINITE);
    DWORD exitCode = 0;
    if (!GetExitCodeProcess(pi.hProcess, &exitCode)) {
        error.assign(static_cast<int>(GetLastError()), std::system_category());
        exitCode = static_cast<DWORD>(-1);
    }
    CloseHandle(pi.hThread);
    CloseHandle(pi.hProcess);
    return static_cast<int>(exitCode);
#else
    const std::string programStr = program.string();
    std::vector<char *> argv{};
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char *>(programStr.c_str()));
    for (const auto &arg : args) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid{};
    const int spawnResult = posix_spawn(&pid, programStr.c_str(), nullptr, nullptr, argv.data(), environ);
    if (spawnResult != 0) {
        error.assign(spawnResult, std::generic_category());
        return -1;
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            error.assign(errno, std::generic_category());
            return -1;
        }
    }

    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return -1;
#endif
}

} // namespace util
