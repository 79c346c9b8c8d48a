#pragma once

#include <discconv/core/types.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace testutil {

// A uniquely named directory under the system temporary directory, removed with its contents on destruction.
class TempDir {
public:
    TempDir() {
        std::random_device rd{};
        std::mt19937_64 rng{rd()};
        const auto base = std::filesystem::temp_directory_path();
        for (int attempt = 0; attempt < 16; attempt++) {
            auto candidate = base / ("discconv-tests-" + std::to_string(rng()));
            if (std::filesystem::create_directory(candidate)) {
                m_path = std::move(candidate);
                return;
            }
        }
        throw std::runtime_error("could not create temporary directory");
    }

    ~TempDir() {
        std::error_code err{};
        std::filesystem::remove_all(m_path, err);
    }

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const std::filesystem::path &Path() const {
        return m_path;
    }

    std::filesystem::path operator/(std::string_view name) const {
        return m_path / name;
    }

private:
    std::filesystem::path m_path;
};

inline void WriteBytes(const std::filesystem::path &path, const std::vector<uint8> &data) {
    std::ofstream out{path, std::ios::binary | std::ios::trunc};
    out.write(reinterpret_cast<const char *>(data.data()), data.size());
}

inline void WriteText(const std::filesystem::path &path, std::string_view text) {
    std::ofstream out{path, std::ios::binary | std::ios::trunc};
    out.write(text.data(), text.size());
}

inline std::vector<uint8> ReadBytes(const std::filesystem::path &path) {
    std::ifstream in{path, std::ios::binary};
    return {std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
}

inline std::string ReadText(const std::filesystem::path &path) {
    std::ifstream in{path, std::ios::binary};
    return {std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
}

// Builds `count` raw 2352-byte sectors whose user data area is filled with the sector index + 1 and whose envelope
// bytes are 0xEE.
inline std::vector<uint8> MakeRawSectors(uint32 count) {
    std::vector<uint8> data(count * 2352u, 0xEE);
    for (uint32 i = 0; i < count; i++) {
        std::fill_n(data.begin() + i * 2352u + 16u, 2048u, static_cast<uint8>(i + 1));
    }
    return data;
}

} // namespace testutil
