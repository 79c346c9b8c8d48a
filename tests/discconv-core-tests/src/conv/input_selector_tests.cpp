#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <discconv/conv/input_selector.hpp>

#include "temp_dir.hpp"

using namespace discconv;
using namespace discconv::conv;

namespace input_selector {

TEST_CASE("Wildcards match file names", "[inputs][wildcard]") {
    struct TestData {
        std::string_view pattern;
        std::string_view name;
        bool matches;
    };

    const auto &testData = GENERATE(values<TestData>({
        {"*.cue", "game.cue", true},
        {"*.cue", "game.iso", false},
        {"*.cue", ".cue", true},
        {"cd_00?.cue", "cd_001.cue", true},
        {"cd_00?.cue", "cd_0010.cue", false},
        {"*", "", true},
        {"", "", true},
        {"", "a", false},
        {"a*b*c", "aXXbYYc", true},
        {"a*b*c", "aXXbYY", false},
        {"*disc*", "my disc 1.bin", true},
        {"??", "a", false},
        {"exact.iso", "exact.iso", true},
    }));

    CAPTURE(testData.pattern, testData.name);
    CHECK(WildcardMatch(testData.pattern, testData.name) == testData.matches);
}

TEST_CASE("Directory selection filters by extension", "[inputs][directory]") {
    testutil::TempDir dir{};
    std::filesystem::create_directories(dir / "sub" / "deeper");
    testutil::WriteText(dir / "b.cue", "");
    testutil::WriteText(dir / "a.CUE", "");
    testutil::WriteText(dir / "c.iso", "");
    testutil::WriteText(dir / "sub" / "d.cue", "");
    testutil::WriteText(dir / "sub" / "deeper" / "e.cue", "");
    std::filesystem::create_directories(dir / "folder.cue");

    SECTION("Non-recursive") {
        const auto extension = GENERATE(as<std::string_view>{}, "cue", ".cue", "CUE");
        std::error_code err{};
        const auto files = CollectDirectory(dir.Path(), extension, false, err);
        CHECK_FALSE(err);
        REQUIRE(files.size() == 2);
        CHECK(files[0] == dir / "a.CUE");
        CHECK(files[1] == dir / "b.cue");
    }

    SECTION("Recursive") {
        std::error_code err{};
        const auto files = CollectDirectory(dir.Path(), "cue", true, err);
        CHECK_FALSE(err);
        REQUIRE(files.size() == 4);
        CHECK(std::is_sorted(files.begin(), files.end()));
        CHECK(std::find(files.begin(), files.end(), dir / "sub" / "deeper" / "e.cue") != files.end());
    }
}

TEST_CASE("Non-recursive selection ignores matches in subdirectories", "[inputs][directory]") {
    testutil::TempDir dir{};
    std::filesystem::create_directories(dir / "sub");
    testutil::WriteText(dir / "sub" / "only.iso", "");

    std::error_code err{};
    CHECK(CollectDirectory(dir.Path(), "iso", false, err).empty());
    CHECK_FALSE(err);
    CHECK(CollectDirectory(dir.Path(), "iso", true, err).size() == 1);
}

TEST_CASE("Missing directories report an error", "[inputs][directory]") {
    testutil::TempDir dir{};
    std::error_code err{};
    CHECK(CollectDirectory(dir / "missing", "cue", false, err).empty());
    CHECK(err);
}

TEST_CASE("Patterns expand to matching files", "[inputs][pattern]") {
    testutil::TempDir dir{};
    testutil::WriteText(dir / "cd_002.cue", "");
    testutil::WriteText(dir / "cd_001.cue", "");
    testutil::WriteText(dir / "cd_001.bin", "");
    std::filesystem::create_directories(dir / "cd_003.cue");

    SECTION("Wildcard") {
        const auto files = ExpandPattern(dir / "cd_*.cue");
        REQUIRE(files.size() == 2);
        CHECK(files[0] == dir / "cd_001.cue");
        CHECK(files[1] == dir / "cd_002.cue");
    }

    SECTION("Literal path") {
        const auto files = ExpandPattern(dir / "cd_001.bin");
        REQUIRE(files.size() == 1);
        CHECK(files[0] == dir / "cd_001.bin");
    }

    SECTION("No match") {
        CHECK(ExpandPattern(dir / "*.iso").empty());
        CHECK(ExpandPattern(dir / "missing.iso").empty());
        CHECK(ExpandPattern(dir / "cd_003.cue").empty());
    }
}

} // namespace input_selector
