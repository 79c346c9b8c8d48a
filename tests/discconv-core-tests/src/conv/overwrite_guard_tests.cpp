#include <catch2/catch_test_macros.hpp>

#include <discconv/conv/overwrite_guard.hpp>

#include "temp_dir.hpp"

#include <vector>

using namespace discconv;
using namespace discconv::conv;

using core::config::conv::OverwritePolicy;

namespace overwrite_guard {

TEST_CASE("Missing destinations can always be written", "[overwrite]") {
    testutil::TempDir dir{};
    int asked = 0;
    for (auto policy : {OverwritePolicy::Fail, OverwritePolicy::Force, OverwritePolicy::Prompt}) {
        OverwriteGuard guard{policy, [&](const std::filesystem::path &) {
                                 asked++;
                                 return false;
                             }};
        CHECK(guard.Check(dir / "new.iso") == OverwriteDecision::Write);
    }
    CHECK(asked == 0);
}

TEST_CASE("Existing destinations follow the overwrite policy", "[overwrite]") {
    testutil::TempDir dir{};
    const auto path = dir / "out.iso";
    testutil::WriteText(path, "existing");

    SECTION("Fail denies") {
        OverwriteGuard guard{OverwritePolicy::Fail, {}};
        CHECK(guard.Check(path) == OverwriteDecision::Denied);
    }

    SECTION("Force allows") {
        OverwriteGuard guard{OverwritePolicy::Force, {}};
        CHECK(guard.Check(path) == OverwriteDecision::Write);
    }

    SECTION("Prompt without a confirmation function denies") {
        OverwriteGuard guard{OverwritePolicy::Prompt, {}};
        CHECK(guard.Check(path) == OverwriteDecision::Denied);
    }

    SECTION("Prompt follows the answer") {
        const bool answer = true;
        OverwriteGuard guard{OverwritePolicy::Prompt, [&](const std::filesystem::path &) { return answer; }};
        CHECK(guard.Check(path) == OverwriteDecision::Write);
    }

    // Checking never touches the file
    CHECK(testutil::ReadText(path) == "existing");
}

TEST_CASE("Prompt asks once per destination path", "[overwrite]") {
    testutil::TempDir dir{};
    const auto first = dir / "a.bin";
    const auto second = dir / "a.cue";
    testutil::WriteText(first, "a");
    testutil::WriteText(second, "b");

    std::vector<std::filesystem::path> asked{};
    OverwriteGuard guard{OverwritePolicy::Prompt, [&](const std::filesystem::path &path) {
                             asked.push_back(path);
                             return path.extension() == ".bin";
                         }};

    CHECK(guard.Check(first) == OverwriteDecision::Write);
    CHECK(guard.Check(second) == OverwriteDecision::Denied);
    CHECK(guard.Check(first) == OverwriteDecision::Write);
    CHECK(guard.Check(dir.Path() / "." / "a.bin") == OverwriteDecision::Write);
    CHECK(guard.Check(second) == OverwriteDecision::Denied);

    REQUIRE(asked.size() == 2);
    CHECK(asked[0] == first);
    CHECK(asked[1] == second);
}

TEST_CASE("Policy changes apply to later checks", "[overwrite]") {
    testutil::TempDir dir{};
    const auto path = dir / "out.iso";
    testutil::WriteText(path, "existing");

    OverwriteGuard guard{OverwritePolicy::Fail, {}};
    CHECK(guard.Check(path) == OverwriteDecision::Denied);
    guard.SetPolicy(OverwritePolicy::Force);
    CHECK(guard.GetPolicy() == OverwritePolicy::Force);
    CHECK(guard.Check(path) == OverwriteDecision::Write);
}

} // namespace overwrite_guard
