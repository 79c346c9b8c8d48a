#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <discconv/conv/dispatcher.hpp>

#include <discconv/media/cue_sheet.hpp>

#include "temp_dir.hpp"

#include <vector>

using namespace discconv;
using namespace discconv::conv;

using namespace core::config::conv;

namespace dispatcher_tests {

// Records codec calls and writes placeholder outputs.
struct FakeCodec : IDiscCodec {
    struct Call {
        std::string op;
        std::filesystem::path source;
        std::filesystem::path dest;
        bool overwrite;
    };

    std::vector<Call> calls;
    ConversionResult nextResult = ConversionResult::Success();
    ConversionResult inspectResult = ConversionResult::Success();

    ConversionResult Compress(const std::filesystem::path &source, const std::filesystem::path &dest,
                              bool overwrite) override {
        calls.push_back({"compress", source, dest, overwrite});
        testutil::WriteText(dest, "CHD");
        return nextResult;
    }

    ConversionResult Extract(const std::filesystem::path &source, const std::filesystem::path &dest,
                             bool overwrite) override {
        calls.push_back({"extract", source, dest, overwrite});
        auto binPath = dest;
        binPath.replace_extension(".bin");
        testutil::WriteBytes(binPath, testutil::MakeRawSectors(1));
        testutil::WriteText(dest, media::FormatCueSheet(binPath.filename().string()));
        return nextResult;
    }

    ConversionResult Inspect(const std::filesystem::path &path) override {
        calls.push_back({"inspect", path, {}, false});
        return inspectResult;
    }
};

struct TestSubject {
    testutil::TempDir dir{};
    core::Configuration config{};
    FakeCodec codec{};
    Dispatcher dispatcher{config, codec};

    JobReport Convert(const std::filesystem::path &input, const std::filesystem::path &output = {}) {
        return dispatcher.Dispatch(dispatcher.Plan(input, output));
    }

    void WriteSheet(std::string_view cueName, std::string_view binName, std::string_view mode) {
        testutil::WriteText(dir / cueName,
                            "FILE \"" + std::string{binName} + "\" BINARY\n  TRACK 01 " + std::string{mode} +
                                "\n    INDEX 01 00:00:00\n");
    }
};

TEST_CASE_METHOD(TestSubject, "Jobs are planned from the input extension", "[dispatcher][plan]") {
    struct TestData {
        std::string_view input;
        TargetFormat target;
        Direction direction;
        std::string_view output;
    };

    const auto &testData = GENERATE(values<TestData>({
        {"a.cue", TargetFormat::Auto, Direction::CueToIso, "a.iso"},
        {"a.CUE", TargetFormat::Auto, Direction::CueToIso, "a.iso"},
        {"a.iso", TargetFormat::Auto, Direction::IsoToBinCue, "a.bin"},
        {"a.bin", TargetFormat::Auto, Direction::BinToIso, "a.iso"},
        {"a.chd", TargetFormat::Auto, Direction::ChdToCue, "a.cue"},
        {"a.cue", TargetFormat::CHD, Direction::ToChd, "a.chd"},
        {"a.iso", TargetFormat::CHD, Direction::ToChd, "a.chd"},
        {"a.bin", TargetFormat::CHD, Direction::ToChd, "a.chd"},
        {"a.chd", TargetFormat::CHD, Direction::ChdToCue, "a.cue"},
        {"a.txt", TargetFormat::Auto, Direction::Skip, ""},
    }));

    config.conversion.target = testData.target;
    const auto job = dispatcher.Plan(dir / testData.input);
    CHECK(job.direction == testData.direction);
    if (!testData.output.empty()) {
        CHECK(job.outputPath == dir / testData.output);
    }

    const auto explicitJob = dispatcher.Plan(dir / testData.input, dir / "custom.out");
    if (testData.direction != Direction::Skip) {
        CHECK(explicitJob.outputPath == dir / "custom.out");
    }
}

TEST_CASE_METHOD(TestSubject, "CUE sheets are converted to ISO", "[dispatcher][cue]") {
    const auto mode = GENERATE(as<std::string_view>{}, "MODE1/2352", "MODE1/2048");
    const bool raw = mode == "MODE1/2352";

    const std::vector<uint8> rawData = testutil::MakeRawSectors(3);
    std::vector<uint8> userData{};
    for (uint32 i = 0; i < 3; i++) {
        userData.insert(userData.end(), 2048, static_cast<uint8>(i + 1));
    }
    testutil::WriteBytes(dir / "Game Disc.bin", raw ? rawData : userData);
    WriteSheet("game.cue", "Game Disc.bin", mode);

    const auto report = Convert(dir / "game.cue");
    REQUIRE(report.result.Succeeded());
    CHECK(report.job.direction == Direction::CueToIso);
    CHECK(report.outputs == std::vector<std::filesystem::path>{dir / "game.iso"});
    CHECK(report.stats.sectors == 3);
    CHECK(testutil::ReadBytes(dir / "game.iso") == userData);
}

TEST_CASE_METHOD(TestSubject, "BIN files are converted to ISO", "[dispatcher][bin]") {
    testutil::WriteBytes(dir / "track.bin", testutil::MakeRawSectors(2));

    const auto report = Convert(dir / "track.bin");
    REQUIRE(report.result.Succeeded());
    const auto iso = testutil::ReadBytes(dir / "track.iso");
    REQUIRE(iso.size() == 2 * 2048);
    CHECK(iso.front() == 0x01);
    CHECK(iso.back() == 0x02);
}

TEST_CASE_METHOD(TestSubject, "ISO files are converted to BIN and CUE", "[dispatcher][iso]") {
    testutil::WriteBytes(dir / "disc.iso", std::vector<uint8>(4 * 2048, 0x7E));

    const auto report = Convert(dir / "disc.iso");
    REQUIRE(report.result.Succeeded());
    CHECK(report.outputs == std::vector<std::filesystem::path>{dir / "disc.bin", dir / "disc.cue"});
    CHECK(std::filesystem::file_size(dir / "disc.bin") == 4 * 2352);
    CHECK(testutil::ReadText(dir / "disc.cue") == media::FormatCueSheet("disc.bin"));

    // The generated pair converts back to the original user data
    std::filesystem::remove(dir / "disc.iso");
    const auto back = Convert(dir / "disc.cue");
    REQUIRE(back.result.Succeeded());
    CHECK(testutil::ReadBytes(dir / "disc.iso") == std::vector<uint8>(4 * 2048, 0x7E));
}

TEST_CASE_METHOD(TestSubject, "Invalid sheets fail before any output is created", "[dispatcher][cue]") {
    testutil::WriteBytes(dir / "a.bin", testutil::MakeRawSectors(1));

    SECTION("Audio track") {
        WriteSheet("a.cue", "a.bin", "AUDIO");
        CHECK(Convert(dir / "a.cue").result.type == ConversionResult::Type::UnsupportedTrack);
    }
    SECTION("Unsupported mode") {
        WriteSheet("a.cue", "a.bin", "MODE2/2352");
        CHECK(Convert(dir / "a.cue").result.type == ConversionResult::Type::UnsupportedSectorMode);
    }
    SECTION("Missing FILE") {
        testutil::WriteText(dir / "a.cue", "  TRACK 01 MODE1/2352\n");
        CHECK(Convert(dir / "a.cue").result.type == ConversionResult::Type::InvalidCue);
    }
    SECTION("Missing binary") {
        WriteSheet("a.cue", "missing.bin", "MODE1/2352");
        CHECK(Convert(dir / "a.cue").result.type == ConversionResult::Type::IOError);
    }

    CHECK_FALSE(std::filesystem::exists(dir / "a.iso"));
}

TEST_CASE_METHOD(TestSubject, "Existing destinations are left untouched under the Fail policy",
                 "[dispatcher][overwrite]") {
    testutil::WriteBytes(dir / "track.bin", testutil::MakeRawSectors(2));
    testutil::WriteText(dir / "track.iso", "keep me");

    const auto report = Convert(dir / "track.bin");
    CHECK(report.result.type == ConversionResult::Type::DestinationExists);
    CHECK(report.result.path == dir / "track.iso");
    CHECK(report.outputs.empty());
    CHECK(testutil::ReadText(dir / "track.iso") == "keep me");

    config.conversion.overwritePolicy = OverwritePolicy::Force;
    REQUIRE(Convert(dir / "track.bin").result.Succeeded());
    CHECK(std::filesystem::file_size(dir / "track.iso") == 2 * 2048);
}

TEST_CASE_METHOD(TestSubject, "ISO conversion checks both outputs before writing", "[dispatcher][overwrite]") {
    testutil::WriteBytes(dir / "disc.iso", std::vector<uint8>(2048, 0x11));
    testutil::WriteText(dir / "disc.cue", "existing sheet");

    const auto report = Convert(dir / "disc.iso");
    CHECK(report.result.type == ConversionResult::Type::DestinationExists);
    CHECK(report.result.path == dir / "disc.cue");
    CHECK_FALSE(std::filesystem::exists(dir / "disc.bin"));
    CHECK(testutil::ReadText(dir / "disc.cue") == "existing sheet");
}

TEST_CASE("Prompted answers are reused for the rest of the run", "[dispatcher][overwrite]") {
    testutil::TempDir dir{};
    testutil::WriteBytes(dir / "track.bin", testutil::MakeRawSectors(1));
    testutil::WriteText(dir / "track.iso", "old");

    int asked = 0;
    core::Configuration config{};
    config.conversion.overwritePolicy = OverwritePolicy::Prompt;
    config.confirmOverwrite = [&](const std::filesystem::path &) {
        asked++;
        return true;
    };
    FakeCodec codec{};
    Dispatcher dispatcher{config, codec};

    const auto reports = dispatcher.RunBatch({dir / "track.bin", dir / "track.bin"});
    REQUIRE(reports.size() == 2);
    CHECK(reports[0].result.Succeeded());
    CHECK(reports[1].result.Succeeded());
    CHECK(asked == 1);
}

TEST_CASE_METHOD(TestSubject, "A destination that resolves to the source is rejected", "[dispatcher]") {
    testutil::WriteBytes(dir / "track.bin", testutil::MakeRawSectors(1));
    config.conversion.overwritePolicy = OverwritePolicy::Force;

    const auto report = Convert(dir / "track.bin", dir / "." / "track.bin");
    CHECK(report.result.type == ConversionResult::Type::DestinationIsSource);
    CHECK(std::filesystem::file_size(dir / "track.bin") == 2352);
}

TEST_CASE_METHOD(TestSubject, "A CUE sheet is never overwritten by its own conversion", "[dispatcher][cue]") {
    testutil::WriteBytes(dir / "g.bin", testutil::MakeRawSectors(1));
    WriteSheet("g.cue", "g.bin", "MODE1/2352");
    const std::string sheet = testutil::ReadText(dir / "g.cue");
    config.conversion.overwritePolicy = OverwritePolicy::Force;

    SECTION("Sheet as ISO destination") {
        const auto report = Convert(dir / "g.cue", dir / "g.cue");
        CHECK(report.result.type == ConversionResult::Type::DestinationIsSource);
        CHECK(report.outputs.empty());
    }

    SECTION("Referenced BIN as CHD destination") {
        config.conversion.target = TargetFormat::CHD;
        const auto report = Convert(dir / "g.cue", dir / "g.bin");
        CHECK(report.result.type == ConversionResult::Type::DestinationIsSource);
        CHECK(codec.calls.empty());
        CHECK(std::filesystem::file_size(dir / "g.bin") == 2352);
    }

    CHECK(testutil::ReadText(dir / "g.cue") == sheet);
}

TEST_CASE_METHOD(TestSubject, "ISO output named after the sheet still produces a BIN and CUE pair",
                 "[dispatcher][iso]") {
    testutil::WriteBytes(dir / "disc.iso", std::vector<uint8>(2 * 2048, 0x11));

    const auto report = Convert(dir / "disc.iso", dir / "out.cue");
    REQUIRE(report.result.Succeeded());
    CHECK(report.outputs == std::vector<std::filesystem::path>{dir / "out.bin", dir / "out.cue"});
    CHECK(std::filesystem::file_size(dir / "out.bin") == 2 * 2352);
    CHECK(testutil::ReadText(dir / "out.cue") == media::FormatCueSheet("out.bin"));
}

TEST_CASE_METHOD(TestSubject, "CHD output named after the BIN still produces a CUE and BIN pair",
                 "[dispatcher][chd]") {
    testutil::WriteText(dir / "disc.chd", "CHD");

    const auto report = Convert(dir / "disc.chd", dir / "out.bin");
    REQUIRE(report.result.Succeeded());
    CHECK(report.outputs == std::vector<std::filesystem::path>{dir / "out.cue", dir / "out.bin"});
    REQUIRE(codec.calls.size() == 2);
    CHECK(codec.calls[1].op == "extract");
    CHECK(codec.calls[1].dest == dir / "out.cue");
    CHECK(std::filesystem::file_size(dir / "out.bin") == 2352);
    CHECK(testutil::ReadText(dir / "out.cue") == media::FormatCueSheet("out.bin"));
}

TEST_CASE_METHOD(TestSubject, "Strict mode rejects misaligned sources without writing", "[dispatcher][partial]") {
    auto raw = testutil::MakeRawSectors(2);
    raw.push_back(0xFF);
    testutil::WriteBytes(dir / "odd.bin", raw);

    SECTION("Lenient") {
        const auto report = Convert(dir / "odd.bin");
        REQUIRE(report.result.Succeeded());
        CHECK(report.stats.trailingBytes == 1);
        CHECK(std::filesystem::file_size(dir / "odd.iso") == 2 * 2048);
    }

    SECTION("Strict") {
        config.conversion.partialSectorPolicy = PartialSectorPolicy::Reject;
        const auto report = Convert(dir / "odd.bin");
        CHECK(report.result.type == ConversionResult::Type::MisalignedSource);
        CHECK_FALSE(std::filesystem::exists(dir / "odd.iso"));
    }
}

TEST_CASE_METHOD(TestSubject, "Failed jobs leave no output behind", "[dispatcher]") {
    SECTION("Destination cannot be created") {
        testutil::WriteBytes(dir / "track.bin", testutil::MakeRawSectors(1));

        const auto report = Convert(dir / "track.bin", dir / "missing" / "track.iso");
        CHECK(report.result.type == ConversionResult::Type::IOError);
        CHECK(report.outputs.empty());
        CHECK_FALSE(std::filesystem::exists(dir / "missing" / "track.iso"));
    }

    SECTION("Companion sheet cannot be written") {
        testutil::WriteBytes(dir / "disc.iso", std::vector<uint8>(2 * 2048, 0x22));
        std::filesystem::create_directories(dir / "disc.cue");
        config.conversion.overwritePolicy = OverwritePolicy::Force;

        const auto report = Convert(dir / "disc.iso");
        CHECK(report.result.type == ConversionResult::Type::IOError);
        CHECK(report.result.path == dir / "disc.cue");
        CHECK_FALSE(std::filesystem::exists(dir / "disc.bin"));
        CHECK(std::filesystem::is_directory(dir / "disc.cue"));
    }
}

TEST_CASE_METHOD(TestSubject, "Unsupported files are skipped", "[dispatcher]") {
    testutil::WriteText(dir / "readme.txt", "hello");
    const auto report = Convert(dir / "readme.txt");
    CHECK(report.result.type == ConversionResult::Type::Skipped);
    CHECK_FALSE(report.result.Failed());
}

TEST_CASE_METHOD(TestSubject, "Batch error policy controls whether failures stop the run", "[dispatcher][batch]") {
    testutil::WriteBytes(dir / "a.bin", testutil::MakeRawSectors(1));
    WriteSheet("b.cue", "b.bin", "AUDIO");
    testutil::WriteText(dir / "c.txt", "");
    testutil::WriteBytes(dir / "d.bin", testutil::MakeRawSectors(1));
    const std::vector<std::filesystem::path> inputs{dir / "a.bin", dir / "b.cue", dir / "c.txt", dir / "d.bin"};

    std::vector<Direction> seen{};
    const auto record = [&](const JobReport &report) { seen.push_back(report.job.direction); };

    SECTION("Continue on error") {
        const auto reports = dispatcher.RunBatch(inputs, {}, record);
        REQUIRE(reports.size() == 4);
        CHECK(reports[0].result.Succeeded());
        CHECK(reports[1].result.type == ConversionResult::Type::UnsupportedTrack);
        CHECK(reports[2].result.type == ConversionResult::Type::Skipped);
        CHECK(reports[3].result.Succeeded());
        CHECK(seen.size() == 4);
        CHECK(std::filesystem::exists(dir / "d.iso"));
    }

    SECTION("Stop on error") {
        config.conversion.batchErrorPolicy = BatchErrorPolicy::StopOnError;
        const auto reports = dispatcher.RunBatch(inputs, {}, record);
        REQUIRE(reports.size() == 2);
        CHECK(reports[1].result.Failed());
        CHECK(seen.size() == 2);
        CHECK_FALSE(std::filesystem::exists(dir / "d.iso"));
    }
}

TEST_CASE_METHOD(TestSubject, "CHD conversions go through the codec", "[dispatcher][chd]") {
    SECTION("Compress") {
        config.conversion.target = TargetFormat::CHD;
        testutil::WriteBytes(dir / "disc.iso", std::vector<uint8>(2048, 0));

        const auto report = Convert(dir / "disc.iso");
        REQUIRE(report.result.Succeeded());
        REQUIRE(codec.calls.size() == 1);
        CHECK(codec.calls[0].op == "compress");
        CHECK(codec.calls[0].dest == dir / "disc.chd");
        CHECK_FALSE(codec.calls[0].overwrite);
    }

    SECTION("Compress rejects unsupported sheets before running the codec") {
        config.conversion.target = TargetFormat::CHD;
        WriteSheet("music.cue", "music.bin", "AUDIO");

        const auto report = Convert(dir / "music.cue");
        CHECK(report.result.type == ConversionResult::Type::UnsupportedTrack);
        CHECK(codec.calls.empty());
    }

    SECTION("Codec failure removes the new container") {
        config.conversion.target = TargetFormat::CHD;
        testutil::WriteBytes(dir / "disc.iso", std::vector<uint8>(2048, 0));
        codec.nextResult = ConversionResult::ToolFailed(dir / "disc.iso", 1);

        const auto report = Convert(dir / "disc.iso");
        CHECK(report.result.type == ConversionResult::Type::ToolFailed);
        CHECK_FALSE(std::filesystem::exists(dir / "disc.chd"));
    }

    SECTION("Extract") {
        testutil::WriteText(dir / "disc.chd", "CHD");

        const auto report = Convert(dir / "disc.chd");
        REQUIRE(report.result.Succeeded());
        REQUIRE(codec.calls.size() == 2);
        CHECK(codec.calls[0].op == "inspect");
        CHECK(codec.calls[1].op == "extract");
        CHECK(report.outputs == std::vector<std::filesystem::path>{dir / "disc.cue", dir / "disc.bin"});
    }

    SECTION("Extract stops when the container is not supported") {
        testutil::WriteText(dir / "disc.chd", "CHD");
        codec.inspectResult = ConversionResult::UnsupportedTrack(dir / "disc.chd");

        const auto report = Convert(dir / "disc.chd");
        CHECK(report.result.type == ConversionResult::Type::UnsupportedTrack);
        REQUIRE(codec.calls.size() == 1);
        CHECK_FALSE(std::filesystem::exists(dir / "disc.cue"));
    }

    SECTION("Extract honors the overwrite policy for the binary") {
        testutil::WriteText(dir / "disc.chd", "CHD");
        testutil::WriteText(dir / "disc.bin", "keep");

        const auto report = Convert(dir / "disc.chd");
        CHECK(report.result.type == ConversionResult::Type::DestinationExists);
        CHECK(report.result.path == dir / "disc.bin");
        CHECK(testutil::ReadText(dir / "disc.bin") == "keep");
    }
}

} // namespace dispatcher_tests
