#include <discconv/conv/dispatcher.hpp>

#include <discconv/media/cue_sheet.hpp>

#include <discconv/util/dev_log.hpp>
#include <discconv/util/scope_guard.hpp>

#include <cerrno>
#include <fstream>

namespace fs = std::filesystem;

namespace discconv::conv {

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    struct dispatch {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Dispatch";
    };

} // namespace grp

using namespace core::config::conv;

namespace {

    std::error_code LastError() {
        return errno != 0 ? std::error_code{errno, std::generic_category()} : std::make_error_code(std::errc::io_error);
    }

    // Removes a file written by a failed job. Anything other than a regular file is left alone.
    void RemoveQuietly(const fs::path &path) {
        std::error_code err{};
        if (!fs::is_regular_file(path, err)) {
            return;
        }
        fs::remove(path, err);
        if (err) {
            devlog::warn<grp::dispatch>("Could not remove partial output {}: {}", path.string(), err.message());
        } else {
            devlog::debug<grp::dispatch>("Removed partial output {}", path.string());
        }
    }

    bool RefersToSameFile(const fs::path &lhs, const fs::path &rhs) {
        std::error_code err{};
        if (fs::exists(lhs, err) && fs::exists(rhs, err)) {
            return fs::equivalent(lhs, rhs, err);
        }
        const fs::path lhsCanon = fs::weakly_canonical(lhs, err);
        if (err) {
            return lhs.lexically_normal() == rhs.lexically_normal();
        }
        const fs::path rhsCanon = fs::weakly_canonical(rhs, err);
        if (err) {
            return lhs.lexically_normal() == rhs.lexically_normal();
        }
        return lhsCanon == rhsCanon;
    }

    fs::path WithExtension(fs::path path, const char *extension) {
        path.replace_extension(extension);
        return path;
    }

    // Splits a requested output into its BIN/CUE pair. An output named after either half of the pair names that
    // half; anything else names the BIN file.
    struct BinCuePair {
        fs::path bin;
        fs::path cue;
    };

    BinCuePair SplitBinCue(const fs::path &output) {
        if (FormatFromPath(output) == ImageFormat::Cue) {
            return {.bin = WithExtension(output, ".bin"), .cue = output};
        }
        return {.bin = output, .cue = WithExtension(output, ".cue")};
    }

    // Same as SplitBinCue, but anything other than a BIN file names the CUE sheet.
    BinCuePair SplitCueBin(const fs::path &output) {
        if (FormatFromPath(output) == ImageFormat::Bin) {
            return {.bin = output, .cue = WithExtension(output, ".cue")};
        }
        return {.bin = WithExtension(output, ".bin"), .cue = output};
    }

} // namespace

Dispatcher::Dispatcher(const core::Configuration &config, IDiscCodec &codec)
    : m_config(config)
    , m_codec(codec)
    , m_overwriteGuard(config.conversion.overwritePolicy, config.confirmOverwrite) {}

ConversionJob Dispatcher::Plan(const fs::path &input, const fs::path &output) const {
    ConversionJob job{.inputPath = input};

    const ImageFormat format = FormatFromPath(input);
    const bool toChd = m_config.conversion.target == TargetFormat::CHD;

    auto resolve = [&](const char *extension) { return output.empty() ? WithExtension(input, extension) : output; };

    switch (format) {
    case ImageFormat::Chd:
        job.direction = Direction::ChdToCue;
        job.outputPath = resolve(".cue");
        break;
    case ImageFormat::Cue:
        job.direction = toChd ? Direction::ToChd : Direction::CueToIso;
        job.outputPath = resolve(toChd ? ".chd" : ".iso");
        break;
    case ImageFormat::Iso:
        job.direction = toChd ? Direction::ToChd : Direction::IsoToBinCue;
        job.outputPath = resolve(toChd ? ".chd" : ".bin");
        break;
    case ImageFormat::Bin:
        job.direction = toChd ? Direction::ToChd : Direction::BinToIso;
        job.outputPath = resolve(toChd ? ".chd" : ".iso");
        break;
    default: job.direction = Direction::Skip; break;
    }

    devlog::debug<grp::dispatch>("Planned {} for {} -> {}", ToString(job.direction), input.string(),
                                 job.outputPath.string());
    return job;
}

JobReport Dispatcher::Dispatch(const ConversionJob &job) {
    JobReport report{.job = job, .result = ConversionResult::Success()};

    m_overwriteGuard.SetPolicy(m_config.conversion.overwritePolicy);

    switch (job.direction) {
    case Direction::CueToIso: report.result = CueToIso(job, report); break;
    case Direction::BinToIso: report.result = BinToIso(job, report); break;
    case Direction::IsoToBinCue: report.result = IsoToBinCue(job, report); break;
    case Direction::ToChd: report.result = ToChd(job, report); break;
    case Direction::ChdToCue: report.result = ChdToCue(job, report); break;
    case Direction::Skip: [[fallthrough]];
    default:
        devlog::warn<grp::dispatch>("Skipping unsupported file {}", job.inputPath.string());
        report.result = ConversionResult::Skipped(job.inputPath);
        break;
    }

    if (!report.result) {
        report.outputs.clear();
        if (report.result.Failed()) {
            devlog::error<grp::dispatch>("{}", report.result.string());
        }
    }
    return report;
}

std::vector<JobReport> Dispatcher::RunBatch(const std::vector<fs::path> &inputs, const fs::path &output,
                                            const JobCallback &onJobDone) {
    std::vector<JobReport> reports{};
    reports.reserve(inputs.size());

    for (const auto &input : inputs) {
        JobReport &report = reports.emplace_back(Dispatch(Plan(input, output)));
        if (onJobDone) {
            onJobDone(report);
        }
        if (report.result.Failed() && m_config.conversion.batchErrorPolicy == BatchErrorPolicy::StopOnError) {
            devlog::info<grp::dispatch>("Stopping after failed job ({} of {})", reports.size(), inputs.size());
            break;
        }
    }
    return reports;
}

// -----------------------------------------------------------------------------
// Conversions

ConversionResult Dispatcher::CueToIso(const ConversionJob &job, JobReport &report) {
    media::CueDescriptor cue{};
    std::error_code err{};
    const auto parseResult = media::ParseCueSheet(job.inputPath, cue, err);
    if (parseResult != media::CueParseResult::Success) {
        return ConversionResult::FromCueParseResult(parseResult, job.inputPath, err);
    }

    const fs::path binPath = job.inputPath.parent_path() / cue.binFileName;
    devlog::debug<grp::dispatch>("{} references {} ({})", job.inputPath.string(), binPath.string(),
                                 media::ToCueTrackType(cue.mode));

    if (RefersToSameFile(job.inputPath, job.outputPath)) {
        return ConversionResult::DestinationIsSource(job.outputPath);
    }

    return ExtractUserData(binPath, job.outputPath, cue.mode, report);
}

ConversionResult Dispatcher::BinToIso(const ConversionJob &job, JobReport &report) {
    return ExtractUserData(job.inputPath, job.outputPath, media::SectorMode::Raw2352, report);
}

ConversionResult Dispatcher::ExtractUserData(const fs::path &source, const fs::path &dest, media::SectorMode mode,
                                             JobReport &report) {
    if (auto result = CheckSource(source); !result) {
        return result;
    }
    if (auto result = CheckAlignment(source, media::SectorSize(mode)); !result) {
        return result;
    }
    if (auto result = CheckDestination(source, dest); !result) {
        return result;
    }

    std::ifstream in{source, std::ios::binary};
    if (!in) {
        return ConversionResult::IOError(source, LastError());
    }
    std::ofstream out{dest, std::ios::binary | std::ios::trunc};
    if (!out) {
        return ConversionResult::IOError(dest, LastError());
    }
    util::ScopeGuard sgRemoveOutput{[&] {
        out.close();
        RemoveQuietly(dest);
    }};

    const auto result = media::RawToUser(in, out, mode, MakeTranscodeOptions(), report.stats);
    if (result != media::TranscodeResult::Success) {
        return ConversionResult::FromTranscodeResult(result, source, dest, LastError());
    }
    out.close();
    if (!out) {
        return ConversionResult::IOError(dest, LastError());
    }

    sgRemoveOutput.Cancel();
    report.outputs.push_back(dest);
    return ConversionResult::Success();
}

ConversionResult Dispatcher::IsoToBinCue(const ConversionJob &job, JobReport &report) {
    const BinCuePair pair = SplitBinCue(job.outputPath);
    const fs::path &binPath = pair.bin;
    const fs::path &cuePath = pair.cue;

    if (auto result = CheckSource(job.inputPath); !result) {
        return result;
    }
    if (auto result = CheckAlignment(job.inputPath, media::kUserDataSize); !result) {
        return result;
    }
    if (auto result = CheckDestination(job.inputPath, binPath); !result) {
        return result;
    }
    if (auto result = CheckDestination(job.inputPath, cuePath); !result) {
        return result;
    }

    std::ifstream in{job.inputPath, std::ios::binary};
    if (!in) {
        return ConversionResult::IOError(job.inputPath, LastError());
    }
    std::ofstream out{binPath, std::ios::binary | std::ios::trunc};
    if (!out) {
        return ConversionResult::IOError(binPath, LastError());
    }
    util::ScopeGuard sgRemoveBin{[&] {
        out.close();
        RemoveQuietly(binPath);
    }};

    const auto result = media::UserToRaw(in, out, MakeTranscodeOptions(), report.stats);
    if (result != media::TranscodeResult::Success) {
        return ConversionResult::FromTranscodeResult(result, job.inputPath, binPath, LastError());
    }
    out.close();
    if (!out) {
        return ConversionResult::IOError(binPath, LastError());
    }

    std::error_code err{};
    if (!media::WriteCueSheet(cuePath, binPath.filename().string(), err)) {
        RemoveQuietly(cuePath);
        return ConversionResult::IOError(cuePath, err);
    }

    sgRemoveBin.Cancel();
    report.outputs.push_back(binPath);
    report.outputs.push_back(cuePath);
    return ConversionResult::Success();
}

ConversionResult Dispatcher::ToChd(const ConversionJob &job, JobReport &report) {
    if (auto result = CheckSource(job.inputPath); !result) {
        return result;
    }
    if (FormatFromPath(job.inputPath) == ImageFormat::Cue) {
        // Apply the same single-track MODE1 rules to sheets handed to the codec
        media::CueDescriptor cue{};
        std::error_code err{};
        const auto parseResult = media::ParseCueSheet(job.inputPath, cue, err);
        if (parseResult != media::CueParseResult::Success) {
            return ConversionResult::FromCueParseResult(parseResult, job.inputPath, err);
        }
        if (RefersToSameFile(job.inputPath.parent_path() / cue.binFileName, job.outputPath)) {
            return ConversionResult::DestinationIsSource(job.outputPath);
        }
    }

    std::error_code err{};
    const bool existed = fs::exists(job.outputPath, err);
    if (auto result = CheckDestination(job.inputPath, job.outputPath); !result) {
        return result;
    }

    auto result = m_codec.Compress(job.inputPath, job.outputPath, existed);
    if (!result) {
        if (!existed) {
            RemoveQuietly(job.outputPath);
        }
        return result;
    }
    report.outputs.push_back(job.outputPath);
    return result;
}

ConversionResult Dispatcher::ChdToCue(const ConversionJob &job, JobReport &report) {
    const BinCuePair pair = SplitCueBin(job.outputPath);
    const fs::path &binPath = pair.bin;
    const fs::path &cuePath = pair.cue;

    if (auto result = CheckSource(job.inputPath); !result) {
        return result;
    }
    if (auto result = m_codec.Inspect(job.inputPath); !result) {
        return result;
    }

    std::error_code err{};
    const bool existed = fs::exists(cuePath, err) || fs::exists(binPath, err);
    if (auto result = CheckDestination(job.inputPath, cuePath); !result) {
        return result;
    }
    if (auto result = CheckDestination(job.inputPath, binPath); !result) {
        return result;
    }

    auto result = m_codec.Extract(job.inputPath, cuePath, existed);
    if (!result) {
        if (!existed) {
            RemoveQuietly(cuePath);
            RemoveQuietly(binPath);
        }
        return result;
    }
    report.outputs.push_back(cuePath);
    report.outputs.push_back(binPath);
    return result;
}

// -----------------------------------------------------------------------------
// Validation

ConversionResult Dispatcher::CheckSource(const fs::path &source) const {
    std::error_code err{};
    const auto status = fs::status(source, err);
    if (err) {
        return ConversionResult::IOError(source, err);
    }
    if (!fs::is_regular_file(status)) {
        return ConversionResult::IOError(source, std::make_error_code(std::errc::no_such_file_or_directory));
    }
    return ConversionResult::Success();
}

ConversionResult Dispatcher::CheckDestination(const fs::path &source, const fs::path &dest) {
    if (RefersToSameFile(source, dest)) {
        return ConversionResult::DestinationIsSource(dest);
    }
    if (m_overwriteGuard.Check(dest) == OverwriteDecision::Denied) {
        return ConversionResult::DestinationExists(dest);
    }
    return ConversionResult::Success();
}

ConversionResult Dispatcher::CheckAlignment(const fs::path &source, uint32 sectorSize) const {
    if (m_config.conversion.partialSectorPolicy != PartialSectorPolicy::Reject) {
        return ConversionResult::Success();
    }

    std::error_code err{};
    const uintmax_t size = fs::file_size(source, err);
    if (err) {
        return ConversionResult::IOError(source, err);
    }
    if (size % sectorSize != 0) {
        devlog::debug<grp::dispatch>("{}: {} bytes is not a multiple of {}", source.string(), size, sectorSize);
        return ConversionResult::MisalignedSource(source);
    }
    return ConversionResult::Success();
}

media::TranscodeOptions Dispatcher::MakeTranscodeOptions() const {
    return {.partialSectorPolicy = m_config.conversion.partialSectorPolicy};
}

} // namespace discconv::conv
