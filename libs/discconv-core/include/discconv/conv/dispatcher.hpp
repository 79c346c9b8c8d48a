#pragma once

/**
@file
@brief Conversion job planning and execution.
*/

#include "conversion_defs.hpp"
#include "conversion_result.hpp"
#include "disc_codec.hpp"
#include "overwrite_guard.hpp"

#include <discconv/core/configuration.hpp>

#include <discconv/media/sector_transcoder.hpp>

#include <filesystem>
#include <functional>
#include <vector>

namespace discconv::conv {

/// @brief The outcome of one job.
struct JobReport {
    ConversionJob job;
    ConversionResult result;
    std::vector<std::filesystem::path> outputs; ///< Files written by the job, empty unless it succeeded
    media::TranscodeStats stats;
};

/// @brief Plans and runs conversion jobs.
///
/// Jobs run one at a time on the calling thread. Each job opens its own files and closes them before returning.
/// Every validation step (CUE parsing, source checks, overwrite policy) completes before the first byte of any
/// destination is written, and a job that fails while writing removes the files it created.
///
/// The only state kept between jobs is the overwrite guard's record of prompted answers.
class Dispatcher {
public:
    using JobCallback = std::function<void(const JobReport &)>;

    /// @brief Creates a dispatcher bound to a configuration and a container codec.
    ///
    /// Both must outlive the dispatcher. The configuration is read at the start of every job.
    Dispatcher(const core::Configuration &config, IDiscCodec &codec);

    // Builds the job for `input`. If `output` is empty, the output path is derived from the input's name:
    //   .cue -> .iso
    //   .iso -> .bin (plus .cue beside it)
    //   .bin -> .iso
    //   .chd -> .cue (plus .bin beside it)
    //   .cue/.iso/.bin with the CHD target -> .chd
    // Inputs with any other extension produce a Direction::Skip job.
    ConversionJob Plan(const std::filesystem::path &input, const std::filesystem::path &output = {}) const;

    // Runs a single job.
    JobReport Dispatch(const ConversionJob &job);

    // Plans and runs a job for each input, in order.
    // `output` may only be set when there is exactly one input.
    // `onJobDone` is invoked after every job. Under BatchErrorPolicy::StopOnError the run ends after the first failed
    // job; skipped inputs never stop it.
    std::vector<JobReport> RunBatch(const std::vector<std::filesystem::path> &inputs,
                                    const std::filesystem::path &output = {}, const JobCallback &onJobDone = {});

private:
    const core::Configuration &m_config;
    IDiscCodec &m_codec;
    OverwriteGuard m_overwriteGuard;

    ConversionResult CueToIso(const ConversionJob &job, JobReport &report);
    ConversionResult BinToIso(const ConversionJob &job, JobReport &report);
    ConversionResult IsoToBinCue(const ConversionJob &job, JobReport &report);
    ConversionResult ToChd(const ConversionJob &job, JobReport &report);
    ConversionResult ChdToCue(const ConversionJob &job, JobReport &report);

    // Runs the raw-to-user transcoder from `source` into `dest` after validating both.
    ConversionResult ExtractUserData(const std::filesystem::path &source, const std::filesystem::path &dest,
                                     media::SectorMode mode, JobReport &report);

    // Checks that `source` is a readable regular file.
    ConversionResult CheckSource(const std::filesystem::path &source) const;

    // Checks that `dest` does not refer to `source` and that the overwrite policy allows writing it.
    ConversionResult CheckDestination(const std::filesystem::path &source, const std::filesystem::path &dest);

    // Under the strict partial sector policy, rejects sources that are not a whole number of sectors.
    ConversionResult CheckAlignment(const std::filesystem::path &source, uint32 sectorSize) const;

    media::TranscodeOptions MakeTranscodeOptions() const;
};

} // namespace discconv::conv
