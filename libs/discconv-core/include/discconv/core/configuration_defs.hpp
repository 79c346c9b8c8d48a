#pragma once

/**
@file
@brief Conversion configuration definitions.
*/

namespace discconv::core::config {

namespace conv {
    /// @brief What to do when a destination file already exists.
    enum class OverwritePolicy {
        /// @brief Abort the job with a `DestinationExists` error.
        Fail,

        /// @brief Always overwrite.
        Force,

        /// @brief Ask the confirmation callback once per destination path. A negative answer behaves like `Fail`.
        Prompt,
    };

    /// @brief How to treat a source whose size is not a whole number of sectors.
    enum class PartialSectorPolicy {
        /// @brief Stop at the partial sector. Raw sources drop it; user data sources pad it to a full sector.
        TreatAsEndOfStream,

        /// @brief Reject the source with a `MisalignedSource` error before writing anything.
        Reject,
    };

    /// @brief What a batch run does after a job fails.
    enum class BatchErrorPolicy {
        /// @brief Keep processing the remaining inputs and report every result.
        ContinueOnError,

        /// @brief Stop at the first failed job.
        StopOnError,
    };

    /// @brief The output format for CUE, ISO and BIN inputs.
    enum class TargetFormat {
        /// @brief CUE and BIN become ISO; ISO becomes BIN + CUE.
        Auto,

        /// @brief CUE, ISO and BIN are compressed into a CHD container by the external codec.
        CHD,
    };
} // namespace conv

} // namespace discconv::core::config
