#pragma once

/**
@file
@brief Destination overwrite policy enforcement.
*/

#include <discconv/core/configuration_defs.hpp>

#include <filesystem>
#include <functional>
#include <map>

namespace discconv::conv {

enum class OverwriteDecision {
    Write,  ///< The destination does not exist, or overwriting was allowed
    Denied, ///< The destination exists and must not be touched
};

/// @brief Decides whether a destination may be written under an overwrite policy.
///
/// With `OverwritePolicy::Prompt`, the confirmation function is asked at most once per destination path for the
/// lifetime of the guard; later checks of the same path reuse the answer. Checks are serialized by the caller.
class OverwriteGuard {
public:
    using ConfirmFn = std::function<bool(const std::filesystem::path &)>;

    OverwriteGuard(core::config::conv::OverwritePolicy policy, ConfirmFn confirm);

    void SetPolicy(core::config::conv::OverwritePolicy policy);

    core::config::conv::OverwritePolicy GetPolicy() const {
        return m_policy;
    }

    // Checks whether `path` may be written.
    // Never modifies the file.
    OverwriteDecision Check(const std::filesystem::path &path);

private:
    core::config::conv::OverwritePolicy m_policy;
    ConfirmFn m_confirm;
    std::map<std::filesystem::path, bool> m_answers;
};

} // namespace discconv::conv
