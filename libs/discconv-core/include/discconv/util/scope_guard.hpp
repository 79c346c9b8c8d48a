#pragma once

/**
@file
@brief Defines `util::ScopeGuard`, which runs a function when the enclosing scope ends.
*/

#include <utility>

namespace util {

/// @brief Runs a cleanup function on scope exit unless cancelled.
///
/// The conversion code uses it to delete partially written outputs: the guard is armed right after a destination is
/// opened and cancelled once the job has fully succeeded.
///
/// ```cpp
/// std::ofstream out{path, std::ios::binary | std::ios::trunc};
/// util::ScopeGuard sgRemoveOutput{[&] { out.close(); std::filesystem::remove(path, ec); }};
/// if (!WriteEverything(out)) {
///     return Failure(); // output removed here
/// }
/// sgRemoveOutput.Cancel();
/// ```
///
/// @tparam Fn the type of the cleanup function
template <typename Fn>
class ScopeGuard {
public:
    ScopeGuard(Fn &&fn) noexcept
        : fn(std::move(fn)) {}

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;

    ~ScopeGuard() noexcept(noexcept(fn())) {
        if (!cancelled) {
            fn();
        }
    }

    /// @brief Disarms the guard; the cleanup function will not run.
    void Cancel() noexcept {
        cancelled = true;
    }

private:
    Fn fn;
    bool cancelled = false;
};

} // namespace util
