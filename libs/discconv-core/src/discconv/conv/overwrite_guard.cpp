#include <discconv/conv/overwrite_guard.hpp>

#include <discconv/util/dev_log.hpp>

#include <system_error>

namespace discconv::conv {

namespace grp {

    struct overwrite {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Overwrite";
    };

} // namespace grp

using core::config::conv::OverwritePolicy;

OverwriteGuard::OverwriteGuard(OverwritePolicy policy, ConfirmFn confirm)
    : m_policy(policy)
    , m_confirm(std::move(confirm)) {}

void OverwriteGuard::SetPolicy(OverwritePolicy policy) {
    m_policy = policy;
}

OverwriteDecision OverwriteGuard::Check(const std::filesystem::path &path) {
    std::error_code err{};
    if (!std::filesystem::exists(path, err)) {
        return OverwriteDecision::Write;
    }

    switch (m_policy) {
    case OverwritePolicy::Force: //
        devlog::debug<grp::overwrite>("Overwriting {}", path.string());
        return OverwriteDecision::Write;

    case OverwritePolicy::Prompt: //
    {
        const auto key = path.lexically_normal();
        auto it = m_answers.find(key);
        if (it == m_answers.end()) {
            const bool answer = m_confirm ? m_confirm(path) : false;
            devlog::debug<grp::overwrite>("Asked to overwrite {}: {}", path.string(), answer ? "yes" : "no");
            it = m_answers.emplace(key, answer).first;
        }
        return it->second ? OverwriteDecision::Write : OverwriteDecision::Denied;
    }

    case OverwritePolicy::Fail: [[fallthrough]];
    default: //
        devlog::debug<grp::overwrite>("Refusing to overwrite {}", path.string());
        return OverwriteDecision::Denied;
    }
}

} // namespace discconv::conv
