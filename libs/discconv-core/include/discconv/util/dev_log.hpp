#pragma once

/**
@file
@brief Development log for tracing conversions.

Log groups are plain structs that are checked at compile time. When `DiscConv_ENABLE_DEVLOG` is off, or a message is
below its group's level, the call compiles to nothing.

Messages go to stderr so they never mix with converted data written to stdout by callers.

@section Usage

```cpp
namespace grp {
    struct transcoder {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Transcoder";
    };

    // Derived groups inherit the switches and override the name
    struct transcoder_raw : public transcoder {
        static constexpr std::string_view name = "Transcoder-Raw";
    };
}

devlog::debug<grp::transcoder>("Copying {} sectors", count);
devlog::warn<grp::transcoder_raw>("Trailing {} bytes ignored", trailing);
```
*/

#include <discconv/core/types.hpp>

#include <fmt/format.h>

#include <concepts>
#include <cstdio>
#include <string_view>
#include <type_traits>

namespace devlog {

/// @brief Globally enable or disable dev logging.
inline constexpr bool globalEnable = DiscConv_ENABLE_DEVLOG;

using Level = uint32;

namespace level {
    /// @brief Per-sector details.
    inline constexpr Level trace = 1;

    /// @brief Per-job details: resolved paths, sector modes, byte counts.
    inline constexpr Level debug = 2;

    /// @brief Infrequent events such as a completed job or an external tool invocation.
    inline constexpr Level info = 3;

    /// @brief Unusual input that is still handled, like a truncated trailing sector.
    inline constexpr Level warn = 4;

    /// @brief Failures that abort a job.
    inline constexpr Level error = 5;

    /// @brief Disables a group entirely.
    inline constexpr Level off = 6;

    template <Level level>
    inline constexpr const char *name = "unk";

    template <>
    inline constexpr const char *name<trace> = "trace";
    template <>
    inline constexpr const char *name<debug> = "debug";
    template <>
    inline constexpr const char *name<info> = "info";
    template <>
    inline constexpr const char *name<warn> = "warn";
    template <>
    inline constexpr const char *name<error> = "error";
} // namespace level

namespace detail {

    /// @brief A log group: a type with static `enabled`, `level` and `name` members.
    template <typename T>
    concept Group = requires() {
        requires std::same_as<std::decay_t<decltype(T::enabled)>, bool>;
        requires std::same_as<std::decay_t<decltype(T::level)>, Level>;
        requires std::same_as<std::decay_t<decltype(T::name)>, std::string_view>;
    };

    template <Level level, Group TGroup>
    inline constexpr bool enabled = globalEnable && TGroup::enabled && level >= TGroup::level;

    template <Level level, Group TGroup, typename... TArgs>
    constexpr void log(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
        static_assert(level < level::off);
        if constexpr (enabled<level, TGroup>) {
            fmt::print(stderr, "{:5s} | {:16s} | ", level::name<level>, TGroup::name);
            fmt::print(stderr, fmt, static_cast<TArgs &&>(args)...);
            std::fputc('\n', stderr);
        }
    }

} // namespace detail

/// @brief Determines if debug logging is enabled for the group.
template <detail::Group TGroup>
inline constexpr bool debug_enabled = detail::enabled<level::debug, TGroup>;

template <detail::Group TGroup, typename... TArgs>
constexpr void trace(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::log<level::trace, TGroup, TArgs...>(fmt, static_cast<TArgs &&>(args)...);
}

template <detail::Group TGroup, typename... TArgs>
constexpr void debug(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::log<level::debug, TGroup, TArgs...>(fmt, static_cast<TArgs &&>(args)...);
}

template <detail::Group TGroup, typename... TArgs>
constexpr void info(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::log<level::info, TGroup, TArgs...>(fmt, static_cast<TArgs &&>(args)...);
}

template <detail::Group TGroup, typename... TArgs>
constexpr void warn(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::log<level::warn, TGroup, TArgs...>(fmt, static_cast<TArgs &&>(args)...);
}

template <detail::Group TGroup, typename... TArgs>
constexpr void error(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::log<level::error, TGroup, TArgs...>(fmt, static_cast<TArgs &&>(args)...);
}

} // namespace devlog
