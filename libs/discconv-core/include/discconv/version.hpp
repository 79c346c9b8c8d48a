#pragma once

/**
@file
@brief discconv library version definitions.
*/

#if DiscConv_DEV_BUILD
    #define DiscConv_FULL_VERSION DiscConv_VERSION "-dev"
#else
    #define DiscConv_FULL_VERSION DiscConv_VERSION
#endif

namespace discconv::version {

/// @brief The library version string in the format "<major>.<minor>.<patch>".
inline constexpr auto string = DiscConv_VERSION;

/// @brief The library version string with a `-dev` suffix on development builds.
inline constexpr auto fullstring = DiscConv_FULL_VERSION;

inline constexpr auto major = static_cast<unsigned>(DiscConv_VERSION_MAJOR); ///< The library's major version
inline constexpr auto minor = static_cast<unsigned>(DiscConv_VERSION_MINOR); ///< The library's minor version
inline constexpr auto patch = static_cast<unsigned>(DiscConv_VERSION_PATCH); ///< The library's patch version

} // namespace discconv::version
