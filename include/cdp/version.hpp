#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define CDP_VERSION_MAJOR 0
#define CDP_VERSION_MINOR 3
#define CDP_VERSION_PATCH 0
#define CDP_VERSION_STRING "0.3.0"

namespace cdp {

/// Project version information at compile time.
struct Version {
    static constexpr int major = CDP_VERSION_MAJOR;
    static constexpr int minor = CDP_VERSION_MINOR;
    static constexpr int patch = CDP_VERSION_PATCH;
    static constexpr const char* string = CDP_VERSION_STRING;
};

} // namespace cdp
