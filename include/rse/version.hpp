#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define RSE_VERSION_MAJOR 0
#define RSE_VERSION_MINOR 1
#define RSE_VERSION_PATCH 0
#define RSE_VERSION_STRING "0.1.0"

namespace rse {

/// Project version information at compile time.
struct Version {
    static constexpr int major = RSE_VERSION_MAJOR;
    static constexpr int minor = RSE_VERSION_MINOR;
    static constexpr int patch = RSE_VERSION_PATCH;
    static constexpr const char* string = RSE_VERSION_STRING;
};

} // namespace rse
