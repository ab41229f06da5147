#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define FXP_VERSION_MAJOR 0
#define FXP_VERSION_MINOR 1
#define FXP_VERSION_PATCH 0
#define FXP_VERSION_STRING "0.1.0"

namespace fxp {

/// Project version information at compile time.
struct Version {
    static constexpr int major = FXP_VERSION_MAJOR;
    static constexpr int minor = FXP_VERSION_MINOR;
    static constexpr int patch = FXP_VERSION_PATCH;
    static constexpr const char* string = FXP_VERSION_STRING;
};

} // namespace fxp
