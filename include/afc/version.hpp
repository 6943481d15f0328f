#pragma once

/// @file version.hpp
/// @brief Controller version information.

#define AFC_VERSION_MAJOR 0
#define AFC_VERSION_MINOR 3
#define AFC_VERSION_PATCH 0
#define AFC_VERSION_STRING "0.3.0"

namespace afc {

struct Version {
    static constexpr int major = AFC_VERSION_MAJOR;
    static constexpr int minor = AFC_VERSION_MINOR;
    static constexpr int patch = AFC_VERSION_PATCH;
    static constexpr const char* string = AFC_VERSION_STRING;
};

} // namespace afc
