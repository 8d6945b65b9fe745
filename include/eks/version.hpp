#pragma once

/// @file version.hpp
/// @brief Package identity and version of the EmberTalk key server.

#define EKS_VERSION_MAJOR 0
#define EKS_VERSION_MINOR 1
#define EKS_VERSION_PATCH 0
#define EKS_VERSION_STRING "0.1.0"

namespace eks {

/// Compile-time version information.
struct Version {
    static constexpr int major = EKS_VERSION_MAJOR;
    static constexpr int minor = EKS_VERSION_MINOR;
    static constexpr int patch = EKS_VERSION_PATCH;
    static constexpr const char* string = EKS_VERSION_STRING;
    static constexpr const char* description = "Key Server for EmberTalk";
};

}  // namespace eks
