#pragma once

/// @file version.hpp
/// @brief Library version information.

#define SCRIBE_VERSION_MAJOR 0
#define SCRIBE_VERSION_MINOR 3
#define SCRIBE_VERSION_PATCH 0

namespace scribe {

/// @brief Return the library version string (e.g. "0.3.0").
inline const char* version() {
    return "0.3.0";
}

inline int versionMajor() { return SCRIBE_VERSION_MAJOR; }
inline int versionMinor() { return SCRIBE_VERSION_MINOR; }
inline int versionPatch() { return SCRIBE_VERSION_PATCH; }

} // namespace scribe
