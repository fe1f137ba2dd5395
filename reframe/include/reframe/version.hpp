#pragma once

#define REFRAME_VERSION "0.3.1"
#define REFRAME_CONFIG_VERSION_MAJOR 1
#define REFRAME_CONFIG_VERSION_MINOR 0

namespace reframe {
namespace version {

inline bool config_compatible(int major, int minor) {
    // Major version must match exactly (renamed or removed keys)
    // Minor version: binary must be >= file (additive keys only)
    return major == REFRAME_CONFIG_VERSION_MAJOR &&
           minor <= REFRAME_CONFIG_VERSION_MINOR;
}

} // namespace version
} // namespace reframe
