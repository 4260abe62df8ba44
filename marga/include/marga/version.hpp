#pragma once

#define MARGA_VERSION "0.4.1"
#define MARGA_PLAN_FORMAT_VERSION_MAJOR 1
#define MARGA_PLAN_FORMAT_VERSION_MINOR 2

namespace marga {
namespace version {

inline bool plan_format_compatible(int major, int minor) {
    // Executors must match the major version exactly and may lag on minor
    // (minor bumps only add keys to the plan document)
    return major == MARGA_PLAN_FORMAT_VERSION_MAJOR &&
           minor <= MARGA_PLAN_FORMAT_VERSION_MINOR;
}

} // namespace version
} // namespace marga
