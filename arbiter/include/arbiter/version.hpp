#pragma once

#define ARBITER_VERSION "1.3.0"
#define ARBITER_PROTOCOL_VERSION_MAJOR 1
#define ARBITER_PROTOCOL_VERSION_MINOR 1

namespace arbiter {
namespace version {

// Same major, and the daemon's minor at least the client's
inline bool protocol_compatible(int major, int minor) {
    return major == ARBITER_PROTOCOL_VERSION_MAJOR &&
           minor <= ARBITER_PROTOCOL_VERSION_MINOR;
}

} // namespace version
} // namespace arbiter
