#pragma once

#define KOSHA_VERSION "1.4.0"
#define KOSHA_PROTOCOL_VERSION_MAJOR 1
#define KOSHA_PROTOCOL_VERSION_MINOR 2

namespace kosha {
namespace version {

inline bool protocol_compatible(int major, int minor) {
    // Major must match exactly; a daemon serves any client whose minor is <= its own
    return major == KOSHA_PROTOCOL_VERSION_MAJOR &&
           minor <= KOSHA_PROTOCOL_VERSION_MINOR;
}

} // namespace version
} // namespace kosha
