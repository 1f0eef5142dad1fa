#pragma once

#include <cstdlib>
#include <cstdio>

namespace gba {

// DEBUG=1 (anything but a leading '0') turns on core logging; read once
inline bool is_debug_mode() {
    static const bool enabled = [] {
        const char* env = std::getenv("DEBUG");
        return env != nullptr && env[0] != '0';
    }();
    return enabled;
}

// Debug print macro for the GBA core
#define SGBA_DEBUG_PRINT(...) \
    do { if (gba::is_debug_mode()) fprintf(stderr, "[GBA] " __VA_ARGS__); } while(0)

} // namespace gba
