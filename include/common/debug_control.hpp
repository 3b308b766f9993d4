#pragma once

#include <cstdlib>
#include <cstdio>
#include <cstring>
#include <iostream>

namespace stark_sync {
namespace debug {

/**
 * Debug and Profile Control
 *
 * Environment variables:
 * - STARK_SYNC_PROFILE: Enable/disable timing output
 *   Set to "1" or "true" to enable, "0" or "false" (or unset) to disable
 *
 * - STARK_SYNC_DEBUG: Enable/disable verbose per-event output
 *   Set to "1" or "true" to enable, "0" or "false" (or unset) to disable
 */

inline bool env_flag(const char* name) {
    const char* env = std::getenv(name);
    return env && (strcmp(env, "1") == 0 || strcmp(env, "true") == 0);
}

// Check if profiling is enabled
inline bool is_profile_enabled() {
    static const bool cached = env_flag("STARK_SYNC_PROFILE");
    return cached;
}

// Check if debug printing is enabled
inline bool is_debug_enabled() {
    static const bool cached = env_flag("STARK_SYNC_DEBUG");
    return cached;
}

} // namespace debug
} // namespace stark_sync

// Profile printing (timing measurements)
#define STARK_SYNC_PROFILE_ENABLED() (stark_sync::debug::is_profile_enabled())

#define STARK_SYNC_PROFILE_COUT(expr) \
    do { \
        if (stark_sync::debug::is_profile_enabled()) { \
            std::cout << expr; \
        } \
    } while(0)

// Debug printing (per-event detail)
#define STARK_SYNC_DEBUG_ENABLED() (stark_sync::debug::is_debug_enabled())

#define STARK_SYNC_DEBUG_COUT(expr) \
    do { \
        if (stark_sync::debug::is_debug_enabled()) { \
            std::cout << expr; \
        } \
    } while(0)

#define STARK_SYNC_IF_DEBUG if (stark_sync::debug::is_debug_enabled())
