#pragma once

// ==============================================================================
// Debug Log (Shared)
// ==============================================================================
// Compile-time gated trace output for UI/model code.
// Define VERNIER_DEBUG_LOGGING=1 to enable; otherwise every VERNIER_DEBUG_LOG
// call compiles to nothing.
// Windows: OutputDebugStringA. Elsewhere: stderr.
// ==============================================================================

#ifndef VERNIER_DEBUG_LOGGING
#define VERNIER_DEBUG_LOGGING 0
#endif

#if VERNIER_DEBUG_LOGGING
#include <cstdarg>
#include <cstdio>
#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

namespace Vernier::Platform {

inline void debugLog(const char* fmt, ...) {
    char buf[512];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
#ifdef _WIN32
    OutputDebugStringA(buf);
#else
    fprintf(stderr, "%s", buf);
#endif
}

} // namespace Vernier::Platform

#define VERNIER_DEBUG_LOG(...) ::Vernier::Platform::debugLog(__VA_ARGS__)
#else
#define VERNIER_DEBUG_LOG(...) ((void)0)
#endif
