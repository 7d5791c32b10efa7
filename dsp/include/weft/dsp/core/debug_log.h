// ==============================================================================
// Layer 0: Core Utility - Debug Trace
// ==============================================================================
// Compile-time gated diagnostic output. Off by default; build with
// -DWEFT_DSP_DEBUG=1 to trace clamped parameters, dropped frames, routing
// decisions and scheduler callback failures on stderr.
//
// When disabled, WEFT_DSP_LOG expands to nothing and its arguments are not
// evaluated, so trace calls are free on the render thread.
// ==============================================================================

#pragma once

#ifndef WEFT_DSP_DEBUG
#define WEFT_DSP_DEBUG 0
#endif

#if WEFT_DSP_DEBUG
#include <cstdarg>
#include <cstdio>
#endif

namespace Weft {
namespace DSP {

#if WEFT_DSP_DEBUG
/// @brief printf-style trace to stderr, prefixed with the subsystem tag.
/// @note Not real-time safe; only compiled into debug builds.
inline void weftDebugLog(const char* tag, const char* fmt, ...) {
    char buf[512];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
    fprintf(stderr, "[weft:%s] %s\n", tag, buf);
}
#endif

} // namespace DSP
} // namespace Weft

#if WEFT_DSP_DEBUG
#define WEFT_DSP_LOG(tag, ...) ::Weft::DSP::weftDebugLog(tag, __VA_ARGS__)
#else
#define WEFT_DSP_LOG(tag, ...) ((void)0)
#endif
