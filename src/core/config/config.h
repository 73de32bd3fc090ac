#pragma once

#ifndef CORE_CONFIG_CONFIG_H
#define CORE_CONFIG_CONFIG_H

#include <cstddef>

// ==============================================================================
// stackerr Compile-time Configuration
// ==============================================================================
// Version, the platform and compiler checks that decide whether live stacks
// can be walked, and the attribute macros shared by the error and logging
// modules. Runtime settings live in error/trace_config.h
// ==============================================================================

// ==============================================================================
// Platform / Compiler
// ==============================================================================

#if defined(__linux__) || defined(__APPLE__) || defined(__unix__)
    #define STACKERR_PLATFORM_POSIX 1
#else
    #define STACKERR_PLATFORM_POSIX 0
#endif

#if defined(__GNUC__) || defined(__clang__)
    #define STACKERR_COMPILER_GNU_LIKE 1
#else
    #define STACKERR_COMPILER_GNU_LIKE 0
#endif

// ==============================================================================
// Feature Toggles
// ==============================================================================

// 0 compiles every logger call down to the level check
#ifndef STACKERR_ENABLE_LOGGING
    #define STACKERR_ENABLE_LOGGING 1
#endif

// Address frames need <execinfo.h>, dladdr and the Itanium demangler
#ifndef STACKERR_ENABLE_STACK_CAPTURE
    #if STACKERR_PLATFORM_POSIX && STACKERR_COMPILER_GNU_LIKE
        #define STACKERR_ENABLE_STACK_CAPTURE 1
    #else
        #define STACKERR_ENABLE_STACK_CAPTURE 0
    #endif
#endif

// ==============================================================================
// Attributes
// ==============================================================================

// Frame counting in capture_frame() relies on these never being inlined
#if STACKERR_COMPILER_GNU_LIKE
    #define STACKERR_NOINLINE __attribute__((noinline))
#elif defined(_MSC_VER)
    #define STACKERR_NOINLINE __declspec(noinline)
#else
    #define STACKERR_NOINLINE
#endif

#define STACKERR_UNUSED(x) ((void)(x))

namespace stackerr {
namespace config {

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;
constexpr const char* VERSION_STRING = "0.3.0";

// Upper bound for a single address-based capture. Merged stacks are unbounded.
constexpr std::size_t DEFAULT_MAX_CAPTURED_FRAMES = 64;

// Placeholder for any frame field that cannot be resolved
constexpr const char* UNKNOWN_FIELD = "unknown";

} // namespace config
} // namespace stackerr

#endif // CORE_CONFIG_CONFIG_H
