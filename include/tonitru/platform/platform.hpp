#pragma once

/// @file platform.hpp
/// @brief Architecture and instruction-set detection, kernel attributes

// ============================================================================
// Architecture Detection
// ============================================================================

#if defined(__x86_64__) || defined(_M_X64)
    #define TNT_ARCH_X64 1
    #define TNT_ARCH_ARM64 0
#elif defined(__aarch64__) || defined(_M_ARM64)
    #define TNT_ARCH_X64 0
    #define TNT_ARCH_ARM64 1
#else
    #define TNT_ARCH_X64 0
    #define TNT_ARCH_ARM64 0
#endif

// getauxval() hardware capability bits
#if defined(__linux__)
    #define TNT_PLATFORM_LINUX 1
#else
    #define TNT_PLATFORM_LINUX 0
#endif

// ============================================================================
// Kernel Tiers
// ============================================================================

// x86 vector kernels use per-function target attributes, so one binary
// carries every tier and capability detection picks one at runtime.
// MSVC has no equivalent and only gets the scalar tier.
#if TNT_ARCH_X64 && (defined(__GNUC__) || defined(__clang__))
    #define TNT_X86_KERNELS 1
    #define TNT_TARGET(isa) __attribute__((target(isa)))
#else
    #define TNT_X86_KERNELS 0
    #define TNT_TARGET(isa)
#endif

// NEON is part of the AArch64 baseline
#if TNT_ARCH_ARM64 && (defined(__ARM_NEON) || defined(__ARM_NEON__))
    #define TNT_NEON_KERNELS 1
#else
    #define TNT_NEON_KERNELS 0
#endif

// Google Highway static-dispatch tier (TNT_HAS_HIGHWAY set by CMake)
#if defined(TNT_HAS_HIGHWAY) && TNT_HAS_HIGHWAY
    #define TNT_HIGHWAY_KERNELS 1
#else
    #define TNT_HIGHWAY_KERNELS 0
#endif

// ============================================================================
// Attributes
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
    #define TNT_FORCE_INLINE __attribute__((always_inline)) inline
    #define TNT_HOT [[gnu::hot]]
#elif defined(_MSC_VER)
    #define TNT_FORCE_INLINE __forceinline
    #define TNT_HOT
#else
    #define TNT_FORCE_INLINE inline
    #define TNT_HOT
#endif

#if __cplusplus >= 202302L
    #include <utility>
    #define TNT_UNREACHABLE() std::unreachable()
#elif defined(__GNUC__) || defined(__clang__)
    #define TNT_UNREACHABLE() __builtin_unreachable()
#else
    #define TNT_UNREACHABLE() ((void)0)
#endif

#define TNT_CACHE_LINE_SIZE 64
