/*
    Tonitru Prefetch Utilities

    Hardware prefetch hints issued by the prefetch stage over a record
    payload before it is handed to a decode worker.
*/

#pragma once

#include <cstddef>
#include <cstdint>

#include "tonitru/platform/platform.hpp"

namespace tnt::util {

// ============================================================================
// Cache Line Constants
// ============================================================================

inline constexpr size_t CACHE_LINE_SIZE = TNT_CACHE_LINE_SIZE;

/// Upper bound on lines hinted per record (about half of a typical L2)
inline constexpr size_t MAX_PREFETCH_LINES = 2048;

// ============================================================================
// Prefetch Functions
// ============================================================================

/// Prefetch for read with high locality (L1 cache)
inline void prefetch_read(const void* ptr) noexcept {
    __builtin_prefetch(ptr, 0, 3);
}

/// Prefetch for read with low locality (streaming data)
inline void prefetch_read_nta(const void* ptr) noexcept {
    __builtin_prefetch(ptr, 0, 0);
}

/// Hint every cache line of [ptr, ptr + size), capped at MAX_PREFETCH_LINES.
/// Small payloads go to L1; larger ones are streamed to avoid evicting the
/// decode worker's working set.
inline void prefetch_span(const void* ptr, size_t size) noexcept {
    const char* p = static_cast<const char*>(ptr);
    const size_t lines = (size + CACHE_LINE_SIZE - 1) / CACHE_LINE_SIZE;
    const size_t n = lines < MAX_PREFETCH_LINES ? lines : MAX_PREFETCH_LINES;
    if (n <= 8) {
        for (size_t i = 0; i < n; ++i) prefetch_read(p + i * CACHE_LINE_SIZE);
    } else {
        for (size_t i = 0; i < n; ++i) prefetch_read_nta(p + i * CACHE_LINE_SIZE);
    }
}

// ============================================================================
// Alignment Utilities
// ============================================================================

[[nodiscard]] inline constexpr size_t align_up(size_t size, size_t alignment) noexcept {
    return (size + alignment - 1) & ~(alignment - 1);
}

[[nodiscard]] inline bool is_aligned(const void* ptr, size_t alignment) noexcept {
    return (reinterpret_cast<uintptr_t>(ptr) & (alignment - 1)) == 0;
}

} // namespace tnt::util
