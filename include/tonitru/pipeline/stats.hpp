#pragma once

/// @file stats.hpp
/// @brief Pipeline counters

#include <atomic>
#include <cstdint>

#include "tonitru/platform/platform.hpp"

namespace tnt::pipeline {

/// Point-in-time copy of the counters
struct PipelineStats {
    uint64_t batches_admitted{0};
    uint64_t batches_ok{0};
    uint64_t batches_failed{0};
    uint64_t batches_cancelled{0};
    uint64_t bytes{0};                  // Record bytes admitted (headers included)
    uint64_t alignment_fallbacks{0};    // Borrowed views promoted to owned copies
    uint64_t isa_fallbacks{0};          // Per-batch kernel tier downgrades
    uint64_t sink_drops{0};             // Deliveries skipped under DropAndReport
    uint64_t peak_in_flight{0};         // Most batches admitted and not yet delivered
};

/// Counters updated by the stage workers (relaxed, read for reporting only)
struct StatsCounters {
    alignas(TNT_CACHE_LINE_SIZE) std::atomic<uint64_t> batches_admitted{0};
    std::atomic<uint64_t> bytes{0};
    std::atomic<uint64_t> alignment_fallbacks{0};
    alignas(TNT_CACHE_LINE_SIZE) std::atomic<uint64_t> batches_ok{0};
    std::atomic<uint64_t> batches_failed{0};
    std::atomic<uint64_t> batches_cancelled{0};
    std::atomic<uint64_t> isa_fallbacks{0};
    std::atomic<uint64_t> sink_drops{0};
    std::atomic<uint64_t> peak_in_flight{0};

    static void bump(std::atomic<uint64_t>& counter, uint64_t n = 1) noexcept {
        counter.fetch_add(n, std::memory_order_relaxed);
    }

    static void raise(std::atomic<uint64_t>& counter, uint64_t value) noexcept {
        uint64_t seen = counter.load(std::memory_order_relaxed);
        while (seen < value && !counter.compare_exchange_weak(seen, value, std::memory_order_relaxed)) {}
    }

    [[nodiscard]] PipelineStats snapshot() const noexcept {
        PipelineStats s;
        s.batches_admitted = batches_admitted.load(std::memory_order_relaxed);
        s.batches_ok = batches_ok.load(std::memory_order_relaxed);
        s.batches_failed = batches_failed.load(std::memory_order_relaxed);
        s.batches_cancelled = batches_cancelled.load(std::memory_order_relaxed);
        s.bytes = bytes.load(std::memory_order_relaxed);
        s.alignment_fallbacks = alignment_fallbacks.load(std::memory_order_relaxed);
        s.isa_fallbacks = isa_fallbacks.load(std::memory_order_relaxed);
        s.sink_drops = sink_drops.load(std::memory_order_relaxed);
        s.peak_in_flight = peak_in_flight.load(std::memory_order_relaxed);
        return s;
    }
};

} // namespace tnt::pipeline
