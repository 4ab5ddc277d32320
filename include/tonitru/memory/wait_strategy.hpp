/*
    Tonitru Stage Waits

    How a stage worker waits on a full or empty queue boundary, a sink
    flush or outstanding borrowed views: spin briefly, then yield, then
    sleep with a doubling interval capped at MaxSleepMicros.
*/

#pragma once

#include <atomic>
#include <chrono>
#include <concepts>
#include <cstdint>
#include <thread>

#include "tonitru/platform/platform.hpp"

#if TNT_ARCH_X64
#include <immintrin.h>
#endif

namespace tnt::memory {

TNT_FORCE_INLINE void cpu_relax() noexcept {
#if TNT_ARCH_X64
    _mm_pause();
#elif TNT_ARCH_ARM64
    asm volatile("yield" ::: "memory");
#else
    std::atomic_signal_fence(std::memory_order_seq_cst);
#endif
}

// ============================================================================
// Backoff
// ============================================================================

template<uint32_t Spins = 64,
         uint32_t Yields = 16,
         uint32_t MaxSleepMicros = 500>
struct BackoffWait {
    /// Progress of one blocked wait; start a fresh one per blocking episode
    struct State {
        uint32_t attempts = 0;
        uint32_t sleep_us = 1;
    };

    static void wait(State& state) noexcept {
        const uint32_t n = state.attempts++;
        if (n < Spins) {
            cpu_relax();
            return;
        }
        if (n < Spins + Yields) {
            std::this_thread::yield();
            return;
        }
        std::this_thread::sleep_for(std::chrono::microseconds(state.sleep_us));
        if (state.sleep_us < MaxSleepMicros) {
            state.sleep_us *= 2;
        }
    }

    static void reset(State& state) noexcept { state = State{}; }

    template<typename Predicate>
    static void wait_until(Predicate&& pred) noexcept(noexcept(pred())) {
        State state{};
        while (!pred()) {
            wait(state);
        }
    }
};

template<typename T>
concept StageWaitPolicy = requires(typename T::State& s) {
    { T::wait(s) } noexcept;
    { T::reset(s) } noexcept;
};

/// Default for every blocking boundary in the pipeline
using StageWait = BackoffWait<>;

static_assert(StageWaitPolicy<StageWait>);

} // namespace tnt::memory
