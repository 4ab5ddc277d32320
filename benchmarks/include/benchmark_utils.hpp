/*
    Tonitru Benchmark Utilities

    Timing and system helpers shared by the benchmarks:
    steady-clock sampling with percentiles, pinning the bench thread to a
    core, and one table row per instruction-set tier or worker count.
*/

#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <string>
#include <vector>

#ifdef __linux__
#include <pthread.h>
#include <sched.h>
#endif

namespace tnt::bench {

using Clock = std::chrono::steady_clock;

/// Keeps the clock reads on either side of the measured call
inline void compiler_barrier() noexcept {
    asm volatile("" ::: "memory");
}

/// Keep a computed value alive without storing it
template <typename T>
inline void do_not_optimize(const T& value) noexcept {
    asm volatile("" : : "r,m"(value) : "memory");
}

// ============================================================================
// CPU Affinity
// ============================================================================

/// Pin the calling thread; false where affinity is unsupported
[[nodiscard]] inline bool bind_to_core(int core_id) noexcept {
#ifdef __linux__
    cpu_set_t cpuset;
    CPU_ZERO(&cpuset);
    CPU_SET(core_id, &cpuset);
    return pthread_setaffinity_np(pthread_self(), sizeof(cpu_set_t), &cpuset) == 0;
#else
    (void)core_id;
    return false;
#endif
}

// ============================================================================
// Latency Statistics
// ============================================================================

/// Per-call timings of one kernel or stage over a fixed input
struct LatencyStats {
    double mean_ns{0};
    double p50_ns{0};
    double p90_ns{0};
    double p99_ns{0};
    size_t count{0};

    /// Sorts `samples` in place
    void compute_from_ns(std::vector<double>& samples) {
        count = samples.size();
        if (count == 0) return;
        std::sort(samples.begin(), samples.end());
        mean_ns = std::accumulate(samples.begin(), samples.end(), 0.0) / static_cast<double>(count);
        const auto at = [&](size_t permille) { return samples[std::min(count - 1, count * permille / 1000)]; };
        p50_ns = at(500);
        p90_ns = at(900);
        p99_ns = at(990);
    }
};

/// Time `iterations` calls of `func`, one sample per call
template <typename Func>
[[nodiscard]] inline LatencyStats sample(Func&& func, size_t iterations, size_t warmup = 1000) {
    for (size_t i = 0; i < warmup; ++i) {
        func();
    }
    std::vector<double> samples;
    samples.reserve(iterations);
    for (size_t i = 0; i < iterations; ++i) {
        compiler_barrier();
        const auto start = Clock::now();
        func();
        const auto end = Clock::now();
        compiler_barrier();
        samples.push_back(std::chrono::duration<double, std::nano>(end - start).count());
    }
    LatencyStats stats;
    stats.compute_from_ns(samples);
    return stats;
}

// ============================================================================
// Output
// ============================================================================

/// GB/s for `bytes` processed in `ns`
[[nodiscard]] inline double throughput_gbps(size_t bytes, double ns) noexcept {
    return ns > 0 ? static_cast<double>(bytes) / ns : 0.0;
}

inline void print_header(const char* first_column) {
    std::cout << std::setw(14) << std::left << first_column
              << std::setw(12) << "mean(ns)"
              << std::setw(12) << "p50(ns)"
              << std::setw(12) << "p90(ns)"
              << std::setw(12) << "p99(ns)"
              << std::setw(10) << "GB/s" << "\n";
    std::cout << std::string(72, '-') << "\n";
}

inline void print_row(const std::string& label, const LatencyStats& s, size_t bytes) {
    std::cout << std::setw(14) << std::left << label
              << std::setw(12) << std::fixed << std::setprecision(1) << s.mean_ns
              << std::setw(12) << s.p50_ns
              << std::setw(12) << s.p90_ns
              << std::setw(12) << s.p99_ns
              << std::setw(10) << std::setprecision(2) << throughput_gbps(bytes, s.mean_ns)
              << "\n";
}

} // namespace tnt::bench
