#pragma once

/// @file stage_context.hpp
/// @brief Envelopes handed between pipeline stages

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "tonitru/codec/decoder.hpp"
#include "tonitru/memory/batch_buffer.hpp"
#include "tonitru/memory/wait_strategy.hpp"
#include "tonitru/pipeline/config.hpp"
#include "tonitru/simd/dispatch.hpp"
#include "tonitru/types/error.hpp"
#include "tonitru/types/record_header.hpp"

namespace tnt::pipeline {

/// Per-batch token travelling with the batch through every stage
struct PipelineStageContext {
    uint64_t sequence{0};        // Admission order, restores output order
    size_t stream_offset{0};     // Offset of the record header in the input
    simd::BatchKernels kernels;  // Instruction-set cursor bound for this batch only

    /// Stream offset of the first payload byte
    [[nodiscard]] size_t payload_offset() const noexcept {
        return stream_offset + RECORD_HEADER_SIZE;
    }
};

/// Prefetch -> Decode
struct StagedBatch {
    PipelineStageContext ctx;
    RecordHeader header;
    memory::BatchBuffer buffer;
    std::vector<BatchError> errors;   // Failures found before decoding
    Diagnostics diagnostics;
};

/// Decode -> Dispatch -> Verify. Keeps the payload for the checksum.
struct DecodedBatch {
    PipelineStageContext ctx;
    RecordHeader header;
    memory::BatchBuffer buffer;
    std::optional<codec::DecodedTree> tree;
    std::vector<BatchError> errors;
    Diagnostics diagnostics;
};

/// Shared stop flags of one pipeline execution
struct CancelState {
    std::atomic<bool> stop_admission{false};
    std::atomic<bool> discard{false};

    void request(CancelMode mode) noexcept {
        if (mode == CancelMode::Discard) {
            discard.store(true, std::memory_order_release);
        }
        stop_admission.store(true, std::memory_order_release);
    }

    [[nodiscard]] bool stopping() const noexcept {
        return stop_admission.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool discarding() const noexcept {
        return discard.load(std::memory_order_acquire);
    }
};

/// Credits for batches between admission and delivery. Prefetch takes one
/// before staging a batch and verify returns it once the result has been
/// delivered, which bounds the reorder buffer behind a slow batch.
class FlightWindow {
public:
    explicit FlightWindow(size_t limit) noexcept : limit_{std::max<size_t>(1, limit)} {}

    FlightWindow(const FlightWindow&) = delete;
    FlightWindow& operator=(const FlightWindow&) = delete;

    /// Take a credit, waiting while the window is full. Single admitting thread.
    /// @return false once admission has stopped
    [[nodiscard]] bool acquire(const CancelState& cancel) noexcept {
        memory::StageWait::State state{};
        while (in_flight_.load(std::memory_order_acquire) >= limit_) {
            if (cancel.stopping()) return false;
            memory::StageWait::wait(state);
        }
        const size_t now = in_flight_.fetch_add(1, std::memory_order_acq_rel) + 1;
        if (now > peak_.load(std::memory_order_relaxed)) {
            peak_.store(now, std::memory_order_relaxed);
        }
        return true;
    }

    void release() noexcept { in_flight_.fetch_sub(1, std::memory_order_acq_rel); }

    [[nodiscard]] size_t limit() const noexcept { return limit_; }
    [[nodiscard]] size_t in_flight() const noexcept { return in_flight_.load(std::memory_order_acquire); }

    /// Highest in_flight() seen so far
    [[nodiscard]] size_t peak() const noexcept { return peak_.load(std::memory_order_relaxed); }

private:
    const size_t limit_;
    std::atomic<size_t> in_flight_{0};
    std::atomic<size_t> peak_{0};
};

} // namespace tnt::pipeline
