#pragma once

/// @file prefetch_stage.hpp
/// @brief Stage 1: frame records and stage their payloads for vector access.
///
/// Input comes from a SpanSource (caller buffer pinned by a SourceScope,
/// zero-copy when aligned) or a ChunkSource (blocking chunk feed, always
/// copied into owned buffers). A record is released only once its header
/// and whole payload are available; bytes of the next record are kept.
/// Each staged batch holds one FlightWindow credit until it is delivered.

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <utility>
#include <vector>

#include "tonitru/memory/batch_buffer.hpp"
#include "tonitru/memory/mpmc_queue.hpp"
#include "tonitru/pipeline/config.hpp"
#include "tonitru/pipeline/stage_context.hpp"
#include "tonitru/pipeline/stats.hpp"
#include "tonitru/simd/dispatch.hpp"
#include "tonitru/types/error.hpp"
#include "tonitru/types/record_header.hpp"
#include "tonitru/util/prefetch.hpp"

namespace tnt::pipeline {

// ============================================================================
// Sources
// ============================================================================

/// Whole input in caller memory
class SpanSource {
public:
    explicit SpanSource(memory::SourceScope& scope) noexcept : scope_{scope} {}

    [[nodiscard]] memory::SourceScope& scope() noexcept { return scope_; }
    [[nodiscard]] std::span<const uint8_t> bytes() const noexcept { return scope_.source(); }

private:
    memory::SourceScope& scope_;
};

/// Input delivered in chunks by another thread
class ChunkSource {
public:
    explicit ChunkSource(size_t capacity = 16) : chunks_{capacity} {}

    ChunkSource(const ChunkSource&) = delete;
    ChunkSource& operator=(const ChunkSource&) = delete;

    /// Copy a chunk in. Blocks while the feed is full.
    /// @return false once the consumer stopped reading (stream error or cancel)
    [[nodiscard]] bool feed(std::span<const uint8_t> chunk) {
        if (chunk.empty()) return !abandoned();
        std::vector<uint8_t> copy(chunk.begin(), chunk.end());
        memory::StageWait::State state{};
        while (!chunks_.try_push(copy)) {
            if (abandoned()) return false;
            memory::StageWait::wait(state);
        }
        return !abandoned();
    }

    /// End of input
    void finish() noexcept { chunks_.close(); }

    /// Next chunk; blocks until one arrives. nullopt after finish() and drain.
    [[nodiscard]] std::optional<std::vector<uint8_t>> next() noexcept { return chunks_.pop(); }

    /// Consumer side gives up; pending and future chunks are dropped
    void abandon() noexcept {
        abandoned_.store(true, std::memory_order_release);
        while (chunks_.try_pop()) {}
    }

    [[nodiscard]] bool abandoned() const noexcept {
        return abandoned_.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool finished() const noexcept { return chunks_.closed(); }

private:
    memory::MPMCQueue<std::vector<uint8_t>> chunks_;
    std::atomic<bool> abandoned_{false};
};

// ============================================================================
// Prefetch Stage
// ============================================================================

class PrefetchStage {
public:
    PrefetchStage(const PipelineConfig& config, StatsCounters& stats, const CancelState& cancel,
                  FlightWindow& window) noexcept
        : config_{config}, stats_{stats}, cancel_{cancel}, window_{window} {}

    /// Frame every record of a pinned buffer. Waits for a window credit
    /// per record; `emit` blocks while the decode queue is full.
    template <typename Emit>
    [[nodiscard]] StreamResult<void> run(SpanSource& source, Emit&& emit) {
        const std::span<const uint8_t> input = source.bytes();
        size_t pos = 0;

        while (pos < input.size()) {
            if (cancel_.stopping()) break;

            auto header = RecordHeader::parse(input.subspan(pos), pos, config_.max_record_size);
            if (!header) [[unlikely]] {
                return std::unexpected(header.error());
            }
            if (header->payload_length > input.size() - pos - RECORD_HEADER_SIZE) [[unlikely]] {
                return std::unexpected(StreamError{HeaderDefect::TruncatedRecord, pos});
            }

            if (!admit()) break;
            memory::BatchBuffer payload{
                source.scope().borrow(pos + RECORD_HEADER_SIZE, header->payload_length)};
            emit(stage(*header, pos, std::move(payload)));
            pos += header->record_size();
        }
        return {};
    }

    /// Frame records from a chunk feed, carrying partial records across chunks
    template <typename Emit>
    [[nodiscard]] StreamResult<void> run(ChunkSource& source, Emit&& emit) {
        std::vector<uint8_t> pending;
        size_t base = 0;   // Stream offset of pending[0]

        for (;;) {
            size_t pos = 0;
            while (!cancel_.stopping() && pending.size() - pos >= RECORD_HEADER_SIZE) {
                const std::span<const uint8_t> window{pending.data() + pos, pending.size() - pos};
                auto header = RecordHeader::parse(window, base + pos, config_.max_record_size);
                if (!header) [[unlikely]] {
                    source.abandon();
                    return std::unexpected(header.error());
                }
                if (window.size() - RECORD_HEADER_SIZE < header->payload_length) {
                    break;   // Wait for the rest of the payload
                }

                if (!admit()) break;
                auto owned = memory::OwnedBuffer::copy_of(
                    window.subspan(RECORD_HEADER_SIZE, header->payload_length), owned_alignment());
                emit(stage(*header, base + pos, memory::BatchBuffer{std::move(owned)}));
                pos += header->record_size();
            }

            if (cancel_.stopping()) {
                source.abandon();
                return {};
            }
            if (pos != 0) {
                pending.erase(pending.begin(), pending.begin() + static_cast<std::ptrdiff_t>(pos));
                base += pos;
            }

            auto chunk = source.next();
            if (!chunk) {
                if (!pending.empty()) [[unlikely]] {
                    return std::unexpected(StreamError{HeaderDefect::TruncatedRecord, base});
                }
                return {};
            }
            pending.insert(pending.end(), chunk->begin(), chunk->end());
        }
    }

    [[nodiscard]] uint64_t admitted() const noexcept { return next_sequence_; }

private:
    [[nodiscard]] bool admit() noexcept {
        if (!window_.acquire(cancel_)) return false;
        StatsCounters::raise(stats_.peak_in_flight, window_.in_flight());
        return true;
    }

    [[nodiscard]] size_t owned_alignment() const noexcept {
        return std::max<size_t>(util::CACHE_LINE_SIZE,
                                simd::kernels_for(config_.capabilities.best()).alignment());
    }

    [[nodiscard]] StagedBatch stage(const RecordHeader& header, size_t offset,
                                    memory::BatchBuffer payload) {
        StagedBatch staged{
            PipelineStageContext{next_sequence_++, offset,
                                 simd::BatchKernels{config_.capabilities, simd::default_kernel_table(), offset}},
            header, std::move(payload), {}, {}};
        const size_t alignment = staged.ctx.kernels.alignment();

        if (header.transformed()) {
            restore(staged, alignment);
        } else if (!staged.buffer.satisfies(alignment)) {
            staged.buffer.promote(alignment);
            staged.diagnostics.emplace_back(DiagnosticCode::AlignmentFallback, offset,
                                            static_cast<uint32_t>(alignment));
            StatsCounters::bump(stats_.alignment_fallbacks);
        }

        const auto bytes = staged.buffer.bytes();
        if (!bytes.empty()) {
            util::prefetch_span(bytes.data(), bytes.size());
        }
        StatsCounters::bump(stats_.batches_admitted);
        StatsCounters::bump(stats_.bytes, header.record_size());
        return staged;
    }

    void restore(StagedBatch& staged, size_t alignment) {
        if (!config_.payload_transform) {
            staged.errors.emplace_back(BatchErrorCode::PayloadTransformError, staged.ctx.stream_offset);
            return;
        }
        auto plain = config_.payload_transform->restore(staged.header, staged.buffer.bytes(), alignment);
        if (!plain) {
            staged.errors.emplace_back(BatchErrorCode::PayloadTransformError, staged.ctx.stream_offset);
            return;
        }
        staged.buffer = memory::BatchBuffer{std::move(*plain)};
        if (!staged.buffer.satisfies(alignment)) {
            staged.buffer.promote(alignment);
        }
    }

    const PipelineConfig& config_;
    StatsCounters& stats_;
    const CancelState& cancel_;
    FlightWindow& window_;
    uint64_t next_sequence_{0};
};

} // namespace tnt::pipeline
