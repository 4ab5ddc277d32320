#pragma once

/// @file verify_stage.hpp
/// @brief Stage 4: checksum confirmation and final per-batch result.

#include <algorithm>
#include <cstdint>
#include <utility>

#include "tonitru/memory/mpmc_queue.hpp"
#include "tonitru/pipeline/batch_result.hpp"
#include "tonitru/pipeline/stage_context.hpp"
#include "tonitru/pipeline/stats.hpp"
#include "tonitru/types/error.hpp"
#include "tonitru/types/record_header.hpp"
#include "tonitru/util/logger.hpp"

namespace tnt::pipeline {

class VerifyStage {
public:
    VerifyStage(StatsCounters& stats, const CancelState& cancel) noexcept
        : stats_{stats}, cancel_{cancel} {}

    /// Consume the batch and release its payload. Only a batch with no
    /// errors and a matching CRC32C comes out as BatchOk.
    [[nodiscard]] BatchResult process(DecodedBatch&& batch) {
        if (cancel_.discarding()) {
            batch.errors.emplace_back(BatchErrorCode::Cancelled, batch.ctx.stream_offset);
        } else if (!has(batch, BatchErrorCode::PayloadTransformError)) {
            // Without a restored payload there is nothing meaningful to checksum
            const auto bytes = batch.buffer.bytes();
            const uint32_t actual = batch.ctx.kernels.crc32c(bytes, 0, bytes.size());
            if (actual != batch.header.checksum) [[unlikely]] {
                batch.errors.emplace_back(BatchErrorCode::ChecksumMismatch,
                                          batch.ctx.stream_offset + CHECKSUM_FIELD_OFFSET);
            }
        }

        Diagnostics diagnostics = std::move(batch.diagnostics);
        for (const Diagnostic& d : batch.ctx.kernels.take_diagnostics()) {
            if (d.code == DiagnosticCode::UnsupportedInstructionSet) {
                StatsCounters::bump(stats_.isa_fallbacks);
            }
            diagnostics.push_back(d);
        }

        BatchResult result;
        result.sequence = batch.ctx.sequence;
        result.stream_offset = batch.ctx.stream_offset;
        result.header = batch.header;

        if (batch.errors.empty() && batch.tree) [[likely]] {
            result.outcome = BatchOk{batch.tree->tag, std::move(batch.tree->root), std::move(diagnostics)};
            StatsCounters::bump(stats_.batches_ok);
            return result;
        }

        if (has(batch, BatchErrorCode::Cancelled)) {
            StatsCounters::bump(stats_.batches_cancelled);
        } else {
            StatsCounters::bump(stats_.batches_failed);
            TNT_LOG_DEBUG("batch failed: seq={} offset={} first_error={} errors={}",
                          batch.ctx.sequence, batch.ctx.stream_offset,
                          batch.errors.front().message(), batch.errors.size());
        }
        result.outcome = PartialFailure{std::move(batch.errors), std::move(diagnostics)};
        return result;
    }

    /// Worker loop; `emit` receives results in sequence order
    template <typename Emit>
    void run(memory::MPMCQueue<DecodedBatch>& in, Emit&& emit) {
        while (auto batch = in.pop()) {
            emit(process(std::move(*batch)));
        }
    }

private:
    [[nodiscard]] static bool has(const DecodedBatch& batch, BatchErrorCode code) noexcept {
        return std::any_of(batch.errors.begin(), batch.errors.end(),
                           [code](const BatchError& e) { return e.code == code; });
    }

    StatsCounters& stats_;
    const CancelState& cancel_;
};

} // namespace tnt::pipeline
