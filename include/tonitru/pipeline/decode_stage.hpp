#pragma once

/// @file decode_stage.hpp
/// @brief Stage 2: payload to value tree on a pool of decode workers.
///
/// Workers complete out of order; the sequence number in the context lets
/// dispatch restore admission order.

#include <atomic>
#include <cstddef>
#include <optional>
#include <utility>

#include "tonitru/codec/decoder.hpp"
#include "tonitru/memory/mpmc_queue.hpp"
#include "tonitru/pipeline/config.hpp"
#include "tonitru/pipeline/stage_context.hpp"
#include "tonitru/types/error.hpp"
#include "tonitru/util/logger.hpp"

namespace tnt::pipeline {

class DecodeStage {
public:
    DecodeStage(const PipelineConfig& config, const CancelState& cancel) noexcept
        : decoder_{config.decoder}, cancel_{cancel} {}

    /// Decode one staged batch. Batches that already failed (transform) or
    /// are being discarded pass through without a tree.
    [[nodiscard]] DecodedBatch process(StagedBatch&& staged) const {
        DecodedBatch out{std::move(staged.ctx), staged.header, std::move(staged.buffer),
                         std::nullopt, std::move(staged.errors), std::move(staged.diagnostics)};

        if (!out.errors.empty() || cancel_.discarding()) {
            return out;
        }

        auto tree = decoder_.decode(out.buffer, out.header, out.ctx.kernels);
        if (tree) [[likely]] {
            out.tree = std::move(*tree);
        } else {
            // Decoder offsets are payload-relative
            const BatchError error = tree.error().rebased(out.ctx.payload_offset());
            TNT_LOG_DEBUG("decode failed: seq={} offset={} reason={}",
                          out.ctx.sequence, error.offset, error.message());
            out.errors.push_back(error);
        }
        return out;
    }

    /// Worker loop. The last worker to finish closes `out`.
    void run(memory::MPMCQueue<StagedBatch>& in, memory::MPMCQueue<DecodedBatch>& out,
             std::atomic<size_t>& live_workers) const {
        while (auto staged = in.pop()) {
            out.push(process(std::move(*staged)));
        }
        if (live_workers.fetch_sub(1, std::memory_order_acq_rel) == 1) {
            out.close();
        }
    }

    [[nodiscard]] const codec::Decoder& decoder() const noexcept { return decoder_; }

private:
    codec::Decoder decoder_;
    const CancelState& cancel_;
};

} // namespace tnt::pipeline
