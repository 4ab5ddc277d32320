#pragma once

/// @file config.hpp
/// @brief Pipeline configuration and collaborator interfaces

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string_view>

#include "tonitru/codec/decoder.hpp"
#include "tonitru/memory/batch_buffer.hpp"
#include "tonitru/simd/capability.hpp"
#include "tonitru/types/record_header.hpp"

namespace tnt::pipeline {

// ============================================================================
// Policies
// ============================================================================

/// What a sink does when its delivery queue is full
enum class BackpressurePolicy : uint8_t {
    Block = 0,        // Wait for room (no data loss)
    DropAndReport     // Skip this delivery and attach a SinkOverflow diagnostic
};

enum class CancelMode : uint8_t {
    Drain = 0,   // Stop admission, finish in-flight batches normally
    Discard      // Stop admission, report in-flight batches as Cancelled
};

[[nodiscard]] inline constexpr std::string_view backpressure_name(BackpressurePolicy p) noexcept {
    return p == BackpressurePolicy::Block ? "block" : "drop_and_report";
}

// ============================================================================
// Payload Transform (decompression / decryption collaborator)
// ============================================================================

/// Restores the plain payload of a record flagged COMPRESSED or ENCRYPTED.
/// Called on the prefetch worker.
class IPayloadTransform {
public:
    virtual ~IPayloadTransform() = default;

    /// @return plain bytes aligned to at least `alignment`, or nullopt on failure
    [[nodiscard]] virtual std::optional<memory::OwnedBuffer>
        restore(const RecordHeader& header, std::span<const uint8_t> payload, size_t alignment) = 0;
};

// ============================================================================
// Pipeline Configuration
// ============================================================================

struct PipelineConfig {
    /// Decode worker threads
    size_t decode_workers = 2;

    /// Capacity of each inter-stage queue (rounded up to a power of two)
    size_t stage_queue_capacity = 64;

    /// Capacity of the result queue behind a BatchStream
    size_t output_queue_capacity = 64;

    /// Batches admitted but not yet delivered (0 = derived from the queues)
    size_t max_in_flight = 0;

    /// Largest accepted payload length; larger headers are stream-fatal
    uint64_t max_record_size = uint64_t{64} << 20;

    codec::DecoderConfig decoder{};

    /// Policy for sinks created through Pipeline::add_async_sink
    BackpressurePolicy backpressure = BackpressurePolicy::Block;

    std::shared_ptr<IPayloadTransform> payload_transform;

    /// Instruction sets batches may bind to
    simd::CapabilitySet capabilities = simd::capabilities();

    /// Effective in-flight window: three stage queues, one batch per decode
    /// worker, plus the one dispatch and verify each hold outside a queue
    [[nodiscard]] size_t in_flight_limit() const noexcept {
        if (max_in_flight != 0) return max_in_flight;
        const size_t queue = std::bit_ceil(std::max<size_t>(2, stage_queue_capacity));
        return 3 * queue + std::max<size_t>(1, decode_workers) + 2;
    }
};

} // namespace tnt::pipeline
