#pragma once

/// @file kernels.hpp
/// @brief Decode primitives shared by every instruction-set tier

#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <string_view>
#include <vector>

#include "tonitru/codec/varint.hpp"
#include "tonitru/simd/capability.hpp"
#include "tonitru/types/error.hpp"

namespace tnt::simd {

using ByteSpan = std::span<const uint8_t>;

inline constexpr size_t npos = std::numeric_limits<size_t>::max();

// ============================================================================
// Header Index (structure-of-arrays, one entry per scanned item)
// ============================================================================

struct HeaderIndex {
    std::vector<uint64_t> tags;
    std::vector<uint64_t> item_offsets;    // First byte of the item (its tag)
    std::vector<uint64_t> value_offsets;   // First byte of the value
    std::vector<uint64_t> lengths;         // Declared value length
    std::vector<uint8_t> types;            // Raw type byte

    [[nodiscard]] size_t size() const noexcept { return tags.size(); }
    [[nodiscard]] bool empty() const noexcept { return tags.empty(); }

    void clear() noexcept {
        tags.clear();
        item_offsets.clear();
        value_offsets.clear();
        lengths.clear();
        types.clear();
    }

    void push(uint64_t tag, uint64_t item_offset, uint64_t value_offset,
              uint64_t length, uint8_t type) {
        tags.push_back(tag);
        item_offsets.push_back(item_offset);
        value_offsets.push_back(value_offset);
        lengths.push_back(length);
        types.push_back(type);
    }

    /// One past the last byte of item i
    [[nodiscard]] uint64_t item_end(size_t i) const noexcept {
        return value_offsets[i] + lengths[i];
    }
};

// ============================================================================
// Primitive Results
// ============================================================================

enum class ScanStop : uint8_t {
    End = 0,      // Reached the end of the range exactly
    Limit,        // Collected the requested number of items
    BadHeader,    // Tag or length varint malformed, or header cut off
    Overrun       // Last item's value runs past the range (item still recorded)
};

struct ScanOutcome {
    size_t count{0};        // Items appended to the index
    ScanStop stop{ScanStop::End};
    size_t next{0};         // Offset where scanning stopped

    constexpr bool operator==(const ScanOutcome&) const noexcept = default;
};

struct Utf8Scan {
    size_t error_offset{npos};   // First byte of the invalid sequence
    uint8_t tail{0};             // Trailing bytes of an incomplete but valid prefix

    [[nodiscard]] constexpr bool complete() const noexcept {
        return error_offset == npos && tail == 0;
    }

    constexpr bool operator==(const Utf8Scan&) const noexcept = default;
};

// ============================================================================
// Kernel Interface
// ============================================================================

/// One implementation per instruction set. Each primitive reports a
/// KernelFault when its own precondition does not hold (never for malformed
/// input, which is part of the result), so the caller can retry on the
/// next-ranked tier. All implementations return bit-identical results.
class IDecodeKernels {
public:
    virtual ~IDecodeKernels() = default;

    [[nodiscard]] virtual Isa isa() const noexcept = 0;

    /// Register width in bytes; buffers handed to this tier must be aligned to it
    [[nodiscard]] virtual size_t alignment() const noexcept = 0;

    [[nodiscard]] std::string_view name() const noexcept { return isa_name(isa()); }

    /// Varint-style length decode at `offset`
    [[nodiscard]] virtual KernelResult<VarintRead>
        read_varint(ByteSpan buffer, size_t offset) const noexcept = 0;

    /// Tag/length header scan of consecutive items in [begin, end).
    /// Stops after `max_items` items.
    [[nodiscard]] virtual KernelResult<ScanOutcome>
        scan_items(ByteSpan buffer, size_t begin, size_t end, size_t max_items,
                   HeaderIndex& out) const = 0;

    /// Bulk bounds/length validation of index entries [first, out.size()).
    /// Returns the index of the first invalid entry, or npos.
    [[nodiscard]] virtual KernelResult<size_t>
        validate_bounds(const HeaderIndex& index, size_t first, uint64_t limit) const noexcept = 0;

    [[nodiscard]] virtual KernelResult<Utf8Scan>
        validate_utf8(ByteSpan buffer, size_t offset, size_t length) const noexcept = 0;

    /// Widen `count` little-endian elements of `width` bytes (1, 2, 4 or 8)
    /// starting at buffer[offset] into 64-bit lanes, sign-extended when
    /// `is_signed`. The caller checks the range; `out` holds `count` lanes.
    /// Returns the number of lanes written.
    [[nodiscard]] virtual KernelResult<size_t>
        unpack_lanes(ByteSpan buffer, size_t offset, size_t count, uint8_t width,
                     bool is_signed, uint64_t* out) const noexcept = 0;

    /// CRC-32C (Castagnoli) of buffer[offset, offset + length)
    [[nodiscard]] virtual KernelResult<uint32_t>
        crc32c(ByteSpan buffer, size_t offset, size_t length, uint32_t seed) const noexcept = 0;

protected:
    [[nodiscard]] bool aligned(ByteSpan buffer) const noexcept {
        return (reinterpret_cast<uintptr_t>(buffer.data()) & (alignment() - 1)) == 0;
    }
};

} // namespace tnt::simd
