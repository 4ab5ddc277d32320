#pragma once

/// @file scalar_kernels.hpp
/// @brief Scalar baseline of every decode primitive.
///
/// These functions define the expected results. Vector tiers either
/// reproduce them exactly or delegate to them for tails and edge cases.

#include <algorithm>
#include <array>
#include <cstring>

#include "tonitru/simd/kernels.hpp"
#include "tonitru/types/wire_type.hpp"

namespace tnt::simd {

namespace scalar {

// ============================================================================
// Varint
// ============================================================================

/// Build the result for a varint whose terminator sits at index `term`.
/// Matches read_varint_scalar when at least MAX_VARINT_LENGTH bytes are readable.
[[nodiscard]] TNT_FORCE_INLINE VarintRead finish_varint(const uint8_t* p, unsigned term) noexcept {
    if (term >= MAX_VARINT_LENGTH ||
        (term == MAX_VARINT_LENGTH - 1 && p[term] > 1)) [[unlikely]] {
        return VarintRead{0, 0, VarintStatus::Overflow};
    }
    return VarintRead{assemble_varint(p, term + 1), static_cast<uint8_t>(term + 1), VarintStatus::Ok};
}

// ============================================================================
// Header Scan
// ============================================================================

/// Shared scan loop; `read` is the tier's varint reader.
template <typename ReadVarint>
[[nodiscard]] inline ScanOutcome scan_items_with(ReadVarint&& read, ByteSpan buffer,
                                                 size_t begin, size_t end, size_t max_items,
                                                 HeaderIndex& out) {
    // Varints must not be read across the end of the enclosing range
    const ByteSpan view = buffer.first(std::min(end, buffer.size()));
    size_t pos = begin;
    size_t count = 0;

    while (pos < view.size()) {
        if (count == max_items) {
            return ScanOutcome{count, ScanStop::Limit, pos};
        }

        const VarintRead tag = read(view, pos);
        if (!tag.ok()) [[unlikely]] {
            return ScanOutcome{count, ScanStop::BadHeader, pos};
        }

        size_t p = pos + tag.length;
        if (p >= view.size()) [[unlikely]] {
            return ScanOutcome{count, ScanStop::BadHeader, pos};
        }
        const uint8_t type = view[p++];

        const VarintRead len = read(view, p);
        if (!len.ok()) [[unlikely]] {
            return ScanOutcome{count, ScanStop::BadHeader, pos};
        }
        p += len.length;

        out.push(tag.value, pos, p, len.value, type);
        ++count;

        if (len.value > view.size() - p) [[unlikely]] {
            return ScanOutcome{count, ScanStop::Overrun, pos};
        }
        pos = p + static_cast<size_t>(len.value);
    }

    return ScanOutcome{count, ScanStop::End, pos};
}

// ============================================================================
// Packed Lanes
// ============================================================================

[[nodiscard]] TNT_FORCE_INLINE uint64_t load_le(const uint8_t* p, size_t n) noexcept {
    uint64_t v = 0;
    for (size_t i = 0; i < n; ++i) {
        v |= static_cast<uint64_t>(p[i]) << (8 * i);
    }
    return v;
}

[[nodiscard]] TNT_FORCE_INLINE uint64_t sign_extend(uint64_t bits, size_t width) noexcept {
    if (width >= 8) return bits;
    const unsigned shift = static_cast<unsigned>(64 - 8 * width);
    return static_cast<uint64_t>(static_cast<int64_t>(bits << shift) >> shift);
}

inline size_t unpack_lanes(ByteSpan buffer, size_t offset, size_t count, uint8_t width,
                           bool is_signed, uint64_t* out) noexcept {
    const uint8_t* p = buffer.data() + offset;
    for (size_t i = 0; i < count; ++i, p += width) {
        const uint64_t bits = load_le(p, width);
        out[i] = is_signed ? sign_extend(bits, width) : bits;
    }
    return count;
}

// ============================================================================
// Bounds Validation
// ============================================================================

[[nodiscard]] TNT_FORCE_INLINE bool entry_invalid(uint64_t value_offset, uint64_t length,
                                                  uint8_t type, uint64_t limit) noexcept {
    const uint64_t expected = expected_length(type);
    return expected == WIDTH_INVALID
        || (expected != WIDTH_VARIABLE && expected != length)
        || value_offset > limit
        || length > limit - value_offset;
}

[[nodiscard]] inline size_t validate_bounds(const HeaderIndex& index, size_t first,
                                            uint64_t limit) noexcept {
    for (size_t i = first; i < index.size(); ++i) {
        if (entry_invalid(index.value_offsets[i], index.lengths[i], index.types[i], limit)) {
            return i;
        }
    }
    return npos;
}

// ============================================================================
// UTF-8 Validation
// ============================================================================

/// Total sequence length announced by a lead byte (0 if not a lead byte)
[[nodiscard]] inline constexpr size_t utf8_sequence_length(uint8_t lead) noexcept {
    if (lead < 0x80) return 1;
    if (lead >= 0xC2 && lead <= 0xDF) return 2;
    if (lead >= 0xE0 && lead <= 0xEF) return 3;
    if (lead >= 0xF0 && lead <= 0xF4) return 4;
    return 0;
}

/// Reject overlongs, surrogates and code points above U+10FFFF.
/// Offsets in the result are buffer offsets.
[[nodiscard]] inline Utf8Scan validate_utf8(ByteSpan buffer, size_t offset,
                                            size_t length) noexcept {
    const uint8_t* p = buffer.data() + offset;
    size_t i = 0;

    while (i < length) {
        const uint8_t lead = p[i];
        if (lead < 0x80) {
            ++i;
            continue;
        }

        uint8_t lo = 0x80;
        uint8_t hi = 0xBF;
        const size_t seq = utf8_sequence_length(lead);
        if (seq == 0) {
            return Utf8Scan{offset + i, 0};
        }
        const size_t need = seq - 1;
        if (lead == 0xE0) lo = 0xA0;
        else if (lead == 0xED) hi = 0x9F;
        else if (lead == 0xF0) lo = 0x90;
        else if (lead == 0xF4) hi = 0x8F;

        const size_t avail = length - i - 1;
        const size_t n = std::min(need, avail);
        for (size_t k = 1; k <= n; ++k) {
            const uint8_t c = p[i + k];
            const uint8_t min = (k == 1) ? lo : uint8_t{0x80};
            const uint8_t max = (k == 1) ? hi : uint8_t{0xBF};
            if (c < min || c > max) {
                return Utf8Scan{offset + i, 0};
            }
        }
        if (avail < need) {
            return Utf8Scan{npos, static_cast<uint8_t>(avail + 1)};
        }
        i += need + 1;
    }
    return Utf8Scan{};
}

// ============================================================================
// CRC-32C
// ============================================================================

namespace detail {

inline constexpr uint32_t CRC32C_POLY = 0x82F63B78u;  // Reflected Castagnoli

consteval std::array<uint32_t, 256> create_crc32c_table() {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int bit = 0; bit < 8; ++bit) {
            crc = (crc & 1) ? (crc >> 1) ^ CRC32C_POLY : crc >> 1;
        }
        table[i] = crc;
    }
    return table;
}

inline constexpr auto CRC32C_TABLE = create_crc32c_table();

} // namespace detail

/// Raw register update (no pre/post inversion)
[[nodiscard]] inline constexpr uint32_t crc32c_update(uint32_t crc, const uint8_t* p,
                                                      size_t n) noexcept {
    for (size_t i = 0; i < n; ++i) {
        crc = detail::CRC32C_TABLE[(crc ^ p[i]) & 0xFF] ^ (crc >> 8);
    }
    return crc;
}

[[nodiscard]] inline uint32_t crc32c(ByteSpan buffer, size_t offset, size_t length,
                                     uint32_t seed) noexcept {
    return ~crc32c_update(~seed, buffer.data() + offset, length);
}

} // namespace scalar

// ============================================================================
// Scalar Tier
// ============================================================================

class ScalarKernels final : public IDecodeKernels {
public:
    [[nodiscard]] Isa isa() const noexcept override { return Isa::Scalar; }
    [[nodiscard]] size_t alignment() const noexcept override { return 1; }

    [[nodiscard]] KernelResult<VarintRead>
        read_varint(ByteSpan buffer, size_t offset) const noexcept override {
        return read_varint_scalar(buffer, offset);
    }

    [[nodiscard]] KernelResult<ScanOutcome>
        scan_items(ByteSpan buffer, size_t begin, size_t end, size_t max_items,
                   HeaderIndex& out) const override {
        return scalar::scan_items_with(read_varint_scalar, buffer, begin, end, max_items, out);
    }

    [[nodiscard]] KernelResult<size_t>
        validate_bounds(const HeaderIndex& index, size_t first,
                        uint64_t limit) const noexcept override {
        return scalar::validate_bounds(index, first, limit);
    }

    [[nodiscard]] KernelResult<Utf8Scan>
        validate_utf8(ByteSpan buffer, size_t offset, size_t length) const noexcept override {
        return scalar::validate_utf8(buffer, offset, length);
    }

    [[nodiscard]] KernelResult<size_t>
        unpack_lanes(ByteSpan buffer, size_t offset, size_t count, uint8_t width,
                     bool is_signed, uint64_t* out) const noexcept override {
        return scalar::unpack_lanes(buffer, offset, count, width, is_signed, out);
    }

    [[nodiscard]] KernelResult<uint32_t>
        crc32c(ByteSpan buffer, size_t offset, size_t length,
               uint32_t seed) const noexcept override {
        return scalar::crc32c(buffer, offset, length, seed);
    }
};

} // namespace tnt::simd
