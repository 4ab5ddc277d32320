/*
    Tonitru x86 Decode Kernels

    SSE4.2, AVX2 and AVX-512 tiers of the decode primitives. Each function
    is compiled for its own target, so the binary does not need -mavx2; the
    capability probe guarantees a tier only runs on a CPU that has it.

    - varint decode: one vector load, movemask of the continuation bits,
      terminator found with a single count-trailing-ones
    - header scan: the shared scan loop driven by the tier's varint reader
    - bounds validation: 2/4/8 entries per compare
    - UTF-8: vector ASCII skip, scalar validation from the first high byte
    - packed lanes: cvtepu/cvtepi widening to 64 bits, 2/4/8 lanes per step
    - CRC-32C: SSE4.2 crc32 instruction, 8 bytes per step
*/

#pragma once

#include <bit>
#include <cstring>

#include "tonitru/simd/scalar_kernels.hpp"

#if TNT_X86_KERNELS
    #include <immintrin.h>
#endif

namespace tnt::simd {

#if TNT_X86_KERNELS

namespace x86 {

// ============================================================================
// Shared Helpers
// ============================================================================

/// BMI2 variant: gather the 7-bit groups of the first 8 bytes with one pext
TNT_TARGET("bmi2")
[[nodiscard]] inline VarintRead finish_varint_bmi2(const uint8_t* p, unsigned term) noexcept {
    if (term >= MAX_VARINT_LENGTH ||
        (term == MAX_VARINT_LENGTH - 1 && p[term] > 1)) [[unlikely]] {
        return VarintRead{0, 0, VarintStatus::Overflow};
    }
    const unsigned len = term + 1;
    uint64_t lo;
    std::memcpy(&lo, p, sizeof(lo));
    if (len < 8) {
        lo &= (uint64_t{1} << (8 * len)) - 1;
    }
    uint64_t value = _pext_u64(lo, 0x7F7F7F7F7F7F7F7Full);
    if (len > 8) value |= static_cast<uint64_t>(p[8] & 0x7F) << 56;
    if (len > 9) value |= static_cast<uint64_t>(p[9] & 0x7F) << 63;
    return VarintRead{value, static_cast<uint8_t>(len), VarintStatus::Ok};
}

// ============================================================================
// SSE4.2 (128-bit)
// ============================================================================

TNT_TARGET("sse4.2")
[[nodiscard]] inline VarintRead read_varint_sse42(ByteSpan data, size_t offset) noexcept {
    if (offset >= data.size() || data.size() - offset < 16) {
        return read_varint_scalar(data, offset);
    }
    const uint8_t* p = data.data() + offset;
    const __m128i v = _mm_loadu_si128(reinterpret_cast<const __m128i*>(p));
    const auto cont = static_cast<uint16_t>(_mm_movemask_epi8(v));
    return scalar::finish_varint(p, static_cast<unsigned>(std::countr_one(cont)));
}

TNT_TARGET("sse4.2")
[[nodiscard]] inline size_t validate_bounds_sse42(const HeaderIndex& index, size_t first,
                                                  uint64_t limit) noexcept {
    const size_t n = index.size();
    const __m128i sign = _mm_set1_epi64x(INT64_MIN);
    const __m128i vlimit = _mm_set1_epi64x(static_cast<int64_t>(limit));
    const __m128i slimit = _mm_xor_si128(vlimit, sign);
    const __m128i variable = _mm_set1_epi64x(static_cast<int64_t>(WIDTH_VARIABLE));
    const __m128i invalid = _mm_set1_epi64x(static_cast<int64_t>(WIDTH_INVALID));

    size_t i = first;
    for (; i + 2 <= n; i += 2) {
        const __m128i vo = _mm_loadu_si128(reinterpret_cast<const __m128i*>(&index.value_offsets[i]));
        const __m128i len = _mm_loadu_si128(reinterpret_cast<const __m128i*>(&index.lengths[i]));
        const __m128i exp = _mm_set_epi64x(
            static_cast<int64_t>(expected_length(index.types[i + 1])),
            static_cast<int64_t>(expected_length(index.types[i])));

        const __m128i width_ok = _mm_or_si128(_mm_cmpeq_epi64(exp, len), _mm_cmpeq_epi64(exp, variable));
        const __m128i room = _mm_sub_epi64(vlimit, vo);
        const __m128i vo_over = _mm_cmpgt_epi64(_mm_xor_si128(vo, sign), slimit);
        const __m128i len_over = _mm_cmpgt_epi64(_mm_xor_si128(len, sign), _mm_xor_si128(room, sign));

        __m128i bad = _mm_or_si128(_mm_cmpeq_epi64(exp, invalid), _mm_or_si128(vo_over, len_over));
        bad = _mm_or_si128(bad, _mm_andnot_si128(width_ok, _mm_set1_epi64x(-1)));

        const int mask = _mm_movemask_pd(_mm_castsi128_pd(bad));
        if (mask != 0) [[unlikely]] {
            return i + static_cast<size_t>(std::countr_zero(static_cast<unsigned>(mask)));
        }
    }
    for (; i < n; ++i) {
        if (scalar::entry_invalid(index.value_offsets[i], index.lengths[i], index.types[i], limit)) {
            return i;
        }
    }
    return npos;
}

TNT_TARGET("sse4.2")
[[nodiscard]] inline Utf8Scan validate_utf8_sse42(ByteSpan buffer, size_t offset,
                                                  size_t length) noexcept {
    const uint8_t* p = buffer.data() + offset;
    size_t i = 0;
    for (; i + 16 <= length; i += 16) {
        const __m128i v = _mm_loadu_si128(reinterpret_cast<const __m128i*>(p + i));
        const int high = _mm_movemask_epi8(v);
        if (high != 0) {
            i += static_cast<size_t>(std::countr_zero(static_cast<unsigned>(high)));
            return scalar::validate_utf8(buffer, offset + i, length - i);
        }
    }
    return scalar::validate_utf8(buffer, offset + i, length - i);
}

TNT_TARGET("sse4.2")
[[nodiscard]] inline size_t unpack_lanes_sse42(ByteSpan buffer, size_t offset, size_t count,
                                               uint8_t width, bool is_signed, uint64_t* out) noexcept {
    if (count == 0) return 0;
    const uint8_t* p = buffer.data() + offset;
    if (width == 8) {
        std::memcpy(out, p, count * 8);
        return count;
    }
    const size_t step = 2 * size_t{width};
    size_t i = 0;
    for (; i + 2 <= count; i += 2, p += step) {
        uint64_t raw = 0;
        std::memcpy(&raw, p, step);
        const __m128i v = _mm_cvtsi64_si128(static_cast<long long>(raw));
        __m128i wide;
        if (width == 1)      wide = is_signed ? _mm_cvtepi8_epi64(v) : _mm_cvtepu8_epi64(v);
        else if (width == 2) wide = is_signed ? _mm_cvtepi16_epi64(v) : _mm_cvtepu16_epi64(v);
        else                 wide = is_signed ? _mm_cvtepi32_epi64(v) : _mm_cvtepu32_epi64(v);
        _mm_storeu_si128(reinterpret_cast<__m128i*>(out + i), wide);
    }
    return i + scalar::unpack_lanes(buffer, offset + i * width, count - i, width, is_signed, out + i);
}

TNT_TARGET("sse4.2")
[[nodiscard]] inline uint32_t crc32c_sse42(ByteSpan buffer, size_t offset, size_t length,
                                           uint32_t seed) noexcept {
    const uint8_t* p = buffer.data() + offset;
    uint64_t crc = static_cast<uint32_t>(~seed);
    while (length >= 8) {
        uint64_t word;
        std::memcpy(&word, p, sizeof(word));
        crc = _mm_crc32_u64(crc, word);
        p += 8;
        length -= 8;
    }
    auto crc32 = static_cast<uint32_t>(crc);
    while (length > 0) {
        crc32 = _mm_crc32_u8(crc32, *p++);
        --length;
    }
    return ~crc32;
}

// ============================================================================
// AVX2 (256-bit)
// ============================================================================

TNT_TARGET("avx2,bmi2")
[[nodiscard]] inline VarintRead read_varint_avx2(ByteSpan data, size_t offset) noexcept {
    if (offset >= data.size() || data.size() - offset < 32) {
        return read_varint_sse42(data, offset);
    }
    const uint8_t* p = data.data() + offset;
    const __m256i v = _mm256_loadu_si256(reinterpret_cast<const __m256i*>(p));
    const auto cont = static_cast<uint32_t>(_mm256_movemask_epi8(v));
    return finish_varint_bmi2(p, static_cast<unsigned>(std::countr_one(cont)));
}

TNT_TARGET("avx2")
[[nodiscard]] inline size_t validate_bounds_avx2(const HeaderIndex& index, size_t first,
                                                 uint64_t limit) noexcept {
    const size_t n = index.size();
    const __m256i sign = _mm256_set1_epi64x(INT64_MIN);
    const __m256i vlimit = _mm256_set1_epi64x(static_cast<int64_t>(limit));
    const __m256i slimit = _mm256_xor_si256(vlimit, sign);
    const __m256i variable = _mm256_set1_epi64x(static_cast<int64_t>(WIDTH_VARIABLE));
    const __m256i invalid = _mm256_set1_epi64x(static_cast<int64_t>(WIDTH_INVALID));
    const __m256i ones = _mm256_set1_epi64x(-1);

    size_t i = first;
    for (; i + 4 <= n; i += 4) {
        const __m256i vo = _mm256_loadu_si256(reinterpret_cast<const __m256i*>(&index.value_offsets[i]));
        const __m256i len = _mm256_loadu_si256(reinterpret_cast<const __m256i*>(&index.lengths[i]));
        const __m256i exp = _mm256_set_epi64x(
            static_cast<int64_t>(expected_length(index.types[i + 3])),
            static_cast<int64_t>(expected_length(index.types[i + 2])),
            static_cast<int64_t>(expected_length(index.types[i + 1])),
            static_cast<int64_t>(expected_length(index.types[i])));

        const __m256i width_ok = _mm256_or_si256(_mm256_cmpeq_epi64(exp, len),
                                                 _mm256_cmpeq_epi64(exp, variable));
        const __m256i room = _mm256_sub_epi64(vlimit, vo);
        const __m256i vo_over = _mm256_cmpgt_epi64(_mm256_xor_si256(vo, sign), slimit);
        const __m256i len_over = _mm256_cmpgt_epi64(_mm256_xor_si256(len, sign),
                                                     _mm256_xor_si256(room, sign));

        __m256i bad = _mm256_or_si256(_mm256_cmpeq_epi64(exp, invalid),
                                      _mm256_or_si256(vo_over, len_over));
        bad = _mm256_or_si256(bad, _mm256_andnot_si256(width_ok, ones));

        const int mask = _mm256_movemask_pd(_mm256_castsi256_pd(bad));
        if (mask != 0) [[unlikely]] {
            return i + static_cast<size_t>(std::countr_zero(static_cast<unsigned>(mask)));
        }
    }
    for (; i < n; ++i) {
        if (scalar::entry_invalid(index.value_offsets[i], index.lengths[i], index.types[i], limit)) {
            return i;
        }
    }
    return npos;
}

TNT_TARGET("avx2")
[[nodiscard]] inline Utf8Scan validate_utf8_avx2(ByteSpan buffer, size_t offset,
                                                 size_t length) noexcept {
    const uint8_t* p = buffer.data() + offset;
    size_t i = 0;
    for (; i + 32 <= length; i += 32) {
        const __m256i v = _mm256_loadu_si256(reinterpret_cast<const __m256i*>(p + i));
        const auto high = static_cast<uint32_t>(_mm256_movemask_epi8(v));
        if (high != 0) {
            i += static_cast<size_t>(std::countr_zero(high));
            return scalar::validate_utf8(buffer, offset + i, length - i);
        }
    }
    return scalar::validate_utf8(buffer, offset + i, length - i);
}

TNT_TARGET("avx2")
[[nodiscard]] inline size_t unpack_lanes_avx2(ByteSpan buffer, size_t offset, size_t count,
                                              uint8_t width, bool is_signed, uint64_t* out) noexcept {
    if (width == 8 || count < 4) {
        return unpack_lanes_sse42(buffer, offset, count, width, is_signed, out);
    }
    const uint8_t* p = buffer.data() + offset;
    const size_t step = 4 * size_t{width};
    size_t i = 0;
    for (; i + 4 <= count; i += 4, p += step) {
        __m128i v;
        if (width == 4) {
            v = _mm_loadu_si128(reinterpret_cast<const __m128i*>(p));
        } else {
            uint64_t raw = 0;
            std::memcpy(&raw, p, step);
            v = _mm_cvtsi64_si128(static_cast<long long>(raw));
        }
        __m256i wide;
        if (width == 1)      wide = is_signed ? _mm256_cvtepi8_epi64(v) : _mm256_cvtepu8_epi64(v);
        else if (width == 2) wide = is_signed ? _mm256_cvtepi16_epi64(v) : _mm256_cvtepu16_epi64(v);
        else                 wide = is_signed ? _mm256_cvtepi32_epi64(v) : _mm256_cvtepu32_epi64(v);
        _mm256_storeu_si256(reinterpret_cast<__m256i*>(out + i), wide);
    }
    return i + unpack_lanes_sse42(buffer, offset + i * width, count - i, width, is_signed, out + i);
}

// ============================================================================
// AVX-512 (512-bit, requires F + BW)
// ============================================================================

TNT_TARGET("avx512f,avx512bw,bmi2")
[[nodiscard]] inline VarintRead read_varint_avx512(ByteSpan data, size_t offset) noexcept {
    if (offset >= data.size() || data.size() - offset < 16) {
        return read_varint_scalar(data, offset);
    }
    const size_t avail = std::min<size_t>(data.size() - offset, 64);
    const __mmask64 load = avail == 64 ? ~__mmask64{0} : (__mmask64{1} << avail) - 1;
    const uint8_t* p = data.data() + offset;
    // Masked-off lanes read as zero, i.e. as terminators past the end; with
    // at least 16 readable bytes they can only matter after index 10.
    const __m512i v = _mm512_maskz_loadu_epi8(load, p);
    const uint64_t cont = _mm512_movepi8_mask(v);
    return finish_varint_bmi2(p, static_cast<unsigned>(std::countr_one(cont)));
}

TNT_TARGET("avx512f,avx512bw")
[[nodiscard]] inline size_t validate_bounds_avx512(const HeaderIndex& index, size_t first,
                                                   uint64_t limit) noexcept {
    const size_t n = index.size();
    const __m512i vlimit = _mm512_set1_epi64(static_cast<int64_t>(limit));
    const __m512i variable = _mm512_set1_epi64(static_cast<int64_t>(WIDTH_VARIABLE));
    const __m512i invalid = _mm512_set1_epi64(static_cast<int64_t>(WIDTH_INVALID));

    size_t i = first;
    for (; i + 8 <= n; i += 8) {
        const __m512i vo = _mm512_loadu_si512(&index.value_offsets[i]);
        const __m512i len = _mm512_loadu_si512(&index.lengths[i]);
        const __m512i exp = _mm512_set_epi64(
            static_cast<int64_t>(expected_length(index.types[i + 7])),
            static_cast<int64_t>(expected_length(index.types[i + 6])),
            static_cast<int64_t>(expected_length(index.types[i + 5])),
            static_cast<int64_t>(expected_length(index.types[i + 4])),
            static_cast<int64_t>(expected_length(index.types[i + 3])),
            static_cast<int64_t>(expected_length(index.types[i + 2])),
            static_cast<int64_t>(expected_length(index.types[i + 1])),
            static_cast<int64_t>(expected_length(index.types[i])));

        const __mmask8 width_ok = _mm512_cmpeq_epu64_mask(exp, len) | _mm512_cmpeq_epu64_mask(exp, variable);
        const __m512i room = _mm512_sub_epi64(vlimit, vo);
        const __mmask8 bad = _mm512_cmpeq_epu64_mask(exp, invalid)
                           | _mm512_cmpgt_epu64_mask(vo, vlimit)
                           | _mm512_cmpgt_epu64_mask(len, room)
                           | static_cast<__mmask8>(~width_ok);
        if (bad != 0) [[unlikely]] {
            return i + static_cast<size_t>(std::countr_zero(static_cast<unsigned>(bad)));
        }
    }
    for (; i < n; ++i) {
        if (scalar::entry_invalid(index.value_offsets[i], index.lengths[i], index.types[i], limit)) {
            return i;
        }
    }
    return npos;
}

TNT_TARGET("avx512f,avx512bw")
[[nodiscard]] inline Utf8Scan validate_utf8_avx512(ByteSpan buffer, size_t offset,
                                                   size_t length) noexcept {
    const uint8_t* p = buffer.data() + offset;
    size_t i = 0;
    for (; i + 64 <= length; i += 64) {
        const __m512i v = _mm512_loadu_si512(p + i);
        const uint64_t high = _mm512_movepi8_mask(v);
        if (high != 0) {
            i += static_cast<size_t>(std::countr_zero(high));
            return scalar::validate_utf8(buffer, offset + i, length - i);
        }
    }
    return validate_utf8_avx2(buffer, offset + i, length - i);
}

TNT_TARGET("avx512f,avx512bw")
[[nodiscard]] inline size_t unpack_lanes_avx512(ByteSpan buffer, size_t offset, size_t count,
                                                uint8_t width, bool is_signed, uint64_t* out) noexcept {
    if (width == 8 || count < 8) {
        return unpack_lanes_avx2(buffer, offset, count, width, is_signed, out);
    }
    const uint8_t* p = buffer.data() + offset;
    const size_t step = 8 * size_t{width};
    size_t i = 0;
    for (; i + 8 <= count; i += 8, p += step) {
        __m512i wide;
        if (width == 4) {
            const __m256i v = _mm256_loadu_si256(reinterpret_cast<const __m256i*>(p));
            wide = is_signed ? _mm512_cvtepi32_epi64(v) : _mm512_cvtepu32_epi64(v);
        } else if (width == 2) {
            const __m128i v = _mm_loadu_si128(reinterpret_cast<const __m128i*>(p));
            wide = is_signed ? _mm512_cvtepi16_epi64(v) : _mm512_cvtepu16_epi64(v);
        } else {
            uint64_t raw;
            std::memcpy(&raw, p, sizeof(raw));
            const __m128i v = _mm_cvtsi64_si128(static_cast<long long>(raw));
            wide = is_signed ? _mm512_cvtepi8_epi64(v) : _mm512_cvtepu8_epi64(v);
        }
        _mm512_storeu_si512(out + i, wide);
    }
    return i + unpack_lanes_avx2(buffer, offset + i * width, count - i, width, is_signed, out + i);
}

} // namespace x86

// ============================================================================
// Tier Classes
// ============================================================================

/// Common shape of the x86 tiers; alignment is checked once per primitive
template <Isa Tier, size_t Width,
          VarintRead (*ReadVarint)(ByteSpan, size_t) noexcept,
          size_t (*ValidateBounds)(const HeaderIndex&, size_t, uint64_t) noexcept,
          Utf8Scan (*ValidateUtf8)(ByteSpan, size_t, size_t) noexcept,
          size_t (*UnpackLanes)(ByteSpan, size_t, size_t, uint8_t, bool, uint64_t*) noexcept>
class X86Kernels final : public IDecodeKernels {
public:
    [[nodiscard]] Isa isa() const noexcept override { return Tier; }
    [[nodiscard]] size_t alignment() const noexcept override { return Width; }

    [[nodiscard]] KernelResult<VarintRead>
        read_varint(ByteSpan buffer, size_t offset) const noexcept override {
        if (!aligned(buffer)) [[unlikely]] return std::unexpected(KernelFault::Misaligned);
        return ReadVarint(buffer, offset);
    }

    [[nodiscard]] KernelResult<ScanOutcome>
        scan_items(ByteSpan buffer, size_t begin, size_t end, size_t max_items,
                   HeaderIndex& out) const override {
        if (!aligned(buffer)) [[unlikely]] return std::unexpected(KernelFault::Misaligned);
        return scalar::scan_items_with(ReadVarint, buffer, begin, end, max_items, out);
    }

    [[nodiscard]] KernelResult<size_t>
        validate_bounds(const HeaderIndex& index, size_t first,
                        uint64_t limit) const noexcept override {
        return ValidateBounds(index, first, limit);
    }

    [[nodiscard]] KernelResult<Utf8Scan>
        validate_utf8(ByteSpan buffer, size_t offset, size_t length) const noexcept override {
        if (!aligned(buffer)) [[unlikely]] return std::unexpected(KernelFault::Misaligned);
        return ValidateUtf8(buffer, offset, length);
    }

    [[nodiscard]] KernelResult<size_t>
        unpack_lanes(ByteSpan buffer, size_t offset, size_t count, uint8_t width,
                     bool is_signed, uint64_t* out) const noexcept override {
        if (!aligned(buffer)) [[unlikely]] return std::unexpected(KernelFault::Misaligned);
        return UnpackLanes(buffer, offset, count, width, is_signed, out);
    }

    [[nodiscard]] KernelResult<uint32_t>
        crc32c(ByteSpan buffer, size_t offset, size_t length,
               uint32_t seed) const noexcept override {
        if (!aligned(buffer)) [[unlikely]] return std::unexpected(KernelFault::Misaligned);
        return x86::crc32c_sse42(buffer, offset, length, seed);
    }
};

using Sse42Kernels = X86Kernels<Isa::Sse42, 16, x86::read_varint_sse42, x86::validate_bounds_sse42,
                                x86::validate_utf8_sse42, x86::unpack_lanes_sse42>;
using Avx2Kernels = X86Kernels<Isa::Avx2, 32, x86::read_varint_avx2, x86::validate_bounds_avx2,
                               x86::validate_utf8_avx2, x86::unpack_lanes_avx2>;
using Avx512Kernels = X86Kernels<Isa::Avx512, 64, x86::read_varint_avx512, x86::validate_bounds_avx512,
                                 x86::validate_utf8_avx512, x86::unpack_lanes_avx512>;

#endif // TNT_X86_KERNELS

} // namespace tnt::simd
