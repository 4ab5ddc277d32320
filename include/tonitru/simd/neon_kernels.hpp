#pragma once

/// @file neon_kernels.hpp
/// @brief AArch64 NEON tier of the decode primitives

#include <bit>

#include "tonitru/simd/scalar_kernels.hpp"

#if TNT_NEON_KERNELS
    #include <arm_neon.h>
#endif

namespace tnt::simd {

#if TNT_NEON_KERNELS

namespace neon {

/// NEON has no movemask: narrow the per-byte compare to 4 bits per lane
[[nodiscard]] TNT_FORCE_INLINE uint64_t high_bit_nibbles(uint8x16_t v) noexcept {
    const uint8x16_t high = vcltzq_s8(vreinterpretq_s8_u8(v));
    const uint8x8_t narrowed = vshrn_n_u16(vreinterpretq_u16_u8(high), 4);
    return vget_lane_u64(vreinterpret_u64_u8(narrowed), 0);
}

[[nodiscard]] inline VarintRead read_varint_neon(ByteSpan data, size_t offset) noexcept {
    if (offset >= data.size() || data.size() - offset < 16) {
        return read_varint_scalar(data, offset);
    }
    const uint8_t* p = data.data() + offset;
    const uint64_t cont = high_bit_nibbles(vld1q_u8(p));
    return scalar::finish_varint(p, static_cast<unsigned>(std::countr_one(cont)) / 4);
}

[[nodiscard]] inline size_t validate_bounds_neon(const HeaderIndex& index, size_t first,
                                                 uint64_t limit) noexcept {
    const size_t n = index.size();
    const uint64x2_t vlimit = vdupq_n_u64(limit);
    const uint64x2_t variable = vdupq_n_u64(WIDTH_VARIABLE);
    const uint64x2_t invalid = vdupq_n_u64(WIDTH_INVALID);

    size_t i = first;
    for (; i + 2 <= n; i += 2) {
        const uint64x2_t vo = vld1q_u64(&index.value_offsets[i]);
        const uint64x2_t len = vld1q_u64(&index.lengths[i]);
        const uint64_t exp_lanes[2] = {expected_length(index.types[i]),
                                       expected_length(index.types[i + 1])};
        const uint64x2_t exp = vld1q_u64(exp_lanes);

        const uint64x2_t width_ok = vorrq_u64(vceqq_u64(exp, len), vceqq_u64(exp, variable));
        const uint64x2_t room = vsubq_u64(vlimit, vo);
        uint64x2_t bad = vorrq_u64(vceqq_u64(exp, invalid),
                                   vorrq_u64(vcgtq_u64(vo, vlimit), vcgtq_u64(len, room)));
        bad = vorrq_u64(bad, vreinterpretq_u64_u32(vmvnq_u32(vreinterpretq_u32_u64(width_ok))));

        if (vgetq_lane_u64(bad, 0) != 0) [[unlikely]] return i;
        if (vgetq_lane_u64(bad, 1) != 0) [[unlikely]] return i + 1;
    }
    for (; i < n; ++i) {
        if (scalar::entry_invalid(index.value_offsets[i], index.lengths[i], index.types[i], limit)) {
            return i;
        }
    }
    return npos;
}

[[nodiscard]] inline Utf8Scan validate_utf8_neon(ByteSpan buffer, size_t offset,
                                                 size_t length) noexcept {
    const uint8_t* p = buffer.data() + offset;
    size_t i = 0;
    for (; i + 16 <= length; i += 16) {
        const uint8x16_t v = vld1q_u8(p + i);
        if (vmaxvq_u8(v) >= 0x80) {
            i += static_cast<size_t>(std::countr_zero(high_bit_nibbles(v))) / 4;
            return scalar::validate_utf8(buffer, offset + i, length - i);
        }
    }
    return scalar::validate_utf8(buffer, offset + i, length - i);
}

inline void store_u32x4(uint32x4_t v, uint64_t* out) noexcept {
    vst1q_u64(out, vmovl_u32(vget_low_u32(v)));
    vst1q_u64(out + 2, vmovl_high_u32(v));
}

inline void store_s32x4(int32x4_t v, uint64_t* out) noexcept {
    vst1q_u64(out, vreinterpretq_u64_s64(vmovl_s32(vget_low_s32(v))));
    vst1q_u64(out + 2, vreinterpretq_u64_s64(vmovl_high_s32(v)));
}

/// Widens 8 elements per step for widths 1 and 2, 2 per step for width 4
[[nodiscard]] inline size_t unpack_lanes_neon(ByteSpan buffer, size_t offset, size_t count,
                                              uint8_t width, bool is_signed, uint64_t* out) noexcept {
    if (count == 0) return 0;
    const uint8_t* p = buffer.data() + offset;
    size_t i = 0;
    switch (width) {
        case 1:
            for (; i + 8 <= count; i += 8, p += 8) {
                if (is_signed) {
                    const int16x8_t h = vmovl_s8(vld1_s8(reinterpret_cast<const int8_t*>(p)));
                    store_s32x4(vmovl_s16(vget_low_s16(h)), out + i);
                    store_s32x4(vmovl_high_s16(h), out + i + 4);
                } else {
                    const uint16x8_t h = vmovl_u8(vld1_u8(p));
                    store_u32x4(vmovl_u16(vget_low_u16(h)), out + i);
                    store_u32x4(vmovl_high_u16(h), out + i + 4);
                }
            }
            break;
        case 2:
            for (; i + 8 <= count; i += 8, p += 16) {
                if (is_signed) {
                    const int16x8_t h = vld1q_s16(reinterpret_cast<const int16_t*>(p));
                    store_s32x4(vmovl_s16(vget_low_s16(h)), out + i);
                    store_s32x4(vmovl_high_s16(h), out + i + 4);
                } else {
                    const uint16x8_t h = vld1q_u16(reinterpret_cast<const uint16_t*>(p));
                    store_u32x4(vmovl_u16(vget_low_u16(h)), out + i);
                    store_u32x4(vmovl_high_u16(h), out + i + 4);
                }
            }
            break;
        case 4:
            for (; i + 4 <= count; i += 4, p += 16) {
                if (is_signed) {
                    store_s32x4(vld1q_s32(reinterpret_cast<const int32_t*>(p)), out + i);
                } else {
                    store_u32x4(vld1q_u32(reinterpret_cast<const uint32_t*>(p)), out + i);
                }
            }
            break;
        default:
            for (; i + 2 <= count; i += 2, p += 16) {
                vst1q_u64(out + i, vld1q_u64(reinterpret_cast<const uint64_t*>(p)));
            }
            break;
    }
    return i + scalar::unpack_lanes(buffer, offset + i * width, count - i, width, is_signed, out + i);
}

} // namespace neon

class NeonKernels final : public IDecodeKernels {
public:
    [[nodiscard]] Isa isa() const noexcept override { return Isa::Neon; }
    [[nodiscard]] size_t alignment() const noexcept override { return 16; }

    [[nodiscard]] KernelResult<VarintRead>
        read_varint(ByteSpan buffer, size_t offset) const noexcept override {
        if (!aligned(buffer)) [[unlikely]] return std::unexpected(KernelFault::Misaligned);
        return neon::read_varint_neon(buffer, offset);
    }

    [[nodiscard]] KernelResult<ScanOutcome>
        scan_items(ByteSpan buffer, size_t begin, size_t end, size_t max_items,
                   HeaderIndex& out) const override {
        if (!aligned(buffer)) [[unlikely]] return std::unexpected(KernelFault::Misaligned);
        return scalar::scan_items_with(neon::read_varint_neon, buffer, begin, end, max_items, out);
    }

    [[nodiscard]] KernelResult<size_t>
        validate_bounds(const HeaderIndex& index, size_t first,
                        uint64_t limit) const noexcept override {
        return neon::validate_bounds_neon(index, first, limit);
    }

    [[nodiscard]] KernelResult<Utf8Scan>
        validate_utf8(ByteSpan buffer, size_t offset, size_t length) const noexcept override {
        if (!aligned(buffer)) [[unlikely]] return std::unexpected(KernelFault::Misaligned);
        return neon::validate_utf8_neon(buffer, offset, length);
    }

    [[nodiscard]] KernelResult<size_t>
        unpack_lanes(ByteSpan buffer, size_t offset, size_t count, uint8_t width,
                     bool is_signed, uint64_t* out) const noexcept override {
        if (!aligned(buffer)) [[unlikely]] return std::unexpected(KernelFault::Misaligned);
        return neon::unpack_lanes_neon(buffer, offset, count, width, is_signed, out);
    }

    // The CRC extension is optional on ARMv8.0, so this tier keeps the table
    [[nodiscard]] KernelResult<uint32_t>
        crc32c(ByteSpan buffer, size_t offset, size_t length,
               uint32_t seed) const noexcept override {
        return scalar::crc32c(buffer, offset, length, seed);
    }
};

#endif // TNT_NEON_KERNELS

} // namespace tnt::simd
