/*
    Tonitru Highway Decode Kernels

    Portable tier built on Google Highway (static dispatch): whatever target
    the translation unit is compiled for (SSE4, AVX2, NEON, SVE, RVV, WASM).
    Ranked below the hand-written tiers and above scalar.
*/

#pragma once

#include <algorithm>
#include <array>

#include "tonitru/simd/scalar_kernels.hpp"

#if TNT_HIGHWAY_KERNELS

#include "hwy/highway.h"

namespace tnt::simd {

namespace hn = hwy::HWY_NAMESPACE;

namespace hwy_impl {

[[nodiscard]] TNT_HOT
inline VarintRead read_varint_hwy(ByteSpan data, size_t offset) noexcept {
    const hn::ScalableTag<uint8_t> d;
    const size_t N = hn::Lanes(d);
    if (N < 16 || offset >= data.size() || data.size() - offset < N) {
        return read_varint_scalar(data, offset);
    }
    const uint8_t* p = data.data() + offset;
    const auto chunk = hn::LoadU(d, p);
    const auto terminator = hn::Lt(chunk, hn::Set(d, uint8_t{0x80}));
    const intptr_t idx = hn::FindFirstTrue(d, terminator);
    const unsigned term = idx < 0 ? static_cast<unsigned>(N) : static_cast<unsigned>(idx);
    return scalar::finish_varint(p, term);
}

[[nodiscard]] TNT_HOT
inline size_t validate_bounds_hwy(const HeaderIndex& index, size_t first, uint64_t limit) noexcept {
    const hn::ScalableTag<uint64_t> d;
    const size_t N = hn::Lanes(d);
    const size_t n = index.size();

    constexpr size_t MAX_LANES = 64;
    HWY_ALIGN std::array<uint64_t, MAX_LANES> exp_lanes{};

    const auto vlimit = hn::Set(d, limit);
    const auto variable = hn::Set(d, WIDTH_VARIABLE);
    const auto invalid = hn::Set(d, WIDTH_INVALID);

    size_t i = first;
    if (N <= MAX_LANES) {
        for (; i + N <= n; i += N) {
            for (size_t lane = 0; lane < N; ++lane) {
                exp_lanes[lane] = expected_length(index.types[i + lane]);
            }
            const auto vo = hn::LoadU(d, &index.value_offsets[i]);
            const auto len = hn::LoadU(d, &index.lengths[i]);
            const auto exp = hn::Load(d, exp_lanes.data());

            const auto width_ok = hn::Or(hn::Eq(exp, len), hn::Eq(exp, variable));
            const auto room = hn::Sub(vlimit, vo);
            const auto bad = hn::Or(
                hn::Or(hn::Eq(exp, invalid), hn::Not(width_ok)),
                hn::Or(hn::Gt(vo, vlimit), hn::Gt(len, room)));

            const intptr_t idx = hn::FindFirstTrue(d, bad);
            if (idx >= 0) [[unlikely]] {
                return i + static_cast<size_t>(idx);
            }
        }
    }
    for (; i < n; ++i) {
        if (scalar::entry_invalid(index.value_offsets[i], index.lengths[i], index.types[i], limit)) {
            return i;
        }
    }
    return npos;
}

[[nodiscard]] TNT_HOT
inline Utf8Scan validate_utf8_hwy(ByteSpan buffer, size_t offset, size_t length) noexcept {
    const hn::ScalableTag<uint8_t> d;
    const size_t N = hn::Lanes(d);
    const auto ascii_max = hn::Set(d, uint8_t{0x7F});
    const uint8_t* p = buffer.data() + offset;

    size_t i = 0;
    for (; i + N <= length; i += N) {
        const auto chunk = hn::LoadU(d, p + i);
        const intptr_t idx = hn::FindFirstTrue(d, hn::Gt(chunk, ascii_max));
        if (idx >= 0) {
            i += static_cast<size_t>(idx);
            return scalar::validate_utf8(buffer, offset + i, length - i);
        }
    }
    return scalar::validate_utf8(buffer, offset + i, length - i);
}

/// Load Lanes(d) elements of `Narrow` width and promote them step by step
/// to the lane type of `d`
template <typename Narrow, class D>
HWY_INLINE hn::Vec<D> widen_load(D d, const uint8_t* p) {
    using Wide = hn::TFromD<D>;
    if constexpr (sizeof(Narrow) == sizeof(Wide)) {
        return hn::LoadU(d, reinterpret_cast<const Wide*>(p));
    } else {
        const hn::Rebind<hwy::MakeNarrow<Wide>, D> dh;
        return hn::PromoteTo(d, widen_load<Narrow>(dh, p));
    }
}

template <typename Wide, typename Narrow>
inline size_t unpack_lanes_as(const uint8_t* p, size_t count, uint64_t* out) noexcept {
    const hn::ScalableTag<Wide> d;
    const size_t N = hn::Lanes(d);
    Wide* dst = reinterpret_cast<Wide*>(out);
    size_t i = 0;
    for (; i + N <= count; i += N) {
        hn::StoreU(widen_load<Narrow>(d, p + i * sizeof(Narrow)), d, dst + i);
    }
    return i;
}

template <typename Wide>
inline size_t unpack_lanes_width(const uint8_t* p, size_t count, uint8_t width, uint64_t* out) noexcept {
    switch (width) {
        case 1:  return unpack_lanes_as<Wide, uint8_t>(p, count, out);
        case 2:  return unpack_lanes_as<Wide, uint16_t>(p, count, out);
        case 4:  return unpack_lanes_as<Wide, uint32_t>(p, count, out);
        default: return unpack_lanes_as<Wide, uint64_t>(p, count, out);
    }
}

[[nodiscard]] TNT_HOT
inline size_t unpack_lanes_hwy(ByteSpan buffer, size_t offset, size_t count, uint8_t width,
                               bool is_signed, uint64_t* out) noexcept {
    if (count == 0) return 0;
    const uint8_t* p = buffer.data() + offset;
    const size_t i = is_signed ? unpack_lanes_width<int64_t>(p, count, width, out)
                               : unpack_lanes_width<uint64_t>(p, count, width, out);
    return i + scalar::unpack_lanes(buffer, offset + i * width, count - i, width, is_signed, out + i);
}

} // namespace hwy_impl

class HighwayKernels final : public IDecodeKernels {
public:
    [[nodiscard]] Isa isa() const noexcept override { return Isa::Highway; }

    [[nodiscard]] size_t alignment() const noexcept override {
        return std::min<size_t>(hn::Lanes(hn::ScalableTag<uint8_t>()), 64);
    }

    [[nodiscard]] KernelResult<VarintRead>
        read_varint(ByteSpan buffer, size_t offset) const noexcept override {
        if (!aligned(buffer)) [[unlikely]] return std::unexpected(KernelFault::Misaligned);
        return hwy_impl::read_varint_hwy(buffer, offset);
    }

    [[nodiscard]] KernelResult<ScanOutcome>
        scan_items(ByteSpan buffer, size_t begin, size_t end, size_t max_items,
                   HeaderIndex& out) const override {
        if (!aligned(buffer)) [[unlikely]] return std::unexpected(KernelFault::Misaligned);
        return scalar::scan_items_with(hwy_impl::read_varint_hwy, buffer, begin, end, max_items, out);
    }

    [[nodiscard]] KernelResult<size_t>
        validate_bounds(const HeaderIndex& index, size_t first,
                        uint64_t limit) const noexcept override {
        return hwy_impl::validate_bounds_hwy(index, first, limit);
    }

    [[nodiscard]] KernelResult<Utf8Scan>
        validate_utf8(ByteSpan buffer, size_t offset, size_t length) const noexcept override {
        if (!aligned(buffer)) [[unlikely]] return std::unexpected(KernelFault::Misaligned);
        return hwy_impl::validate_utf8_hwy(buffer, offset, length);
    }

    [[nodiscard]] KernelResult<size_t>
        unpack_lanes(ByteSpan buffer, size_t offset, size_t count, uint8_t width,
                     bool is_signed, uint64_t* out) const noexcept override {
        if (!aligned(buffer)) [[unlikely]] return std::unexpected(KernelFault::Misaligned);
        return hwy_impl::unpack_lanes_hwy(buffer, offset, count, width, is_signed, out);
    }

    [[nodiscard]] KernelResult<uint32_t>
        crc32c(ByteSpan buffer, size_t offset, size_t length,
               uint32_t seed) const noexcept override {
        return scalar::crc32c(buffer, offset, length, seed);
    }
};

} // namespace tnt::simd

#endif // TNT_HIGHWAY_KERNELS
