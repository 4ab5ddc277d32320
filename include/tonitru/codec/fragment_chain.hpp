#pragma once

/// @file fragment_chain.hpp
/// @brief Fragment chains carrying one oversized String/Bytes field.
///
/// Value layout: total_length varint, then fragments of
/// `flags u8 (bit0 = continuation)` `length varint` `bytes[length]`.
/// The last fragment has the continuation bit clear.

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

#include "tonitru/simd/dispatch.hpp"
#include "tonitru/types/error.hpp"

namespace tnt::codec {

using simd::ByteSpan;

inline constexpr uint8_t FRAGMENT_CONTINUATION = 0x01;
inline constexpr uint8_t FRAGMENT_KNOWN_FLAGS = FRAGMENT_CONTINUATION;

struct FragmentDescriptor {
    size_t offset;       // Payload offset of the fragment bytes
    size_t length;
    bool continuation;
};

struct FragmentChain {
    uint64_t total_length{0};
    std::vector<FragmentDescriptor> fragments;

    [[nodiscard]] size_t size() const noexcept { return fragments.size(); }
};

/// Parse the chain stored in payload[begin, end). Error offsets are payload offsets.
[[nodiscard]] inline DecodeResult<FragmentChain>
parse_fragment_chain(simd::BatchKernels& kernels, ByteSpan payload, size_t begin, size_t end) {
    using enum BatchErrorCode;
    const ByteSpan view = payload.first(end);

    const VarintRead total = kernels.read_varint(view, begin);
    if (!total.ok()) [[unlikely]] {
        return std::unexpected(BatchError{
            total.status == VarintStatus::Overflow ? InvalidEncoding : FragmentReassemblyError,
            begin});
    }

    FragmentChain chain;
    chain.total_length = total.value;
    size_t pos = begin + total.length;
    uint64_t sum = 0;
    bool terminated = false;

    while (pos < end) {
        if (terminated) [[unlikely]] {
            // Bytes after the terminal fragment
            return std::unexpected(BatchError{FragmentReassemblyError, pos});
        }
        const uint8_t flag_byte = view[pos];
        if ((flag_byte & ~FRAGMENT_KNOWN_FLAGS) != 0) [[unlikely]] {
            return std::unexpected(BatchError{FragmentReassemblyError, pos});
        }

        const VarintRead len = kernels.read_varint(view, pos + 1);
        if (!len.ok()) [[unlikely]] {
            return std::unexpected(BatchError{
                len.status == VarintStatus::Overflow ? InvalidEncoding : FragmentReassemblyError,
                pos});
        }
        const size_t data = pos + 1 + len.length;
        if (len.value > end - data) [[unlikely]] {
            return std::unexpected(BatchError{FragmentReassemblyError, pos});
        }

        const bool continuation = (flag_byte & FRAGMENT_CONTINUATION) != 0;
        chain.fragments.push_back(FragmentDescriptor{data, static_cast<size_t>(len.value), continuation});
        sum += len.value;
        terminated = !continuation;
        pos = data + static_cast<size_t>(len.value);
    }

    if (chain.fragments.empty()) [[unlikely]] {
        return std::unexpected(BatchError{FragmentReassemblyError, begin});
    }
    if (!terminated) [[unlikely]] {
        // Ran out of bytes while a continuation was announced
        return std::unexpected(BatchError{FragmentReassemblyError, end});
    }
    if (sum != chain.total_length) [[unlikely]] {
        return std::unexpected(BatchError{FragmentReassemblyError, begin});
    }
    return chain;
}

/// Copy every fragment into one contiguous buffer
template <typename Out>
[[nodiscard]] inline Out reassemble(ByteSpan payload, const FragmentChain& chain) {
    Out out;
    out.resize(static_cast<size_t>(chain.total_length));
    size_t pos = 0;
    for (const FragmentDescriptor& f : chain.fragments) {
        if (f.length != 0) {
            std::memcpy(out.data() + pos, payload.data() + f.offset, f.length);
        }
        pos += f.length;
    }
    return out;
}

// ============================================================================
// UTF-8 across fragment boundaries
// ============================================================================

/// Validates a string delivered in pieces. A code point split between two
/// fragments is carried over (at most 3 bytes) and checked once complete.
class Utf8ChunkValidator {
public:
    explicit Utf8ChunkValidator(simd::BatchKernels& kernels) noexcept : kernels_{kernels} {}

    /// @return payload offset of the first invalid sequence, or npos
    [[nodiscard]] size_t feed(ByteSpan payload, size_t offset, size_t length) {
        size_t i = 0;
        if (carry_len_ != 0) {
            const size_t seq = simd::scalar::utf8_sequence_length(carry_[0]);
            while (carry_len_ < seq && i < length) {
                carry_[carry_len_++] = payload[offset + i++];
            }
            if (carry_len_ < seq) {
                return simd::npos;
            }
            const ByteSpan joined{carry_.data(), carry_len_};
            if (!simd::scalar::validate_utf8(joined, 0, carry_len_).complete()) {
                return carry_origin_;
            }
            carry_len_ = 0;
        }

        const simd::Utf8Scan scan = kernels_.validate_utf8(payload, offset + i, length - i);
        if (scan.error_offset != simd::npos) {
            return scan.error_offset;
        }
        if (scan.tail != 0) {
            carry_origin_ = offset + length - scan.tail;
            carry_len_ = scan.tail;
            std::memcpy(carry_.data(), payload.data() + carry_origin_, carry_len_);
        }
        return simd::npos;
    }

    /// @return offset of a sequence left incomplete at the end, or npos
    [[nodiscard]] size_t finish() const noexcept {
        return carry_len_ != 0 ? carry_origin_ : simd::npos;
    }

private:
    simd::BatchKernels& kernels_;
    std::array<uint8_t, 4> carry_{};
    size_t carry_len_{0};
    size_t carry_origin_{0};
};

} // namespace tnt::codec
