#pragma once

/// @file varint.hpp
/// @brief Unsigned LEB128 varints used for tags and lengths

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "tonitru/platform/platform.hpp"

namespace tnt {

/// Longest encoding of a u64 (ceil(64 / 7))
inline constexpr size_t MAX_VARINT_LENGTH = 10;

enum class VarintStatus : uint8_t {
    Ok = 0,
    Truncated,   // Input ended before the terminating byte
    Overflow     // More than 64 significant bits
};

struct VarintRead {
    uint64_t value{0};
    uint8_t length{0};    // Bytes consumed; 0 unless status is Ok
    VarintStatus status{VarintStatus::Ok};

    [[nodiscard]] constexpr bool ok() const noexcept { return status == VarintStatus::Ok; }

    constexpr bool operator==(const VarintRead&) const noexcept = default;
};

/// Reference decoder. Every vector tier must return exactly this.
[[nodiscard]] TNT_FORCE_INLINE constexpr VarintRead read_varint_scalar(
        std::span<const uint8_t> data, size_t offset) noexcept {
    uint64_t value = 0;
    for (size_t i = 0; i < MAX_VARINT_LENGTH; ++i) {
        if (offset + i >= data.size()) [[unlikely]] {
            return VarintRead{0, 0, VarintStatus::Truncated};
        }
        const uint8_t byte = data[offset + i];
        if (i == MAX_VARINT_LENGTH - 1 && byte > 1) [[unlikely]] {
            return VarintRead{0, 0, VarintStatus::Overflow};
        }
        value |= static_cast<uint64_t>(byte & 0x7F) << (7 * i);
        if ((byte & 0x80) == 0) {
            return VarintRead{value, static_cast<uint8_t>(i + 1), VarintStatus::Ok};
        }
    }
    return VarintRead{0, 0, VarintStatus::Overflow};
}

/// Combine the 7-bit groups of a varint whose length is already known
[[nodiscard]] TNT_FORCE_INLINE constexpr uint64_t assemble_varint(
        const uint8_t* p, size_t length) noexcept {
    uint64_t value = 0;
    for (size_t i = 0; i < length; ++i) {
        value |= static_cast<uint64_t>(p[i] & 0x7F) << (7 * i);
    }
    return value;
}

[[nodiscard]] inline constexpr size_t varint_size(uint64_t value) noexcept {
    size_t n = 1;
    while (value >= 0x80) {
        value >>= 7;
        ++n;
    }
    return n;
}

inline void write_varint(std::vector<uint8_t>& out, uint64_t value) {
    while (value >= 0x80) {
        out.push_back(static_cast<uint8_t>(value | 0x80));
        value >>= 7;
    }
    out.push_back(static_cast<uint8_t>(value));
}

static_assert(varint_size(0) == 1);
static_assert(varint_size(127) == 1);
static_assert(varint_size(128) == 2);
static_assert(varint_size(~uint64_t{0}) == MAX_VARINT_LENGTH);

} // namespace tnt
