#pragma once

/// @file record_header.hpp
/// @brief Fixed 16-byte record header framing every payload in a stream.
///
/// Layout (little endian):
///   [0..2)   magic "TN"
///   [2]      version
///   [3]      flags (COMPRESSED, ENCRYPTED, FRAGMENTED)
///   [4]      map strategy
///   [5..8)   reserved, zero
///   [8..12)  payload length
///   [12..16) CRC-32C of the plain payload

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include "tonitru/types/error.hpp"

namespace tnt {

// ============================================================================
// Header Constants
// ============================================================================

inline constexpr size_t RECORD_HEADER_SIZE = 16;
inline constexpr uint8_t RECORD_MAGIC_0 = 0x54;  // 'T'
inline constexpr uint8_t RECORD_MAGIC_1 = 0x4E;  // 'N'
inline constexpr uint8_t RECORD_VERSION = 1;

/// Stream offset of the checksum field relative to the record start
inline constexpr size_t CHECKSUM_FIELD_OFFSET = 12;

namespace record_flags {
    inline constexpr uint8_t COMPRESSED = 0x01;
    inline constexpr uint8_t ENCRYPTED  = 0x02;
    inline constexpr uint8_t FRAGMENTED = 0x04;
    inline constexpr uint8_t KNOWN      = COMPRESSED | ENCRYPTED | FRAGMENTED;
}

enum class MapStrategy : uint8_t {
    None = 0,
    Hash = 1,
    Sorted = 2,
    Compact = 3
};

[[nodiscard]] inline constexpr bool is_valid_map_strategy(uint8_t raw) noexcept {
    return raw <= static_cast<uint8_t>(MapStrategy::Compact);
}

[[nodiscard]] inline constexpr std::string_view map_strategy_name(MapStrategy s) noexcept {
    switch (s) {
        case MapStrategy::None:    return "none";
        case MapStrategy::Hash:    return "hash";
        case MapStrategy::Sorted:  return "sorted";
        case MapStrategy::Compact: return "compact";
    }
    return "unknown";
}

// ============================================================================
// Record Header
// ============================================================================

struct RecordHeader {
    uint8_t version{RECORD_VERSION};
    uint8_t flags{0};
    MapStrategy map_strategy{MapStrategy::None};
    uint32_t payload_length{0};
    uint32_t checksum{0};

    [[nodiscard]] constexpr bool compressed() const noexcept { return flags & record_flags::COMPRESSED; }
    [[nodiscard]] constexpr bool encrypted() const noexcept { return flags & record_flags::ENCRYPTED; }
    [[nodiscard]] constexpr bool fragmented() const noexcept { return flags & record_flags::FRAGMENTED; }

    /// Payload must pass through an IPayloadTransform before decoding
    [[nodiscard]] constexpr bool transformed() const noexcept {
        return flags & (record_flags::COMPRESSED | record_flags::ENCRYPTED);
    }

    [[nodiscard]] constexpr size_t record_size() const noexcept {
        return RECORD_HEADER_SIZE + payload_length;
    }

    /// Validate the 16 header bytes at the start of `bytes`.
    /// `stream_offset` is only used to position the error.
    [[nodiscard]] static constexpr StreamResult<RecordHeader>
    parse(std::span<const uint8_t> bytes, size_t stream_offset, uint64_t max_payload) noexcept {
        if (bytes.size() < RECORD_HEADER_SIZE) [[unlikely]] {
            return std::unexpected(StreamError{HeaderDefect::TruncatedRecord, stream_offset});
        }
        if (bytes[0] != RECORD_MAGIC_0 || bytes[1] != RECORD_MAGIC_1) [[unlikely]] {
            return std::unexpected(StreamError{HeaderDefect::BadMagic, stream_offset});
        }
        if (bytes[2] != RECORD_VERSION) [[unlikely]] {
            return std::unexpected(StreamError{HeaderDefect::UnsupportedVersion, stream_offset + 2});
        }
        if ((bytes[3] & ~record_flags::KNOWN) != 0) [[unlikely]] {
            return std::unexpected(StreamError{HeaderDefect::ReservedBits, stream_offset + 3});
        }
        if (!is_valid_map_strategy(bytes[4])) [[unlikely]] {
            return std::unexpected(StreamError{HeaderDefect::UnknownMapStrategy, stream_offset + 4});
        }
        if (bytes[5] != 0 || bytes[6] != 0 || bytes[7] != 0) [[unlikely]] {
            return std::unexpected(StreamError{HeaderDefect::ReservedBits, stream_offset + 5});
        }

        RecordHeader h;
        h.version = bytes[2];
        h.flags = bytes[3];
        h.map_strategy = static_cast<MapStrategy>(bytes[4]);
        h.payload_length = load_u32(bytes, 8);
        h.checksum = load_u32(bytes, 12);

        if (h.payload_length > max_payload) [[unlikely]] {
            return std::unexpected(StreamError{HeaderDefect::LengthTooLarge, stream_offset + 8});
        }
        return h;
    }

    [[nodiscard]] constexpr std::array<uint8_t, RECORD_HEADER_SIZE> serialize() const noexcept {
        std::array<uint8_t, RECORD_HEADER_SIZE> out{};
        out[0] = RECORD_MAGIC_0;
        out[1] = RECORD_MAGIC_1;
        out[2] = version;
        out[3] = flags;
        out[4] = static_cast<uint8_t>(map_strategy);
        store_u32(out, 8, payload_length);
        store_u32(out, 12, checksum);
        return out;
    }

    constexpr bool operator==(const RecordHeader&) const noexcept = default;

private:
    static constexpr uint32_t load_u32(std::span<const uint8_t> b, size_t at) noexcept {
        return static_cast<uint32_t>(b[at])
             | (static_cast<uint32_t>(b[at + 1]) << 8)
             | (static_cast<uint32_t>(b[at + 2]) << 16)
             | (static_cast<uint32_t>(b[at + 3]) << 24);
    }

    static constexpr void store_u32(std::array<uint8_t, RECORD_HEADER_SIZE>& b, size_t at,
                                    uint32_t v) noexcept {
        b[at] = static_cast<uint8_t>(v);
        b[at + 1] = static_cast<uint8_t>(v >> 8);
        b[at + 2] = static_cast<uint8_t>(v >> 16);
        b[at + 3] = static_cast<uint8_t>(v >> 24);
    }
};

static_assert(RecordHeader{}.serialize()[0] == RECORD_MAGIC_0);
static_assert(RecordHeader::parse(RecordHeader{}.serialize(), 0, 1).has_value());

} // namespace tnt
