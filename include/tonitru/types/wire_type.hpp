#pragma once

#include <array>
#include <cstdint>
#include <string_view>

namespace tnt {

// ============================================================================
// Item Type Bytes
// ============================================================================

/// Type byte of an HTLV item: tag(varint) type(u8) length(varint) value
enum class WireType : uint8_t {
    Null = 0,
    Bool = 1,
    U8 = 2,
    U16 = 3,
    U32 = 4,
    U64 = 5,
    I8 = 6,
    I16 = 7,
    I32 = 8,
    I64 = 9,
    F32 = 10,
    F64 = 11,
    Bytes = 12,
    String = 13,
    Array = 14,
    Object = 15,
    Map = 16,
    FragmentedBytes = 17,
    FragmentedString = 18,
    PackedArray = 19        // element type(u8), then count x element, all one width
};

inline constexpr uint8_t WIRE_TYPE_COUNT = 20;

/// Sentinel lengths used by the bounds-validation kernels
inline constexpr uint64_t WIDTH_VARIABLE = ~uint64_t{0} - 1;
inline constexpr uint64_t WIDTH_INVALID = ~uint64_t{0};

namespace detail {

consteval std::array<uint64_t, 256> create_width_table() {
    std::array<uint64_t, 256> table{};
    for (auto& w : table) w = WIDTH_INVALID;
    table[0] = 0;                          // Null
    table[1] = 1;                          // Bool
    table[2] = 1; table[3] = 2; table[4] = 4; table[5] = 8;
    table[6] = 1; table[7] = 2; table[8] = 4; table[9] = 8;
    table[10] = 4; table[11] = 8;          // F32, F64
    for (uint8_t t = 12; t < WIRE_TYPE_COUNT; ++t) {
        table[t] = WIDTH_VARIABLE;
    }
    return table;
}

inline constexpr auto WIDTH_TABLE = create_width_table();

} // namespace detail

/// Required value length for a type byte: a fixed width, WIDTH_VARIABLE, or
/// WIDTH_INVALID for unknown type bytes
[[nodiscard]] inline constexpr uint64_t expected_length(uint8_t type) noexcept {
    return detail::WIDTH_TABLE[type];
}

[[nodiscard]] inline constexpr bool is_valid_wire_type(uint8_t type) noexcept {
    return type < WIRE_TYPE_COUNT;
}

[[nodiscard]] inline constexpr bool is_container(WireType type) noexcept {
    return type == WireType::Array || type == WireType::Object || type == WireType::Map;
}

[[nodiscard]] inline constexpr bool is_fragmented(WireType type) noexcept {
    return type == WireType::FragmentedBytes || type == WireType::FragmentedString;
}

[[nodiscard]] inline constexpr std::string_view wire_type_name(WireType type) noexcept {
    switch (type) {
        case WireType::Null:             return "null";
        case WireType::Bool:             return "bool";
        case WireType::U8:               return "u8";
        case WireType::U16:              return "u16";
        case WireType::U32:              return "u32";
        case WireType::U64:              return "u64";
        case WireType::I8:               return "i8";
        case WireType::I16:              return "i16";
        case WireType::I32:              return "i32";
        case WireType::I64:              return "i64";
        case WireType::F32:              return "f32";
        case WireType::F64:              return "f64";
        case WireType::Bytes:            return "bytes";
        case WireType::String:           return "string";
        case WireType::Array:            return "array";
        case WireType::Object:           return "object";
        case WireType::Map:              return "map";
        case WireType::FragmentedBytes:  return "fragmented_bytes";
        case WireType::FragmentedString: return "fragmented_string";
        case WireType::PackedArray:      return "packed_array";
    }
    return "unknown";
}

static_assert(expected_length(0) == 0);
static_assert(expected_length(11) == 8);
static_assert(expected_length(13) == WIDTH_VARIABLE);
static_assert(expected_length(19) == WIDTH_VARIABLE);
static_assert(expected_length(20) == WIDTH_INVALID);

// ============================================================================
// Packed Numeric Arrays
// ============================================================================

/// Element types a PackedArray may carry: every fixed-width integer and float
[[nodiscard]] inline constexpr bool is_packed_element(uint8_t type) noexcept {
    return type >= static_cast<uint8_t>(WireType::U8) && type <= static_cast<uint8_t>(WireType::F64);
}

[[nodiscard]] inline constexpr bool is_signed_integer(WireType type) noexcept {
    return type >= WireType::I8 && type <= WireType::I64;
}

[[nodiscard]] inline constexpr bool is_float(WireType type) noexcept {
    return type == WireType::F32 || type == WireType::F64;
}

static_assert(is_packed_element(static_cast<uint8_t>(WireType::U8)));
static_assert(!is_packed_element(static_cast<uint8_t>(WireType::Bool)));
static_assert(!is_packed_element(static_cast<uint8_t>(WireType::Bytes)));

// ============================================================================
// Nesting Limit
// ============================================================================

/// Maximum Array/Map/Object composition depth; the root container is depth 1
inline constexpr uint32_t MAX_NESTING_DEPTH = 32;

} // namespace tnt
