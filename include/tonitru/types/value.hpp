#pragma once

/// @file value.hpp
/// @brief Decoded value tree

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <initializer_list>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "tonitru/memory/batch_buffer.hpp"

namespace tnt {

enum class ValueKind : uint8_t {
    Null = 0,
    Bool,
    Int,
    Float,
    String,
    Bytes,
    Array,
    Map,
    Object
};

[[nodiscard]] inline constexpr std::string_view value_kind_name(ValueKind kind) noexcept {
    switch (kind) {
        case ValueKind::Null:   return "null";
        case ValueKind::Bool:   return "bool";
        case ValueKind::Int:    return "int";
        case ValueKind::Float:  return "float";
        case ValueKind::String: return "string";
        case ValueKind::Bytes:  return "bytes";
        case ValueKind::Array:  return "array";
        case ValueKind::Map:    return "map";
        case ValueKind::Object: return "object";
    }
    return "unknown";
}

// ============================================================================
// Scalar Payloads
// ============================================================================

struct NullValue {
    constexpr bool operator==(const NullValue&) const noexcept = default;
};

/// Integer of a fixed wire width; `bits` holds the zero- or sign-extended value
struct IntValue {
    uint64_t bits{0};
    uint8_t width{8};        // Bytes on the wire: 1, 2, 4 or 8
    bool is_signed{false};

    [[nodiscard]] constexpr int64_t as_signed() const noexcept { return static_cast<int64_t>(bits); }
    [[nodiscard]] constexpr uint64_t as_unsigned() const noexcept { return bits; }

    /// True when `bits` is representable in `width` bytes with this signedness
    [[nodiscard]] constexpr bool fits_width() const noexcept {
        if (width >= 8) return true;
        const unsigned n = 8u * width;
        if (!is_signed) return (bits >> n) == 0;
        const int64_t v = as_signed();
        const int64_t limit = int64_t{1} << (n - 1);
        return v >= -limit && v < limit;
    }

    constexpr bool operator==(const IntValue&) const noexcept = default;
};

/// Float of a fixed wire width (4 or 8). Compared bitwise so NaN payloads round-trip.
struct FloatValue {
    double value{0.0};
    uint8_t width{8};

    constexpr bool operator==(const FloatValue& other) const noexcept {
        return width == other.width
            && std::bit_cast<uint64_t>(value) == std::bit_cast<uint64_t>(other.value);
    }
};

using Bytes = std::vector<uint8_t>;

// ============================================================================
// Chunked Field (oversized fragmented String/Bytes)
// ============================================================================

/// Fragmented field left in place instead of being reassembled.
/// Chunks point into the batch payload, which the field keeps alive.
class ChunkedField {
public:
    struct Chunk {
        size_t offset;   // Into the owner's bytes
        size_t length;
    };

    /// Restartable forward range of byte spans
    class ChunkRange {
    public:
        class iterator {
        public:
            using value_type = std::span<const uint8_t>;
            using difference_type = std::ptrdiff_t;

            iterator() noexcept = default;
            iterator(const ChunkedField* field, size_t i) noexcept : field_{field}, i_{i} {}

            [[nodiscard]] value_type operator*() const noexcept { return field_->chunk(i_); }
            iterator& operator++() noexcept { ++i_; return *this; }
            iterator operator++(int) noexcept { auto t = *this; ++i_; return t; }
            bool operator==(const iterator& o) const noexcept { return i_ == o.i_; }

        private:
            const ChunkedField* field_{nullptr};
            size_t i_{0};
        };

        explicit ChunkRange(const ChunkedField* field) noexcept : field_{field} {}

        [[nodiscard]] iterator begin() const noexcept { return {field_, 0}; }
        [[nodiscard]] iterator end() const noexcept { return {field_, field_->chunk_count()}; }
        [[nodiscard]] size_t size() const noexcept { return field_->chunk_count(); }

    private:
        const ChunkedField* field_;
    };

    ChunkedField(ValueKind kind, std::shared_ptr<const memory::OwnedBuffer> owner,
                 std::vector<Chunk> chunks) noexcept
        : kind_{kind}, owner_{std::move(owner)}, chunks_{std::move(chunks)} {
        for (const Chunk& c : chunks_) total_ += c.length;
    }

    /// String or Bytes
    [[nodiscard]] ValueKind kind() const noexcept { return kind_; }

    /// Total content length
    [[nodiscard]] size_t size() const noexcept { return total_; }

    [[nodiscard]] size_t chunk_count() const noexcept { return chunks_.size(); }

    [[nodiscard]] std::span<const uint8_t> chunk(size_t i) const noexcept {
        return owner_->bytes().subspan(chunks_[i].offset, chunks_[i].length);
    }

    [[nodiscard]] ChunkRange chunks() const noexcept { return ChunkRange{this}; }

    [[nodiscard]] Bytes materialize() const {
        Bytes out;
        out.reserve(total_);
        for (auto c : chunks()) out.insert(out.end(), c.begin(), c.end());
        return out;
    }

    [[nodiscard]] std::string materialize_string() const {
        std::string out;
        out.reserve(total_);
        for (auto c : chunks()) out.append(reinterpret_cast<const char*>(c.data()), c.size());
        return out;
    }

    /// Content comparison against contiguous bytes
    [[nodiscard]] bool content_equals(std::span<const uint8_t> bytes) const noexcept {
        if (bytes.size() != total_) return false;
        size_t pos = 0;
        for (auto c : chunks()) {
            if (!c.empty() && std::memcmp(c.data(), bytes.data() + pos, c.size()) != 0) {
                return false;
            }
            pos += c.size();
        }
        return true;
    }

    [[nodiscard]] const std::shared_ptr<const memory::OwnedBuffer>& owner() const noexcept {
        return owner_;
    }

    bool operator==(const ChunkedField& other) const {
        return kind_ == other.kind_ && content_equals(other.materialize());
    }

private:
    ValueKind kind_;
    std::shared_ptr<const memory::OwnedBuffer> owner_;
    std::vector<Chunk> chunks_;
    size_t total_{0};
};

// ============================================================================
// Value
// ============================================================================

struct Field;
struct MapEntry;

class Value;
using Array = std::vector<Value>;
using Map = std::vector<MapEntry>;
using Object = std::vector<Field>;

class Value {
public:
    using Storage = std::variant<NullValue, bool, IntValue, FloatValue, std::string, Bytes,
                                 Array, Map, Object, ChunkedField>;

    Value() noexcept;
    Value(const Value&);
    Value(Value&&) noexcept;
    Value& operator=(const Value&);
    Value& operator=(Value&&) noexcept;
    ~Value();

    // ------------------------------------------------------------------------
    // Factories
    // ------------------------------------------------------------------------

    [[nodiscard]] static Value null() noexcept { return Value{}; }
    [[nodiscard]] static Value boolean(bool b) { return Value{Storage{b}}; }

    [[nodiscard]] static Value u8(uint8_t v) { return integer(v, 1, false); }
    [[nodiscard]] static Value u16(uint16_t v) { return integer(v, 2, false); }
    [[nodiscard]] static Value u32(uint32_t v) { return integer(v, 4, false); }
    [[nodiscard]] static Value u64(uint64_t v) { return integer(v, 8, false); }
    [[nodiscard]] static Value i8(int8_t v) { return integer(static_cast<uint64_t>(int64_t{v}), 1, true); }
    [[nodiscard]] static Value i16(int16_t v) { return integer(static_cast<uint64_t>(int64_t{v}), 2, true); }
    [[nodiscard]] static Value i32(int32_t v) { return integer(static_cast<uint64_t>(int64_t{v}), 4, true); }
    [[nodiscard]] static Value i64(int64_t v) { return integer(static_cast<uint64_t>(v), 8, true); }

    /// Stored as given; the encoder rejects values where !IntValue::fits_width()
    [[nodiscard]] static Value integer(uint64_t bits, uint8_t width, bool is_signed) {
        return Value{Storage{IntValue{bits, width, is_signed}}};
    }

    [[nodiscard]] static Value f32(float v) { return Value{Storage{FloatValue{v, 4}}}; }
    [[nodiscard]] static Value f64(double v) { return Value{Storage{FloatValue{v, 8}}}; }

    [[nodiscard]] static Value string(std::string s) {
        return Value{Storage{std::in_place_type<std::string>, std::move(s)}};
    }
    [[nodiscard]] static Value bytes(Bytes b) {
        return Value{Storage{std::in_place_type<Bytes>, std::move(b)}};
    }
    [[nodiscard]] static Value array(Array items);
    [[nodiscard]] static Value map(Map entries);
    [[nodiscard]] static Value object(Object fields);
    [[nodiscard]] static Value chunked(ChunkedField field) {
        return Value{Storage{std::in_place_type<ChunkedField>, std::move(field)}};
    }

    // ------------------------------------------------------------------------
    // Inspection
    // ------------------------------------------------------------------------

    [[nodiscard]] ValueKind kind() const noexcept;

    [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<NullValue>(storage_); }
    [[nodiscard]] bool is_chunked() const noexcept { return std::holds_alternative<ChunkedField>(storage_); }
    [[nodiscard]] bool is_container() const noexcept {
        const ValueKind k = kind();
        return k == ValueKind::Array || k == ValueKind::Map || k == ValueKind::Object;
    }

    [[nodiscard]] std::optional<bool> as_bool() const noexcept {
        if (auto* b = std::get_if<bool>(&storage_)) return *b;
        return std::nullopt;
    }

    [[nodiscard]] const IntValue* as_int() const noexcept { return std::get_if<IntValue>(&storage_); }
    [[nodiscard]] const FloatValue* as_float() const noexcept { return std::get_if<FloatValue>(&storage_); }

    [[nodiscard]] std::optional<uint64_t> as_u64() const noexcept {
        if (auto* i = as_int(); i != nullptr && !i->is_signed) return i->bits;
        return std::nullopt;
    }

    [[nodiscard]] std::optional<int64_t> as_i64() const noexcept {
        if (auto* i = as_int(); i != nullptr && i->is_signed) return i->as_signed();
        return std::nullopt;
    }

    [[nodiscard]] std::optional<double> as_double() const noexcept {
        if (auto* f = as_float()) return f->value;
        return std::nullopt;
    }

    /// Contiguous string; nullptr for chunked strings
    [[nodiscard]] const std::string* as_string() const noexcept { return std::get_if<std::string>(&storage_); }
    [[nodiscard]] const Bytes* as_bytes() const noexcept { return std::get_if<Bytes>(&storage_); }
    [[nodiscard]] const ChunkedField* as_chunked() const noexcept { return std::get_if<ChunkedField>(&storage_); }
    [[nodiscard]] const Array* as_array() const noexcept { return std::get_if<Array>(&storage_); }
    [[nodiscard]] const Map* as_map() const noexcept { return std::get_if<Map>(&storage_); }
    [[nodiscard]] const Object* as_object() const noexcept { return std::get_if<Object>(&storage_); }

    [[nodiscard]] Array* as_array() noexcept { return std::get_if<Array>(&storage_); }
    [[nodiscard]] Map* as_map() noexcept { return std::get_if<Map>(&storage_); }
    [[nodiscard]] Object* as_object() noexcept { return std::get_if<Object>(&storage_); }

    /// String or Bytes content as one contiguous copy (materializes chunked fields)
    [[nodiscard]] std::optional<Bytes> content() const;

    /// First field of an object with the given tag
    [[nodiscard]] const Value* field(uint64_t tag) const noexcept;

    /// Value stored under `key` in a map
    [[nodiscard]] const Value* find(const Value& key) const;

    /// Number of elements of a container, content length of String/Bytes, else 0
    [[nodiscard]] size_t size() const noexcept;

    [[nodiscard]] const Storage& storage() const noexcept { return storage_; }

    /// Semantic equality: chunked equals contiguous of the same kind and
    /// content; map entries compare without regard to order.
    friend bool operator==(const Value& a, const Value& b);

private:
    explicit Value(Storage s) noexcept;

    Storage storage_;
};

struct Field {
    uint64_t tag{0};
    Value value;

    friend bool operator==(const Field&, const Field&) = default;
};

struct MapEntry {
    Value key;
    Value value;

    friend bool operator==(const MapEntry&, const MapEntry&) = default;
};

// ============================================================================
// Value Out-of-line Members (need Field and MapEntry complete)
// ============================================================================

inline Value::Value() noexcept : storage_{NullValue{}} {}
inline Value::Value(Storage s) noexcept : storage_{std::move(s)} {}
inline Value::Value(const Value&) = default;
inline Value::Value(Value&&) noexcept = default;
inline Value& Value::operator=(const Value&) = default;
inline Value& Value::operator=(Value&&) noexcept = default;
inline Value::~Value() = default;

inline Value Value::array(Array items) {
    return Value{Storage{std::in_place_type<Array>, std::move(items)}};
}

inline Value Value::map(Map entries) {
    return Value{Storage{std::in_place_type<Map>, std::move(entries)}};
}

inline Value Value::object(Object fields) {
    return Value{Storage{std::in_place_type<Object>, std::move(fields)}};
}

inline ValueKind Value::kind() const noexcept {
    switch (storage_.index()) {
        case 0: return ValueKind::Null;
        case 1: return ValueKind::Bool;
        case 2: return ValueKind::Int;
        case 3: return ValueKind::Float;
        case 4: return ValueKind::String;
        case 5: return ValueKind::Bytes;
        case 6: return ValueKind::Array;
        case 7: return ValueKind::Map;
        case 8: return ValueKind::Object;
        case 9: return std::get<ChunkedField>(storage_).kind();
        default: break;
    }
    return ValueKind::Null;
}

inline std::optional<Bytes> Value::content() const {
    if (auto* s = as_string()) return Bytes(s->begin(), s->end());
    if (auto* b = as_bytes()) return *b;
    if (auto* c = as_chunked()) return c->materialize();
    return std::nullopt;
}

inline const Value* Value::field(uint64_t tag) const noexcept {
    if (auto* obj = as_object()) {
        for (const Field& f : *obj) {
            if (f.tag == tag) return &f.value;
        }
    }
    return nullptr;
}

inline const Value* Value::find(const Value& key) const {
    if (auto* m = as_map()) {
        for (const MapEntry& e : *m) {
            if (e.key == key) return &e.value;
        }
    }
    return nullptr;
}

inline size_t Value::size() const noexcept {
    if (auto* s = as_string()) return s->size();
    if (auto* b = as_bytes()) return b->size();
    if (auto* c = as_chunked()) return c->size();
    if (auto* a = as_array()) return a->size();
    if (auto* m = as_map()) return m->size();
    if (auto* o = as_object()) return o->size();
    return 0;
}

namespace detail {

[[nodiscard]] inline std::span<const uint8_t> contiguous_content(const Value& v) noexcept {
    if (auto* s = v.as_string()) {
        return {reinterpret_cast<const uint8_t*>(s->data()), s->size()};
    }
    if (auto* b = v.as_bytes()) return *b;
    return {};
}

[[nodiscard]] inline bool maps_equal(const Map& a, const Map& b) {
    if (a.size() != b.size()) return false;
    std::vector<bool> matched(b.size(), false);
    for (const MapEntry& ea : a) {
        bool found = false;
        for (size_t j = 0; j < b.size(); ++j) {
            if (!matched[j] && ea == b[j]) {
                matched[j] = true;
                found = true;
                break;
            }
        }
        if (!found) return false;
    }
    return true;
}

} // namespace detail

inline bool operator==(const Value& a, const Value& b) {
    const ValueKind kind = a.kind();
    if (kind != b.kind()) return false;

    if (a.is_chunked() || b.is_chunked()) {
        if (a.is_chunked() && b.is_chunked()) {
            return a.as_chunked()->content_equals(b.as_chunked()->materialize());
        }
        const Value& chunked = a.is_chunked() ? a : b;
        const Value& flat = a.is_chunked() ? b : a;
        return chunked.as_chunked()->content_equals(detail::contiguous_content(flat));
    }

    if (kind == ValueKind::Map) {
        return detail::maps_equal(*a.as_map(), *b.as_map());
    }
    return a.storage() == b.storage();
}

} // namespace tnt
