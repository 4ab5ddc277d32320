#pragma once

/// @file encoder.hpp
/// @brief Value tree to HTLV items and framed records

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tonitru/codec/fragment_chain.hpp"
#include "tonitru/codec/varint.hpp"
#include "tonitru/simd/scalar_kernels.hpp"
#include "tonitru/types/error.hpp"
#include "tonitru/types/record_header.hpp"
#include "tonitru/types/value.hpp"
#include "tonitru/types/wire_type.hpp"
#include "tonitru/util/hash_map.hpp"

namespace tnt::codec {

template <typename T>
using EncodeResult = std::expected<T, BatchError>;

struct EncodeOptions {
    MapStrategy map_strategy = MapStrategy::Hash;

    /// String/Bytes longer than this are written as fragment chains (0 = never)
    size_t fragment_size = 0;

    /// Tag of the root item
    uint64_t root_tag = 0;

    /// Arrays of at least this many numbers sharing one wire type are
    /// written as PackedArray (0 = never)
    size_t packed_min_elements = 0;
};

// ============================================================================
// Encoder
// ============================================================================

class Encoder {
public:
    explicit Encoder(EncodeOptions options = {}) noexcept : options_{options} {}

    /// Append one item. Fails with NestingLimitExceeded above 32 container
    /// levels, or InvalidEncoding for maps the strategy cannot express and
    /// integers whose bits do not fit their width.
    [[nodiscard]] EncodeResult<void> encode_item(uint64_t tag, const Value& value,
                                                 std::vector<uint8_t>& out) {
        return write_item(tag, value, 0, out);
    }

    /// A fragment chain was written since construction
    [[nodiscard]] bool wrote_fragments() const noexcept { return wrote_fragments_; }

    [[nodiscard]] const EncodeOptions& options() const noexcept { return options_; }

private:
    static void write_header(std::vector<uint8_t>& out, uint64_t tag, WireType type, uint64_t length) {
        write_varint(out, tag);
        out.push_back(static_cast<uint8_t>(type));
        write_varint(out, length);
    }

    static void write_le(std::vector<uint8_t>& out, uint64_t bits, size_t width) {
        for (size_t i = 0; i < width; ++i) {
            out.push_back(static_cast<uint8_t>(bits >> (8 * i)));
        }
    }

    [[nodiscard]] static WireType int_type(const IntValue& v) noexcept {
        const auto log2 = static_cast<uint8_t>(std::countr_zero(static_cast<unsigned>(v.width)));
        const uint8_t base = v.is_signed ? static_cast<uint8_t>(WireType::I8)
                                         : static_cast<uint8_t>(WireType::U8);
        return static_cast<WireType>(base + log2);
    }

    [[nodiscard]] static bool valid_int(const IntValue& v) noexcept {
        return (v.width == 1 || v.width == 2 || v.width == 4 || v.width == 8) && v.fits_width();
    }

    /// Wire type of a scalar that can be a packed element, if any
    [[nodiscard]] static std::optional<WireType> packed_element(const Value& v) noexcept {
        if (const IntValue* i = v.as_int()) {
            if (!valid_int(*i)) return std::nullopt;
            return int_type(*i);
        }
        if (const FloatValue* f = v.as_float()) {
            return f->width == 4 ? WireType::F32 : WireType::F64;
        }
        return std::nullopt;
    }

    /// Element type shared by every item, when the array qualifies for packing
    [[nodiscard]] std::optional<WireType> packable(const Array& items) const noexcept {
        if (options_.packed_min_elements == 0 || items.size() < options_.packed_min_elements) {
            return std::nullopt;
        }
        const std::optional<WireType> first = packed_element(items.front());
        if (!first) return std::nullopt;
        for (const Value& item : items) {
            if (packed_element(item) != first) return std::nullopt;
        }
        return first;
    }

    static void write_packed(std::vector<uint8_t>& out, uint64_t tag, WireType element,
                             const Array& items) {
        const auto width = expected_length(static_cast<uint8_t>(element));
        write_header(out, tag, WireType::PackedArray, 1 + width * items.size());
        out.push_back(static_cast<uint8_t>(element));
        for (const Value& item : items) {
            if (const IntValue* i = item.as_int()) {
                write_le(out, i->bits, width);
            } else if (element == WireType::F32) {
                write_le(out, std::bit_cast<uint32_t>(static_cast<float>(item.as_float()->value)), 4);
            } else {
                write_le(out, std::bit_cast<uint64_t>(item.as_float()->value), 8);
            }
        }
    }

    [[nodiscard]] EncodeResult<void> write_item(uint64_t tag, const Value& value, uint32_t depth,
                                                std::vector<uint8_t>& out) {
        switch (value.kind()) {
            case ValueKind::Null:
                write_header(out, tag, WireType::Null, 0);
                return {};
            case ValueKind::Bool:
                write_header(out, tag, WireType::Bool, 1);
                out.push_back(*value.as_bool() ? 1 : 0);
                return {};
            case ValueKind::Int: {
                const IntValue& v = *value.as_int();
                if (!valid_int(v)) [[unlikely]] {
                    return std::unexpected(BatchError{BatchErrorCode::InvalidEncoding});
                }
                write_header(out, tag, int_type(v), v.width);
                write_le(out, v.bits, v.width);
                return {};
            }
            case ValueKind::Float: {
                const FloatValue& v = *value.as_float();
                if (v.width == 4) {
                    write_header(out, tag, WireType::F32, 4);
                    write_le(out, std::bit_cast<uint32_t>(static_cast<float>(v.value)), 4);
                } else {
                    write_header(out, tag, WireType::F64, 8);
                    write_le(out, std::bit_cast<uint64_t>(v.value), 8);
                }
                return {};
            }
            case ValueKind::String:
            case ValueKind::Bytes:
                write_content(tag, value, out);
                return {};
            case ValueKind::Array:
            case ValueKind::Map:
            case ValueKind::Object:
                break;
        }

        if (depth + 1 > MAX_NESTING_DEPTH) [[unlikely]] {
            return std::unexpected(BatchError{BatchErrorCode::NestingLimitExceeded});
        }

        if (const Array* items = value.as_array()) {
            if (const std::optional<WireType> element = packable(*items)) {
                write_packed(out, tag, *element, *items);
                return {};
            }
        }

        std::vector<uint8_t> body;
        WireType type = WireType::Array;
        if (const Array* items = value.as_array()) {
            for (const Value& item : *items) {
                if (auto r = write_item(0, item, depth + 1, body); !r) return r;
            }
        } else if (const Object* fields = value.as_object()) {
            type = WireType::Object;
            for (const Field& f : *fields) {
                if (auto r = write_item(f.tag, f.value, depth + 1, body); !r) return r;
            }
        } else {
            type = WireType::Map;
            if (auto r = write_map(*value.as_map(), depth + 1, body); !r) return r;
        }

        write_header(out, tag, type, body.size());
        out.insert(out.end(), body.begin(), body.end());
        return {};
    }

    void write_content(uint64_t tag, const Value& value, std::vector<uint8_t>& out) {
        const bool is_string = value.kind() == ValueKind::String;
        const Bytes materialized = value.is_chunked() ? value.as_chunked()->materialize() : Bytes{};
        std::span<const uint8_t> content;
        if (value.is_chunked()) {
            content = materialized;
        } else if (const std::string* s = value.as_string()) {
            content = {reinterpret_cast<const uint8_t*>(s->data()), s->size()};
        } else {
            content = *value.as_bytes();
        }

        if (options_.fragment_size == 0 || content.size() <= options_.fragment_size) {
            write_header(out, tag, is_string ? WireType::String : WireType::Bytes, content.size());
            out.insert(out.end(), content.begin(), content.end());
            return;
        }

        std::vector<uint8_t> chain;
        write_varint(chain, content.size());
        for (size_t pos = 0; pos < content.size(); pos += options_.fragment_size) {
            const size_t n = std::min(options_.fragment_size, content.size() - pos);
            const bool last = pos + n == content.size();
            chain.push_back(last ? 0 : FRAGMENT_CONTINUATION);
            write_varint(chain, n);
            chain.insert(chain.end(), content.begin() + pos, content.begin() + pos + n);
        }
        write_header(out, tag, is_string ? WireType::FragmentedString : WireType::FragmentedBytes,
                     chain.size());
        out.insert(out.end(), chain.begin(), chain.end());
        wrote_fragments_ = true;
    }

    [[nodiscard]] EncodeResult<void> write_map(const Map& map, uint32_t depth, std::vector<uint8_t>& out) {
        // Keys and values are encoded once, then laid out per strategy
        std::vector<std::pair<std::vector<uint8_t>, std::vector<uint8_t>>> encoded;
        encoded.reserve(map.size());
        for (const MapEntry& e : map) {
            std::vector<uint8_t> key;
            std::vector<uint8_t> val;
            if (auto r = write_item(0, e.key, depth, key); !r) return r;
            if (auto r = write_item(0, e.value, depth, val); !r) return r;
            encoded.emplace_back(std::move(key), std::move(val));
        }

        const auto key_view = [](const std::vector<uint8_t>& k) {
            return std::string_view{reinterpret_cast<const char*>(k.data()), k.size()};
        };

        switch (options_.map_strategy) {
            case MapStrategy::None:
                return std::unexpected(BatchError{BatchErrorCode::InvalidEncoding});
            case MapStrategy::Sorted:
                std::sort(encoded.begin(), encoded.end(), [&](const auto& a, const auto& b) {
                    return key_view(a.first) < key_view(b.first);
                });
                [[fallthrough]];
            case MapStrategy::Hash: {
                util::HashSet<std::string_view> seen;
                for (const auto& [key, val] : encoded) {
                    if (!seen.insert(key_view(key)).second) [[unlikely]] {
                        return std::unexpected(BatchError{BatchErrorCode::InvalidEncoding});
                    }
                }
                write_varint(out, encoded.size());
                for (const auto& [key, val] : encoded) {
                    out.insert(out.end(), key.begin(), key.end());
                    out.insert(out.end(), val.begin(), val.end());
                }
                return {};
            }
            case MapStrategy::Compact:
                break;
        }

        util::HashMap<std::string_view, uint64_t> ids;
        std::vector<const std::vector<uint8_t>*> table;
        std::vector<uint64_t> entry_ids;
        entry_ids.reserve(encoded.size());
        for (const auto& [key, val] : encoded) {
            auto [it, inserted] = ids.try_emplace(key_view(key), table.size());
            if (inserted) table.push_back(&key);
            entry_ids.push_back(it->second);
        }

        write_varint(out, table.size());
        for (const auto* key : table) out.insert(out.end(), key->begin(), key->end());
        write_varint(out, encoded.size());
        for (size_t i = 0; i < encoded.size(); ++i) {
            write_varint(out, entry_ids[i]);
            out.insert(out.end(), encoded[i].second.begin(), encoded[i].second.end());
        }
        return {};
    }

    EncodeOptions options_;
    bool wrote_fragments_{false};
};

// ============================================================================
// Records
// ============================================================================

/// Frame an already encoded payload. `checksum` overrides the computed CRC.
[[nodiscard]] inline std::vector<uint8_t> frame_record(std::span<const uint8_t> payload,
                                                       uint8_t flags, MapStrategy strategy,
                                                       std::optional<uint32_t> checksum = std::nullopt) {
    RecordHeader header;
    header.flags = flags;
    header.map_strategy = strategy;
    header.payload_length = static_cast<uint32_t>(payload.size());
    header.checksum = checksum.value_or(simd::scalar::crc32c(payload, 0, payload.size(), 0));

    std::vector<uint8_t> out;
    out.reserve(RECORD_HEADER_SIZE + payload.size());
    const auto head = header.serialize();
    out.insert(out.end(), head.begin(), head.end());
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

/// One complete record: header, then the root item as payload
[[nodiscard]] inline EncodeResult<std::vector<uint8_t>> encode_record(const Value& value,
                                                                      const EncodeOptions& options = {}) {
    Encoder encoder{options};
    std::vector<uint8_t> payload;
    if (auto r = encoder.encode_item(options.root_tag, value, payload); !r) {
        return std::unexpected(r.error());
    }
    if (payload.size() > std::numeric_limits<uint32_t>::max()) [[unlikely]] {
        return std::unexpected(BatchError{BatchErrorCode::InvalidEncoding});
    }
    const uint8_t flags = encoder.wrote_fragments() ? record_flags::FRAGMENTED : uint8_t{0};
    return frame_record(payload, flags, options.map_strategy);
}

/// Appends records back to back into one stream buffer
class RecordWriter {
public:
    explicit RecordWriter(EncodeOptions options = {}) noexcept : options_{options} {}

    [[nodiscard]] EncodeResult<void> append(const Value& value) {
        auto record = encode_record(value, options_);
        if (!record) return std::unexpected(record.error());
        append_bytes(*record);
        return {};
    }

    /// Append a pre-encoded payload with explicit header fields
    void append_payload(std::span<const uint8_t> payload, uint8_t flags, MapStrategy strategy,
                        std::optional<uint32_t> checksum = std::nullopt) {
        append_bytes(frame_record(payload, flags, strategy, checksum));
    }

    void append_bytes(std::span<const uint8_t> record) {
        offsets_.push_back(stream_.size());
        stream_.insert(stream_.end(), record.begin(), record.end());
    }

    [[nodiscard]] const std::vector<uint8_t>& bytes() const noexcept { return stream_; }
    [[nodiscard]] std::vector<uint8_t> take() noexcept { offsets_.clear(); return std::move(stream_); }

    /// Stream offset of each appended record
    [[nodiscard]] const std::vector<size_t>& offsets() const noexcept { return offsets_; }
    [[nodiscard]] size_t record_count() const noexcept { return offsets_.size(); }

private:
    EncodeOptions options_;
    std::vector<uint8_t> stream_;
    std::vector<size_t> offsets_;
};

} // namespace tnt::codec
