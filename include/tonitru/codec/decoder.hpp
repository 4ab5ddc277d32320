#pragma once

/// @file decoder.hpp
/// @brief Payload to value tree, iterative with an explicit work stack.
///
/// Every container is opened in one step: its child headers are scanned
/// and bounds-checked through the batch's kernel cursor, map layouts are
/// validated, and a frame is pushed. Children are then decoded in order and
/// attached to the frame on top of the stack. Nothing is recursive, so the
/// nesting limit is the only bound on depth.
///
/// Error offsets are payload offsets (first payload byte = 0).

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tonitru/codec/fragment_chain.hpp"
#include "tonitru/memory/batch_buffer.hpp"
#include "tonitru/simd/dispatch.hpp"
#include "tonitru/simd/scalar_kernels.hpp"
#include "tonitru/types/error.hpp"
#include "tonitru/types/record_header.hpp"
#include "tonitru/types/value.hpp"
#include "tonitru/types/wire_type.hpp"
#include "tonitru/util/hash_map.hpp"

namespace tnt::codec {

// ============================================================================
// Configuration and Result
// ============================================================================

struct DecoderConfig {
    /// Fragmented fields longer than this stay chunked instead of reassembled
    size_t fragment_inline_threshold = size_t{1} << 20;

    /// Validate String and FragmentedString content as UTF-8
    bool validate_utf8 = true;
};

struct DecodedTree {
    uint64_t tag{0};            // Tag of the root item
    Value root;
    size_t item_count{0};
    size_t chunked_fields{0};
};

// ============================================================================
// Decoder
// ============================================================================

class Decoder {
public:
    explicit Decoder(DecoderConfig config = {}) noexcept : config_{config} {}

    /// Decode a payload the caller keeps alive for the duration of the call.
    /// Chunked fields get one owned copy of the payload.
    [[nodiscard]] DecodeResult<DecodedTree>
    decode(ByteSpan payload, const RecordHeader& header, simd::BatchKernels& kernels) const;

    /// Decode a staged batch. Chunked fields share the batch buffer.
    [[nodiscard]] DecodeResult<DecodedTree>
    decode(memory::BatchBuffer& buffer, const RecordHeader& header, simd::BatchKernels& kernels) const;

    [[nodiscard]] const DecoderConfig& config() const noexcept { return config_; }

private:
    class Session;

    DecoderConfig config_;
};

namespace detail {

using simd::scalar::load_le;
using simd::scalar::sign_extend;

/// Scalar value of a packed element type from its widened 64-bit lane
[[nodiscard]] inline Value lane_value(WireType type, uint8_t width, uint64_t lane) {
    if (type == WireType::F32) return Value::f32(std::bit_cast<float>(static_cast<uint32_t>(lane)));
    if (type == WireType::F64) return Value::f64(std::bit_cast<double>(lane));
    return Value::integer(lane, width, is_signed_integer(type));
}

[[nodiscard]] inline std::string_view item_bytes(ByteSpan payload, const simd::HeaderIndex& index,
                                                 size_t i) noexcept {
    const size_t begin = static_cast<size_t>(index.item_offsets[i]);
    const size_t end = static_cast<size_t>(index.item_end(i));
    return {reinterpret_cast<const char*>(payload.data()) + begin, end - begin};
}

} // namespace detail

// ============================================================================
// Decode Session (per call)
// ============================================================================

class Decoder::Session {
public:
    using ShareFn = std::function<std::shared_ptr<const memory::OwnedBuffer>()>;

    Session(const DecoderConfig& config, const RecordHeader& header,
            simd::BatchKernels& kernels, ByteSpan payload, ShareFn share)
        : config_{config}
        , header_{header}
        , kernels_{kernels}
        , payload_{payload}
        , share_{std::move(share)} {
        stack_.reserve(8);
    }

    [[nodiscard]] DecodeResult<DecodedTree> run() {
        simd::HeaderIndex root;
        const simd::ScanOutcome scan = kernels_.scan_items(payload_, 0, payload_.size(), 1, root);
        if (scan.count != 1 || scan.stop != simd::ScanStop::End) [[unlikely]] {
            // Missing root, bad header, overrun, or bytes after the root item
            return fail(BatchErrorCode::InvalidEncoding, scan.next);
        }
        if (const size_t bad = kernels_.validate_bounds(root, 0, payload_.size());
            bad != simd::npos) [[unlikely]] {
            return fail(BatchErrorCode::InvalidEncoding, root.item_offsets[bad]);
        }
        const uint64_t root_tag = root.tags[0];

        auto first = open(root, 0, 0);
        if (!first) return std::unexpected(first.error());
        if (first->has_value()) {
            return DecodedTree{root_tag, std::move(**first), items_, chunked_};
        }

        while (!stack_.empty()) {
            Frame& top = stack_.back();
            if (top.next == top.children.size()) {
                Value done = finish(top);
                stack_.pop_back();
                if (stack_.empty()) {
                    return DecodedTree{root_tag, std::move(done), items_, chunked_};
                }
                attach(stack_.back(), std::move(done));
                continue;
            }

            const size_t i = top.next++;
            auto child = open(top.children, i, top.depth);
            if (!child) [[unlikely]] {
                // Partial tree is dropped with the stack
                return std::unexpected(child.error());
            }
            if (child->has_value()) {
                attach(stack_.back(), std::move(**child));
            }
        }
        TNT_UNREACHABLE();
        return fail(BatchErrorCode::InvalidEncoding, 0);
    }

private:
    struct Frame {
        WireType type{WireType::Array};
        uint32_t depth{0};
        size_t item_offset{0};
        simd::HeaderIndex children;
        size_t next{0};

        size_t key_count{0};             // Compact maps: leading key-table children
        std::vector<uint64_t> key_ids;   // Compact maps: key id per entry
        std::vector<Value> keys;
        Value pending_key;

        Array items;
        Object fields;
        Map entries;
    };

    /// Decoded scalar, or nullopt when a container frame was pushed
    using Opened = DecodeResult<std::optional<Value>>;
    using Status = std::expected<void, BatchError>;

    static std::unexpected<BatchError> fail(BatchErrorCode code, size_t offset) noexcept {
        return std::unexpected(BatchError{code, offset});
    }

    static Opened done(Value v) { return Opened{std::in_place, std::move(v)}; }

    // ------------------------------------------------------------------------
    // Items
    // ------------------------------------------------------------------------

    [[nodiscard]] Opened open(const simd::HeaderIndex& index, size_t i, uint32_t parent_depth) {
        // Copy out first: pushing a frame may move the index
        const size_t item_off = static_cast<size_t>(index.item_offsets[i]);
        const size_t vo = static_cast<size_t>(index.value_offsets[i]);
        const size_t len = static_cast<size_t>(index.lengths[i]);
        const uint8_t raw = index.types[i];
        ++items_;

        if (!is_valid_wire_type(raw)) [[unlikely]] {
            return fail(BatchErrorCode::InvalidEncoding, item_off);
        }
        const auto type = static_cast<WireType>(raw);
        const uint8_t* p = payload_.data() + vo;

        switch (type) {
            case WireType::Null:
                return done(Value::null());
            case WireType::Bool:
                if (p[0] > 1) [[unlikely]] return fail(BatchErrorCode::InvalidEncoding, vo);
                return done(Value::boolean(p[0] == 1));
            case WireType::U8:
            case WireType::U16:
            case WireType::U32:
            case WireType::U64:
                return done(Value::integer(detail::load_le(p, len), static_cast<uint8_t>(len), false));
            case WireType::I8:
            case WireType::I16:
            case WireType::I32:
            case WireType::I64:
                return done(Value::integer(detail::sign_extend(detail::load_le(p, len), len),
                                           static_cast<uint8_t>(len), true));
            case WireType::F32:
                return done(Value::f32(std::bit_cast<float>(static_cast<uint32_t>(detail::load_le(p, 4)))));
            case WireType::F64:
                return done(Value::f64(std::bit_cast<double>(detail::load_le(p, 8))));
            case WireType::Bytes:
                return done(Value::bytes(Bytes(p, p + len)));
            case WireType::String:
                if (config_.validate_utf8) {
                    const simd::Utf8Scan scan = kernels_.validate_utf8(payload_, vo, len);
                    if (!scan.complete()) [[unlikely]] {
                        return fail(BatchErrorCode::InvalidEncoding,
                                    scan.error_offset != simd::npos ? scan.error_offset
                                                                    : vo + len - scan.tail);
                    }
                }
                return done(Value::string(std::string(reinterpret_cast<const char*>(p), len)));
            case WireType::FragmentedBytes:
            case WireType::FragmentedString:
                return open_fragmented(type, item_off, vo, len);
            case WireType::PackedArray:
                return open_packed(item_off, vo, len, parent_depth + 1);
            case WireType::Array:
            case WireType::Object:
            case WireType::Map:
                break;
        }

        const uint32_t depth = parent_depth + 1;
        if (depth > MAX_NESTING_DEPTH) [[unlikely]] {
            return fail(BatchErrorCode::NestingLimitExceeded, item_off);
        }

        Frame& frame = stack_.emplace_back();
        frame.type = type;
        frame.depth = depth;
        frame.item_offset = item_off;

        const Status opened = type == WireType::Map
            ? open_map(frame, vo, vo + len)
            : open_sequence(frame, vo, vo + len);
        if (!opened) [[unlikely]] {
            return std::unexpected(opened.error());
        }
        return Opened{std::in_place};
    }

    [[nodiscard]] Opened open_fragmented(WireType type, size_t item_off, size_t vo, size_t len) {
        if (!header_.fragmented()) [[unlikely]] {
            return fail(BatchErrorCode::FragmentReassemblyError, item_off);
        }
        auto chain = parse_fragment_chain(kernels_, payload_, vo, vo + len);
        if (!chain) [[unlikely]] {
            return std::unexpected(chain.error());
        }

        const bool is_string = type == WireType::FragmentedString;
        if (is_string && config_.validate_utf8) {
            Utf8ChunkValidator utf8{kernels_};
            for (const FragmentDescriptor& f : chain->fragments) {
                if (const size_t bad = utf8.feed(payload_, f.offset, f.length); bad != simd::npos) {
                    return fail(BatchErrorCode::FragmentReassemblyError, bad);
                }
            }
            if (const size_t bad = utf8.finish(); bad != simd::npos) {
                return fail(BatchErrorCode::FragmentReassemblyError, bad);
            }
        }

        if (chain->total_length <= config_.fragment_inline_threshold) {
            if (is_string) return done(Value::string(reassemble<std::string>(payload_, *chain)));
            return done(Value::bytes(reassemble<Bytes>(payload_, *chain)));
        }

        const auto& owner = shared_owner();
        std::vector<ChunkedField::Chunk> chunks;
        chunks.reserve(chain->size());
        for (const FragmentDescriptor& f : chain->fragments) {
            chunks.push_back(ChunkedField::Chunk{f.offset, f.length});
        }
        ++chunked_;
        return done(Value::chunked(ChunkedField{is_string ? ValueKind::String : ValueKind::Bytes,
                                                owner, std::move(chunks)}));
    }

    /// element type byte, then count x element; decoded as an Array of scalars
    [[nodiscard]] Opened open_packed(size_t item_off, size_t vo, size_t len, uint32_t depth) {
        if (depth > MAX_NESTING_DEPTH) [[unlikely]] {
            return fail(BatchErrorCode::NestingLimitExceeded, item_off);
        }
        if (len == 0 || !is_packed_element(payload_[vo])) [[unlikely]] {
            return fail(BatchErrorCode::InvalidEncoding, len == 0 ? item_off : vo);
        }
        const auto element = static_cast<WireType>(payload_[vo]);
        const auto width = static_cast<uint8_t>(expected_length(payload_[vo]));
        if ((len - 1) % width != 0) [[unlikely]] {
            return fail(BatchErrorCode::InvalidEncoding, item_off);
        }

        const size_t count = (len - 1) / width;
        lanes_.resize(count);
        const size_t unpacked = kernels_.unpack_lanes(payload_, vo + 1, count, width,
                                                      is_signed_integer(element), lanes_.data());
        Array items;
        items.reserve(unpacked);
        for (size_t i = 0; i < unpacked; ++i) {
            items.push_back(detail::lane_value(element, width, lanes_[i]));
        }
        return done(Value::array(std::move(items)));
    }

    // ------------------------------------------------------------------------
    // Containers
    // ------------------------------------------------------------------------

    /// Array and Object: a plain run of items filling the value
    [[nodiscard]] Status open_sequence(Frame& frame, size_t begin, size_t end) {
        const simd::ScanOutcome scan =
            kernels_.scan_items(payload_, begin, end, simd::npos, frame.children);
        if (scan.stop != simd::ScanStop::End) [[unlikely]] {
            return fail(BatchErrorCode::InvalidEncoding, scan.next);
        }
        if (frame.type == WireType::Array) {
            for (size_t i = 0; i < frame.children.size(); ++i) {
                if (frame.children.tags[i] != 0) [[unlikely]] {
                    return fail(BatchErrorCode::InvalidEncoding, frame.children.item_offsets[i]);
                }
            }
            frame.items.reserve(frame.children.size());
        } else {
            frame.fields.reserve(frame.children.size());
        }
        return check_bounds(frame, end);
    }

    [[nodiscard]] Status open_map(Frame& frame, size_t begin, size_t end) {
        switch (header_.map_strategy) {
            case MapStrategy::Hash:
            case MapStrategy::Sorted:
                return open_pair_map(frame, begin, end);
            case MapStrategy::Compact:
                return open_compact_map(frame, begin, end);
            case MapStrategy::None:
                break;
        }
        return fail(BatchErrorCode::InvalidEncoding, frame.item_offset);
    }

    /// count, then count x (key item, value item)
    [[nodiscard]] Status open_pair_map(Frame& frame, size_t begin, size_t end) {
        const ByteSpan view = payload_.first(end);
        const VarintRead count = kernels_.read_varint(view, begin);
        if (!count.ok()) [[unlikely]] return fail(BatchErrorCode::InvalidEncoding, begin);
        const size_t pos = begin + count.length;

        // A pair takes at least six bytes
        if (count.value > (end - pos) / 6) [[unlikely]] {
            return fail(BatchErrorCode::InvalidEncoding, begin);
        }
        const size_t want = static_cast<size_t>(count.value) * 2;
        const simd::ScanOutcome scan = kernels_.scan_items(payload_, pos, end, want, frame.children);
        if (scan.count != want || scan.stop != simd::ScanStop::End) [[unlikely]] {
            return fail(BatchErrorCode::InvalidEncoding, scan.next);
        }
        if (auto ok = check_bounds(frame, end); !ok) return ok;

        if (header_.map_strategy == MapStrategy::Sorted) {
            for (size_t k = 2; k < want; k += 2) {
                if (!(detail::item_bytes(payload_, frame.children, k - 2) <
                      detail::item_bytes(payload_, frame.children, k))) [[unlikely]] {
                    return fail(BatchErrorCode::InvalidEncoding, frame.children.item_offsets[k]);
                }
            }
        } else {
            util::HashSet<std::string_view> seen;
            seen.reserve(count.value);
            for (size_t k = 0; k < want; k += 2) {
                if (!seen.insert(detail::item_bytes(payload_, frame.children, k)).second) [[unlikely]] {
                    return fail(BatchErrorCode::InvalidEncoding, frame.children.item_offsets[k]);
                }
            }
        }
        frame.entries.reserve(count.value);
        return {};
    }

    /// key_count, key items, entry_count, entry_count x (key_id, value item)
    [[nodiscard]] Status open_compact_map(Frame& frame, size_t begin, size_t end) {
        const ByteSpan view = payload_.first(end);
        const VarintRead key_count = kernels_.read_varint(view, begin);
        if (!key_count.ok()) [[unlikely]] return fail(BatchErrorCode::InvalidEncoding, begin);
        size_t pos = begin + key_count.length;
        if (key_count.value > (end - pos) / 3) [[unlikely]] {
            return fail(BatchErrorCode::InvalidEncoding, begin);
        }

        const size_t keys = static_cast<size_t>(key_count.value);
        const simd::ScanOutcome key_scan = kernels_.scan_items(payload_, pos, end, keys, frame.children);
        if (key_scan.count != keys ||
            (key_scan.stop != simd::ScanStop::Limit && key_scan.stop != simd::ScanStop::End)) [[unlikely]] {
            return fail(BatchErrorCode::InvalidEncoding, key_scan.next);
        }
        pos = key_scan.next;

        util::HashSet<std::string_view> seen;
        seen.reserve(keys);
        for (size_t k = 0; k < keys; ++k) {
            if (!seen.insert(detail::item_bytes(payload_, frame.children, k)).second) [[unlikely]] {
                return fail(BatchErrorCode::InvalidEncoding, frame.children.item_offsets[k]);
            }
        }

        const VarintRead entry_count = kernels_.read_varint(view, pos);
        if (!entry_count.ok()) [[unlikely]] return fail(BatchErrorCode::InvalidEncoding, pos);
        pos += entry_count.length;
        if (entry_count.value > (end - pos) / 4) [[unlikely]] {
            return fail(BatchErrorCode::InvalidEncoding, pos);
        }

        frame.key_ids.reserve(entry_count.value);
        for (uint64_t e = 0; e < entry_count.value; ++e) {
            const VarintRead id = kernels_.read_varint(view, pos);
            if (!id.ok() || id.value >= key_count.value) [[unlikely]] {
                return fail(BatchErrorCode::InvalidEncoding, pos);
            }
            pos += id.length;
            const simd::ScanOutcome scan = kernels_.scan_items(payload_, pos, end, 1, frame.children);
            if (scan.count != 1 ||
                (scan.stop != simd::ScanStop::Limit && scan.stop != simd::ScanStop::End)) [[unlikely]] {
                return fail(BatchErrorCode::InvalidEncoding, scan.next);
            }
            frame.key_ids.push_back(id.value);
            pos = scan.next;
        }
        if (pos != end) [[unlikely]] {
            return fail(BatchErrorCode::InvalidEncoding, pos);
        }

        frame.key_count = keys;
        frame.keys.reserve(keys);
        frame.entries.reserve(entry_count.value);
        return check_bounds(frame, end);
    }

    [[nodiscard]] Status check_bounds(const Frame& frame, size_t end) {
        if (const size_t bad = kernels_.validate_bounds(frame.children, 0, end);
            bad != simd::npos) [[unlikely]] {
            return fail(BatchErrorCode::InvalidEncoding, frame.children.item_offsets[bad]);
        }
        return {};
    }

    void attach(Frame& frame, Value value) {
        const size_t idx = frame.next - 1;
        switch (frame.type) {
            case WireType::Array:
                frame.items.push_back(std::move(value));
                return;
            case WireType::Object:
                frame.fields.push_back(Field{frame.children.tags[idx], std::move(value)});
                return;
            default:
                break;
        }

        if (header_.map_strategy == MapStrategy::Compact) {
            if (idx < frame.key_count) {
                frame.keys.push_back(std::move(value));
            } else {
                const auto key_id = static_cast<size_t>(frame.key_ids[idx - frame.key_count]);
                frame.entries.push_back(MapEntry{frame.keys[key_id], std::move(value)});
            }
        } else if (idx % 2 == 0) {
            frame.pending_key = std::move(value);
        } else {
            frame.entries.push_back(MapEntry{std::move(frame.pending_key), std::move(value)});
        }
    }

    [[nodiscard]] static Value finish(Frame& frame) {
        switch (frame.type) {
            case WireType::Array:  return Value::array(std::move(frame.items));
            case WireType::Object: return Value::object(std::move(frame.fields));
            default:               return Value::map(std::move(frame.entries));
        }
    }

    /// Owner of the payload for chunked fields. Decoding continues on the
    /// owned bytes so chunk offsets stay valid.
    [[nodiscard]] const std::shared_ptr<const memory::OwnedBuffer>& shared_owner() {
        if (!owner_) {
            owner_ = share_();
            payload_ = owner_->bytes();
        }
        return owner_;
    }

    const DecoderConfig& config_;
    const RecordHeader& header_;
    simd::BatchKernels& kernels_;
    ByteSpan payload_;
    ShareFn share_;
    std::shared_ptr<const memory::OwnedBuffer> owner_;
    std::vector<Frame> stack_;
    std::vector<uint64_t> lanes_;   // Reused by every packed array of the batch
    size_t items_{0};
    size_t chunked_{0};
};

// ============================================================================
// Decoder Entry Points
// ============================================================================

inline DecodeResult<DecodedTree>
Decoder::decode(ByteSpan payload, const RecordHeader& header, simd::BatchKernels& kernels) const {
    Session session{config_, header, kernels, payload, [payload] {
        return std::make_shared<const memory::OwnedBuffer>(memory::OwnedBuffer::copy_of(payload));
    }};
    return session.run();
}

inline DecodeResult<DecodedTree>
Decoder::decode(memory::BatchBuffer& buffer, const RecordHeader& header,
                simd::BatchKernels& kernels) const {
    Session session{config_, header, kernels, buffer.bytes(), [&buffer] { return buffer.share(); }};
    return session.run();
}

} // namespace tnt::codec
