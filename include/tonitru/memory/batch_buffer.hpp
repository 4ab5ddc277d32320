#pragma once

/// @file batch_buffer.hpp
/// @brief Storage of one record payload while it moves through the pipeline.
///
/// A payload is either a BorrowedView into caller memory (zero-copy) or an
/// OwnedBuffer (aligned heap copy). Borrowed views can only be obtained from
/// a SourceScope, which outlives every stage that could hold one and waits
/// for all leases before it goes away.

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <new>
#include <span>
#include <stdexcept>
#include <utility>
#include <variant>
#include <vector>

#include "tonitru/memory/wait_strategy.hpp"
#include "tonitru/util/prefetch.hpp"

namespace tnt::memory {

// ============================================================================
// Owned Buffer
// ============================================================================

struct AlignedDeleter {
    size_t alignment{alignof(std::max_align_t)};

    void operator()(uint8_t* p) const noexcept {
        ::operator delete[](p, std::align_val_t{alignment});
    }
};

/// Aligned heap allocation holding one payload
class OwnedBuffer {
public:
    OwnedBuffer() noexcept = default;

    OwnedBuffer(OwnedBuffer&&) noexcept = default;
    OwnedBuffer& operator=(OwnedBuffer&&) noexcept = default;
    OwnedBuffer(const OwnedBuffer&) = delete;
    OwnedBuffer& operator=(const OwnedBuffer&) = delete;

    /// Uninitialized storage of `size` bytes; `alignment` must be a power of two
    [[nodiscard]] static OwnedBuffer allocate(size_t size, size_t alignment) {
        if (alignment < alignof(std::max_align_t)) {
            alignment = alignof(std::max_align_t);
        }
        // Round up so vector kernels may read whole registers at the tail
        const size_t capacity = util::align_up(size == 0 ? 1 : size, alignment);
        auto* raw = static_cast<uint8_t*>(::operator new[](capacity, std::align_val_t{alignment}));
        OwnedBuffer out;
        out.data_ = Storage{raw, AlignedDeleter{alignment}};
        out.size_ = size;
        out.alignment_ = alignment;
        return out;
    }

    [[nodiscard]] static OwnedBuffer copy_of(std::span<const uint8_t> bytes,
                                             size_t alignment = util::CACHE_LINE_SIZE) {
        OwnedBuffer out = allocate(bytes.size(), alignment);
        if (!bytes.empty()) {
            std::memcpy(out.data_.get(), bytes.data(), bytes.size());
        }
        return out;
    }

    /// Take over transform output. Copies only if the vector's storage is
    /// not aligned to `alignment`.
    [[nodiscard]] static OwnedBuffer adopt(std::vector<uint8_t>&& bytes,
                                           size_t alignment = util::CACHE_LINE_SIZE) {
        if (!bytes.empty() && util::is_aligned(bytes.data(), alignment)) {
            OwnedBuffer out;
            out.adopted_ = std::move(bytes);
            out.size_ = out.adopted_.size();
            out.alignment_ = alignment;
            return out;
        }
        return copy_of(bytes, alignment);
    }

    [[nodiscard]] std::span<const uint8_t> bytes() const noexcept { return {data(), size_}; }
    [[nodiscard]] std::span<uint8_t> mutable_bytes() noexcept { return {data(), size_}; }

    [[nodiscard]] uint8_t* data() noexcept {
        return data_ ? data_.get() : adopted_.data();
    }
    [[nodiscard]] const uint8_t* data() const noexcept {
        return data_ ? data_.get() : adopted_.data();
    }

    [[nodiscard]] size_t size() const noexcept { return size_; }
    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }
    [[nodiscard]] size_t alignment() const noexcept { return alignment_; }

private:
    using Storage = std::unique_ptr<uint8_t[], AlignedDeleter>;

    Storage data_;
    std::vector<uint8_t> adopted_;
    size_t size_{0};
    size_t alignment_{1};
};

// ============================================================================
// Source Scope and Borrowed View
// ============================================================================

class SourceScope;

/// Zero-copy view of caller memory. Move-only; holds a lease on its scope
/// until destroyed.
class BorrowedView {
public:
    BorrowedView(BorrowedView&& other) noexcept
        : scope_{std::exchange(other.scope_, nullptr)}
        , bytes_{other.bytes_}
        , offset_{other.offset_} {}

    BorrowedView& operator=(BorrowedView&& other) noexcept {
        if (this != &other) {
            release();
            scope_ = std::exchange(other.scope_, nullptr);
            bytes_ = other.bytes_;
            offset_ = other.offset_;
        }
        return *this;
    }

    BorrowedView(const BorrowedView&) = delete;
    BorrowedView& operator=(const BorrowedView&) = delete;

    ~BorrowedView() { release(); }

    [[nodiscard]] std::span<const uint8_t> bytes() const noexcept { return bytes_; }

    /// Offset of the view inside the scope's source
    [[nodiscard]] size_t offset() const noexcept { return offset_; }

private:
    friend class SourceScope;

    BorrowedView(SourceScope* scope, std::span<const uint8_t> bytes, size_t offset) noexcept
        : scope_{scope}, bytes_{bytes}, offset_{offset} {}

    inline void release() noexcept;

    SourceScope* scope_;
    std::span<const uint8_t> bytes_;
    size_t offset_;
};

/// One pipeline invocation over a caller-owned buffer
class SourceScope {
public:
    explicit SourceScope(std::span<const uint8_t> source) noexcept : source_{source} {}

    ~SourceScope() { wait_released(); }

    SourceScope(const SourceScope&) = delete;
    SourceScope& operator=(const SourceScope&) = delete;
    SourceScope(SourceScope&&) = delete;
    SourceScope& operator=(SourceScope&&) = delete;

    /// @throws std::out_of_range if the range is not inside the source
    [[nodiscard]] BorrowedView borrow(size_t offset, size_t length) {
        if (offset > source_.size() || length > source_.size() - offset) {
            throw std::out_of_range("SourceScope::borrow: range outside source");
        }
        leases_.fetch_add(1, std::memory_order_acq_rel);
        return BorrowedView{this, source_.subspan(offset, length), offset};
    }

    [[nodiscard]] std::span<const uint8_t> source() const noexcept { return source_; }

    [[nodiscard]] size_t live_borrows() const noexcept {
        return leases_.load(std::memory_order_acquire);
    }

    /// Block until every BorrowedView of this scope has been destroyed
    void wait_released() const noexcept {
        StageWait::wait_until([this] { return leases_.load(std::memory_order_acquire) == 0; });
    }

private:
    friend class BorrowedView;

    void release() noexcept { leases_.fetch_sub(1, std::memory_order_acq_rel); }

    std::span<const uint8_t> source_;
    std::atomic<size_t> leases_{0};
};

inline void BorrowedView::release() noexcept {
    if (scope_ != nullptr) {
        std::exchange(scope_, nullptr)->release();
    }
}

// ============================================================================
// Batch Buffer
// ============================================================================

/// Tagged union of the two payload representations
class BatchBuffer {
public:
    BatchBuffer() noexcept : storage_{OwnedBuffer{}} {}
    BatchBuffer(BorrowedView view) noexcept : storage_{std::move(view)} {}
    BatchBuffer(OwnedBuffer owned) noexcept : storage_{std::move(owned)} {}
    BatchBuffer(std::shared_ptr<const OwnedBuffer> shared) noexcept : storage_{std::move(shared)} {}

    BatchBuffer(BatchBuffer&&) noexcept = default;
    BatchBuffer& operator=(BatchBuffer&&) noexcept = default;

    [[nodiscard]] std::span<const uint8_t> bytes() const noexcept {
        return std::visit([](const auto& s) noexcept { return span_of(s); }, storage_);
    }

    [[nodiscard]] size_t size() const noexcept { return bytes().size(); }

    [[nodiscard]] bool is_borrowed() const noexcept {
        return std::holds_alternative<BorrowedView>(storage_);
    }

    /// Base address suits kernels of the given register width
    [[nodiscard]] bool satisfies(size_t alignment) const noexcept {
        return util::is_aligned(bytes().data(), alignment);
    }

    /// Replace a borrowed or misaligned payload by an aligned owned copy.
    /// The borrow lease is released here.
    OwnedBuffer& promote(size_t alignment) {
        if (auto* owned = std::get_if<OwnedBuffer>(&storage_);
            owned != nullptr && owned->alignment() >= alignment && satisfies(alignment)) {
            return *owned;
        }
        OwnedBuffer copy = OwnedBuffer::copy_of(bytes(), alignment);
        storage_ = std::move(copy);
        return std::get<OwnedBuffer>(storage_);
    }

    /// Shared owner of the payload for values that outlive the batch
    /// (chunked fields). Borrowed payloads are copied first.
    [[nodiscard]] std::shared_ptr<const OwnedBuffer> share() {
        if (auto* shared = std::get_if<Shared>(&storage_)) {
            return *shared;
        }
        const size_t alignment = std::holds_alternative<OwnedBuffer>(storage_)
            ? std::get<OwnedBuffer>(storage_).alignment()
            : util::CACHE_LINE_SIZE;
        if (is_borrowed()) {
            promote(alignment);
        }
        auto shared = std::make_shared<const OwnedBuffer>(std::get<OwnedBuffer>(std::move(storage_)));
        storage_ = shared;
        return shared;
    }

private:
    using Shared = std::shared_ptr<const OwnedBuffer>;

    static std::span<const uint8_t> span_of(const BorrowedView& v) noexcept { return v.bytes(); }
    static std::span<const uint8_t> span_of(const OwnedBuffer& o) noexcept { return o.bytes(); }
    static std::span<const uint8_t> span_of(const Shared& s) noexcept {
        return s ? s->bytes() : std::span<const uint8_t>{};
    }

    std::variant<BorrowedView, OwnedBuffer, Shared> storage_;
};

} // namespace tnt::memory
