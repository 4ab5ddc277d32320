#pragma once

/// @file dispatch.hpp
/// @brief Binding of decode primitives to instruction-set tiers.
///
/// Each batch gets its own BatchKernels cursor, which starts at the best
/// tier of the process-wide capability set. When a primitive reports a
/// KernelFault, the cursor moves to the next-ranked tier for the rest of
/// that batch only, records a diagnostic, and retries.

#include <array>
#include <type_traits>
#include <utility>

#include "tonitru/simd/capability.hpp"
#include "tonitru/simd/highway_kernels.hpp"
#include "tonitru/simd/kernels.hpp"
#include "tonitru/simd/neon_kernels.hpp"
#include "tonitru/simd/scalar_kernels.hpp"
#include "tonitru/simd/x86_kernels.hpp"
#include "tonitru/types/error.hpp"

namespace tnt::simd {

// ============================================================================
// Kernel Table
// ============================================================================

/// Stand-in for a tier that is not compiled into this binary
class UnavailableKernels final : public IDecodeKernels {
public:
    explicit constexpr UnavailableKernels(Isa isa) noexcept : isa_{isa} {}

    [[nodiscard]] Isa isa() const noexcept override { return isa_; }
    [[nodiscard]] size_t alignment() const noexcept override { return 1; }

    [[nodiscard]] KernelResult<VarintRead>
        read_varint(ByteSpan, size_t) const noexcept override {
        return std::unexpected(KernelFault::Unavailable);
    }

    [[nodiscard]] KernelResult<ScanOutcome>
        scan_items(ByteSpan, size_t, size_t, size_t, HeaderIndex&) const override {
        return std::unexpected(KernelFault::Unavailable);
    }

    [[nodiscard]] KernelResult<size_t>
        validate_bounds(const HeaderIndex&, size_t, uint64_t) const noexcept override {
        return std::unexpected(KernelFault::Unavailable);
    }

    [[nodiscard]] KernelResult<Utf8Scan>
        validate_utf8(ByteSpan, size_t, size_t) const noexcept override {
        return std::unexpected(KernelFault::Unavailable);
    }

    [[nodiscard]] KernelResult<size_t>
        unpack_lanes(ByteSpan, size_t, size_t, uint8_t, bool, uint64_t*) const noexcept override {
        return std::unexpected(KernelFault::Unavailable);
    }

    [[nodiscard]] KernelResult<uint32_t>
        crc32c(ByteSpan, size_t, size_t, uint32_t) const noexcept override {
        return std::unexpected(KernelFault::Unavailable);
    }

private:
    Isa isa_;
};

/// One kernel implementation per Isa, indexed by the enum value
using KernelTable = std::array<const IDecodeKernels*, ISA_COUNT>;

/// Process-lifetime singletons for every tier
[[nodiscard]] inline const KernelTable& default_kernel_table() noexcept {
    static const ScalarKernels scalar_tier;
#if TNT_HIGHWAY_KERNELS
    static const HighwayKernels highway_tier;
#else
    static const UnavailableKernels highway_tier{Isa::Highway};
#endif
#if TNT_NEON_KERNELS
    static const NeonKernels neon_tier;
#else
    static const UnavailableKernels neon_tier{Isa::Neon};
#endif
#if TNT_X86_KERNELS
    static const Sse42Kernels sse42_tier;
    static const Avx2Kernels avx2_tier;
    static const Avx512Kernels avx512_tier;
#else
    static const UnavailableKernels sse42_tier{Isa::Sse42};
    static const UnavailableKernels avx2_tier{Isa::Avx2};
    static const UnavailableKernels avx512_tier{Isa::Avx512};
#endif
    static const KernelTable table{
        &scalar_tier, &highway_tier, &neon_tier, &sse42_tier, &avx2_tier, &avx512_tier};
    return table;
}

[[nodiscard]] inline const IDecodeKernels& kernels_for(Isa isa) noexcept {
    return *default_kernel_table()[static_cast<size_t>(isa)];
}

// ============================================================================
// Per-batch Cursor
// ============================================================================

class BatchKernels {
public:
    /// `diag_offset` is stamped on fallback diagnostics (the record's stream offset)
    explicit BatchKernels(const CapabilitySet& caps = capabilities(),
                          const KernelTable& table = default_kernel_table(),
                          size_t diag_offset = 0) noexcept
        : caps_{caps}
        , table_{&table}
        , isa_{caps.best()}
        , active_{table[static_cast<size_t>(caps.best())]}
        , diag_offset_{diag_offset} {}

    [[nodiscard]] Isa isa() const noexcept { return isa_; }
    [[nodiscard]] const IDecodeKernels& active() const noexcept { return *active_; }
    [[nodiscard]] size_t alignment() const noexcept { return active_->alignment(); }
    [[nodiscard]] const CapabilitySet& capability_set() const noexcept { return caps_; }

    void set_diag_offset(size_t offset) noexcept { diag_offset_ = offset; }

    [[nodiscard]] const Diagnostics& diagnostics() const noexcept { return diagnostics_; }
    [[nodiscard]] Diagnostics take_diagnostics() noexcept { return std::exchange(diagnostics_, {}); }

    // ------------------------------------------------------------------------
    // Primitives (never fault: scalar is the last resort)
    // ------------------------------------------------------------------------

    [[nodiscard]] VarintRead read_varint(ByteSpan buffer, size_t offset) {
        return call([&](const IDecodeKernels& k) { return k.read_varint(buffer, offset); });
    }

    [[nodiscard]] ScanOutcome scan_items(ByteSpan buffer, size_t begin, size_t end,
                                         size_t max_items, HeaderIndex& out) {
        const size_t rollback = out.size();
        return call([&](const IDecodeKernels& k) {
            // A faulting tier must not leave partial entries behind
            if (out.size() != rollback) truncate(out, rollback);
            return k.scan_items(buffer, begin, end, max_items, out);
        });
    }

    [[nodiscard]] size_t validate_bounds(const HeaderIndex& index, size_t first, uint64_t limit) {
        return call([&](const IDecodeKernels& k) { return k.validate_bounds(index, first, limit); });
    }

    [[nodiscard]] Utf8Scan validate_utf8(ByteSpan buffer, size_t offset, size_t length) {
        return call([&](const IDecodeKernels& k) { return k.validate_utf8(buffer, offset, length); });
    }

    [[nodiscard]] size_t unpack_lanes(ByteSpan buffer, size_t offset, size_t count, uint8_t width,
                                      bool is_signed, uint64_t* out) {
        return call([&](const IDecodeKernels& k) {
            return k.unpack_lanes(buffer, offset, count, width, is_signed, out);
        });
    }

    [[nodiscard]] uint32_t crc32c(ByteSpan buffer, size_t offset, size_t length, uint32_t seed = 0) {
        return call([&](const IDecodeKernels& k) { return k.crc32c(buffer, offset, length, seed); });
    }

private:
    template <typename F>
    [[nodiscard]] auto call(F&& primitive)
        -> typename std::invoke_result_t<F&, const IDecodeKernels&>::value_type {
        for (;;) {
            auto result = primitive(*active_);
            if (result.has_value()) [[likely]] {
                return *std::move(result);
            }
            fall_back();
        }
    }

    void fall_back() noexcept {
        const Isa from = isa_;
        isa_ = caps_.next_after(from);
        if (isa_ == from) {
            isa_ = Isa::Scalar;
        }
        // The built-in scalar tier terminates every fallback chain
        active_ = isa_ == Isa::Scalar
            ? &kernels_for(Isa::Scalar)
            : (*table_)[static_cast<size_t>(isa_)];
        diagnostics_.emplace_back(DiagnosticCode::UnsupportedInstructionSet, diag_offset_,
                                  (static_cast<uint32_t>(from) << 8) | static_cast<uint32_t>(isa_));
    }

    static void truncate(HeaderIndex& index, size_t n) {
        index.tags.resize(n);
        index.item_offsets.resize(n);
        index.value_offsets.resize(n);
        index.lengths.resize(n);
        index.types.resize(n);
    }

    CapabilitySet caps_;
    const KernelTable* table_;
    Isa isa_;
    const IDecodeKernels* active_;
    size_t diag_offset_;
    Diagnostics diagnostics_;
};

} // namespace tnt::simd
