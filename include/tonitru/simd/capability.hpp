#pragma once

/// @file capability.hpp
/// @brief One-time instruction-set capability probe

#include <array>
#include <cstdint>
#include <cstdlib>
#include <initializer_list>
#include <string_view>

#include "tonitru/platform/platform.hpp"

#if TNT_ARCH_ARM64 && TNT_PLATFORM_LINUX
    #include <sys/auxv.h>
    #include <asm/hwcap.h>
#endif

namespace tnt::simd {

// ============================================================================
// Instruction Sets
// ============================================================================

/// Kernel tiers, declared from least to most preferred
enum class Isa : uint8_t {
    Scalar = 0,
    Highway,
    Neon,
    Sse42,
    Avx2,
    Avx512
};

inline constexpr size_t ISA_COUNT = 6;

[[nodiscard]] inline constexpr std::string_view isa_name(Isa isa) noexcept {
    switch (isa) {
        case Isa::Scalar:  return "scalar";
        case Isa::Highway: return "highway";
        case Isa::Neon:    return "neon";
        case Isa::Sse42:   return "sse42";
        case Isa::Avx2:    return "avx2";
        case Isa::Avx512:  return "avx512";
    }
    return "unknown";
}

/// Inverse of isa_name(); used for the TNT_SIMD_IMPL override
[[nodiscard]] inline constexpr bool parse_isa(std::string_view name, Isa& out) noexcept {
    for (uint8_t i = 0; i < ISA_COUNT; ++i) {
        if (isa_name(static_cast<Isa>(i)) == name) {
            out = static_cast<Isa>(i);
            return true;
        }
    }
    return false;
}

// ============================================================================
// Capability Set
// ============================================================================

/// Ranked, immutable list of usable tiers. Index 0 is the preferred tier and
/// the last entry is always Scalar.
class CapabilitySet {
public:
    constexpr CapabilitySet() noexcept : ranked_{Isa::Scalar}, count_{1} {}

    /// Build from an unordered list of detected tiers; Scalar is implied
    [[nodiscard]] static constexpr CapabilitySet from_detected(
            std::initializer_list<Isa> detected) noexcept {
        CapabilitySet set;
        set.count_ = 0;
        for (int i = static_cast<int>(ISA_COUNT) - 1; i > 0; --i) {
            const auto isa = static_cast<Isa>(i);
            for (Isa d : detected) {
                if (d == isa) {
                    set.ranked_[set.count_++] = isa;
                    break;
                }
            }
        }
        set.ranked_[set.count_++] = Isa::Scalar;
        return set;
    }

    /// Drop every tier ranked above `cap`. No-op if `cap` was not detected.
    [[nodiscard]] constexpr CapabilitySet capped_at(Isa cap) const noexcept {
        if (!contains(cap)) return *this;
        CapabilitySet set;
        set.count_ = 0;
        for (size_t i = 0; i < count_; ++i) {
            if (ranked_[i] <= cap) {
                set.ranked_[set.count_++] = ranked_[i];
            }
        }
        return set;
    }

    [[nodiscard]] constexpr Isa best() const noexcept { return ranked_[0]; }
    [[nodiscard]] constexpr size_t size() const noexcept { return count_; }
    [[nodiscard]] constexpr Isa operator[](size_t i) const noexcept { return ranked_[i]; }

    [[nodiscard]] constexpr const Isa* begin() const noexcept { return ranked_.data(); }
    [[nodiscard]] constexpr const Isa* end() const noexcept { return ranked_.data() + count_; }

    [[nodiscard]] constexpr bool contains(Isa isa) const noexcept {
        for (size_t i = 0; i < count_; ++i) {
            if (ranked_[i] == isa) return true;
        }
        return false;
    }

    /// Next-ranked tier after `isa`, or Scalar when none remain
    [[nodiscard]] constexpr Isa next_after(Isa isa) const noexcept {
        for (size_t i = 0; i + 1 < count_; ++i) {
            if (ranked_[i] == isa) return ranked_[i + 1];
        }
        return Isa::Scalar;
    }

    constexpr bool operator==(const CapabilitySet& other) const noexcept {
        if (count_ != other.count_) return false;
        for (size_t i = 0; i < count_; ++i) {
            if (ranked_[i] != other.ranked_[i]) return false;
        }
        return true;
    }

private:
    std::array<Isa, ISA_COUNT> ranked_{};
    size_t count_;
};

static_assert(CapabilitySet{}.best() == Isa::Scalar);
static_assert(CapabilitySet::from_detected({Isa::Sse42, Isa::Avx2}).best() == Isa::Avx2);
static_assert(CapabilitySet::from_detected({Isa::Avx2}).capped_at(Isa::Scalar).size() == 1);

// ============================================================================
// Hardware Probe
// ============================================================================

/// Query the CPU. Never fails; unsupported features are simply absent.
[[nodiscard]] inline CapabilitySet probe_hardware() noexcept {
    bool avx512 = false;
    bool avx2 = false;
    bool sse42 = false;
    bool neon = false;

#if TNT_X86_KERNELS
    __builtin_cpu_init();
    sse42 = __builtin_cpu_supports("sse4.2");
    avx2 = sse42 && __builtin_cpu_supports("avx2") && __builtin_cpu_supports("bmi2");
    avx512 = avx2 && __builtin_cpu_supports("avx512f") && __builtin_cpu_supports("avx512bw");
#endif

#if TNT_NEON_KERNELS
    #if TNT_PLATFORM_LINUX && defined(HWCAP_ASIMD)
    neon = (getauxval(AT_HWCAP) & HWCAP_ASIMD) != 0;
    #else
    neon = true;
    #endif
#endif

    return CapabilitySet::from_detected({
        avx512 ? Isa::Avx512 : Isa::Scalar,
        avx2 ? Isa::Avx2 : Isa::Scalar,
        sse42 ? Isa::Sse42 : Isa::Scalar,
        neon ? Isa::Neon : Isa::Scalar,
        TNT_HIGHWAY_KERNELS ? Isa::Highway : Isa::Scalar,
    });
}

/// Apply the TNT_SIMD_IMPL environment override to a probed set
[[nodiscard]] inline CapabilitySet apply_override(CapabilitySet probed, const char* env) noexcept {
    if (env == nullptr) return probed;
    Isa cap{};
    if (!parse_isa(env, cap)) return probed;
    return probed.capped_at(cap);
}

/// Process-wide capability set. Computed on first use (thread-safe static
/// initialization) and immutable afterwards.
[[nodiscard]] inline const CapabilitySet& capabilities() noexcept {
    static const CapabilitySet set = apply_override(probe_hardware(), std::getenv("TNT_SIMD_IMPL"));
    return set;
}

} // namespace tnt::simd
