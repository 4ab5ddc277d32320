#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string_view>
#include <vector>

namespace tnt {

// ============================================================================
// Diagnostics (non-fatal)
// ============================================================================

enum class DiagnosticCode : uint8_t {
    None = 0,
    AlignmentFallback,          // Borrowed view promoted to an aligned copy
    UnsupportedInstructionSet,  // Kernel tier fell back for one batch
    SinkOverflow                // An async sink dropped this batch
};

inline constexpr size_t DIAGNOSTIC_CODE_COUNT = 4;

namespace detail {

template<DiagnosticCode Code>
struct DiagnosticInfo {
    static constexpr std::string_view message = "Unknown diagnostic";
};

template<> struct DiagnosticInfo<DiagnosticCode::None> {
    static constexpr std::string_view message = "No diagnostic";
};

template<> struct DiagnosticInfo<DiagnosticCode::AlignmentFallback> {
    static constexpr std::string_view message = "Source misaligned, batch copied to aligned buffer";
};

template<> struct DiagnosticInfo<DiagnosticCode::UnsupportedInstructionSet> {
    static constexpr std::string_view message = "Kernel precondition failed, fell back to next instruction set";
};

template<> struct DiagnosticInfo<DiagnosticCode::SinkOverflow> {
    static constexpr std::string_view message = "Sink queue full, delivery dropped";
};

consteval std::array<std::string_view, DIAGNOSTIC_CODE_COUNT> create_diagnostic_table() {
    std::array<std::string_view, DIAGNOSTIC_CODE_COUNT> table{};
    table[0] = DiagnosticInfo<DiagnosticCode::None>::message;
    table[1] = DiagnosticInfo<DiagnosticCode::AlignmentFallback>::message;
    table[2] = DiagnosticInfo<DiagnosticCode::UnsupportedInstructionSet>::message;
    table[3] = DiagnosticInfo<DiagnosticCode::SinkOverflow>::message;
    return table;
}

inline constexpr auto DIAGNOSTIC_TABLE = create_diagnostic_table();

} // namespace detail

[[nodiscard]] inline constexpr std::string_view diagnostic_message(DiagnosticCode code) noexcept {
    const auto idx = static_cast<uint8_t>(code);
    if (idx < detail::DIAGNOSTIC_TABLE.size()) [[likely]] {
        return detail::DIAGNOSTIC_TABLE[idx];
    }
    return "Unknown diagnostic";
}

static_assert(detail::DIAGNOSTIC_TABLE[1] == "Source misaligned, batch copied to aligned buffer");

struct Diagnostic {
    DiagnosticCode code;
    size_t offset;     // Stream offset of the record the diagnostic refers to
    uint32_t detail;   // Code-specific detail (alignment, instruction set, ...)

    constexpr Diagnostic() noexcept
        : code{DiagnosticCode::None}, offset{0}, detail{0} {}

    constexpr Diagnostic(DiagnosticCode c, size_t off, uint32_t d = 0) noexcept
        : code{c}, offset{off}, detail{d} {}

    [[nodiscard]] constexpr std::string_view message() const noexcept {
        return diagnostic_message(code);
    }

    constexpr bool operator==(const Diagnostic&) const noexcept = default;
};

using Diagnostics = std::vector<Diagnostic>;

// ============================================================================
// Batch Errors (batch-fatal, recovered locally)
// ============================================================================

enum class BatchErrorCode : uint8_t {
    None = 0,
    NestingLimitExceeded,
    FragmentReassemblyError,
    ChecksumMismatch,
    SchemaTypeMismatch,
    InvalidEncoding,
    PayloadTransformError,
    Cancelled
};

inline constexpr size_t BATCH_ERROR_COUNT = 8;

namespace detail {

template<BatchErrorCode Code>
struct BatchErrorInfo {
    static constexpr std::string_view message = "Unknown error";
};

template<> struct BatchErrorInfo<BatchErrorCode::None> {
    static constexpr std::string_view message = "No error";
};

template<> struct BatchErrorInfo<BatchErrorCode::NestingLimitExceeded> {
    static constexpr std::string_view message = "Nesting limit exceeded";
};

template<> struct BatchErrorInfo<BatchErrorCode::FragmentReassemblyError> {
    static constexpr std::string_view message = "Missing or inconsistent fragment chain";
};

template<> struct BatchErrorInfo<BatchErrorCode::ChecksumMismatch> {
    static constexpr std::string_view message = "Checksum mismatch";
};

template<> struct BatchErrorInfo<BatchErrorCode::SchemaTypeMismatch> {
    static constexpr std::string_view message = "Schema type mismatch";
};

template<> struct BatchErrorInfo<BatchErrorCode::InvalidEncoding> {
    static constexpr std::string_view message = "Invalid value encoding";
};

template<> struct BatchErrorInfo<BatchErrorCode::PayloadTransformError> {
    static constexpr std::string_view message = "Payload transform failed";
};

template<> struct BatchErrorInfo<BatchErrorCode::Cancelled> {
    static constexpr std::string_view message = "Batch discarded by cancellation";
};

consteval std::array<std::string_view, BATCH_ERROR_COUNT> create_batch_error_table() {
    std::array<std::string_view, BATCH_ERROR_COUNT> table{};
    table[0] = BatchErrorInfo<BatchErrorCode::None>::message;
    table[1] = BatchErrorInfo<BatchErrorCode::NestingLimitExceeded>::message;
    table[2] = BatchErrorInfo<BatchErrorCode::FragmentReassemblyError>::message;
    table[3] = BatchErrorInfo<BatchErrorCode::ChecksumMismatch>::message;
    table[4] = BatchErrorInfo<BatchErrorCode::SchemaTypeMismatch>::message;
    table[5] = BatchErrorInfo<BatchErrorCode::InvalidEncoding>::message;
    table[6] = BatchErrorInfo<BatchErrorCode::PayloadTransformError>::message;
    table[7] = BatchErrorInfo<BatchErrorCode::Cancelled>::message;
    return table;
}

inline constexpr auto BATCH_ERROR_TABLE = create_batch_error_table();

} // namespace detail

/// Compile-time query (when code is known at compile time)
template<BatchErrorCode Code>
[[nodiscard]] consteval std::string_view batch_error_message() noexcept {
    return detail::BatchErrorInfo<Code>::message;
}

/// Runtime query using O(1) lookup table
[[nodiscard]] inline constexpr std::string_view batch_error_message(BatchErrorCode code) noexcept {
    const auto idx = static_cast<uint8_t>(code);
    if (idx < detail::BATCH_ERROR_TABLE.size()) [[likely]] {
        return detail::BATCH_ERROR_TABLE[idx];
    }
    return "Unknown error";
}

static_assert(detail::BatchErrorInfo<BatchErrorCode::None>::message == "No error");
static_assert(detail::BATCH_ERROR_TABLE[3] == "Checksum mismatch");

struct BatchError {
    BatchErrorCode code;
    size_t offset;     // Byte offset where the error was detected

    constexpr BatchError() noexcept
        : code{BatchErrorCode::None}, offset{0} {}

    constexpr BatchError(BatchErrorCode c) noexcept
        : code{c}, offset{0} {}

    constexpr BatchError(BatchErrorCode c, size_t off) noexcept
        : code{c}, offset{off} {}

    [[nodiscard]] constexpr bool ok() const noexcept {
        return code == BatchErrorCode::None;
    }

    [[nodiscard]] constexpr explicit operator bool() const noexcept {
        return !ok();
    }

    [[nodiscard]] constexpr std::string_view message() const noexcept {
        return batch_error_message(code);
    }

    /// Same error moved from batch-relative to stream-relative offsets
    [[nodiscard]] constexpr BatchError rebased(size_t base) const noexcept {
        return BatchError{code, offset + base};
    }

    constexpr bool operator==(const BatchError&) const noexcept = default;
};

// ============================================================================
// Stream Errors (stream-fatal)
// ============================================================================

enum class StreamErrorCode : uint8_t {
    None = 0,
    MalformedStreamHeader
};

/// Why a record header could not establish a batch boundary
enum class HeaderDefect : uint8_t {
    None = 0,
    BadMagic,
    UnsupportedVersion,
    ReservedBits,
    UnknownMapStrategy,
    LengthTooLarge,
    TruncatedRecord
};

inline constexpr size_t HEADER_DEFECT_COUNT = 7;

namespace detail {

template<HeaderDefect Defect>
struct HeaderDefectInfo {
    static constexpr std::string_view message = "Unknown defect";
};

template<> struct HeaderDefectInfo<HeaderDefect::None> {
    static constexpr std::string_view message = "No defect";
};

template<> struct HeaderDefectInfo<HeaderDefect::BadMagic> {
    static constexpr std::string_view message = "Bad record magic";
};

template<> struct HeaderDefectInfo<HeaderDefect::UnsupportedVersion> {
    static constexpr std::string_view message = "Unsupported format version";
};

template<> struct HeaderDefectInfo<HeaderDefect::ReservedBits> {
    static constexpr std::string_view message = "Reserved header bits set";
};

template<> struct HeaderDefectInfo<HeaderDefect::UnknownMapStrategy> {
    static constexpr std::string_view message = "Unknown map strategy tag";
};

template<> struct HeaderDefectInfo<HeaderDefect::LengthTooLarge> {
    static constexpr std::string_view message = "Declared length exceeds record limit";
};

template<> struct HeaderDefectInfo<HeaderDefect::TruncatedRecord> {
    static constexpr std::string_view message = "Stream ended inside a record";
};

consteval std::array<std::string_view, HEADER_DEFECT_COUNT> create_header_defect_table() {
    std::array<std::string_view, HEADER_DEFECT_COUNT> table{};
    table[0] = HeaderDefectInfo<HeaderDefect::None>::message;
    table[1] = HeaderDefectInfo<HeaderDefect::BadMagic>::message;
    table[2] = HeaderDefectInfo<HeaderDefect::UnsupportedVersion>::message;
    table[3] = HeaderDefectInfo<HeaderDefect::ReservedBits>::message;
    table[4] = HeaderDefectInfo<HeaderDefect::UnknownMapStrategy>::message;
    table[5] = HeaderDefectInfo<HeaderDefect::LengthTooLarge>::message;
    table[6] = HeaderDefectInfo<HeaderDefect::TruncatedRecord>::message;
    return table;
}

inline constexpr auto HEADER_DEFECT_TABLE = create_header_defect_table();

} // namespace detail

[[nodiscard]] inline constexpr std::string_view header_defect_message(HeaderDefect defect) noexcept {
    const auto idx = static_cast<uint8_t>(defect);
    if (idx < detail::HEADER_DEFECT_TABLE.size()) [[likely]] {
        return detail::HEADER_DEFECT_TABLE[idx];
    }
    return "Unknown defect";
}

static_assert(detail::HEADER_DEFECT_TABLE[1] == "Bad record magic");

struct StreamError {
    StreamErrorCode code;
    HeaderDefect defect;
    size_t offset;     // Stream offset of the unusable header

    constexpr StreamError() noexcept
        : code{StreamErrorCode::None}, defect{HeaderDefect::None}, offset{0} {}

    constexpr StreamError(HeaderDefect d, size_t off) noexcept
        : code{StreamErrorCode::MalformedStreamHeader}, defect{d}, offset{off} {}

    [[nodiscard]] constexpr bool ok() const noexcept {
        return code == StreamErrorCode::None;
    }

    [[nodiscard]] constexpr std::string_view message() const noexcept {
        return ok() ? std::string_view{"No error"} : header_defect_message(defect);
    }

    constexpr bool operator==(const StreamError&) const noexcept = default;
};

// ============================================================================
// Kernel Faults (internal precondition failures of a SIMD tier)
// ============================================================================

enum class KernelFault : uint8_t {
    Misaligned,    // Buffer base not aligned to the tier's register width
    Unavailable    // Tier not compiled into this binary
};

[[nodiscard]] inline constexpr std::string_view kernel_fault_message(KernelFault fault) noexcept {
    switch (fault) {
        case KernelFault::Misaligned:  return "Buffer misaligned for instruction set";
        case KernelFault::Unavailable: return "Instruction set not compiled in";
    }
    return "Unknown fault";
}

// ============================================================================
// Result Type Aliases (using std::expected)
// ============================================================================

template <typename T>
using DecodeResult = std::expected<T, BatchError>;

template <typename T>
using StreamResult = std::expected<T, StreamError>;

template <typename T>
using KernelResult = std::expected<T, KernelFault>;

} // namespace tnt
