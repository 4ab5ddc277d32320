#pragma once

/// @file batch_result.hpp
/// @brief Per-batch outcome emitted by the verify stage

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <variant>
#include <vector>

#include "tonitru/types/error.hpp"
#include "tonitru/types/record_header.hpp"
#include "tonitru/types/value.hpp"

namespace tnt::pipeline {

/// Decoded and checksum-confirmed batch
struct BatchOk {
    uint64_t tag{0};
    Value root;
    Diagnostics diagnostics;
};

/// Batch that failed one or more checks; siblings are unaffected
struct PartialFailure {
    std::vector<BatchError> errors;
    Diagnostics diagnostics;
};

struct BatchResult {
    uint64_t sequence{0};
    size_t stream_offset{0};   // Offset of the record header in the input
    RecordHeader header{};
    std::variant<BatchOk, PartialFailure> outcome;

    [[nodiscard]] bool ok() const noexcept { return std::holds_alternative<BatchOk>(outcome); }

    [[nodiscard]] const BatchOk* value() const noexcept { return std::get_if<BatchOk>(&outcome); }
    [[nodiscard]] BatchOk* value() noexcept { return std::get_if<BatchOk>(&outcome); }

    [[nodiscard]] const PartialFailure* failure() const noexcept {
        return std::get_if<PartialFailure>(&outcome);
    }

    [[nodiscard]] const Diagnostics& diagnostics() const noexcept {
        return ok() ? value()->diagnostics : failure()->diagnostics;
    }

    [[nodiscard]] bool has_error(BatchErrorCode code) const noexcept {
        const auto* f = failure();
        return f != nullptr && std::any_of(f->errors.begin(), f->errors.end(),
                                           [code](const BatchError& e) { return e.code == code; });
    }

    [[nodiscard]] bool has_diagnostic(DiagnosticCode code) const noexcept {
        const Diagnostics& d = diagnostics();
        return std::any_of(d.begin(), d.end(), [code](const Diagnostic& x) { return x.code == code; });
    }
};

} // namespace tnt::pipeline
