/*
    Record Header Tests

    16-byte record framing: field layout, every header defect with the
    offset it is reported at, and the error message tables.
*/

#include <catch2/catch_test_macros.hpp>

#include <tonitru/types/error.hpp>
#include <tonitru/types/record_header.hpp>

#include <array>
#include <cstdint>

using namespace tnt;

namespace {

std::array<uint8_t, RECORD_HEADER_SIZE> valid_header() {
    RecordHeader h;
    h.flags = record_flags::FRAGMENTED;
    h.map_strategy = MapStrategy::Compact;
    h.payload_length = 0x01020304;
    h.checksum = 0xA1B2C3D4;
    return h.serialize();
}

} // namespace

TEST_CASE("Record header layout", "[header]") {
    const auto bytes = valid_header();

    REQUIRE(bytes[0] == 'T');
    REQUIRE(bytes[1] == 'N');
    REQUIRE(bytes[2] == RECORD_VERSION);
    REQUIRE(bytes[3] == record_flags::FRAGMENTED);
    REQUIRE(bytes[4] == static_cast<uint8_t>(MapStrategy::Compact));
    REQUIRE(bytes[5] == 0);
    REQUIRE(bytes[6] == 0);
    REQUIRE(bytes[7] == 0);
    // Little-endian length and checksum
    REQUIRE(bytes[8] == 0x04);
    REQUIRE(bytes[11] == 0x01);
    REQUIRE(bytes[CHECKSUM_FIELD_OFFSET] == 0xD4);
    REQUIRE(bytes[15] == 0xA1);

    auto parsed = RecordHeader::parse(bytes, 0, uint64_t{1} << 32);
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->fragmented());
    REQUIRE_FALSE(parsed->transformed());
    REQUIRE(parsed->payload_length == 0x01020304);
    REQUIRE(parsed->checksum == 0xA1B2C3D4);
    REQUIRE(parsed->record_size() == RECORD_HEADER_SIZE + 0x01020304);
}

TEST_CASE("Record header defects", "[header][error]") {
    constexpr size_t at = 1000;
    auto bytes = valid_header();
    const uint64_t max = uint64_t{1} << 32;

    auto expect_defect = [&](HeaderDefect defect, size_t offset) {
        auto r = RecordHeader::parse(bytes, at, max);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == StreamErrorCode::MalformedStreamHeader);
        REQUIRE(r.error().defect == defect);
        REQUIRE(r.error().offset == offset);
    };

    SECTION("truncated") {
        auto r = RecordHeader::parse(std::span<const uint8_t>{bytes.data(), 15}, at, max);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().defect == HeaderDefect::TruncatedRecord);
        REQUIRE(r.error().offset == at);
    }

    SECTION("bad magic") {
        bytes[1] = 'X';
        expect_defect(HeaderDefect::BadMagic, at);
    }

    SECTION("unsupported version") {
        bytes[2] = 2;
        expect_defect(HeaderDefect::UnsupportedVersion, at + 2);
    }

    SECTION("unknown flag bit") {
        bytes[3] |= 0x80;
        expect_defect(HeaderDefect::ReservedBits, at + 3);
    }

    SECTION("unknown map strategy") {
        bytes[4] = 4;
        expect_defect(HeaderDefect::UnknownMapStrategy, at + 4);
    }

    SECTION("reserved bytes set") {
        bytes[6] = 1;
        expect_defect(HeaderDefect::ReservedBits, at + 5);
    }

    SECTION("length above limit") {
        auto r = RecordHeader::parse(bytes, at, 1024);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().defect == HeaderDefect::LengthTooLarge);
        REQUIRE(r.error().offset == at + 8);
    }
}

TEST_CASE("Error message tables", "[error]") {
    REQUIRE(batch_error_message(BatchErrorCode::ChecksumMismatch) == "Checksum mismatch");
    REQUIRE(batch_error_message<BatchErrorCode::Cancelled>() == "Batch discarded by cancellation");
    REQUIRE(header_defect_message(HeaderDefect::BadMagic) == "Bad record magic");
    REQUIRE(diagnostic_message(DiagnosticCode::SinkOverflow) != "Unknown diagnostic");

    SECTION("out-of-range codes map to a fallback") {
        REQUIRE(batch_error_message(static_cast<BatchErrorCode>(200)) == "Unknown error");
    }

    SECTION("rebasing moves the offset only") {
        const BatchError e{BatchErrorCode::InvalidEncoding, 5};
        REQUIRE(e.rebased(16) == BatchError{BatchErrorCode::InvalidEncoding, 21});
        REQUIRE(static_cast<bool>(e));
        REQUIRE(BatchError{}.ok());
    }
}
