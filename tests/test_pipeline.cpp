/*
    Pipeline Tests

    End-to-end runs through prefetch, decode, dispatch and verify:
    per-batch failure isolation, ordering with several decode workers,
    the in-flight window, sink backpressure, cancellation, chunked input
    and the pull stream.
*/

#include <catch2/catch_test_macros.hpp>

#include <tonitru/codec/encoder.hpp>
#include <tonitru/pipeline/pipeline.hpp>
#include <tonitru/simd/dispatch.hpp>
#include <tonitru/simd/scalar_kernels.hpp>

#include "test_support.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace tnt;
using namespace tnt::pipeline;

namespace {

Value message(uint64_t i) {
    return Value::object({
        {1, Value::string("message " + std::to_string(i))},
        {2, Value::u64(i)},
        {3, Value::array(std::vector<Value>(i % 7, Value::u8(static_cast<uint8_t>(i))))},
    });
}

/// Stream of `count` encoded records, record i holding message(i)
test::Buffer record_stream(size_t count) {
    codec::RecordWriter writer;
    for (size_t i = 0; i < count; ++i) {
        REQUIRE(writer.append(message(i)).has_value());
    }
    return writer.take();
}

std::vector<BatchResult> run_all(Pipeline& pipeline, std::span<const uint8_t> input,
                                 StreamStatus* status = nullptr) {
    std::vector<BatchResult> results;
    auto s = pipeline.run(input, [&](BatchResult&& r) { results.push_back(std::move(r)); });
    if (status != nullptr) {
        *status = s;
    } else {
        REQUIRE(s.has_value());
    }
    return results;
}

/// Payload bytes XOR 0x5A stand in for a compressed payload
class XorTransform final : public IPayloadTransform {
public:
    explicit XorTransform(bool fail = false) noexcept : fail_{fail} {}

    std::optional<memory::OwnedBuffer>
    restore(const RecordHeader&, std::span<const uint8_t> payload, size_t alignment) override {
        ++calls;
        if (fail_) return std::nullopt;
        std::vector<uint8_t> plain(payload.begin(), payload.end());
        for (auto& b : plain) b ^= 0x5A;
        return memory::OwnedBuffer::copy_of(plain, alignment);
    }

    std::atomic<int> calls{0};

private:
    bool fail_;
};

test::Buffer scrambled_record(std::span<const uint8_t> plain) {
    test::Buffer scrambled(plain.begin(), plain.end());
    for (auto& b : scrambled) b ^= 0x5A;
    return test::record(scrambled, record_flags::COMPRESSED, MapStrategy::Hash,
                        simd::scalar::crc32c(plain, 0, plain.size(), 0));
}

} // namespace

// ============================================================================
// Failure Isolation
// ============================================================================

TEST_CASE("Checksum failure is confined to its batch", "[pipeline][isolation]") {
    const auto p1 = test::string_item(1, "first");
    const auto p2 = test::string_item(1, "second");
    const auto p3 = test::string_item(1, "third");

    const auto r1 = test::record(p1);
    const auto r2 = test::record(p2, 0, MapStrategy::Hash, 0xDEADBEEFu);
    const auto r3 = test::record(p3);
    const auto input = test::concat({r1, r2, r3});

    Pipeline pipeline;
    auto results = run_all(pipeline, input);

    REQUIRE(results.size() == 3);
    REQUIRE(results[0].ok());
    REQUIRE(results[2].ok());
    REQUIRE(*results[0].value()->root.as_string() == "first");
    REQUIRE(*results[2].value()->root.as_string() == "third");

    const BatchResult& bad = results[1];
    REQUIRE_FALSE(bad.ok());
    REQUIRE(bad.stream_offset == r1.size());
    REQUIRE(bad.failure()->errors.size() == 1);
    REQUIRE(bad.failure()->errors[0].code == BatchErrorCode::ChecksumMismatch);
    REQUIRE(bad.failure()->errors[0].offset == r1.size() + CHECKSUM_FIELD_OFFSET);

    const PipelineStats stats = pipeline.stats();
    REQUIRE(stats.batches_admitted == 3);
    REQUIRE(stats.batches_ok == 2);
    REQUIRE(stats.batches_failed == 1);
    REQUIRE(stats.bytes == input.size());
}

TEST_CASE("Decode error offsets are stream offsets", "[pipeline][isolation]") {
    const auto good = test::record(test::string_item(1, "ok"));
    // Bool value 2 sits three bytes into the payload
    const auto broken = test::record(test::item(0, WireType::Bool, {2}));
    const auto input = test::concat({good, broken, good});

    Pipeline pipeline;
    auto results = run_all(pipeline, input);

    REQUIRE(results.size() == 3);
    REQUIRE(results[0].ok());
    REQUIRE(results[2].ok());
    REQUIRE(results[1].has_error(BatchErrorCode::InvalidEncoding));
    REQUIRE(results[1].failure()->errors[0].offset == good.size() + RECORD_HEADER_SIZE + 3);
    // Checksum still matches the bytes as written
    REQUIRE_FALSE(results[1].has_error(BatchErrorCode::ChecksumMismatch));
}

// ============================================================================
// Ordering
// ============================================================================

TEST_CASE("Results keep admission order with several decode workers", "[pipeline][order]") {
    constexpr size_t COUNT = 300;
    codec::RecordWriter writer;
    std::vector<size_t> offsets;
    for (size_t i = 0; i < COUNT; ++i) {
        offsets.push_back(writer.bytes().size());
        REQUIRE(writer.append(message(i)).has_value());
    }
    const auto input = writer.take();

    PipelineConfig config;
    config.decode_workers = 4;
    config.stage_queue_capacity = 8;
    Pipeline pipeline{config};

    std::vector<uint64_t> observed;
    pipeline.add_observer([&](const DispatchedBatch& b) { observed.push_back(b.sequence); });

    auto results = run_all(pipeline, input);

    REQUIRE(results.size() == COUNT);
    REQUIRE(observed.size() == COUNT);
    for (size_t i = 0; i < COUNT; ++i) {
        INFO("batch " << i);
        REQUIRE(results[i].sequence == i);
        REQUIRE(observed[i] == i);
        REQUIRE(results[i].stream_offset == offsets[i]);
        REQUIRE(results[i].ok());
        REQUIRE(results[i].value()->root == message(i));
    }
}

// ============================================================================
// In-flight Window
// ============================================================================

TEST_CASE("Flight window credits", "[pipeline][window]") {
    CancelState cancel;
    FlightWindow window{2};
    REQUIRE(window.acquire(cancel));
    REQUIRE(window.acquire(cancel));
    REQUIRE(window.in_flight() == 2);

    SECTION("release makes room") {
        window.release();
        REQUIRE(window.acquire(cancel));
        REQUIRE(window.in_flight() == 2);
        REQUIRE(window.peak() == 2);
    }

    SECTION("a full window waits for a release") {
        std::thread releaser([&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            window.release();
        });
        REQUIRE(window.acquire(cancel));
        releaser.join();
        REQUIRE(window.in_flight() == 2);
    }

    SECTION("stopped admission returns instead of waiting") {
        cancel.request(CancelMode::Discard);
        REQUIRE_FALSE(window.acquire(cancel));
        REQUIRE(window.in_flight() == 2);
    }

    SECTION("limit derivation") {
        PipelineConfig config;
        config.stage_queue_capacity = 5;
        config.decode_workers = 3;
        REQUIRE(config.in_flight_limit() == 3 * 8 + 3 + 2);
        config.max_in_flight = 4;
        REQUIRE(config.in_flight_limit() == 4);
        REQUIRE(FlightWindow{0}.limit() == 1);
    }
}

TEST_CASE("A slow first batch does not let admission run ahead", "[pipeline][window][order]") {
    constexpr size_t SMALL = 3000;
    codec::RecordWriter writer;
    // Plain 200k-item array: decodes far slower than the records behind it
    REQUIRE(writer.append(Value::array(std::vector<Value>(200000, Value::u8(7)))).has_value());
    for (size_t i = 1; i <= SMALL; ++i) {
        REQUIRE(writer.append(message(i)).has_value());
    }
    const auto input = writer.take();

    auto run_bounded = [&](const PipelineConfig& config) {
        const size_t limit = config.in_flight_limit();
        Pipeline pipeline{config};

        uint64_t delivered = 0;
        uint64_t widest = 0;
        uint64_t admitted_at_first = 0;
        std::vector<uint64_t> sequences;
        auto status = pipeline.run(input, [&](BatchResult&& r) {
            const uint64_t admitted = pipeline.stats().batches_admitted;
            if (delivered == 0) admitted_at_first = admitted;
            widest = std::max(widest, admitted - delivered);
            ++delivered;
            sequences.push_back(r.sequence);
        });
        REQUIRE(status.has_value());

        INFO("limit " << limit << " widest " << widest);
        REQUIRE(delivered == SMALL + 1);
        REQUIRE(admitted_at_first <= limit);
        REQUIRE(widest <= limit);
        REQUIRE(pipeline.stats().peak_in_flight <= limit);
        for (size_t i = 0; i < sequences.size(); ++i) {
            REQUIRE(sequences[i] == i);
        }
    };

    SECTION("derived window") {
        PipelineConfig config;
        config.decode_workers = 2;
        config.stage_queue_capacity = 2;
        REQUIRE(config.in_flight_limit() == 10);
        run_bounded(config);
    }

    SECTION("explicit window of one batch") {
        PipelineConfig config;
        config.decode_workers = 4;
        config.max_in_flight = 1;
        run_bounded(config);
    }
}

// ============================================================================
// Sinks and Observers
// ============================================================================

namespace {

class CountingSink final : public IBatchSink {
public:
    std::string_view name() const noexcept override { return "counting"; }

    SinkVerdict consume(const DispatchedBatch& batch) override {
        if (!batch.decoded()) undecoded = true;
        sequences.push_back(batch.sequence);
        return SinkVerdict::accept();
    }

    std::vector<uint64_t> sequences;
    bool undecoded{false};
};

} // namespace

TEST_CASE("Sinks see decoded batches only, observers see all", "[pipeline][sink]") {
    const auto good = test::record(test::string_item(1, "ok"));
    const auto corrupt = test::record(test::string_item(1, "bad \xFF"));
    const auto input = test::concat({good, corrupt, good});

    Pipeline pipeline;
    auto sink = std::make_shared<CountingSink>();
    pipeline.add_sink(sink);

    std::vector<bool> roots;
    pipeline.add_observer([&](const DispatchedBatch& b) { roots.push_back(b.root != nullptr); });

    auto results = run_all(pipeline, input);
    REQUIRE(results.size() == 3);
    REQUIRE(sink->sequences == std::vector<uint64_t>{0, 2});
    REQUIRE_FALSE(sink->undecoded);
    REQUIRE(roots == std::vector<bool>{true, false, true});
}

TEST_CASE("Schema sink rejects mismatched batches", "[pipeline][sink]") {
    auto shape = std::make_shared<ObjectShapeValidator>();
    shape->require(1, ValueKind::String).require(2, ValueKind::Int);

    codec::RecordWriter writer;
    REQUIRE(writer.append(message(1)).has_value());
    REQUIRE(writer.append(Value::object({{1, Value::u8(1)}, {2, Value::u8(2)}})).has_value());
    REQUIRE(writer.append(Value::string("not an object")).has_value());
    const std::vector<size_t> offsets = writer.offsets();
    const auto input = writer.take();

    Pipeline pipeline;
    pipeline.add_sink(std::make_shared<SchemaSink>("shape", shape));
    auto after = std::make_shared<CountingSink>();
    pipeline.add_sink(after);

    auto results = run_all(pipeline, input);
    REQUIRE(results.size() == 3);
    REQUIRE(results[0].ok());
    for (size_t i : {size_t{1}, size_t{2}}) {
        REQUIRE(results[i].has_error(BatchErrorCode::SchemaTypeMismatch));
        REQUIRE(results[i].failure()->errors[0].offset == offsets[i]);
    }
    // A rejection stops delivery to later sinks
    REQUIRE(after->sequences == std::vector<uint64_t>{0});
}

TEST_CASE("DropAndReport sink records overflow without blocking", "[pipeline][sink][backpressure]") {
    constexpr size_t COUNT = 12;
    const auto input = record_stream(COUNT);

    PipelineConfig config;
    config.backpressure = BackpressurePolicy::DropAndReport;
    Pipeline pipeline{config};

    std::atomic<bool> gate{false};
    std::atomic<int> consumed{0};
    auto sink = pipeline.add_async_sink("slow", [&](uint64_t, const Value&) {
        memory::StageWait::wait_until([&] { return gate.load(); });
        consumed.fetch_add(1);
    }, 2);

    std::vector<BatchResult> results;
    auto status = pipeline.run(input, [&](BatchResult&& r) {
        // Dispatch is done with every batch by the time the last result arrives
        if (r.sequence == COUNT - 1) gate.store(true);
        results.push_back(std::move(r));
    });
    REQUIRE(status.has_value());

    REQUIRE(results.size() == COUNT);
    size_t overflowed = 0;
    for (const BatchResult& r : results) {
        REQUIRE(r.ok());
        if (r.has_diagnostic(DiagnosticCode::SinkOverflow)) ++overflowed;
    }
    // Delivery thread holds at most one, queue holds two
    REQUIRE(overflowed >= COUNT - 3);
    REQUIRE(sink->dropped() == overflowed);
    REQUIRE(pipeline.stats().sink_drops == overflowed);
    REQUIRE(sink->delivered() == COUNT - overflowed);
    REQUIRE(static_cast<size_t>(consumed.load()) == COUNT - overflowed);
}

TEST_CASE("Blocking async sink receives every batch", "[pipeline][sink][backpressure]") {
    constexpr size_t COUNT = 40;
    const auto input = record_stream(COUNT);

    Pipeline pipeline;
    // Filled on the delivery thread, read after run() has flushed the sink
    std::vector<uint64_t> seen;
    std::vector<bool> intact;
    auto sink = pipeline.add_async_sink("ordered", [&](uint64_t seq, const Value& root) {
        seen.push_back(seq);
        intact.push_back(root == message(seq));
    }, 2);

    auto results = run_all(pipeline, input);
    REQUIRE(results.size() == COUNT);
    REQUIRE(sink->delivered() == COUNT);
    REQUIRE(sink->dropped() == 0);
    REQUIRE(seen.size() == COUNT);
    for (size_t i = 0; i < COUNT; ++i) {
        REQUIRE(seen[i] == i);
        REQUIRE(intact[i]);
    }
}

// ============================================================================
// Cancellation
// ============================================================================

TEST_CASE("Cancellation never loses an admitted batch", "[pipeline][cancel]") {
    constexpr size_t COUNT = 1000;
    constexpr uint64_t CANCEL_AT = 5;
    const auto input = record_stream(COUNT);

    PipelineConfig config;
    config.stage_queue_capacity = 2;
    config.decode_workers = 2;

    SECTION("drain finishes in-flight batches") {
        Pipeline pipeline{config};
        pipeline.add_observer([&](const DispatchedBatch& b) {
            if (b.sequence == CANCEL_AT) pipeline.cancel(CancelMode::Drain);
        });

        auto results = run_all(pipeline, input);
        const PipelineStats stats = pipeline.stats();

        REQUIRE(results.size() < COUNT);
        REQUIRE(results.size() > CANCEL_AT);
        REQUIRE(results.size() == stats.batches_admitted);
        for (size_t i = 0; i < results.size(); ++i) {
            REQUIRE(results[i].sequence == i);
            REQUIRE(results[i].ok());
        }
        REQUIRE(stats.batches_cancelled == 0);
    }

    SECTION("discard reports in-flight batches as cancelled") {
        Pipeline pipeline{config};
        pipeline.add_observer([&](const DispatchedBatch& b) {
            if (b.sequence == CANCEL_AT) pipeline.cancel(CancelMode::Discard);
        });

        auto results = run_all(pipeline, input);
        const PipelineStats stats = pipeline.stats();

        REQUIRE(results.size() < COUNT);
        REQUIRE(results.size() == stats.batches_admitted);
        size_t cancelled = 0;
        for (size_t i = 0; i < results.size(); ++i) {
            REQUIRE(results[i].sequence == i);
            if (i >= CANCEL_AT) {
                REQUIRE(results[i].has_error(BatchErrorCode::Cancelled));
            }
            if (results[i].has_error(BatchErrorCode::Cancelled)) ++cancelled;
        }
        REQUIRE(cancelled == stats.batches_cancelled);
        REQUIRE(stats.batches_ok + stats.batches_cancelled == stats.batches_admitted);
    }
}

TEST_CASE("Exception from the result callback surfaces from run", "[pipeline][cancel]") {
    const auto input = record_stream(20);
    Pipeline pipeline;

    size_t calls = 0;
    REQUIRE_THROWS_AS(
        (void)pipeline.run(input, [&](BatchResult&&) {
            ++calls;
            throw std::runtime_error("consumer failed");
        }),
        std::runtime_error);
    REQUIRE(calls == 1);
}

// ============================================================================
// Stream Errors
// ============================================================================

TEST_CASE("Malformed header ends the stream after earlier batches", "[pipeline][stream]") {
    const auto r1 = test::record(test::string_item(1, "a"));
    const auto r2 = test::record(test::string_item(1, "b"));

    SECTION("bad magic") {
        auto garbage = test::record(test::string_item(1, "c"));
        garbage[0] = 'X';
        const auto input = test::concat({r1, r2, garbage});

        Pipeline pipeline;
        StreamStatus status;
        auto results = run_all(pipeline, input, &status);

        REQUIRE(results.size() == 2);
        REQUIRE(results[0].ok());
        REQUIRE(results[1].ok());
        REQUIRE_FALSE(status.has_value());
        REQUIRE(status.error().defect == HeaderDefect::BadMagic);
        REQUIRE(status.error().offset == r1.size() + r2.size());
    }

    SECTION("payload cut short") {
        auto input = test::concat({r1, r2});
        input.resize(input.size() - 1);

        Pipeline pipeline;
        StreamStatus status;
        auto results = run_all(pipeline, input, &status);

        REQUIRE(results.size() == 1);
        REQUIRE_FALSE(status.has_value());
        REQUIRE(status.error().defect == HeaderDefect::TruncatedRecord);
        REQUIRE(status.error().offset == r1.size());
    }

    SECTION("record above the size limit") {
        PipelineConfig config;
        config.max_record_size = 2;
        Pipeline pipeline{config};
        StreamStatus status;
        auto results = run_all(pipeline, test::concat({r1, r2}), &status);

        REQUIRE(results.empty());
        REQUIRE(status.error().defect == HeaderDefect::LengthTooLarge);
        REQUIRE(status.error().offset == 8);
    }

    SECTION("empty input") {
        Pipeline pipeline;
        auto results = run_all(pipeline, {});
        REQUIRE(results.empty());
    }
}

// ============================================================================
// Chunked Input
// ============================================================================

TEST_CASE("Chunk boundaries do not change results", "[pipeline][stream]") {
    const auto input = record_stream(3);

    std::vector<Value> expected;
    for (uint64_t i = 0; i < 3; ++i) expected.push_back(message(i));

    auto check = [&](const std::vector<BatchResult>& results) {
        REQUIRE(results.size() == 3);
        for (size_t i = 0; i < 3; ++i) {
            REQUIRE(results[i].ok());
            REQUIRE(results[i].value()->root == expected[i]);
        }
    };

    for (size_t split = 0; split <= input.size(); ++split) {
        INFO("split at " << split);
        Pipeline pipeline;
        std::vector<BatchResult> results;
        auto session = pipeline.stream([&](BatchResult&& r) { results.push_back(std::move(r)); });

        const std::span<const uint8_t> all{input};
        REQUIRE(session.feed(all.first(split)));
        REQUIRE(session.feed(all.subspan(split)));
        REQUIRE(session.finish().has_value());
        check(results);
    }

    SECTION("one byte at a time") {
        Pipeline pipeline;
        std::vector<BatchResult> results;
        auto session = pipeline.stream([&](BatchResult&& r) { results.push_back(std::move(r)); });
        for (uint8_t b : input) {
            REQUIRE(session.feed(std::span<const uint8_t>{&b, 1}));
        }
        REQUIRE(session.finish().has_value());
        check(results);
    }

    SECTION("unfinished record at end of input") {
        Pipeline pipeline;
        std::vector<BatchResult> results;
        auto session = pipeline.stream([&](BatchResult&& r) { results.push_back(std::move(r)); });
        REQUIRE(session.feed(std::span<const uint8_t>{input}.first(input.size() - 2)));
        auto status = session.finish();
        REQUIRE_FALSE(status.has_value());
        REQUIRE(status.error().defect == HeaderDefect::TruncatedRecord);
        REQUIRE(results.size() == 2);
    }

    SECTION("feed refuses input after a stream error") {
        Pipeline pipeline;
        auto session = pipeline.stream([](BatchResult&&) {});
        test::Buffer junk(RECORD_HEADER_SIZE, 0);
        (void)session.feed(junk);
        auto status = session.finish();
        REQUIRE_FALSE(status.has_value());
        REQUIRE(status.error().defect == HeaderDefect::BadMagic);
    }
}

// ============================================================================
// Payload Transform
// ============================================================================

TEST_CASE("Transformed payloads are restored before decoding", "[pipeline][transform]") {
    const auto plain = test::string_item(1, "restored text");
    const auto record = scrambled_record(plain);
    const auto input = test::concat({test::record(plain), record});

    SECTION("transform present") {
        PipelineConfig config;
        auto transform = std::make_shared<XorTransform>();
        config.payload_transform = transform;
        Pipeline pipeline{config};

        auto results = run_all(pipeline, input);
        REQUIRE(results.size() == 2);
        REQUIRE(results[1].ok());
        REQUIRE(*results[1].value()->root.as_string() == "restored text");
        REQUIRE(transform->calls == 1);
    }

    SECTION("no transform configured") {
        Pipeline pipeline;
        auto results = run_all(pipeline, input);
        REQUIRE(results.size() == 2);
        REQUIRE(results[0].ok());
        REQUIRE(results[1].failure()->errors.size() == 1);
        REQUIRE(results[1].failure()->errors[0].code == BatchErrorCode::PayloadTransformError);
        REQUIRE(results[1].failure()->errors[0].offset == results[1].stream_offset);
    }

    SECTION("transform fails") {
        PipelineConfig config;
        config.payload_transform = std::make_shared<XorTransform>(true);
        Pipeline pipeline{config};
        auto results = run_all(pipeline, input);
        REQUIRE(results[1].has_error(BatchErrorCode::PayloadTransformError));
        REQUIRE_FALSE(results[1].has_error(BatchErrorCode::ChecksumMismatch));
    }
}

// ============================================================================
// Alignment Fallback
// ============================================================================

TEST_CASE("Misaligned input is copied once and flagged", "[pipeline][fallback]") {
    const simd::CapabilitySet& caps = simd::capabilities();
    if (simd::kernels_for(caps.best()).alignment() == 1) {
        SKIP("best tier has no alignment requirement");
    }

    const auto input = record_stream(4);
    test::SkewedBytes skewed{input, 1};

    Pipeline pipeline;
    auto results = run_all(pipeline, skewed.view());
    REQUIRE(results.size() == 4);
    for (const BatchResult& r : results) {
        REQUIRE(r.ok());
        REQUIRE(r.value()->root == message(r.sequence));
        REQUIRE(r.has_diagnostic(DiagnosticCode::AlignmentFallback));
    }
    REQUIRE(pipeline.stats().alignment_fallbacks == 4);
}

// ============================================================================
// Pull Stream
// ============================================================================

TEST_CASE("BatchStream yields results in order", "[pipeline][pull]") {
    const auto input = record_stream(25);
    Pipeline pipeline;

    SECTION("pull to the end") {
        BatchStream stream = pipeline.open(input);
        uint64_t expected = 0;
        for (;;) {
            auto next = stream.next();
            REQUIRE(next.has_value());
            if (!next->has_value()) break;
            REQUIRE((*next)->sequence == expected);
            REQUIRE((*next)->value()->root == message(expected));
            ++expected;
        }
        REQUIRE(expected == 25);
    }

    SECTION("stream error arrives after the batches") {
        auto broken = input;
        broken.push_back(0x00);
        BatchStream stream = pipeline.open(broken);
        size_t count = 0;
        for (;;) {
            auto next = stream.next();
            if (!next) {
                REQUIRE(next.error().defect == HeaderDefect::TruncatedRecord);
                REQUIRE(next.error().offset == input.size());
                break;
            }
            if (!next->has_value()) FAIL("stream ended without reporting the truncation");
            ++count;
        }
        REQUIRE(count == 25);
    }

    SECTION("dropping the stream early stops the run") {
        const auto big = record_stream(2000);
        {
            BatchStream stream = pipeline.open(big);
            auto first = stream.next();
            REQUIRE(first.has_value());
            REQUIRE(first->has_value());
        }
        REQUIRE(pipeline.stats().batches_admitted < 2000);
    }
}
