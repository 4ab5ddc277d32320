// decode_stream.cpp
// Tonitru Example: decode a record stream arriving in chunks
// Reads records from a file (or builds a demo stream), feeds it to a
// StreamingSession in fixed-size chunks and prints one line per batch.
//
// Usage: decode_stream [file] [chunk_size]

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "tonitru/tonitru.hpp"

namespace {

using namespace tnt;
using namespace tnt::pipeline;

/// Three small records; the middle one carries a wrong checksum
std::vector<uint8_t> demo_stream() {
    codec::RecordWriter writer;
    if (!writer.append(Value::object({{1, Value::string("EURUSD")}, {2, Value::f64(1.0842)}}))) {
        return {};
    }

    codec::Encoder encoder;
    std::vector<uint8_t> payload;
    if (!encoder.encode_item(0, Value::object({{1, Value::string("GBPUSD")}}), payload)) {
        return {};
    }
    writer.append_payload(payload, 0, MapStrategy::Hash, 0x12345678u);

    if (!writer.append(Value::map({{Value::string("venue"), Value::string("XLON")},
                                   {Value::string("lots"), Value::u32(250)}}))) {
        return {};
    }
    return writer.take();
}

std::vector<uint8_t> read_file(const char* path) {
    std::ifstream in{path, std::ios::binary};
    if (!in) return {};
    return {std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
}

void print_result(const BatchResult& r) {
    std::cout << "[BATCH] seq=" << r.sequence << " offset=" << r.stream_offset;
    if (const BatchOk* ok = r.value()) {
        std::cout << " ok tag=" << ok->tag
                  << " kind=" << value_kind_name(ok->root.kind())
                  << " size=" << ok->root.size();
    } else {
        for (const BatchError& e : r.failure()->errors) {
            std::cout << " error=\"" << e.message() << "\"@" << e.offset;
        }
    }
    for (const Diagnostic& d : r.diagnostics()) {
        std::cout << " note=\"" << diagnostic_message(d.code) << "\"";
    }
    std::cout << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    logging::LogConfig log_config;
    log_config.min_level = logging::Level::Info;
    logging::init(log_config);

    std::vector<uint8_t> input = argc > 1 ? read_file(argv[1]) : demo_stream();
    if (input.empty()) {
        std::cerr << "[ERROR] No input" << (argc > 1 ? std::string{" in "} + argv[1] : "") << "\n";
        return 1;
    }
    const size_t chunk_size = argc > 2 ? std::strtoull(argv[2], nullptr, 10) : 7;
    if (chunk_size == 0) {
        std::cerr << "[ERROR] chunk_size must be positive\n";
        return 1;
    }

    std::cout << "[INFO] " << input.size() << " bytes, chunk size " << chunk_size
              << ", ISA " << simd::isa_name(simd::capabilities().best()) << "\n";

    PipelineConfig config;
    config.decode_workers = 2;
    Pipeline pipeline{config};
    pipeline.add_observer([](const DispatchedBatch& b) {
        if (!b.decoded()) {
            std::cout << "[WARN] seq=" << b.sequence << " failed to decode\n";
        }
    });

    auto session = pipeline.stream([](BatchResult&& r) { print_result(r); });

    const std::span<const uint8_t> all{input};
    for (size_t pos = 0; pos < all.size(); pos += chunk_size) {
        if (!session.feed(all.subspan(pos, std::min(chunk_size, all.size() - pos)))) {
            break;
        }
    }

    auto status = session.finish();
    const PipelineStats stats = pipeline.stats();
    std::cout << "[INFO] admitted=" << stats.batches_admitted << " ok=" << stats.batches_ok
              << " failed=" << stats.batches_failed << "\n";

    logging::flush();
    if (!status) {
        std::cerr << "[ERROR] " << status.error().message() << " at offset "
                  << status.error().offset << "\n";
        return 2;
    }
    return 0;
}
