// Benchmark: Pipeline Throughput
// Decodes one in-memory stream of records with 1, 2 and 4 decode workers
//
// Build: cmake --build build && ./build/bin/benchmarks/pipeline_bench

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>

#include "benchmark_utils.hpp"
#include "tonitru/codec/encoder.hpp"
#include "tonitru/pipeline/pipeline.hpp"

using namespace tnt;
using namespace tnt::pipeline;

namespace {

constexpr size_t RECORDS = 20000;
constexpr int ROUNDS = 5;

Value order(uint64_t i) {
    Array legs;
    for (uint64_t j = 0; j < 4; ++j) {
        legs.push_back(Value::object({
            {1, Value::u32(static_cast<uint32_t>(i * 4 + j))},
            {2, Value::f64(100.25 + static_cast<double>(j))},
            {3, Value::string("VENUE-" + std::to_string(j))},
        }));
    }
    return Value::object({
        {1, Value::u64(i)},
        {2, Value::string("client order " + std::to_string(i))},
        {3, Value::array(std::move(legs))},
        {4, Value::map({{Value::string("desk"), Value::string("rates")},
                        {Value::string("book"), Value::u16(7)}})},
    });
}

} // namespace

int main() {
    std::cout << "==========================================================\n";
    std::cout << "  Pipeline Throughput Benchmark\n";
    std::cout << "==========================================================\n\n";

    codec::RecordWriter writer;
    for (size_t i = 0; i < RECORDS; ++i) {
        if (!writer.append(order(i))) {
            std::cerr << "encoding failed at record " << i << "\n";
            return 1;
        }
    }
    const auto stream = writer.take();
    std::cout << "Records: " << RECORDS << "  Bytes: " << stream.size()
              << "  ISA: " << simd::isa_name(simd::capabilities().best()) << "\n\n";

    std::cout << std::setw(10) << std::left << "workers"
              << std::setw(14) << "best(ms)"
              << std::setw(14) << "records/s"
              << "GB/s\n";
    std::cout << std::string(50, '-') << "\n";

    for (size_t workers : {size_t{1}, size_t{2}, size_t{4}}) {
        PipelineConfig config;
        config.decode_workers = workers;
        Pipeline pipeline{config};

        double best_ns = 0;
        for (int round = 0; round < ROUNDS; ++round) {
            size_t ok = 0;
            const auto start = bench::Clock::now();
            auto status = pipeline.run(stream, [&ok](BatchResult&& r) { ok += r.ok() ? 1 : 0; });
            const auto end = bench::Clock::now();
            if (!status || ok != RECORDS) {
                std::cerr << "run failed: ok=" << ok << "\n";
                return 1;
            }
            const double ns = std::chrono::duration<double, std::nano>(end - start).count();
            if (round == 0 || ns < best_ns) best_ns = ns;
        }

        std::cout << std::setw(10) << std::left << workers
                  << std::setw(14) << std::fixed << std::setprecision(2) << best_ns / 1e6
                  << std::setw(14) << std::setprecision(0)
                  << static_cast<double>(RECORDS) / (best_ns / 1e9)
                  << std::setprecision(2) << bench::throughput_gbps(stream.size(), best_ns) << "\n";
    }
    return 0;
}
