#pragma once

/// @file pipeline.hpp
/// @brief Four-stage overlapped decode pipeline.
///
///   prefetch (1 thread) -> decode (N workers) -> dispatch (1) -> verify (1)
///
/// Stage boundaries are bounded MPMC queues; a full queue blocks its
/// producer. Dispatch reorders decode completions so sinks, observers and
/// result consumers all see admission order.
///
/// Usage:
/// @code
///   tnt::pipeline::Pipeline pipeline{config};
///   pipeline.add_sink(std::make_shared<MySink>());
///   auto status = pipeline.run(bytes, [](tnt::pipeline::BatchResult&& r) { ... });
/// @endcode
///
/// Sinks and observers must be registered before a run starts. The Pipeline
/// must outlive every BatchStream and StreamingSession it creates.

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "tonitru/memory/batch_buffer.hpp"
#include "tonitru/memory/mpmc_queue.hpp"
#include "tonitru/pipeline/batch_result.hpp"
#include "tonitru/pipeline/config.hpp"
#include "tonitru/pipeline/decode_stage.hpp"
#include "tonitru/pipeline/dispatch_stage.hpp"
#include "tonitru/pipeline/prefetch_stage.hpp"
#include "tonitru/pipeline/stage_context.hpp"
#include "tonitru/pipeline/stats.hpp"
#include "tonitru/pipeline/verify_stage.hpp"
#include "tonitru/simd/capability.hpp"
#include "tonitru/types/error.hpp"
#include "tonitru/util/logger.hpp"

namespace tnt::pipeline {

/// Stream-level outcome: empty on success, StreamError when a header could
/// not establish a batch boundary
using StreamStatus = StreamResult<void>;

/// Receives each result in sequence order on the verify worker
using ResultCallback = std::function<void(BatchResult&&)>;

namespace detail {

// ============================================================================
// Execution (one pass over one input)
// ============================================================================

class Execution {
public:
    Execution(const PipelineConfig& config, StatsCounters& stats,
              std::span<const std::shared_ptr<IBatchSink>> sinks,
              std::span<const DispatchObserver> observers)
        : config_{config}
        , stats_{stats}
        , sinks_{sinks}
        , cancel_{std::make_shared<CancelState>()}
        , staged_{config.stage_queue_capacity}
        , decoded_{config.stage_queue_capacity}
        , ordered_{config.stage_queue_capacity}
        , window_{config.in_flight_limit()}
        , prefetch_{config, stats, *cancel_, window_}
        , decode_{config, *cancel_}
        , dispatch_{sinks, observers, stats, *cancel_}
        , verify_{stats, *cancel_} {}

    Execution(const Execution&) = delete;
    Execution& operator=(const Execution&) = delete;

    ~Execution() {
        if (started_ && !joined_) {
            cancel_->request(CancelMode::Discard);
            join_threads();
        }
    }

    /// Spawn all stage workers. `done` runs on the verify worker after the
    /// last result.
    template <typename Source>
    void start(Source& source, ResultCallback emit, std::function<void()> done = {}) {
        emit_ = std::move(emit);
        done_ = std::move(done);
        started_ = true;

        const size_t workers = std::max<size_t>(1, config_.decode_workers);
        live_decoders_.store(workers, std::memory_order_relaxed);

        TNT_LOG_INFO("pipeline start: decode_workers={} isa={} queue_capacity={} in_flight={} backpressure={}",
                     workers, simd::isa_name(config_.capabilities.best()),
                     staged_.capacity(), window_.limit(), backpressure_name(config_.backpressure));

        verify_thread_ = std::thread([this] { verify_loop(); });
        dispatch_thread_ = std::thread([this] { dispatch_.run(decoded_, ordered_); });
        decode_threads_.reserve(workers);
        for (size_t i = 0; i < workers; ++i) {
            decode_threads_.emplace_back([this] { decode_.run(staged_, decoded_, live_decoders_); });
        }
        prefetch_thread_ = std::thread([this, &source] {
            status_ = prefetch_.run(source, [this](StagedBatch&& batch) {
                staged_.push(std::move(batch));
            });
            if (!status_) {
                TNT_LOG_ERROR("stream error at offset {}: {}",
                              status_.error().offset, status_.error().message());
            }
            staged_.close();
        });
    }

    /// Wait for every admitted batch to be delivered. Rethrows the first
    /// exception raised by the result callback.
    [[nodiscard]] StreamStatus join() {
        if (!joined_) {
            join_threads();
            for (const auto& sink : sinks_) {
                sink->flush();
            }
            [[maybe_unused]] const PipelineStats s = stats_.snapshot();
            TNT_LOG_INFO("pipeline stop: admitted={} ok={} failed={} cancelled={} bytes={} peak_in_flight={}",
                         s.batches_admitted, s.batches_ok, s.batches_failed,
                         s.batches_cancelled, s.bytes, window_.peak());
        }
        if (callback_error_) {
            std::rethrow_exception(std::exchange(callback_error_, nullptr));
        }
        return status_;
    }

    void cancel(CancelMode mode) noexcept { cancel_->request(mode); }

    [[nodiscard]] std::weak_ptr<CancelState> cancel_token() const noexcept { return cancel_; }

private:
    void verify_loop() {
        verify_.run(ordered_, [this](BatchResult&& result) {
            deliver(std::move(result));
            window_.release();
        });
        if (done_) done_();
    }

    void deliver(BatchResult&& result) {
        if (callback_error_) return;
        try {
            emit_(std::move(result));
        } catch (...) {
            // Surfaced from join(); remaining batches are discarded
            callback_error_ = std::current_exception();
            cancel_->request(CancelMode::Discard);
        }
    }

    void join_threads() noexcept {
        joined_ = true;
        if (prefetch_thread_.joinable()) prefetch_thread_.join();
        for (auto& t : decode_threads_) {
            if (t.joinable()) t.join();
        }
        if (dispatch_thread_.joinable()) dispatch_thread_.join();
        if (verify_thread_.joinable()) verify_thread_.join();
    }

    const PipelineConfig& config_;
    StatsCounters& stats_;
    std::span<const std::shared_ptr<IBatchSink>> sinks_;
    std::shared_ptr<CancelState> cancel_;

    memory::MPMCQueue<StagedBatch> staged_;
    memory::MPMCQueue<DecodedBatch> decoded_;
    memory::MPMCQueue<DecodedBatch> ordered_;
    FlightWindow window_;

    PrefetchStage prefetch_;
    DecodeStage decode_;
    DispatchStage dispatch_;
    VerifyStage verify_;

    ResultCallback emit_;
    std::function<void()> done_;
    std::exception_ptr callback_error_;
    StreamStatus status_{};
    std::atomic<size_t> live_decoders_{0};
    bool started_{false};
    bool joined_{false};

    std::thread prefetch_thread_;
    std::vector<std::thread> decode_threads_;
    std::thread dispatch_thread_;
    std::thread verify_thread_;
};

} // namespace detail

// ============================================================================
// BatchStream (pull-style)
// ============================================================================

/// Results of one pinned input, pulled in sequence order. Destroying the
/// stream early discards what is still in flight.
class BatchStream {
public:
    using Next = std::expected<std::optional<BatchResult>, StreamError>;

    BatchStream(BatchStream&&) noexcept = default;
    BatchStream& operator=(BatchStream&&) noexcept = default;

    /// Next result; nullopt at end of input. A stream error is reported
    /// once, after every admitted batch has been returned.
    [[nodiscard]] Next next() {
        if (auto result = state_->output.pop()) {
            return std::optional<BatchResult>{std::move(*result)};
        }
        auto status = state_->execution.join();
        if (!status) {
            return std::unexpected(status.error());
        }
        return std::optional<BatchResult>{};
    }

    void cancel(CancelMode mode) noexcept { state_->execution.cancel(mode); }

private:
    friend class Pipeline;

    struct State {
        State(std::span<const uint8_t> input, const PipelineConfig& config, StatsCounters& stats,
              std::span<const std::shared_ptr<IBatchSink>> sinks,
              std::span<const DispatchObserver> observers)
            : scope{input}
            , source{scope}
            , output{config.output_queue_capacity}
            , execution{config, stats, sinks, observers} {}

        ~State() {
            execution.cancel(CancelMode::Discard);
            while (output.pop()) {}
        }

        // Destroyed last: waits for every borrowed view
        memory::SourceScope scope;
        SpanSource source;
        memory::MPMCQueue<BatchResult> output;
        detail::Execution execution;
    };

    explicit BatchStream(std::unique_ptr<State> state) noexcept : state_{std::move(state)} {}

    std::unique_ptr<State> state_;
};

// ============================================================================
// StreamingSession (chunked push-style)
// ============================================================================

/// Input arrives in chunks from the caller; results go to the callback
class StreamingSession {
public:
    StreamingSession(StreamingSession&&) noexcept = default;
    StreamingSession& operator=(StreamingSession&&) noexcept = default;

    /// Blocks while the chunk feed is full.
    /// @return false once the pipeline stopped reading (stream error or cancel)
    [[nodiscard]] bool feed(std::span<const uint8_t> chunk) { return state_->source.feed(chunk); }

    /// End of input; waits for every admitted batch
    [[nodiscard]] StreamStatus finish() {
        state_->source.finish();
        return state_->execution.join();
    }

    void cancel(CancelMode mode) noexcept { state_->execution.cancel(mode); }

private:
    friend class Pipeline;

    struct State {
        State(const PipelineConfig& config, StatsCounters& stats,
              std::span<const std::shared_ptr<IBatchSink>> sinks,
              std::span<const DispatchObserver> observers)
            : source{config.stage_queue_capacity}
            , execution{config, stats, sinks, observers} {}

        ~State() { source.finish(); }

        ChunkSource source;
        detail::Execution execution;
    };

    explicit StreamingSession(std::unique_ptr<State> state) noexcept : state_{std::move(state)} {}

    std::unique_ptr<State> state_;
};

// ============================================================================
// Pipeline
// ============================================================================

class Pipeline {
public:
    explicit Pipeline(PipelineConfig config = {}) : config_{std::move(config)} {}

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    void add_sink(std::shared_ptr<IBatchSink> sink) { sinks_.push_back(std::move(sink)); }

    /// Consumer on its own delivery thread, using the configured backpressure
    std::shared_ptr<AsyncSink> add_async_sink(std::string name, AsyncSink::Consumer consumer,
                                              size_t capacity) {
        auto sink = std::make_shared<AsyncSink>(std::move(name), std::move(consumer),
                                                capacity, config_.backpressure);
        sinks_.push_back(sink);
        return sink;
    }

    void add_observer(DispatchObserver observer) { observers_.push_back(std::move(observer)); }

    /// Decode a whole buffer; `on_result` runs per batch in order
    [[nodiscard]] StreamStatus run(std::span<const uint8_t> input, const ResultCallback& on_result) {
        memory::SourceScope scope{input};
        SpanSource source{scope};
        detail::Execution execution{config_, stats_, sinks_, observers_};
        track(execution);
        execution.start(source, [&on_result](BatchResult&& r) { on_result(std::move(r)); });
        return execution.join();
    }

    /// Pull-style decode of a buffer the caller keeps alive for the stream
    [[nodiscard]] BatchStream open(std::span<const uint8_t> input) {
        auto state = std::make_unique<BatchStream::State>(input, config_, stats_, sinks_, observers_);
        auto* raw = state.get();
        track(raw->execution);
        raw->execution.start(
            raw->source,
            [raw](BatchResult&& r) { raw->output.push(std::move(r)); },
            [raw] { raw->output.close(); });
        return BatchStream{std::move(state)};
    }

    /// Chunked input; results go to `on_result` in order
    [[nodiscard]] StreamingSession stream(ResultCallback on_result) {
        auto state = std::make_unique<StreamingSession::State>(config_, stats_, sinks_, observers_);
        track(state->execution);
        state->execution.start(state->source, std::move(on_result));
        return StreamingSession{std::move(state)};
    }

    /// Stop admission on the most recently started run. Drain finishes
    /// in-flight batches; Discard reports them as Cancelled.
    void cancel(CancelMode mode) {
        std::lock_guard lock{mutex_};
        if (auto state = current_.lock()) {
            state->request(mode);
        }
    }

    [[nodiscard]] PipelineStats stats() const noexcept { return stats_.snapshot(); }
    [[nodiscard]] const PipelineConfig& config() const noexcept { return config_; }

private:
    void track(const detail::Execution& execution) {
        std::lock_guard lock{mutex_};
        current_ = execution.cancel_token();
    }

    PipelineConfig config_;
    StatsCounters stats_;
    std::vector<std::shared_ptr<IBatchSink>> sinks_;
    std::vector<DispatchObserver> observers_;
    std::mutex mutex_;
    std::weak_ptr<CancelState> current_;
};

} // namespace tnt::pipeline
