#pragma once

/// @file dispatch_stage.hpp
/// @brief Stage 3: restore admission order and hand batches to sinks.
///
/// Sinks run synchronously on the dispatch worker, in sequence order, and
/// only see batches that decoded cleanly. Observers see every batch.
/// AsyncSink moves delivery to its own thread behind a bounded queue.

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "tonitru/memory/mpmc_queue.hpp"
#include "tonitru/memory/wait_strategy.hpp"
#include "tonitru/pipeline/config.hpp"
#include "tonitru/pipeline/stage_context.hpp"
#include "tonitru/pipeline/stats.hpp"
#include "tonitru/types/error.hpp"
#include "tonitru/types/record_header.hpp"
#include "tonitru/types/value.hpp"
#include "tonitru/util/logger.hpp"

namespace tnt::pipeline {

// ============================================================================
// Sink Interface
// ============================================================================

/// Read-only view of a batch in sequence order
struct DispatchedBatch {
    uint64_t sequence{0};
    size_t stream_offset{0};
    RecordHeader header{};
    uint64_t tag{0};
    const Value* root{nullptr};           // nullptr when decoding failed
    std::span<const BatchError> errors;   // Failures so far (before verify)

    [[nodiscard]] bool decoded() const noexcept { return root != nullptr && errors.empty(); }
};

/// Outcome of handing a batch to one sink
struct SinkVerdict {
    std::optional<BatchError> error;        // Fails the batch
    std::optional<Diagnostic> diagnostic;   // Non-fatal note on the batch

    [[nodiscard]] static SinkVerdict accept() noexcept { return {}; }

    [[nodiscard]] static SinkVerdict reject(BatchError e) noexcept {
        SinkVerdict v;
        v.error = e;
        return v;
    }

    [[nodiscard]] static SinkVerdict note(Diagnostic d) noexcept {
        SinkVerdict v;
        v.diagnostic = d;
        return v;
    }
};

/// Downstream consumer of decoded batches. consume() runs on the dispatch
/// worker and must not throw.
class IBatchSink {
public:
    virtual ~IBatchSink() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    [[nodiscard]] virtual SinkVerdict consume(const DispatchedBatch& batch) = 0;

    /// Block until everything accepted so far has been delivered
    virtual void flush() {}
};

using DispatchObserver = std::function<void(const DispatchedBatch&)>;

// ============================================================================
// Schema Validation
// ============================================================================

class ISchemaValidator {
public:
    virtual ~ISchemaValidator() = default;

    [[nodiscard]] virtual bool accepts(uint64_t tag, const Value& root) const = 0;
};

/// Root must be an object whose listed fields exist with the listed kinds
class ObjectShapeValidator final : public ISchemaValidator {
public:
    ObjectShapeValidator& require(uint64_t tag, ValueKind kind) {
        fields_.push_back({tag, kind});
        return *this;
    }

    [[nodiscard]] bool accepts(uint64_t, const Value& root) const override {
        if (root.kind() != ValueKind::Object) return false;
        for (const auto& f : fields_) {
            const Value* v = root.field(f.tag);
            if (v == nullptr || v->kind() != f.kind) return false;
        }
        return true;
    }

private:
    struct Requirement {
        uint64_t tag;
        ValueKind kind;
    };
    std::vector<Requirement> fields_;
};

/// Turns validator rejections into SchemaTypeMismatch at the record offset
class SchemaSink final : public IBatchSink {
public:
    SchemaSink(std::string name, std::shared_ptr<const ISchemaValidator> validator)
        : name_{std::move(name)}, validator_{std::move(validator)} {}

    [[nodiscard]] std::string_view name() const noexcept override { return name_; }

    [[nodiscard]] SinkVerdict consume(const DispatchedBatch& batch) override {
        if (validator_->accepts(batch.tag, *batch.root)) {
            return SinkVerdict::accept();
        }
        return SinkVerdict::reject(BatchError{BatchErrorCode::SchemaTypeMismatch, batch.stream_offset});
    }

private:
    std::string name_;
    std::shared_ptr<const ISchemaValidator> validator_;
};

// ============================================================================
// Async Sink
// ============================================================================

/// Delivers deep copies of decoded trees on a dedicated thread
class AsyncSink final : public IBatchSink {
public:
    using Consumer = std::function<void(uint64_t sequence, const Value& root)>;

    AsyncSink(std::string name, Consumer consumer, size_t capacity, BackpressurePolicy policy)
        : name_{std::move(name)}
        , consumer_{std::move(consumer)}
        , policy_{policy}
        , queue_{capacity} {
        worker_ = std::thread([this] { deliver_loop(); });
    }

    AsyncSink(const AsyncSink&) = delete;
    AsyncSink& operator=(const AsyncSink&) = delete;

    ~AsyncSink() override { stop(); }

    [[nodiscard]] std::string_view name() const noexcept override { return name_; }

    [[nodiscard]] SinkVerdict consume(const DispatchedBatch& batch) override {
        Delivery delivery{batch.sequence, *batch.root};

        if (policy_ == BackpressurePolicy::Block) {
            queue_.push(std::move(delivery));
            accepted_.fetch_add(1, std::memory_order_relaxed);
            return SinkVerdict::accept();
        }

        if (queue_.try_push(delivery)) {
            accepted_.fetch_add(1, std::memory_order_relaxed);
            return SinkVerdict::accept();
        }

        dropped_.fetch_add(1, std::memory_order_relaxed);
        TNT_LOG_WARN("sink '{}' full, dropped batch seq={} offset={}",
                     name_, batch.sequence, batch.stream_offset);
        return SinkVerdict::note(Diagnostic{DiagnosticCode::SinkOverflow, batch.stream_offset});
    }

    void flush() override {
        memory::StageWait::wait_until([this] {
            return delivered_.load(std::memory_order_acquire) ==
                   accepted_.load(std::memory_order_relaxed);
        });
    }

    /// Deliver what is queued and join the delivery thread
    void stop() noexcept {
        queue_.close();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    [[nodiscard]] uint64_t delivered() const noexcept {
        return delivered_.load(std::memory_order_acquire);
    }

    [[nodiscard]] uint64_t dropped() const noexcept {
        return dropped_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] BackpressurePolicy policy() const noexcept { return policy_; }

private:
    struct Delivery {
        uint64_t sequence;
        Value root;
    };

    void deliver_loop() noexcept {
        while (auto delivery = queue_.pop()) {
            try {
                consumer_(delivery->sequence, delivery->root);
            } catch (const std::exception& e) {
                TNT_LOG_ERROR("sink '{}' consumer threw on seq={}: {}",
                              name_, delivery->sequence, e.what());
            }
            delivered_.fetch_add(1, std::memory_order_release);
        }
    }

    std::string name_;
    Consumer consumer_;
    BackpressurePolicy policy_;
    memory::MPMCQueue<Delivery> queue_;
    std::atomic<uint64_t> accepted_{0};
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> dropped_{0};
    std::thread worker_;
};

// ============================================================================
// Reorder Buffer
// ============================================================================

/// Holds completions until every lower sequence number has been released.
/// Never larger than the FlightWindow limit of the execution.
template <typename T>
class ReorderBuffer {
public:
    void insert(uint64_t sequence, T item) {
        pending_.emplace(sequence, std::move(item));
    }

    /// Next item in sequence order, if it has arrived
    [[nodiscard]] std::optional<T> pop_ready() {
        auto it = pending_.find(next_);
        if (it == pending_.end()) {
            return std::nullopt;
        }
        std::optional<T> item{std::move(it->second)};
        pending_.erase(it);
        ++next_;
        return item;
    }

    [[nodiscard]] uint64_t next_sequence() const noexcept { return next_; }
    [[nodiscard]] size_t pending() const noexcept { return pending_.size(); }
    [[nodiscard]] bool empty() const noexcept { return pending_.empty(); }

private:
    std::map<uint64_t, T> pending_;
    uint64_t next_{0};
};

// ============================================================================
// Dispatch Stage
// ============================================================================

class DispatchStage {
public:
    DispatchStage(std::span<const std::shared_ptr<IBatchSink>> sinks,
                  std::span<const DispatchObserver> observers,
                  StatsCounters& stats, const CancelState& cancel) noexcept
        : sinks_{sinks}, observers_{observers}, stats_{stats}, cancel_{cancel} {}

    /// Hand one in-order batch to observers and sinks
    void dispatch(DecodedBatch& batch) {
        DispatchedBatch view{batch.ctx.sequence, batch.ctx.stream_offset, batch.header,
                             batch.tree ? batch.tree->tag : 0,
                             batch.tree ? &batch.tree->root : nullptr,
                             batch.errors};

        for (const auto& observer : observers_) {
            observer(view);
        }

        if (!view.decoded() || cancel_.discarding()) {
            return;
        }

        for (const auto& sink : sinks_) {
            SinkVerdict verdict = sink->consume(view);
            if (verdict.diagnostic) {
                if (verdict.diagnostic->code == DiagnosticCode::SinkOverflow) {
                    StatsCounters::bump(stats_.sink_drops);
                }
                batch.diagnostics.push_back(*verdict.diagnostic);
            }
            if (verdict.error) {
                TNT_LOG_DEBUG("sink '{}' rejected seq={}: {}",
                              sink->name(), batch.ctx.sequence, verdict.error->message());
                batch.errors.push_back(*verdict.error);
                // Later sinks only see clean batches
                break;
            }
        }
    }

    /// Worker loop: reorder, dispatch, forward. Closes `out` at end of input.
    void run(memory::MPMCQueue<DecodedBatch>& in, memory::MPMCQueue<DecodedBatch>& out) {
        ReorderBuffer<DecodedBatch> reorder;

        while (auto batch = in.pop()) {
            const uint64_t sequence = batch->ctx.sequence;
            reorder.insert(sequence, std::move(*batch));
            while (auto ready = reorder.pop_ready()) {
                dispatch(*ready);
                out.push(std::move(*ready));
            }
        }
        out.close();
    }

private:
    std::span<const std::shared_ptr<IBatchSink>> sinks_;
    std::span<const DispatchObserver> observers_;
    StatsCounters& stats_;
    const CancelState& cancel_;
};

} // namespace tnt::pipeline
