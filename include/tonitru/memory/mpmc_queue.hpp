/*
    Tonitru Bounded MPMC Queue

    Multi-Producer Multi-Consumer queue joining two pipeline stages.
    Rigtorp-style turn-based slot synchronization with a capacity chosen
    at construction (rounded up to a power of two).

    Turn protocol:
    - slot.turn == (ticket / capacity) * 2       -> slot ready for write
    - slot.turn == (ticket / capacity) * 2 + 1   -> slot ready for read

    Blocking semantics:
    - push() waits while the queue is full
    - pop() waits while the queue is empty and not closed
    - close() is called once every producer is done; consumers drain the
      remaining elements and then observe end of input
*/

#pragma once

#include <atomic>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <new>
#include <optional>
#include <type_traits>

#include "tonitru/memory/wait_strategy.hpp"
#include "tonitru/platform/platform.hpp"

namespace tnt::memory {

inline constexpr size_t MPMC_CACHE_LINE = TNT_CACHE_LINE_SIZE;

/// Lock-free bounded queue
/// @tparam T Element type (move-constructible)
/// @tparam WaitStrategyT Wait strategy for the blocking calls
template<typename T, typename WaitStrategyT = StageWait>
class MPMCQueue {
    static_assert(std::is_nothrow_move_constructible_v<T>, "Elements must be nothrow movable");
    static_assert(StageWaitPolicy<WaitStrategyT>, "Invalid wait strategy");

    struct Slot {
        alignas(MPMC_CACHE_LINE) std::atomic<size_t> turn{0};
        alignas(alignof(T)) std::byte storage[sizeof(T)];

        T* ptr() noexcept {
            return std::launder(reinterpret_cast<T*>(storage));
        }
    };

public:
    using value_type = T;
    using wait_strategy = WaitStrategyT;

    explicit MPMCQueue(size_t capacity)
        : capacity_{std::bit_ceil(capacity < 2 ? size_t{2} : capacity)}
        , shift_{static_cast<unsigned>(std::countr_zero(capacity_))}
        , mask_{capacity_ - 1}
        , slots_{std::make_unique<Slot[]>(capacity_)} {}

    ~MPMCQueue() noexcept {
        if constexpr (!std::is_trivially_destructible_v<T>) {
            size_t head = head_.load(std::memory_order_relaxed);
            size_t tail = tail_.load(std::memory_order_relaxed);
            while (tail != head) {
                slots_[tail & mask_].ptr()->~T();
                ++tail;
            }
        }
    }

    MPMCQueue(const MPMCQueue&) = delete;
    MPMCQueue& operator=(const MPMCQueue&) = delete;
    MPMCQueue(MPMCQueue&&) = delete;
    MPMCQueue& operator=(MPMCQueue&&) = delete;

    // ========================================================================
    // Producer Interface
    // ========================================================================

    /// @return false if the queue is full; `item` is left untouched
    [[nodiscard]] bool try_push(T& item) noexcept {
        size_t head = head_.load(std::memory_order_relaxed);

        for (;;) {
            Slot& slot = slots_[head & mask_];
            const size_t turn = slot.turn.load(std::memory_order_acquire);
            const size_t expected_turn = (head >> shift_) * 2;

            if (turn == expected_turn) {
                if (head_.compare_exchange_weak(head, head + 1, std::memory_order_relaxed)) {
                    std::construct_at(slot.ptr(), std::move(item));
                    slot.turn.store(expected_turn + 1, std::memory_order_release);
                    return true;
                }
            } else if (turn < expected_turn) {
                return false;
            } else {
                head = head_.load(std::memory_order_relaxed);
            }
        }
    }

    /// Blocks while full
    void push(T item) noexcept {
        typename WaitStrategyT::State state{};
        while (!try_push(item)) {
            WaitStrategyT::wait(state);
        }
    }

    // ========================================================================
    // Consumer Interface
    // ========================================================================

    [[nodiscard]] std::optional<T> try_pop() noexcept {
        size_t tail = tail_.load(std::memory_order_relaxed);

        for (;;) {
            Slot& slot = slots_[tail & mask_];
            const size_t turn = slot.turn.load(std::memory_order_acquire);
            const size_t expected_turn = (tail >> shift_) * 2 + 1;

            if (turn == expected_turn) {
                if (tail_.compare_exchange_weak(tail, tail + 1, std::memory_order_relaxed)) {
                    std::optional<T> item{std::move(*slot.ptr())};
                    slot.ptr()->~T();
                    slot.turn.store(expected_turn + 1, std::memory_order_release);
                    return item;
                }
            } else if (turn < expected_turn) {
                return std::nullopt;
            } else {
                tail = tail_.load(std::memory_order_relaxed);
            }
        }
    }

    /// Blocks while empty. Returns nullopt once closed and drained.
    [[nodiscard]] std::optional<T> pop() noexcept {
        typename WaitStrategyT::State state{};
        for (;;) {
            if (auto item = try_pop()) {
                return item;
            }
            if (closed_.load(std::memory_order_acquire) && empty()) {
                // A push may have landed between the failed pop and the close check
                return try_pop();
            }
            WaitStrategyT::wait(state);
        }
    }

    /// No further pushes will happen
    void close() noexcept { closed_.store(true, std::memory_order_release); }

    // ========================================================================
    // Status Queries (approximate)
    // ========================================================================

    [[nodiscard]] bool closed() const noexcept {
        return closed_.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool empty() const noexcept {
        return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire);
    }

    [[nodiscard]] size_t size_approx() const noexcept {
        const size_t head = head_.load(std::memory_order_acquire);
        const size_t tail = tail_.load(std::memory_order_acquire);
        return head >= tail ? head - tail : 0;
    }

    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }

    [[nodiscard]] bool full() const noexcept { return size_approx() >= capacity_; }

private:
    const size_t capacity_;
    const unsigned shift_;
    const size_t mask_;
    std::unique_ptr<Slot[]> slots_;

    alignas(MPMC_CACHE_LINE) std::atomic<size_t> head_{0};
    alignas(MPMC_CACHE_LINE) std::atomic<size_t> tail_{0};
    alignas(MPMC_CACHE_LINE) std::atomic<bool> closed_{false};
};

} // namespace tnt::memory
