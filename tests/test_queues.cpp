/*
    Stage Queue Tests

    Tests for the bounded MPMCQueue used at every stage boundary.
    Covers single-threaded correctness, close/drain semantics,
    concurrent correctness and move-only element types.
*/

#include <catch2/catch_test_macros.hpp>

#include <tonitru/memory/mpmc_queue.hpp>
#include <tonitru/memory/wait_strategy.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <numeric>
#include <set>
#include <thread>
#include <vector>

using namespace tnt::memory;

// ============================================================================
// Basic Single-Threaded Tests
// ============================================================================

TEST_CASE("Stage queue basic push/pop", "[queue]") {
    MPMCQueue<int> queue{16};

    SECTION("capacity rounds up to a power of two") {
        MPMCQueue<int> odd{10};
        REQUIRE(odd.capacity() == 16);
        MPMCQueue<int> tiny{0};
        REQUIRE(tiny.capacity() == 2);
    }

    SECTION("FIFO order") {
        for (int i = 0; i < 8; ++i) {
            int v = i;
            REQUIRE(queue.try_push(v));
        }
        for (int i = 0; i < 8; ++i) {
            auto r = queue.try_pop();
            REQUIRE(r.has_value());
            REQUIRE(*r == i);
        }
        REQUIRE_FALSE(queue.try_pop().has_value());
    }

    SECTION("full queue rejects and leaves the item intact") {
        for (int i = 0; i < 16; ++i) {
            int v = i;
            REQUIRE(queue.try_push(v));
        }
        REQUIRE(queue.full());
        int extra = 999;
        REQUIRE_FALSE(queue.try_push(extra));
        REQUIRE(extra == 999);
    }

    SECTION("wraps around many times") {
        for (int round = 0; round < 100; ++round) {
            int v = round;
            REQUIRE(queue.try_push(v));
            auto r = queue.try_pop();
            REQUIRE(r.has_value());
            REQUIRE(*r == round);
        }
        REQUIRE(queue.empty());
    }
}

TEST_CASE("Stage queue close and drain", "[queue]") {
    MPMCQueue<int> queue{8};

    queue.push(1);
    queue.push(2);
    queue.close();
    REQUIRE(queue.closed());

    // Remaining items are still delivered after close
    REQUIRE(queue.pop() == 1);
    REQUIRE(queue.pop() == 2);
    REQUIRE_FALSE(queue.pop().has_value());
}

TEST_CASE("Stage queue holds move-only elements", "[queue]") {
    MPMCQueue<std::unique_ptr<int>> queue{4};

    queue.push(std::make_unique<int>(7));
    auto owned = std::make_unique<int>(8);
    REQUIRE(queue.try_push(owned));
    REQUIRE(owned == nullptr);

    auto a = queue.pop();
    auto b = queue.pop();
    REQUIRE(**a == 7);
    REQUIRE(**b == 8);

    SECTION("destructor frees what is left") {
        queue.push(std::make_unique<int>(9));
        REQUIRE(queue.size_approx() == 1);
    }
}

// ============================================================================
// Concurrent Tests
// ============================================================================

TEST_CASE("Stage queue concurrent producers and consumers", "[queue][concurrent]") {
    constexpr int PRODUCERS = 4;
    constexpr int CONSUMERS = 4;
    constexpr int PER_PRODUCER = 20000;

    MPMCQueue<int> queue{64};
    std::atomic<int> producers_left{PRODUCERS};
    std::vector<std::vector<int>> received(CONSUMERS);

    std::vector<std::thread> threads;
    for (int p = 0; p < PRODUCERS; ++p) {
        threads.emplace_back([&, p] {
            for (int i = 0; i < PER_PRODUCER; ++i) {
                queue.push(p * PER_PRODUCER + i);
            }
            if (producers_left.fetch_sub(1) == 1) {
                queue.close();
            }
        });
    }
    for (int c = 0; c < CONSUMERS; ++c) {
        threads.emplace_back([&, c] {
            while (auto v = queue.pop()) {
                received[c].push_back(*v);
            }
        });
    }
    for (auto& t : threads) t.join();

    std::vector<int> all;
    for (const auto& r : received) {
        all.insert(all.end(), r.begin(), r.end());
    }
    REQUIRE(all.size() == static_cast<size_t>(PRODUCERS * PER_PRODUCER));

    std::sort(all.begin(), all.end());
    std::vector<int> expected(all.size());
    std::iota(expected.begin(), expected.end(), 0);
    REQUIRE(all == expected);
}

TEST_CASE("Blocking push waits for room", "[queue][concurrent]") {
    MPMCQueue<int> queue{2};
    int a = 1;
    int b = 2;
    REQUIRE(queue.try_push(a));
    REQUIRE(queue.try_push(b));

    std::atomic<bool> pushed{false};
    std::thread producer([&] {
        queue.push(3);
        pushed.store(true);
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    REQUIRE_FALSE(pushed.load());

    REQUIRE(queue.pop() == 1);
    producer.join();
    REQUIRE(pushed.load());
    REQUIRE(queue.pop() == 2);
    REQUIRE(queue.pop() == 3);
}

TEST_CASE("Backoff wait_until returns once the predicate holds", "[queue][wait]") {
    std::atomic<bool> flag{false};
    std::thread setter([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        flag.store(true);
    });
    StageWait::wait_until([&] { return flag.load(); });
    REQUIRE(flag.load());
    setter.join();
}
