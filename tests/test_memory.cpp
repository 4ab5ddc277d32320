/*
    Batch Buffer Tests

    OwnedBuffer alignment, SourceScope leases and BatchBuffer promotion
    between the borrowed, owned and shared representations.
*/

#include <catch2/catch_test_macros.hpp>

#include <tonitru/memory/batch_buffer.hpp>
#include <tonitru/util/prefetch.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <numeric>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace tnt;
using namespace tnt::memory;

namespace {

std::vector<uint8_t> iota_bytes(size_t n) {
    std::vector<uint8_t> v(n);
    std::iota(v.begin(), v.end(), uint8_t{0});
    return v;
}

} // namespace

// ============================================================================
// OwnedBuffer
// ============================================================================

TEST_CASE("OwnedBuffer alignment", "[memory][owned]") {
    const auto src = iota_bytes(100);

    SECTION("copy_of honours the requested alignment") {
        for (size_t alignment : {size_t{16}, size_t{32}, size_t{64}, size_t{128}}) {
            OwnedBuffer b = OwnedBuffer::copy_of(src, alignment);
            REQUIRE(util::is_aligned(b.data(), alignment));
            REQUIRE(b.size() == src.size());
            REQUIRE(std::equal(src.begin(), src.end(), b.bytes().begin()));
        }
    }

    SECTION("small alignments are raised to max_align_t") {
        OwnedBuffer b = OwnedBuffer::copy_of(src, 1);
        REQUIRE(b.alignment() == alignof(std::max_align_t));
    }

    SECTION("empty copy is valid") {
        OwnedBuffer b = OwnedBuffer::copy_of({}, 64);
        REQUIRE(b.empty());
        REQUIRE(b.bytes().empty());
    }

    SECTION("adopt keeps contents") {
        OwnedBuffer b = OwnedBuffer::adopt(std::vector<uint8_t>(src), 16);
        REQUIRE(util::is_aligned(b.data(), 16));
        REQUIRE(std::equal(src.begin(), src.end(), b.bytes().begin()));
    }

    SECTION("move transfers the storage") {
        OwnedBuffer a = OwnedBuffer::copy_of(src, 64);
        const uint8_t* p = a.data();
        OwnedBuffer b = std::move(a);
        REQUIRE(b.data() == p);
        REQUIRE(b.size() == 100);
    }
}

// ============================================================================
// SourceScope / BorrowedView
// ============================================================================

TEST_CASE("SourceScope tracks borrowed views", "[memory][borrow]") {
    const auto src = iota_bytes(64);
    SourceScope scope{src};

    SECTION("borrow is zero-copy") {
        BorrowedView v = scope.borrow(8, 16);
        REQUIRE(v.bytes().data() == src.data() + 8);
        REQUIRE(v.bytes().size() == 16);
        REQUIRE(v.offset() == 8);
        REQUIRE(scope.live_borrows() == 1);
    }

    SECTION("moved-from views release nothing") {
        BorrowedView a = scope.borrow(0, 4);
        {
            BorrowedView b = std::move(a);
            REQUIRE(scope.live_borrows() == 1);
        }
        REQUIRE(scope.live_borrows() == 0);
    }

    SECTION("out-of-range borrow throws") {
        REQUIRE_THROWS_AS(scope.borrow(60, 8), std::out_of_range);
        REQUIRE_THROWS_AS(scope.borrow(65, 0), std::out_of_range);
        REQUIRE(scope.live_borrows() == 0);
    }

    SECTION("wait_released blocks until the last view is gone") {
        auto view = std::make_unique<BorrowedView>(scope.borrow(0, 8));
        std::atomic<bool> released{false};
        std::thread holder([&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            released.store(true);
            view.reset();
        });
        scope.wait_released();
        REQUIRE(released.load());
        holder.join();
    }

    REQUIRE(scope.live_borrows() == 0);
}

// ============================================================================
// BatchBuffer
// ============================================================================

TEST_CASE("BatchBuffer representations", "[memory][batch]") {
    auto storage = OwnedBuffer::copy_of(iota_bytes(80), 64);
    SourceScope scope{storage.bytes()};

    SECTION("aligned borrowed view needs no copy") {
        BatchBuffer b{scope.borrow(0, 64)};
        REQUIRE(b.is_borrowed());
        REQUIRE(b.satisfies(32));
        REQUIRE(b.bytes().data() == storage.data());
    }

    SECTION("misaligned view is promoted and releases its lease") {
        BatchBuffer b{scope.borrow(3, 40)};
        REQUIRE_FALSE(b.satisfies(32));

        OwnedBuffer& owned = b.promote(32);
        REQUIRE_FALSE(b.is_borrowed());
        REQUIRE(util::is_aligned(owned.data(), 32));
        REQUIRE(scope.live_borrows() == 0);
        REQUIRE(b.bytes()[0] == 3);
        REQUIRE(b.size() == 40);
    }

    SECTION("promote is a no-op when already owned and aligned") {
        BatchBuffer b{OwnedBuffer::copy_of(storage.bytes(), 64)};
        const uint8_t* before = b.bytes().data();
        b.promote(32);
        REQUIRE(b.bytes().data() == before);
    }

    SECTION("share copies a borrowed view once") {
        BatchBuffer b{scope.borrow(16, 16)};
        auto first = b.share();
        auto second = b.share();
        REQUIRE(first == second);
        REQUIRE(first->bytes()[0] == 16);
        REQUIRE(scope.live_borrows() == 0);
        REQUIRE(b.bytes().data() == first->data());
    }

    SECTION("shared owner outlives the batch") {
        std::shared_ptr<const OwnedBuffer> owner;
        {
            BatchBuffer b{OwnedBuffer::copy_of(storage.bytes(), 64)};
            owner = b.share();
        }
        REQUIRE(owner->size() == 80);
        REQUIRE(owner->bytes()[79] == 79);
    }
}

TEST_CASE("Alignment helpers", "[memory][util]") {
    REQUIRE(util::align_up(0, 64) == 0);
    REQUIRE(util::align_up(1, 64) == 64);
    REQUIRE(util::align_up(64, 64) == 64);
    REQUIRE(util::align_up(65, 16) == 80);

    alignas(64) uint8_t block[128]{};
    REQUIRE(util::is_aligned(block, 64));
    REQUIRE_FALSE(util::is_aligned(block + 1, 2));
    REQUIRE(util::is_aligned(block + 1, 1));
}
