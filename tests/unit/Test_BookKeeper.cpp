#include <catch2/catch.hpp>
#include <BookKeeper/BookKeeper.hpp>
#include <BookKeeper/RingBuffer.hpp>

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <vector>

using Catch::Detail::Approx;
using bubble::bookkeeping::BookKeeper;
using bubble::bookkeeping::RingBuffer;

TEST_CASE("RingBuffer fills and restarts from its last element", "[RingBuffer]")
{
    RingBuffer<int> ring(3);
    REQUIRE(ring.capacity() == 3);

    REQUIRE_FALSE(ring.push(1));
    REQUIRE_FALSE(ring.push(2));
    REQUIRE(ring.push(3));
    REQUIRE(ring.full());
    REQUIRE(ring.values().size() == 3);

    ring.restartFromLast();
    REQUIRE(ring.size() == 1);
    REQUIRE(ring.front() == 3);

    REQUIRE_FALSE(ring.push(4));
    REQUIRE(ring.push(5));
    const std::vector<int> window(ring.values().begin(), ring.values().end());
    REQUIRE(window == std::vector<int>{3, 4, 5});

    // Pushing into a full window reseeds implicitly.
    REQUIRE_FALSE(ring.push(6));
    REQUIRE(ring.front() == 5);
    REQUIRE(ring.back() == 6);

    ring.clear();
    REQUIRE(ring.size() == 0);
    ring.restartFromLast();
    REQUIRE(ring.size() == 0);

    REQUIRE_THROWS_AS(RingBuffer<int>(0), std::invalid_argument);
}

TEST_CASE("BookKeeper reports statistics once per full window", "[BookKeeper]")
{
    BookKeeper keeper; // default capacity
    REQUIRE(keeper.capacity() == 1000);

    for (int i = 0; i < 999; ++i)
        REQUIRE_FALSE(keeper.record(20).has_value());

    const auto stats = keeper.record(20);
    REQUIRE(stats.has_value());
    REQUIRE(stats->count == 1000);
    REQUIRE(stats->average == Approx(20.0));
    REQUIRE(stats->minimum == Approx(20.0));
    REQUIRE(stats->maximum == Approx(20.0));
    REQUIRE(stats->standardDeviation == Approx(0.0).margin(1e-12));

    // The next window is seeded with the last delta, so 999 more fill it.
    REQUIRE(keeper.size() == 1);
    for (int i = 0; i < 998; ++i)
        REQUIRE_FALSE(keeper.record(20).has_value());
    REQUIRE(keeper.record(20).has_value());
}

TEST_CASE("BookKeeper carries the last delta into the next window", "[BookKeeper]")
{
    BookKeeper keeper(3);

    REQUIRE_FALSE(keeper.record(10).has_value());
    REQUIRE_FALSE(keeper.record(20).has_value());
    const auto first = keeper.record(30);
    REQUIRE(first.has_value());
    REQUIRE(first->average == Approx(20.0));
    REQUIRE(first->minimum == Approx(10.0));
    REQUIRE(first->maximum == Approx(30.0));

    REQUIRE_FALSE(keeper.record(40).has_value());
    const auto second = keeper.record(50);
    REQUIRE(second.has_value());
    REQUIRE(second->count == 3);
    REQUIRE(second->average == Approx(40.0));
    REQUIRE(second->minimum == Approx(30.0));
}

TEST_CASE("BookKeeper never fails on unusual deltas", "[BookKeeper]")
{
    SECTION("all zeros")
    {
        BookKeeper keeper(4);
        std::optional<bubble::JitterStats> stats;
        for (int i = 0; i < 4; ++i)
            REQUIRE_NOTHROW(stats = keeper.record(0));
        REQUIRE(stats.has_value());
        REQUIRE(stats->average == Approx(0.0).margin(1e-12));
        REQUIRE(stats->maximum == Approx(0.0).margin(1e-12));
    }

    SECTION("single extreme outlier")
    {
        BookKeeper keeper(4);
        const auto huge = std::numeric_limits<std::int64_t>::max();
        REQUIRE_NOTHROW(keeper.record(5));
        REQUIRE_NOTHROW(keeper.record(huge));
        REQUIRE_NOTHROW(keeper.record(huge));
        const auto stats = keeper.record(5);
        REQUIRE(stats.has_value());
        REQUIRE(stats->maximum == Approx(static_cast<double>(huge)));
        REQUIRE(stats->minimum == Approx(5.0));
        REQUIRE(stats->average > 0.0);
    }

    SECTION("negative deltas are clamped")
    {
        BookKeeper keeper(2);
        REQUIRE_FALSE(keeper.record(-15).has_value());
        const auto stats = keeper.record(10);
        REQUIRE(stats.has_value());
        REQUIRE(stats->minimum == Approx(0.0).margin(1e-12));
        REQUIRE(stats->average == Approx(5.0));
    }
}

TEST_CASE("BookKeeper calculate summarizes an arbitrary window", "[BookKeeper]")
{
    const std::vector<std::int64_t> window{2, 4, 4, 4, 5, 5, 7, 9};
    const auto stats = BookKeeper::calculate(window);

    REQUIRE(stats.count == 8);
    REQUIRE(stats.average == Approx(5.0));
    REQUIRE(stats.minimum == Approx(2.0));
    REQUIRE(stats.maximum == Approx(9.0));
    REQUIRE(stats.standardDeviation == Approx(2.0));

    const auto empty = BookKeeper::calculate(std::vector<std::int64_t>{});
    REQUIRE(empty.count == 0);
    REQUIRE(empty.average == Approx(0.0).margin(1e-12));
}
