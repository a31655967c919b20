#include <catch2/catch.hpp>
#include <SampleAggregator/SampleAggregator.hpp>

#include <cmath>
#include <limits>
#include <stdexcept>

using Catch::Detail::Approx;
using bubble::Coordinates;
using bubble::aggregation::SampleAggregator;

TEST_CASE("SampleAggregator emits one average per full window", "[SampleAggregator]")
{
    SampleAggregator aggregator(3);

    REQUIRE_FALSE(aggregator.push({1.0f, 1.0f, 1.0f}).has_value());
    REQUIRE_FALSE(aggregator.push({2.0f, 2.0f, 2.0f}).has_value());

    const auto average = aggregator.push({3.0f, 3.0f, 3.0f});
    REQUIRE(average.has_value());
    REQUIRE(average->pitch == Approx(2.0f));
    REQUIRE(average->roll == Approx(2.0f));
    REQUIRE(average->azimuth == Approx(2.0f));
    REQUIRE(aggregator.size() == 0);

    // The fourth push opens a fresh window.
    REQUIRE_FALSE(aggregator.push({100.0f, 0.0f, 0.0f}).has_value());
    REQUIRE(aggregator.size() == 1);
}

TEST_CASE("SampleAggregator averages exactly the pushed window", "[SampleAggregator]")
{
    SampleAggregator aggregator; // default capacity
    REQUIRE(aggregator.capacity() == 20);

    float pitchSum = 0.0f;
    float rollSum = 0.0f;
    for (int i = 0; i < 19; ++i)
    {
        const Coordinates c{0.05f * static_cast<float>(i), -0.1f * static_cast<float>(i % 4), 0.0f};
        pitchSum += c.pitch;
        rollSum += c.roll;
        REQUIRE_FALSE(aggregator.push(c).has_value());
    }

    const Coordinates last{0.3f, 0.2f, 0.0f};
    pitchSum += last.pitch;
    rollSum += last.roll;

    const auto average = aggregator.push(last);
    REQUIRE(average.has_value());
    REQUIRE(average->pitch == Approx(pitchSum / 20.0f));
    REQUIRE(average->roll == Approx(rollSum / 20.0f));
    REQUIRE(aggregator.size() == 0);
}

TEST_CASE("SampleAggregator capacity edge cases", "[SampleAggregator]")
{
    REQUIRE_THROWS_AS(SampleAggregator(0), std::invalid_argument);

    SampleAggregator single(1);
    REQUIRE(single.push({0.5f, 0.0f, 0.0f}).has_value());
    REQUIRE(single.push({0.7f, 0.0f, 0.0f})->pitch == Approx(0.7f));

    SampleAggregator partial(4);
    REQUIRE_FALSE(partial.push({1.0f, 0.0f, 0.0f}).has_value());
    partial.clear();
    REQUIRE(partial.size() == 0);
    for (int i = 0; i < 3; ++i)
        REQUIRE_FALSE(partial.push({1.0f, 0.0f, 0.0f}).has_value());
    REQUIRE(partial.push({1.0f, 0.0f, 0.0f}).has_value());
}

TEST_CASE("SampleAggregator passes NaN through the average", "[SampleAggregator]")
{
    SampleAggregator aggregator(2);
    const float nan = std::numeric_limits<float>::quiet_NaN();

    REQUIRE_FALSE(aggregator.push({nan, 0.0f, 0.0f}).has_value());
    const auto average = aggregator.push({1.0f, 0.0f, 0.0f});
    REQUIRE(average.has_value());
    REQUIRE(std::isnan(average->pitch));
    REQUIRE(average->roll == Approx(0.0f));
}
