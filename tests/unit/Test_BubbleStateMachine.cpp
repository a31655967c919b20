#include <catch2/catch.hpp>
#include <StateMachine/BubbleStateMachine.hpp>

#include <limits>
#include <numbers>

using bubble::Coordinates;
using bubble::Orientation;
using bubble::state::BubbleStateMachine;
using bubble::state::classify;
using bubble::state::kDefaultTiltThreshold;

namespace
{
    constexpr float kPi = std::numbers::pi_v<float>;
} // namespace

TEST_CASE("BubbleStateMachine starts in Unknown", "[BubbleStateMachine]")
{
    BubbleStateMachine machine;
    REQUIRE(machine.orientation() == Orientation::Unknown);
    REQUIRE(machine.previousOrientation() == Orientation::Unknown);
    REQUIRE_FALSE(machine.changed());
}

TEST_CASE("BubbleStateMachine classifies tilt regions", "[BubbleStateMachine]")
{
    REQUIRE(classify({0.0f, 0.0f, 0.0f}) == Orientation::Horizontal);
    REQUIRE(classify({0.1f, -0.2f, 0.0f}) == Orientation::Horizontal);
    REQUIRE(classify({0.0f, kPi, 0.0f}) == Orientation::Horizontal); // screen down
    REQUIRE(classify({-kPi / 2.0f, 0.0f, 0.0f}) == Orientation::Top);
    REQUIRE(classify({kPi / 2.0f, 0.0f, 0.0f}) == Orientation::Bottom);
    REQUIRE(classify({0.0f, -kPi / 2.0f, 0.0f}) == Orientation::Left);
    REQUIRE(classify({0.0f, kPi / 2.0f, 0.0f}) == Orientation::Right);

    // Pitch wins over roll.
    REQUIRE(classify({-1.2f, 1.2f, 0.0f}) == Orientation::Top);
}

TEST_CASE("BubbleStateMachine resolves boundaries to the tilted side", "[BubbleStateMachine]")
{
    const float t = kDefaultTiltThreshold;
    const float flatBack = kPi - t;

    for (int run = 0; run < 3; ++run)
    {
        REQUIRE(classify({-t, 0.0f, 0.0f}) == Orientation::Top);
        REQUIRE(classify({t, 0.0f, 0.0f}) == Orientation::Bottom);
        REQUIRE(classify({0.0f, -t, 0.0f}) == Orientation::Left);
        REQUIRE(classify({0.0f, t, 0.0f}) == Orientation::Right);
        REQUIRE(classify({0.0f, flatBack, 0.0f}) == Orientation::Horizontal);
        REQUIRE(classify({0.0f, -flatBack, 0.0f}) == Orientation::Horizontal);
    }

    REQUIRE(classify({0.0f, 0.3f, 0.0f}, 0.3f) == Orientation::Right);
    REQUIRE(classify({0.0f, 0.3f, 0.0f}, 0.31f) == Orientation::Horizontal);
}

TEST_CASE("BubbleStateMachine maps non-finite coordinates to Unknown", "[BubbleStateMachine]")
{
    const float nan = std::numeric_limits<float>::quiet_NaN();
    const float inf = std::numeric_limits<float>::infinity();

    REQUIRE(classify({nan, 0.0f, 0.0f}) == Orientation::Unknown);
    REQUIRE(classify({0.0f, nan, 0.0f}) == Orientation::Unknown);
    REQUIRE(classify({inf, 0.0f, 0.0f}) == Orientation::Unknown);

    // Azimuth does not take part in the classification.
    REQUIRE(classify({0.0f, 0.0f, nan}) == Orientation::Horizontal);
}

TEST_CASE("BubbleStateMachine update is deterministic and tracks transitions", "[BubbleStateMachine]")
{
    BubbleStateMachine machine;
    const Coordinates upright{-1.4f, 0.0f, 0.0f};

    REQUIRE(machine.update(upright).orientation() == Orientation::Top);
    REQUIRE(machine.previousOrientation() == Orientation::Unknown);
    REQUIRE(machine.changed());

    REQUIRE(machine.update(upright).orientation() == Orientation::Top);
    REQUIRE(machine.previousOrientation() == Orientation::Top);
    REQUIRE_FALSE(machine.changed());

    // Any state can follow any other.
    REQUIRE(machine.update({1.4f, 0.0f, 0.0f}).orientation() == Orientation::Bottom);
    REQUIRE(machine.update({0.0f, 1.0f, 0.0f}).orientation() == Orientation::Right);
    REQUIRE(machine.update({0.0f, 0.0f, 0.0f}).orientation() == Orientation::Horizontal);
    REQUIRE(machine.update({std::numeric_limits<float>::quiet_NaN(), 0.0f, 0.0f}).orientation() == Orientation::Unknown);
    REQUIRE(machine.previousOrientation() == Orientation::Horizontal);
}

TEST_CASE("BubbleStateMachine honours a custom threshold", "[BubbleStateMachine]")
{
    BubbleStateMachine machine(0.2f);
    REQUIRE(machine.threshold() == 0.2f);
    REQUIRE(machine.update({0.0f, -0.25f, 0.0f}).orientation() == Orientation::Left);
}
