#pragma once

#include <Bubble/Messages.hpp>
#include <numbers>

namespace bubble::state
{
    inline constexpr float kDefaultTiltThreshold = std::numbers::pi_v<float> / 4.0f;

    /// Maps averaged coordinates onto a discrete orientation.
    ///
    /// Pitch is checked first: pitch <= -threshold is Top (device upright),
    /// pitch >= threshold is Bottom (upside down). Otherwise roll within
    /// [threshold, pi - threshold) is Right and within (-(pi - threshold), -threshold]
    /// is Left. Everything else lies flat, screen up or down, and is Horizontal.
    /// Values exactly on a threshold always fall into the tilted region.
    /// Non-finite pitch or roll classify as Unknown.
    [[nodiscard]] Orientation classify(const Coordinates &coordinates,
                                       float threshold = kDefaultTiltThreshold) noexcept;

    // Caches the current orientation between updates. Any state can follow any
    // other; repeated states are reported like any other update. Callers
    // serialize access.
    class BubbleStateMachine
    {
    public:
        explicit BubbleStateMachine(float threshold = kDefaultTiltThreshold) noexcept;

        BubbleStateMachine &update(const Coordinates &coordinates) noexcept;

        [[nodiscard]] Orientation orientation() const noexcept { return m_orientation; }
        [[nodiscard]] Orientation previousOrientation() const noexcept { return m_previous; }

        // Whether the last update moved to a different orientation.
        [[nodiscard]] bool changed() const noexcept { return m_orientation != m_previous; }

        [[nodiscard]] float threshold() const noexcept { return m_threshold; }

    private:
        float m_threshold;
        Orientation m_orientation{Orientation::Unknown};
        Orientation m_previous{Orientation::Unknown};
    };
} // namespace bubble::state
