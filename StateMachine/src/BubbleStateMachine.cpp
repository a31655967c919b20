#include <StateMachine/BubbleStateMachine.hpp>
#include <cmath>

namespace bubble::state
{
    Orientation classify(const Coordinates &coordinates, float threshold) noexcept
    {
        const float pitch = coordinates.pitch;
        const float roll = coordinates.roll;

        if (!std::isfinite(pitch) || !std::isfinite(roll))
            return Orientation::Unknown;

        if (pitch <= -threshold)
            return Orientation::Top;
        if (pitch >= threshold)
            return Orientation::Bottom;

        const float flatBack = std::numbers::pi_v<float> - threshold;
        if (roll <= -threshold && roll > -flatBack)
            return Orientation::Left;
        if (roll >= threshold && roll < flatBack)
            return Orientation::Right;

        return Orientation::Horizontal;
    }

    BubbleStateMachine::BubbleStateMachine(float threshold) noexcept : m_threshold(threshold) {}

    BubbleStateMachine &BubbleStateMachine::update(const Coordinates &coordinates) noexcept
    {
        m_previous = m_orientation;
        m_orientation = classify(coordinates, m_threshold);
        return *this;
    }
} // namespace bubble::state
