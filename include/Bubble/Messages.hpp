#pragma once

#include <chrono>
#include <cstddef>
#include <Eigen/Core>

namespace bubble
{
    enum class SensorChannel
    {
        Accelerometer,
        Magnetometer
    };

    inline constexpr std::size_t kChannelCount = 2;

    // A single reading from one sensor channel, already scaled to SI units
    // (m/s^2 for the accelerometer, uT for the magnetometer).
    struct RawSample
    {
        std::chrono::steady_clock::time_point timestamp;
        SensorChannel channel{SensorChannel::Accelerometer};
        Eigen::Vector3f values{Eigen::Vector3f::Zero()};
    };

    // Tilt of the device in radians. Azimuth is only known when a magnetic
    // reading was available and is NaN otherwise.
    struct Coordinates
    {
        float pitch{0.0f};
        float roll{0.0f};
        float azimuth{0.0f};
    };

    enum class Orientation
    {
        Unknown,
        Horizontal,
        Top,
        Bottom,
        Left,
        Right
    };

    // Orientation-changed notification handed to the client.
    struct BubbleEvent
    {
        Orientation orientation{Orientation::Unknown};
        Coordinates coordinates{};
    };

    // Summary of one window of inter-arrival deltas, in milliseconds.
    struct JitterStats
    {
        std::size_t count{0};
        double average{0.0};
        double minimum{0.0};
        double maximum{0.0};
        double standardDeviation{0.0};
    };

    enum class Registration
    {
        Unregistered,
        Listener,
        Observer
    };

    [[nodiscard]] constexpr std::size_t channelIndex(SensorChannel channel) noexcept
    {
        return static_cast<std::size_t>(channel);
    }

    [[nodiscard]] constexpr const char *toString(SensorChannel channel) noexcept
    {
        switch (channel)
        {
        case SensorChannel::Accelerometer:
            return "accelerometer";
        case SensorChannel::Magnetometer:
            return "magnetometer";
        }
        return "unknown";
    }

    [[nodiscard]] constexpr const char *toString(Orientation orientation) noexcept
    {
        switch (orientation)
        {
        case Orientation::Unknown:
            return "unknown";
        case Orientation::Horizontal:
            return "horizontal";
        case Orientation::Top:
            return "top";
        case Orientation::Bottom:
            return "bottom";
        case Orientation::Left:
            return "left";
        case Orientation::Right:
            return "right";
        }
        return "unknown";
    }
} // namespace bubble
