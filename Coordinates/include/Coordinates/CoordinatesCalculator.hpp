#pragma once

#include <Bubble/Messages.hpp>
#include <span>

namespace bubble::coordinates
{
    // Converts raw samples into tilt coordinates. Stateless; every method is a
    // pure function of its arguments.
    class CoordinatesCalculator
    {
    public:
        /// Pitch and roll from a gravity reading. Azimuth is NaN.
        /// Degenerate input (zero, NaN or infinite axes) yields NaN ordinates
        /// instead of failing.
        [[nodiscard]] Coordinates calculate(const RawSample &gravity) const noexcept;

        /// Pitch and roll from gravity, azimuth from the rotation matrix built
        /// out of the gravity and geomagnetic readings.
        [[nodiscard]] Coordinates calculate(const RawSample &gravity, const RawSample &geomagnetic) const noexcept;

        /// Arithmetic mean of pitch and roll, circular mean of azimuth.
        /// Throws std::invalid_argument on an empty sequence.
        [[nodiscard]] Coordinates calculateAverage(std::span<const Coordinates> coordinates) const;
    };
} // namespace bubble::coordinates
