#include <Coordinates/CoordinatesCalculator.hpp>
#include <Eigen/Geometry>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace bubble::coordinates
{
    namespace
    {
        constexpr float kNaN = std::numeric_limits<float>::quiet_NaN();

        // Below this fraction of |E||A| the east axis is too short to trust
        // (free fall or the device close to magnetic north/south pole).
        constexpr float kMinEastNorm = 0.1f;
    } // namespace

    Coordinates CoordinatesCalculator::calculate(const RawSample &gravity) const noexcept
    {
        const Eigen::Vector3f &a = gravity.values;
        const float norm = a.norm();

        Coordinates c{};
        c.pitch = std::asin(-a.y() / norm);
        c.roll = std::atan2(-a.x(), a.z());
        c.azimuth = kNaN;
        return c;
    }

    Coordinates CoordinatesCalculator::calculate(const RawSample &gravity, const RawSample &geomagnetic) const noexcept
    {
        Coordinates c = calculate(gravity);

        const Eigen::Vector3f &a = gravity.values;
        const Eigen::Vector3f &e = geomagnetic.values;

        // Rows of the device-to-world rotation: east (H), north (M), up (A).
        Eigen::Vector3f h = e.cross(a);
        const float hNorm = h.norm();
        if (!(hNorm >= kMinEastNorm * e.norm() * a.norm()) || hNorm == 0.0f)
            return c;

        h /= hNorm;
        const Eigen::Vector3f m = a.normalized().cross(h);
        c.azimuth = std::atan2(h.y(), m.y());
        return c;
    }

    Coordinates CoordinatesCalculator::calculateAverage(std::span<const Coordinates> coordinates) const
    {
        if (coordinates.empty())
            throw std::invalid_argument("calculateAverage requires at least one coordinate");

        // Azimuth wraps at +-pi, so it is averaged on the unit circle.
        Eigen::Vector4f sum = Eigen::Vector4f::Zero();
        for (const auto &c : coordinates)
            sum += Eigen::Vector4f(c.pitch, c.roll, std::sin(c.azimuth), std::cos(c.azimuth));

        const Eigen::Vector4f mean = sum / static_cast<float>(coordinates.size());
        return Coordinates{mean.x(), mean.y(), std::atan2(mean.z(), mean.w())};
    }
} // namespace bubble::coordinates
