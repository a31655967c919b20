#include <BookKeeper/BookKeeper.hpp>
#include <Eigen/Core>
#include <algorithm>
#include <cmath>

namespace bubble::bookkeeping
{
    BookKeeper::BookKeeper(std::size_t capacity) : m_window(capacity) {}

    std::optional<JitterStats> BookKeeper::record(std::int64_t deltaMillis)
    {
        if (!m_window.push(std::max<std::int64_t>(deltaMillis, 0)))
            return std::nullopt;

        JitterStats stats = calculate(m_window.values());
        m_window.restartFromLast();
        return stats;
    }

    JitterStats BookKeeper::calculate(std::span<const std::int64_t> window)
    {
        JitterStats stats{};
        if (window.empty())
            return stats;

        using DeltaArray = Eigen::Array<std::int64_t, Eigen::Dynamic, 1>;
        const Eigen::Map<const DeltaArray> raw(window.data(), static_cast<Eigen::Index>(window.size()));

        // Doubles keep large outliers from overflowing the sums.
        const Eigen::ArrayXd deltas = raw.cast<double>();

        stats.count = window.size();
        stats.average = deltas.mean();
        stats.minimum = deltas.minCoeff();
        stats.maximum = deltas.maxCoeff();
        stats.standardDeviation = std::sqrt((deltas - stats.average).square().mean());
        return stats;
    }
} // namespace bubble::bookkeeping
