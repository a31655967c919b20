#pragma once

#include <Bubble/Messages.hpp>
#include <Coordinates/CoordinatesCalculator.hpp>
#include <cstddef>
#include <optional>
#include <vector>

namespace bubble::aggregation
{
    inline constexpr std::size_t kDefaultSampleSize = 20;

    // Batches coordinates of one channel into fixed-size windows and reduces
    // every full window to its average. Not thread-safe; each channel owns its
    // own aggregator.
    class SampleAggregator
    {
    public:
        explicit SampleAggregator(std::size_t capacity = kDefaultSampleSize);

        /// Appends to the current window. Returns the window average and
        /// empties the window once it holds capacity() elements.
        [[nodiscard]] std::optional<Coordinates> push(const Coordinates &coordinates);

        /// Drops a partially filled window.
        void clear() noexcept;

        [[nodiscard]] std::size_t size() const noexcept { return m_window.size(); }
        [[nodiscard]] std::size_t capacity() const noexcept { return m_capacity; }

    private:
        std::size_t m_capacity;
        std::vector<Coordinates> m_window;
        coordinates::CoordinatesCalculator m_calculator;
    };
} // namespace bubble::aggregation
