#include <SampleAggregator/SampleAggregator.hpp>
#include <stdexcept>

namespace bubble::aggregation
{
    SampleAggregator::SampleAggregator(std::size_t capacity) : m_capacity(capacity)
    {
        if (m_capacity == 0)
            throw std::invalid_argument("SampleAggregator capacity must be at least 1");

        m_window.reserve(m_capacity);
    }

    std::optional<Coordinates> SampleAggregator::push(const Coordinates &coordinates)
    {
        m_window.push_back(coordinates);
        if (m_window.size() < m_capacity)
            return std::nullopt;

        const Coordinates average = m_calculator.calculateAverage(m_window);
        m_window.clear();
        return average;
    }

    void SampleAggregator::clear() noexcept
    {
        m_window.clear();
    }
} // namespace bubble::aggregation
