#pragma once

#include <Bubble/Messages.hpp>
#include <BookKeeper/RingBuffer.hpp>
#include <cstdint>
#include <optional>
#include <span>

namespace bubble::bookkeeping
{
    inline constexpr std::size_t kDefaultTimingWindow = 1000;

    // Collects inter-arrival deltas of one channel and summarizes them each
    // time the window fills. Diagnostic only; never affects the fusion path.
    class BookKeeper
    {
    public:
        explicit BookKeeper(std::size_t capacity = kDefaultTimingWindow);

        /// Records one delta. Negative values are clamped to zero.
        /// Returns the statistics of the window when this delta filled it; the
        /// window then restarts seeded with its last delta.
        [[nodiscard]] std::optional<JitterStats> record(std::int64_t deltaMillis);

        [[nodiscard]] static JitterStats calculate(std::span<const std::int64_t> window);

        [[nodiscard]] std::size_t size() const noexcept { return m_window.size(); }
        [[nodiscard]] std::size_t capacity() const noexcept { return m_window.capacity(); }

    private:
        RingBuffer<std::int64_t> m_window;
    };
} // namespace bubble::bookkeeping
