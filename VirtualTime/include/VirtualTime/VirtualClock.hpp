#pragma once

#include <atomic>
#include <chrono>

namespace bubble::time
{
    /// Timestamps simulated sensor samples. Safe to read from sensor threads
    /// while the simulation thread advances it.
    class VirtualClock
    {
    public:
        using TimePoint = std::chrono::steady_clock::time_point;
        using Duration = std::chrono::steady_clock::duration;

        /// Starts at the zero epoch.
        VirtualClock() noexcept = default;

        [[nodiscard]] TimePoint now() const noexcept;

        /// Advances the virtual time. Negative deltas are ignored.
        void advance(Duration delta) noexcept;

        void reset() noexcept;

    private:
        std::atomic<Duration::rep> m_ticks{0};
    };
} // namespace bubble::time
