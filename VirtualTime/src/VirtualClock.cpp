#include <VirtualTime/VirtualClock.hpp>

namespace bubble::time
{
    VirtualClock::TimePoint VirtualClock::now() const noexcept
    {
        return TimePoint{Duration{m_ticks.load(std::memory_order_acquire)}};
    }

    void VirtualClock::advance(Duration delta) noexcept
    {
        if (delta < Duration::zero())
            return;

        m_ticks.fetch_add(delta.count(), std::memory_order_acq_rel);
    }

    void VirtualClock::reset() noexcept
    {
        m_ticks.store(0, std::memory_order_release);
    }
} // namespace bubble::time
