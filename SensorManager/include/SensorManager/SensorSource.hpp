#pragma once

#include <Bubble/Messages.hpp>
#include <chrono>
#include <functional>

namespace bubble::sensors
{
    // Platform sensor service seen from the library: delivers samples of one
    // channel to a handler at (roughly) the requested sampling period.
    class SensorSource
    {
    public:
        using SampleHandler = std::function<void(const RawSample &)>;

        virtual ~SensorSource() = default;

        virtual void registerListener(SensorChannel channel,
                                      SampleHandler handler,
                                      std::chrono::microseconds samplingPeriod) = 0;

        /// Removes all handlers. No handler runs after this returns, except the
        /// one that is making this call.
        virtual void unregisterListeners() = 0;
    };
} // namespace bubble::sensors
