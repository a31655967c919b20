#pragma once

#include <Bubble/Messages.hpp>

namespace bubble::fusion
{
    // Receives timing statistics whenever a channel's timing window fills.
    // Called on the sensor thread of that channel.
    class DiagnosticsSink
    {
    public:
        virtual ~DiagnosticsSink() = default;

        virtual void onJitterStats(SensorChannel channel, const JitterStats &stats) = 0;
    };
} // namespace bubble::fusion
