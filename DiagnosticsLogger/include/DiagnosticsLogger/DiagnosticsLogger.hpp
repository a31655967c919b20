#pragma once

#include <Delivery/EventStream.hpp>
#include <FusionPipeline/DiagnosticsSink.hpp>
#include <fstream>
#include <mutex>
#include <string>

namespace bubble::logging
{
    struct LoggerConfig
    {
        std::string outputPath;
        bool logJitterStats = true;
        bool logBubbleEvents = true;
    };

    // Writes timing statistics and, when attached to a stream, orientation
    // events as text lines to a file.
    class DiagnosticsLogger final : public fusion::DiagnosticsSink
    {
    public:
        explicit DiagnosticsLogger(const LoggerConfig &config);

        void start();
        void stop();

        // Subscribes to the stream; call before events are published.
        void attach(delivery::EventStream &stream);

        void onJitterStats(SensorChannel channel, const JitterStats &stats) override;

    private:
        void handleBubbleEvent(const BubbleEvent &event);

        LoggerConfig m_config;

        std::ofstream m_file;
        std::mutex m_mutex;

        bool m_running = false;
    };
} // namespace bubble::logging
