#include <DiagnosticsLogger/DiagnosticsLogger.hpp>
#include <stdexcept>

namespace bubble::logging
{
    DiagnosticsLogger::DiagnosticsLogger(const LoggerConfig &config) : m_config(config) {}

    void DiagnosticsLogger::start()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_running)
            return;

        m_file.open(m_config.outputPath, std::ios::out | std::ios::trunc);
        if (!m_file.is_open())
            throw std::runtime_error("DiagnosticsLogger cannot open " + m_config.outputPath);

        m_running = true;
    }

    void DiagnosticsLogger::stop()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running)
            return;
        m_running = false;

        if (m_file.is_open())
            m_file.close();
    }

    void DiagnosticsLogger::attach(delivery::EventStream &stream)
    {
        if (!m_config.logBubbleEvents)
            return;

        stream.subscribe([this](const BubbleEvent &e)
                         { this->handleBubbleEvent(e); });
    }

    void DiagnosticsLogger::onJitterStats(SensorChannel channel, const JitterStats &stats)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running || !m_config.logJitterStats)
            return;

        m_file << "[JitterStats] channel=" << toString(channel)
               << " count=" << stats.count
               << " avg=" << stats.average
               << " min=" << stats.minimum
               << " max=" << stats.maximum
               << " stddev=" << stats.standardDeviation
               << "\n";
    }

    void DiagnosticsLogger::handleBubbleEvent(const BubbleEvent &e)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running)
            return;

        m_file << "[BubbleEvent] orientation=" << toString(e.orientation)
               << " pitch=" << e.coordinates.pitch
               << " roll=" << e.coordinates.roll
               << " azimuth=" << e.coordinates.azimuth
               << "\n";
    }
} // namespace bubble::logging
