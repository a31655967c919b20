#include <FusionPipeline/FusionPipeline.hpp>
#include <stdexcept>

namespace bubble::fusion
{
    FusionPipeline::FusionPipeline(const PipelineConfig &config,
                                   std::shared_ptr<delivery::EventSink> sink,
                                   std::shared_ptr<DiagnosticsSink> diagnostics)
        : m_config(config),
          m_diagnostics(std::move(diagnostics)),
          m_channels{ChannelState(config), ChannelState(config)},
          m_stateMachine(config.tiltThreshold),
          m_sink(std::move(sink))
    {
        if (!m_sink)
            throw std::invalid_argument("FusionPipeline requires an event sink");
    }

    void FusionPipeline::onSample(const RawSample &sample)
    {
        if (!m_attached.load())
            throw std::logic_error("FusionPipeline used after it was detached");

        auto &channel = m_channels[channelIndex(sample.channel)];

        recordTiming(channel, sample);

        m_latest[channelIndex(sample.channel)].publish(sample);
        const Coordinates coordinates = coordinatesFor(sample);

        if (auto average = channel.aggregator.push(coordinates))
            publish(*average);
    }

    void FusionPipeline::detach()
    {
        if (!m_attached.exchange(false))
            return;

        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_sink.reset();
        m_diagnostics.reset();
    }

    Orientation FusionPipeline::orientation() const
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        return m_stateMachine.orientation();
    }

    std::size_t FusionPipeline::pendingSamples(SensorChannel channel) const noexcept
    {
        return m_channels[channelIndex(channel)].aggregator.size();
    }

    void FusionPipeline::recordTiming(ChannelState &channel, const RawSample &sample)
    {
        const auto previous = channel.lastArrival;
        channel.lastArrival = sample.timestamp;
        if (!previous)
            return;

        const auto delta = std::chrono::duration_cast<std::chrono::milliseconds>(sample.timestamp - *previous);
        const auto stats = channel.bookKeeper.record(delta.count());
        if (!stats)
            return;

        std::shared_ptr<DiagnosticsSink> diagnostics;
        {
            std::lock_guard<std::mutex> lock(m_stateMutex);
            diagnostics = m_diagnostics;
        }
        if (diagnostics)
            diagnostics->onJitterStats(sample.channel, *stats);
    }

    Coordinates FusionPipeline::coordinatesFor(const RawSample &sample) const
    {
        if (sample.channel == SensorChannel::Accelerometer)
        {
            if (auto geomagnetic = m_latest[channelIndex(SensorChannel::Magnetometer)].readLatest())
                return m_calculator.calculate(sample, *geomagnetic);
            return m_calculator.calculate(sample);
        }

        // A magnetometer sample without any gravity reading yet has no tilt;
        // the zero vector yields NaN pitch and an Unknown orientation.
        auto gravity = m_latest[channelIndex(SensorChannel::Accelerometer)].readLatest();
        if (!gravity)
        {
            RawSample none{};
            none.channel = SensorChannel::Accelerometer;
            return m_calculator.calculate(none, sample);
        }
        return m_calculator.calculate(*gravity, sample);
    }

    void FusionPipeline::publish(const Coordinates &average)
    {
        // The delivery lock spans update and deliver so events keep update
        // order; the state lock is released before the sink runs so a
        // listener may read orientation() or detach the pipeline.
        std::lock_guard<std::mutex> deliveryLock(m_deliveryMutex);

        std::shared_ptr<delivery::EventSink> sink;
        BubbleEvent event{};
        {
            std::lock_guard<std::mutex> lock(m_stateMutex);
            if (!m_sink)
                return; // detached while this window was being reduced

            m_stateMachine.update(average);
            if (m_config.emission == EmissionPolicy::OnChange && !m_stateMachine.changed())
                return;

            sink = m_sink;
            event = BubbleEvent{m_stateMachine.orientation(), average};
        }

        sink->deliver(event);
    }
} // namespace bubble::fusion
