#include <Bubble/Bubble.hpp>
#include <initializer_list>
#include <stdexcept>
#include <utility>

namespace bubble
{
    Bubble::Bubble(const BubbleSettings &settings, std::shared_ptr<fusion::DiagnosticsSink> diagnostics)
        : m_settings(settings), m_diagnostics(std::move(diagnostics))
    {
        if (m_settings.sampleSize == 0)
            throw std::invalid_argument("Bubble sample size must be at least 1");
    }

    Bubble::~Bubble()
    {
        Teardown teardown;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_registration == Registration::Unregistered)
                return;
            teardown = takeRegistrationLocked();
        }
        finishTeardown(teardown);
    }

    std::shared_ptr<delivery::EventStream> Bubble::registerObserver(sensors::SensorSource &source)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ensureUnregisteredLocked();

        auto stream = std::make_shared<delivery::EventStream>(m_settings.stream);
        setupAndRegisterLocked(stream, source, Registration::Observer);

        m_stream = stream;
        stream->start();
        return stream;
    }

    void Bubble::registerListener(Listener listener, sensors::SensorSource &source)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ensureUnregisteredLocked();

        auto sink = std::make_shared<delivery::ListenerSink>(std::move(listener));
        setupAndRegisterLocked(std::move(sink), source, Registration::Listener);
    }

    void Bubble::setupAndRegisterLocked(std::shared_ptr<delivery::EventSink> sink,
                                        sensors::SensorSource &source,
                                        Registration mode)
    {
        fusion::PipelineConfig config;
        config.sampleSize = m_settings.sampleSize;
        config.timingWindow = m_settings.timingWindow;
        config.tiltThreshold = m_settings.tiltThreshold;
        config.emission = m_settings.emission;

        m_pipeline = std::make_shared<fusion::FusionPipeline>(config, std::move(sink), m_diagnostics);
        m_source = &source;
        m_registration = mode;

        // The handlers share ownership so a sample already in flight never
        // outlives its pipeline.
        auto pipeline = m_pipeline;
        for (auto channel : {SensorChannel::Accelerometer, SensorChannel::Magnetometer})
        {
            source.registerListener(channel,
                                    [pipeline](const RawSample &sample)
                                    { pipeline->onSample(sample); },
                                    m_settings.samplingPeriod);
        }
    }

    void Bubble::unregister()
    {
        Teardown teardown;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            ensureRegisteredLocked();
            teardown = takeRegistrationLocked();
        }

        // Runs without m_mutex so listeners and subscribers that are still
        // being served may query this object.
        finishTeardown(teardown);
    }

    Bubble::Teardown Bubble::takeRegistrationLocked()
    {
        Teardown teardown;
        teardown.source = std::exchange(m_source, nullptr);
        teardown.pipeline = std::move(m_pipeline);
        teardown.stream = std::move(m_stream);

        m_registration = Registration::Unregistered;
        m_tearingDown = true;
        return teardown;
    }

    void Bubble::finishTeardown(Teardown &teardown)
    {
        if (teardown.source)
            teardown.source->unregisterListeners();

        // Partial windows go away with the pipeline.
        if (teardown.pipeline)
            teardown.pipeline->detach();

        // Flushes queued events; returns at once when called by a subscriber.
        if (teardown.stream)
            teardown.stream->complete();

        std::lock_guard<std::mutex> lock(m_mutex);
        m_tearingDown = false;
    }

    Registration Bubble::registration() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_registration;
    }

    Orientation Bubble::orientation() const
    {
        std::shared_ptr<fusion::FusionPipeline> pipeline;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            ensureRegisteredLocked();
            pipeline = m_pipeline;
        }
        return pipeline->orientation();
    }

    void Bubble::ensureUnregisteredLocked() const
    {
        if (m_registration != Registration::Unregistered)
            throw std::logic_error("Detector is already registered.");
        if (m_tearingDown)
            throw std::logic_error("Detector is still being unregistered.");
    }

    void Bubble::ensureRegisteredLocked() const
    {
        if (m_registration == Registration::Unregistered)
            throw std::logic_error("Detector must be registered before use.");
    }
} // namespace bubble
