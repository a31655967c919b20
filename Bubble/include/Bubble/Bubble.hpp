#pragma once

#include <Bubble/Messages.hpp>
#include <Delivery/EventSink.hpp>
#include <Delivery/EventStream.hpp>
#include <FusionPipeline/FusionPipeline.hpp>
#include <SensorManager/SensorSource.hpp>
#include <chrono>
#include <memory>
#include <mutex>

namespace bubble
{
    struct BubbleSettings
    {
        std::size_t sampleSize = aggregation::kDefaultSampleSize;
        std::chrono::microseconds samplingPeriod{20000}; // 50 Hz
        std::size_t timingWindow = bookkeeping::kDefaultTimingWindow;
        float tiltThreshold = state::kDefaultTiltThreshold;
        fusion::EmissionPolicy emission = fusion::EmissionPolicy::EveryUpdate;
        delivery::StreamConfig stream{};
    };

    // Entry point for clients. Registers accelerometer and magnetometer
    // listeners on a sensor source and delivers orientation events either to a
    // callback or through an EventStream, chosen at registration time.
    //
    // Every registration starts from empty sample windows. Listeners and
    // stream subscribers may call any member, unregister() included.
    // Registering again is only possible once unregister() has returned.
    class Bubble
    {
    public:
        using Listener = delivery::ListenerSink::Listener;

        explicit Bubble(const BubbleSettings &settings = {},
                        std::shared_ptr<fusion::DiagnosticsSink> diagnostics = nullptr);
        ~Bubble();

        Bubble(const Bubble &) = delete;
        Bubble &operator=(const Bubble &) = delete;

        /// Observer mode. The returned stream is started; it completes on
        /// unregister().
        std::shared_ptr<delivery::EventStream> registerObserver(sensors::SensorSource &source);

        /// Listener mode. The listener runs on the sensor thread.
        void registerListener(Listener listener, sensors::SensorSource &source);

        /// Throws std::logic_error when not registered.
        void unregister();

        [[nodiscard]] Registration registration() const;

        /// Throws std::logic_error when not registered.
        [[nodiscard]] Orientation orientation() const;

        [[nodiscard]] const BubbleSettings &settings() const noexcept { return m_settings; }

    private:
        void setupAndRegisterLocked(std::shared_ptr<delivery::EventSink> sink,
                                    sensors::SensorSource &source,
                                    Registration mode);
        struct Teardown
        {
            sensors::SensorSource *source = nullptr;
            std::shared_ptr<fusion::FusionPipeline> pipeline;
            std::shared_ptr<delivery::EventStream> stream;
        };

        Teardown takeRegistrationLocked();
        void finishTeardown(Teardown &teardown);
        void ensureUnregisteredLocked() const;
        void ensureRegisteredLocked() const;

        BubbleSettings m_settings;
        std::shared_ptr<fusion::DiagnosticsSink> m_diagnostics;

        mutable std::mutex m_mutex;
        Registration m_registration{Registration::Unregistered};
        bool m_tearingDown{false};
        sensors::SensorSource *m_source = nullptr;
        std::shared_ptr<fusion::FusionPipeline> m_pipeline;
        std::shared_ptr<delivery::EventStream> m_stream;
    };
} // namespace bubble
