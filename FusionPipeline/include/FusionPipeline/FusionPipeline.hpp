#pragma once

#include <Bubble/Messages.hpp>
#include <BookKeeper/BookKeeper.hpp>
#include <Coordinates/CoordinatesCalculator.hpp>
#include <Delivery/EventSink.hpp>
#include <FusionPipeline/DiagnosticsSink.hpp>
#include <FusionPipeline/SampleMailbox.hpp>
#include <SampleAggregator/SampleAggregator.hpp>
#include <StateMachine/BubbleStateMachine.hpp>
#include <array>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>

namespace bubble::fusion
{
    enum class EmissionPolicy
    {
        EveryUpdate, // one event per averaged window
        OnChange     // only when the orientation differs from the previous one
    };

    struct PipelineConfig
    {
        std::size_t sampleSize = aggregation::kDefaultSampleSize;
        std::size_t timingWindow = bookkeeping::kDefaultTimingWindow;
        float tiltThreshold = state::kDefaultTiltThreshold;
        EmissionPolicy emission = EmissionPolicy::EveryUpdate;
    };

    // Turns per-channel raw samples into orientation events:
    // sample -> coordinates -> window average -> state machine -> sink.
    //
    // onSample() may be called concurrently for different channels but not
    // for the same channel. Updates are delivered in the order they were
    // applied to the state machine. The sink may call orientation() and
    // detach() from inside deliver(), but must not feed samples back.
    class FusionPipeline
    {
    public:
        FusionPipeline(const PipelineConfig &config,
                       std::shared_ptr<delivery::EventSink> sink,
                       std::shared_ptr<DiagnosticsSink> diagnostics = nullptr);

        /// Throws std::logic_error once the pipeline has been detached.
        void onSample(const RawSample &sample);

        /// Stops delivery and releases the sinks. Partial windows are never flushed.
        void detach();

        [[nodiscard]] bool attached() const noexcept { return m_attached.load(); }
        [[nodiscard]] Orientation orientation() const;
        [[nodiscard]] std::size_t pendingSamples(SensorChannel channel) const noexcept;

    private:
        struct ChannelState
        {
            explicit ChannelState(const PipelineConfig &config)
                : aggregator(config.sampleSize), bookKeeper(config.timingWindow) {}

            aggregation::SampleAggregator aggregator;
            bookkeeping::BookKeeper bookKeeper;
            std::optional<std::chrono::steady_clock::time_point> lastArrival;
        };

        void recordTiming(ChannelState &channel, const RawSample &sample);
        [[nodiscard]] Coordinates coordinatesFor(const RawSample &sample) const;
        void publish(const Coordinates &average);

        PipelineConfig m_config;
        coordinates::CoordinatesCalculator m_calculator;
        std::shared_ptr<DiagnosticsSink> m_diagnostics;

        std::array<ChannelState, kChannelCount> m_channels;
        std::array<SampleMailbox, kChannelCount> m_latest;

        std::atomic<bool> m_attached{true};

        // Taken before m_stateMutex, never the other way round.
        std::mutex m_deliveryMutex;

        mutable std::mutex m_stateMutex;
        state::BubbleStateMachine m_stateMachine;
        std::shared_ptr<delivery::EventSink> m_sink;
    };
} // namespace bubble::fusion
