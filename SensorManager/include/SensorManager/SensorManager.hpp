#pragma once

#include <SensorManager/SensorSource.hpp>
#include <VirtualTime/VirtualClock.hpp>
#include <array>
#include <atomic>
#include <mutex>
#include <optional>
#include <thread>

namespace bubble::sensors
{
    // Attitude the simulated device sweeps through. Pitch and roll follow
    // p(t) = initial + rate * t.
    struct TiltProfile
    {
        float initialPitch = 0.0f; // rad
        float initialRoll = 0.0f;  // rad
        float pitchRateRadSec = 0.0f;
        float rollRateRadSec = 0.0f;
    };

    struct SensorConfig
    {
        float gravity = 9.81f;                         // m/s^2
        Eigen::Vector3f earthField{0.0f, 22.0f, -42.0f}; // uT, north and down
        float accelNoiseSigma = 0.0f;
        float magNoiseSigma = 0.0f;
    };

    // Simulated sensor service. A single worker thread advances the virtual
    // clock and emits accelerometer and magnetometer samples for the tilt
    // profile to whichever handlers are registered.
    class SensorManager final : public SensorSource
    {
    public:
        SensorManager(time::VirtualClock &clock, const SensorConfig &config, const TiltProfile &profile);
        ~SensorManager() override;

        void start();
        void stop();

        void registerListener(SensorChannel channel,
                              SampleHandler handler,
                              std::chrono::microseconds samplingPeriod) override;
        void unregisterListeners() override;

        /// Sample of the given channel at virtual time t, noise included.
        [[nodiscard]] RawSample generateSample(SensorChannel channel, time::VirtualClock::TimePoint t);

    private:
        struct Registration
        {
            SampleHandler handler;
            std::chrono::microseconds period{0};
            time::VirtualClock::TimePoint nextDue{};
        };

        void workerLoop(std::stop_token st);

        time::VirtualClock &m_clock;
        SensorConfig m_config;
        TiltProfile m_profile;

        std::jthread m_worker;
        std::atomic<bool> m_running{false};

        // Held while handlers run so unregisterListeners() waits for them.
        std::mutex m_dispatchMutex;
        std::atomic<std::thread::id> m_workerId{};

        std::mutex m_mutex;
        std::array<std::optional<Registration>, kChannelCount> m_registrations;
    };
} // namespace bubble::sensors
