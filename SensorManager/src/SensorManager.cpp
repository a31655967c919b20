#include <SensorManager/SensorManager.hpp>
#include <Eigen/Geometry>
#include <algorithm>
#include <cmath>
#include <random>

namespace bubble::sensors
{
    SensorManager::SensorManager(time::VirtualClock &clock, const SensorConfig &config, const TiltProfile &profile)
        : m_clock(clock), m_config(config), m_profile(profile) {}

    SensorManager::~SensorManager()
    {
        stop();
    }

    void SensorManager::start()
    {
        bool expected = false;
        if (!m_running.compare_exchange_strong(expected, true))
            return; // already running

        m_worker = std::jthread([this](std::stop_token st)
                                { workerLoop(st); });
    }

    void SensorManager::stop()
    {
        if (!m_running.exchange(false))
            return;

        if (m_worker.joinable())
        {
            m_worker.request_stop();
            m_worker.join();
        }
    }

    void SensorManager::registerListener(SensorChannel channel,
                                         SampleHandler handler,
                                         std::chrono::microseconds samplingPeriod)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_registrations[channelIndex(channel)] = Registration{std::move(handler),
                                                              std::max(samplingPeriod, std::chrono::microseconds(1)),
                                                              m_clock.now()};
    }

    void SensorManager::unregisterListeners()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            for (auto &r : m_registrations)
                r.reset();
        }

        // Wait for a handler that is still running, unless we are that handler.
        if (std::this_thread::get_id() != m_workerId.load())
        {
            std::lock_guard<std::mutex> dispatchLock(m_dispatchMutex);
        }
    }

    RawSample SensorManager::generateSample(SensorChannel channel, time::VirtualClock::TimePoint t)
    {
        // thread_local: each thread gets its own rng instance to avoid contention
        static thread_local std::mt19937 rng{std::random_device{}()};

        const float seconds = std::chrono::duration<float>(t.time_since_epoch()).count();
        const float pitch = m_profile.initialPitch + m_profile.pitchRateRadSec * seconds;
        const float roll = m_profile.initialRoll + m_profile.rollRateRadSec * seconds;

        // World (east, north, up) to device frame.
        const Eigen::Matrix3f deviceToWorld =
            (Eigen::AngleAxisf(-pitch, Eigen::Vector3f::UnitX()) *
             Eigen::AngleAxisf(roll, Eigen::Vector3f::UnitY()))
                .toRotationMatrix();
        const Eigen::Matrix3f worldToDevice = deviceToWorld.transpose();

        RawSample sample{};
        sample.timestamp = t;
        sample.channel = channel;

        if (channel == SensorChannel::Accelerometer)
        {
            std::normal_distribution<float> noise(0.0f, std::max(m_config.accelNoiseSigma, 1e-9f));
            sample.values = worldToDevice * Eigen::Vector3f(0.0f, 0.0f, m_config.gravity);
            if (m_config.accelNoiseSigma > 0.0f)
                sample.values += Eigen::Vector3f(noise(rng), noise(rng), noise(rng));
        }
        else
        {
            std::normal_distribution<float> noise(0.0f, std::max(m_config.magNoiseSigma, 1e-9f));
            sample.values = worldToDevice * m_config.earthField;
            if (m_config.magNoiseSigma > 0.0f)
                sample.values += Eigen::Vector3f(noise(rng), noise(rng), noise(rng));
        }
        return sample;
    }

    void SensorManager::workerLoop(std::stop_token st)
    {
        using namespace std::chrono_literals;

        const auto tick = 1ms;

        m_workerId = std::this_thread::get_id();

        while (!st.stop_requested())
        {
            const auto now = m_clock.now();
            {
                std::lock_guard<std::mutex> dispatchLock(m_dispatchMutex);
                for (std::size_t i = 0; i < m_registrations.size(); ++i)
                {
                    SampleHandler handler;
                    {
                        std::lock_guard<std::mutex> lock(m_mutex);
                        auto &r = m_registrations[i];
                        if (!r || now < r->nextDue)
                            continue;

                        handler = r->handler;
                        r->nextDue = now + r->period;
                    }

                    // Runs without m_mutex so the handler may unregister.
                    handler(generateSample(static_cast<SensorChannel>(i), now));
                }
            }

            std::this_thread::sleep_for(tick);
            m_clock.advance(tick);
        }

        m_workerId = std::thread::id{};
    }
} // namespace bubble::sensors
