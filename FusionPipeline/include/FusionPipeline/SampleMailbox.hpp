#pragma once

#include <Bubble/Messages.hpp>
#include <mutex>
#include <optional>

namespace bubble::fusion
{
    // Holds the most recent sample of one channel so the other channel can
    // pair with it. Written by the owning channel, read by the other one.
    class SampleMailbox
    {
    public:
        void publish(const RawSample &sample)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_sample = sample;
        }

        [[nodiscard]] std::optional<RawSample> readLatest() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_sample;
        }

        void clear()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_sample.reset();
        }

    private:
        mutable std::mutex m_mutex;
        std::optional<RawSample> m_sample;
    };
} // namespace bubble::fusion
