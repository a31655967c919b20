#pragma once

#include <cstddef>
#include <span>
#include <stdexcept>
#include <vector>

namespace bubble::bookkeeping
{
    /// Fixed-capacity window that is filled front to back and then restarted.
    ///
    /// restartFromLast() keeps the newest element as the first element of the
    /// next window, so consecutive windows overlap by exactly one entry.
    template <typename T>
    class RingBuffer
    {
    public:
        explicit RingBuffer(std::size_t capacity) : m_data(capacity)
        {
            if (capacity == 0)
                throw std::invalid_argument("RingBuffer capacity must be at least 1");
        }

        // Returns true when this push filled the window.
        bool push(const T &value) noexcept
        {
            if (full())
                restartFromLast();

            m_data[m_size++] = value;
            return full();
        }

        void restartFromLast() noexcept
        {
            if (m_size == 0)
                return;

            m_data[0] = m_data[m_size - 1];
            m_size = 1;
        }

        void clear() noexcept { m_size = 0; }

        [[nodiscard]] bool full() const noexcept { return m_size == m_data.size(); }
        [[nodiscard]] std::size_t size() const noexcept { return m_size; }
        [[nodiscard]] std::size_t capacity() const noexcept { return m_data.size(); }

        [[nodiscard]] std::span<const T> values() const noexcept
        {
            return std::span<const T>(m_data.data(), m_size);
        }

        [[nodiscard]] const T &front() const { return m_data.at(0); }
        [[nodiscard]] const T &back() const { return m_data.at(m_size - 1); }

    private:
        std::vector<T> m_data;
        std::size_t m_size{0};
    };
} // namespace bubble::bookkeeping
