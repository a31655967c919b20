#pragma once

#include <Bubble/Messages.hpp>
#include <functional>

namespace bubble::delivery
{
    // Destination of orientation events. Chosen once when the pipeline is
    // registered and kept until it is unregistered.
    class EventSink
    {
    public:
        virtual ~EventSink() = default;

        virtual void deliver(const BubbleEvent &event) = 0;
    };

    // Push delivery: invokes the client callback on the calling sensor thread.
    class ListenerSink final : public EventSink
    {
    public:
        using Listener = std::function<void(const BubbleEvent &)>;

        explicit ListenerSink(Listener listener);

        void deliver(const BubbleEvent &event) override;

    private:
        Listener m_listener;
    };
} // namespace bubble::delivery
