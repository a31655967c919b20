#include <Delivery/EventSink.hpp>
#include <stdexcept>

namespace bubble::delivery
{
    ListenerSink::ListenerSink(Listener listener) : m_listener(std::move(listener))
    {
        if (!m_listener)
            throw std::invalid_argument("ListenerSink requires a callable listener");
    }

    void ListenerSink::deliver(const BubbleEvent &event)
    {
        m_listener(event);
    }
} // namespace bubble::delivery
