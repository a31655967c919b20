#include <Delivery/EventStream.hpp>

namespace bubble::delivery
{
    EventStream::EventStream(const StreamConfig &config) : m_config(config) {}

    EventStream::~EventStream()
    {
        stop();
    }

    void EventStream::start()
    {
        if (m_completed.load())
            return;

        bool expected = false;
        if (!m_running.compare_exchange_strong(expected, true))
            return; // already running

        m_worker = std::jthread([this](std::stop_token st)
                                { workerLoop(st); });
    }

    void EventStream::stop()
    {
        if (!m_worker.joinable())
            return;

        m_worker.request_stop();

        if (onWorkerThread())
            return;

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_hasWork = true; // wake up worker to exit
        }
        m_cv.notify_one();
        m_worker.join();
        m_running = false;
    }

    void EventStream::deliver(const BubbleEvent &event)
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_completing)
                return;

            if (m_config.dropOnOverflow && m_queue.size() >= m_config.maxQueueSize)
            {
                ++m_dropped;
            }
            else
            {
                m_queue.push(event);
            }

            m_hasWork = true;
        }
        m_cv.notify_one();
    }

    void EventStream::subscribe(EventHandler onNext, CompletionHandler onComplete)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (onNext)
            m_eventHandlers.emplace_back(std::move(onNext));
        if (onComplete)
            m_completionHandlers.emplace_back(std::move(onComplete));
    }

    void EventStream::complete()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_completing)
                return;

            m_completing = true;
            m_hasWork = true;
        }
        m_cv.notify_one();

        // Called by a subscriber: the worker finishes once the handler returns.
        if (onWorkerThread())
            return;

        if (m_worker.joinable())
        {
            // The worker flushes the queue and runs the completion handlers.
            m_worker.join();
            m_running = false;
            return;
        }

        // Never started: flush on the calling thread.
        std::queue<BubbleEvent> pending;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            pending.swap(m_queue);
        }
        dispatch(pending);
        notifyCompletion();
    }

    bool EventStream::onWorkerThread() const noexcept
    {
        return m_worker.joinable() && m_worker.get_id() == std::this_thread::get_id();
    }

    void EventStream::dispatch(std::queue<BubbleEvent> &events)
    {
        std::vector<EventHandler> handlers;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            handlers = m_eventHandlers;
        }

        while (!events.empty())
        {
            const auto &msg = events.front();
            for (auto &h : handlers)
            {
                h(msg);
            }
            events.pop();
        }
    }

    void EventStream::notifyCompletion()
    {
        std::vector<CompletionHandler> handlers;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            handlers = m_completionHandlers;
        }

        for (auto &h : handlers)
        {
            h();
        }
        m_completed = true;
    }

    void EventStream::workerLoop(std::stop_token st)
    {
        while (!st.stop_requested())
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [&]
                      { return m_hasWork || st.stop_requested(); });

            if (st.stop_requested())
                break;

            std::queue<BubbleEvent> events;
            events.swap(m_queue);

            const bool finishing = m_completing;
            m_hasWork = false;
            lock.unlock();

            dispatch(events);

            if (finishing)
            {
                notifyCompletion();
                break;
            }
        }
    }
} // namespace bubble::delivery
