#pragma once

#include <Delivery/EventSink.hpp>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace bubble::delivery
{
    struct StreamConfig
    {
        bool dropOnOverflow = false;
        std::size_t maxQueueSize = 1024;
    };

    // Observable stream of BubbleEvents. Events are queued by deliver() and
    // fanned out to subscribers on a dedicated worker thread, in publish order.
    // complete() flushes what is queued, notifies completion handlers once and
    // rejects further events. When a subscriber calls it, the flush finishes
    // on the worker after the handler returns instead of blocking.
    class EventStream final : public EventSink
    {
    public:
        using EventHandler = std::function<void(const BubbleEvent &)>;
        using CompletionHandler = std::function<void()>;

        explicit EventStream(const StreamConfig &config = {});
        ~EventStream() override;

        EventStream(const EventStream &) = delete;
        EventStream &operator=(const EventStream &) = delete;

        void start();

        // Stops the worker without flushing or completing. Safe to call from a
        // subscriber; the worker then exits after the handler returns.
        void stop();

        // Publish API - thread-safe
        void deliver(const BubbleEvent &event) override;

        void subscribe(EventHandler onNext, CompletionHandler onComplete = {});

        void complete();

        [[nodiscard]] bool completed() const noexcept { return m_completed.load(); }
        [[nodiscard]] std::size_t droppedCount() const noexcept { return m_dropped.load(); }

    private:
        void workerLoop(std::stop_token st);
        [[nodiscard]] bool onWorkerThread() const noexcept;
        void dispatch(std::queue<BubbleEvent> &events);
        void notifyCompletion();

        StreamConfig m_config{};

        std::queue<BubbleEvent> m_queue;
        std::vector<EventHandler> m_eventHandlers;
        std::vector<CompletionHandler> m_completionHandlers;

        // Synchronization
        std::mutex m_mutex;
        std::condition_variable m_cv;
        bool m_hasWork{false};
        bool m_completing{false};

        std::atomic<bool> m_running{false};
        std::atomic<bool> m_completed{false};
        std::atomic<std::size_t> m_dropped{0};
        std::jthread m_worker;
    };
} // namespace bubble::delivery
