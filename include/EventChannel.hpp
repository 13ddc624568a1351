#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include "Event.hpp"

namespace rtmpingest {
// Bounded single producer, single consumer queue of session events. The
// producer (the io thread) never blocks: it checks hasSpace() before decoding
// the next message and parks a callback with waitSpace() when the queue is
// full. close() appends SessionClosed after the queued events without
// taking a slot.
class EventChannel : public EventSink
{
public:
    explicit EventChannel(std::size_t capacity);

    // producer side
    bool hasSpace() const;
    // The handler runs once, on the consumer thread, when a slot frees or
    // the consumer goes away.
    void waitSpace(std::function<void()> handler);
    void push(Event event) override;
    void close(boost::system::error_code reason) override;

    // consumer side, false once SessionClosed was taken
    bool pop(Event &event);
    bool pop(Event &event, std::chrono::milliseconds timeout);
    bool tryPop(Event &event);
    // Consumer stops reading, pending and later events are discarded.
    void shutdown();

    std::size_t size() const;

    std::size_t capacity() const
    {
        return capacity_;
    }

    bool closed() const;

private:
    bool popLocked(Event &event);
    std::function<void()> takeWaiter();

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable readable_;
    std::condition_variable writable_;
    std::deque<Event> events_;
    bool closed_{ false };
    bool finished_{ false };
    bool shutdown_{ false };
    boost::system::error_code reason_;
    std::function<void()> waiter_;
};
}
