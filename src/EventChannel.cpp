#include <spdlog/spdlog.h>
#include "EventChannel.hpp"

namespace rtmpingest {
EventChannel::EventChannel(std::size_t capacity) : capacity_(capacity > 0 ? capacity : 1)
{
}

bool EventChannel::hasSpace() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return shutdown_ || events_.size() < capacity_;
}

void EventChannel::waitSpace(std::function<void()> handler)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if(!shutdown_ && events_.size() >= capacity_) {
            waiter_ = std::move(handler);
            return;
        }
    }
    handler();
}

void EventChannel::push(Event event)
{
    std::unique_lock<std::mutex> lock(mutex_);
    if(events_.size() >= capacity_ && !shutdown_ && !closed_) {
        SPDLOG_WARN("Event channel {}, full, producer blocks", (void *)this);
        writable_.wait(lock, [this] {
            return events_.size() < capacity_ || shutdown_;
        });
    }
    if(shutdown_ || closed_) {
        return;
    }
    events_.push_back(std::move(event));
    readable_.notify_one();
}

void EventChannel::close(boost::system::error_code reason)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if(closed_) {
        return;
    }
    closed_ = true;
    reason_ = reason;
    readable_.notify_all();
}

bool EventChannel::popLocked(Event &event)
{
    if(shutdown_) {
        return false;
    }
    if(!events_.empty()) {
        event = std::move(events_.front());
        events_.pop_front();
        return true;
    }
    if(closed_ && !finished_) {
        event = Event::sessionClosed(reason_);
        finished_ = true;
        return true;
    }
    return false;
}

std::function<void()> EventChannel::takeWaiter()
{
    std::function<void()> waiter;
    if(waiter_ && (shutdown_ || events_.size() < capacity_)) {
        waiter.swap(waiter_);
    }
    return waiter;
}

bool EventChannel::pop(Event &event)
{
    std::function<void()> waiter;
    bool ok;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        readable_.wait(lock, [this] {
            return !events_.empty() || closed_ || shutdown_;
        });
        ok = popLocked(event);
        waiter = takeWaiter();
        writable_.notify_one();
    }
    if(waiter) {
        waiter();
    }
    return ok;
}

bool EventChannel::pop(Event &event, std::chrono::milliseconds timeout)
{
    std::function<void()> waiter;
    bool ok;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        readable_.wait_for(lock, timeout, [this] {
            return !events_.empty() || closed_ || shutdown_;
        });
        ok = popLocked(event);
        waiter = takeWaiter();
        writable_.notify_one();
    }
    if(waiter) {
        waiter();
    }
    return ok;
}

bool EventChannel::tryPop(Event &event)
{
    std::function<void()> waiter;
    bool ok;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ok = popLocked(event);
        waiter = takeWaiter();
        writable_.notify_one();
    }
    if(waiter) {
        waiter();
    }
    return ok;
}

void EventChannel::shutdown()
{
    std::function<void()> waiter;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
        events_.clear();
        waiter = takeWaiter();
        writable_.notify_all();
        readable_.notify_all();
    }
    if(waiter) {
        waiter();
    }
}

std::size_t EventChannel::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

bool EventChannel::closed() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}
}
