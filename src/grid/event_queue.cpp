#include "grid/event_queue.hpp"

#include <iostream>
#include <utility>

namespace grid {

void EventQueue::post(Event event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }
        events_.push_back(std::move(event));
    }
    cv_.notify_one();
}

void EventQueue::run() {
    while (true) {
        Event event;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stopped_ || !events_.empty(); });
            if (stopped_) {
                return;
            }
            event = std::move(events_.front());
            events_.pop_front();
        }
        execute(event);
    }
}

void EventQueue::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
        events_.clear();
    }
    cv_.notify_all();
}

std::size_t EventQueue::run_pending() {
    std::deque<Event> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(events_);
    }
    for (auto& event : batch) {
        execute(event);
    }
    return batch.size();
}

std::size_t EventQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

void EventQueue::execute(Event& event) {
    try {
        event();
    } catch (const std::exception& ex) {
        std::cerr << "[Strategy] Event handler failed: " << ex.what() << std::endl;
    }
}

} // namespace grid
