#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>

namespace grid {

// Single-consumer task queue: producers post from any thread, one thread
// drains it, so handlers run to completion one after another.
class EventQueue {
public:
    using Event = std::function<void()>;

    void post(Event event);

    // Blocks, running events until stop() is called.
    void run();
    void stop();

    // Runs whatever is queued right now without blocking; returns the count.
    std::size_t run_pending();

    std::size_t size() const;

private:
    void execute(Event& event);

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Event> events_;
    bool stopped_ = false;
};

} // namespace grid
