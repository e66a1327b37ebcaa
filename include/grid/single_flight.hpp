#pragma once

#include <mutex>
#include <utility>

namespace grid {

// Runs at most one task at a time. A caller arriving while a task is in flight
// is turned away instead of queueing behind it.
class SingleFlight {
public:
    template <typename Fn>
    bool try_run(Fn&& fn) {
        std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
        if (!lock.owns_lock()) {
            return false;
        }
        std::forward<Fn>(fn)();
        return true;
    }

    bool in_flight() const {
        std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
        return !lock.owns_lock();
    }

private:
    mutable std::mutex mutex_;
};

} // namespace grid
