#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace grid {

// Named periodic callbacks on one background thread.
class Scheduler {
public:
    using Task = std::function<void()>;

    Scheduler() = default;
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // First run happens one interval after start().
    void add_task(std::string name, std::chrono::milliseconds interval, Task task);

    void start();
    void stop();

    // Runs every task whose deadline has passed; used by the worker thread.
    std::size_t run_due(std::chrono::steady_clock::time_point now);

    std::vector<std::string> task_names() const;

private:
    struct Entry {
        std::string name;
        std::chrono::milliseconds interval;
        Task task;
        std::chrono::steady_clock::time_point next_run;
    };

    void worker();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Entry> entries_;
    std::thread thread_;
    bool running_ = false;
};

} // namespace grid
