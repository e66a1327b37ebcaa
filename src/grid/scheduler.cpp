#include "grid/scheduler.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace grid {
namespace {

constexpr auto kMaxSleep = std::chrono::seconds(1);

} // namespace

Scheduler::~Scheduler() {
    stop();
}

void Scheduler::add_task(std::string name, std::chrono::milliseconds interval, Task task) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(Entry{std::move(name), interval, std::move(task),
                             std::chrono::steady_clock::now() + interval});
}

void Scheduler::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            return;
        }
        running_ = true;
        const auto now = std::chrono::steady_clock::now();
        for (auto& entry : entries_) {
            entry.next_run = now + entry.interval;
        }
    }
    thread_ = std::thread([this]() { worker(); });
}

void Scheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

std::size_t Scheduler::run_due(std::chrono::steady_clock::time_point now) {
    std::vector<std::pair<std::string, Task>> due;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& entry : entries_) {
            if (entry.next_run <= now) {
                due.emplace_back(entry.name, entry.task);
                entry.next_run = now + entry.interval;
            }
        }
    }

    for (auto& [name, task] : due) {
        try {
            task();
        } catch (const std::exception& ex) {
            std::cerr << "[Scheduler] Task " << name << " failed: " << ex.what() << std::endl;
        }
    }
    return due.size();
}

std::vector<std::string> Scheduler::task_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& entry : entries_) {
        names.push_back(entry.name);
    }
    return names;
}

void Scheduler::worker() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        auto wake = std::chrono::steady_clock::now() + kMaxSleep;
        for (const auto& entry : entries_) {
            wake = std::min(wake, entry.next_run);
        }
        cv_.wait_until(lock, wake, [this]() { return !running_; });
        if (!running_) {
            break;
        }
        lock.unlock();
        run_due(std::chrono::steady_clock::now());
        lock.lock();
    }
}

} // namespace grid
