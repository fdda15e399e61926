#include "voice_orchestrator/utils/timer.hpp"

#include <exception>
#include <vector>

#include "voice_orchestrator/logging.hpp"

namespace voice_orchestrator::utils {

ThreadTimerService::ThreadTimerService()
    : worker_([this]() { run_loop(); }) {}

ThreadTimerService::~ThreadTimerService() {
    stop();
}

TimerService::TimerId ThreadTimerService::schedule(std::chrono::milliseconds delay,
                                                   Callback callback) {
    TimerId id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = ++next_id_;
        timers_.emplace(std::chrono::steady_clock::now() + delay,
                        Entry{id, std::move(callback)});
    }
    cv_.notify_one();
    return id;
}

void ThreadTimerService::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
        if (it->second.id == id) {
            timers_.erase(it);
            return;
        }
    }
}

void ThreadTimerService::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
        timers_.clear();
    }
    cv_.notify_one();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void ThreadTimerService::run_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        if (timers_.empty()) {
            cv_.wait(lock);
            continue;
        }
        const auto deadline = timers_.begin()->first;
        if (cv_.wait_until(lock, deadline) != std::cv_status::timeout) {
            // Woken by schedule/cancel/stop; re-evaluate the earliest deadline.
            continue;
        }

        std::vector<Callback> due;
        const auto now = std::chrono::steady_clock::now();
        while (!timers_.empty() && timers_.begin()->first <= now) {
            due.push_back(std::move(timers_.begin()->second.callback));
            timers_.erase(timers_.begin());
        }

        lock.unlock();
        for (auto& callback : due) {
            try {
                callback();
            } catch (const std::exception& ex) {
                logging::error(
                    "Timer callback failed",
                    {kv("error", ex.what())});
            }
        }
        lock.lock();
    }
}

}
