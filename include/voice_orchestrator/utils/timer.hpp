#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

namespace voice_orchestrator {
namespace utils {

class TimerService {
public:
    using TimerId = uint64_t;
    using Callback = std::function<void()>;

    virtual ~TimerService() = default;

    virtual TimerId schedule(std::chrono::milliseconds delay, Callback callback) = 0;
    // Cancelling an unknown or already fired timer is a no-op.
    virtual void cancel(TimerId id) = 0;
};

// One worker thread serving every one-shot timer of the process.
class ThreadTimerService : public TimerService {
public:
    ThreadTimerService();
    ~ThreadTimerService() override;

    ThreadTimerService(const ThreadTimerService&) = delete;
    ThreadTimerService& operator=(const ThreadTimerService&) = delete;

    TimerId schedule(std::chrono::milliseconds delay, Callback callback) override;
    void cancel(TimerId id) override;
    void stop();

private:
    struct Entry {
        TimerId id = 0;
        Callback callback;
    };

    void run_loop();

    std::mutex mutex_;
    std::condition_variable cv_;
    std::multimap<std::chrono::steady_clock::time_point, Entry> timers_;
    TimerId next_id_ = 0;
    bool running_ = true;
    std::thread worker_;
};

}
}
