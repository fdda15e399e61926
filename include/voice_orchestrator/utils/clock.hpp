#pragma once

#include <chrono>
#include <cstdint>
#include <memory>

namespace voice_orchestrator {
namespace utils {

class Clock {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    // Monotonic time, used for latency measurements.
    virtual TimePoint now() const = 0;
    // Milliseconds since the Unix epoch, used for transcript timestamps.
    virtual int64_t wall_time_ms() const = 0;
};

class SystemClock : public Clock {
public:
    TimePoint now() const override;
    int64_t wall_time_ms() const override;

    static std::shared_ptr<Clock> shared();
};

double elapsed_ms(Clock::TimePoint start, Clock::TimePoint end);

}
}
