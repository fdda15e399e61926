#include "voice_orchestrator/utils/clock.hpp"

namespace voice_orchestrator::utils {

Clock::TimePoint SystemClock::now() const {
    return std::chrono::steady_clock::now();
}

int64_t SystemClock::wall_time_ms() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::shared_ptr<Clock> SystemClock::shared() {
    static const auto clock = std::make_shared<SystemClock>();
    return clock;
}

double elapsed_ms(Clock::TimePoint start, Clock::TimePoint end) {
    return std::chrono::duration<double, std::milli>(end - start).count();
}

}
