#include "voice_orchestrator/call/inactivity_scheduler.hpp"

#include <algorithm>
#include <utility>

namespace voice_orchestrator {

InactivityScheduler::InactivityScheduler(std::shared_ptr<utils::TimerService> timers,
                                         FireHandler on_fire)
    : timers_(std::move(timers)),
      on_fire_(std::move(on_fire)) {}

void InactivityScheduler::arm(ReminderState& state, std::chrono::milliseconds delay) {
    clear(state);
    const auto generation = state.generation;
    auto on_fire = on_fire_;
    state.idle_timer_handle = timers_->schedule(delay, [on_fire, generation]() {
        if (on_fire) {
            on_fire(generation);
        }
    });
}

void InactivityScheduler::clear(ReminderState& state) {
    if (state.idle_timer_handle) {
        timers_->cancel(*state.idle_timer_handle);
        state.idle_timer_handle.reset();
    }
    ++state.generation;
}

bool InactivityScheduler::is_armed(const ReminderState& state) const {
    return state.idle_timer_handle.has_value();
}

bool InactivityScheduler::accept_fire(ReminderState& state, uint64_t generation) const {
    if (!state.idle_timer_handle || generation != state.generation) {
        return false;
    }
    state.idle_timer_handle.reset();
    return true;
}

bool InactivityScheduler::can_remind(const ReminderState& state) const {
    return state.reminders_sent < state.max_reminders;
}

void InactivityScheduler::record_reminder(ReminderState& state) const {
    state.reminders_sent = std::min(state.reminders_sent + 1, state.max_reminders);
}

void InactivityScheduler::reset(ReminderState& state) const {
    state.reminders_sent = 0;
}

void InactivityScheduler::set_max_reminders(ReminderState& state, int max_reminders) const {
    state.max_reminders = std::max(0, max_reminders);
}

}
