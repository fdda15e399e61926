#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

#include "voice_orchestrator/call/call_session.hpp"
#include "voice_orchestrator/utils/timer.hpp"

namespace voice_orchestrator {

// Owns the single reminder timer of a call. Every method is invoked by the
// call actor while it processes an event; a timer fire is reported back
// through FireHandler (normally a push onto the call inbox) tagged with the
// generation it was armed under.
class InactivityScheduler {
public:
    using FireHandler = std::function<void(uint64_t generation)>;

    InactivityScheduler(std::shared_ptr<utils::TimerService> timers, FireHandler on_fire);

    void arm(ReminderState& state, std::chrono::milliseconds delay);
    void clear(ReminderState& state);
    bool is_armed(const ReminderState& state) const;

    // Consumes the fire when it belongs to the currently armed timer; stale
    // fires (timer replaced or cleared since) return false.
    bool accept_fire(ReminderState& state, uint64_t generation) const;

    bool can_remind(const ReminderState& state) const;
    void record_reminder(ReminderState& state) const;
    void reset(ReminderState& state) const;
    void set_max_reminders(ReminderState& state, int max_reminders) const;

private:
    std::shared_ptr<utils::TimerService> timers_;
    FireHandler on_fire_;
};

}
