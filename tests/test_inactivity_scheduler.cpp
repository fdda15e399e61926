#include <catch2/catch_test_macros.hpp>

#include "support/fakes.hpp"
#include "voice_orchestrator/call/inactivity_scheduler.hpp"

#include <chrono>
#include <vector>

using namespace voice_orchestrator;
using namespace voice_orchestrator::testing;
using std::chrono::milliseconds;

namespace {

struct SchedulerFixture {
    SchedulerFixture()
        : clock(std::make_shared<FakeClock>()),
          timers(std::make_shared<ManualTimerService>(clock)),
          scheduler(timers, [this](uint64_t generation) { fired.push_back(generation); }) {}

    std::shared_ptr<FakeClock> clock;
    std::shared_ptr<ManualTimerService> timers;
    InactivityScheduler scheduler;
    ReminderState state;
    std::vector<uint64_t> fired;
};

}

TEST_CASE("armed timer fires once after the delay") {
    SchedulerFixture f;
    f.scheduler.arm(f.state, milliseconds(3000));
    REQUIRE(f.scheduler.is_armed(f.state));

    f.timers->advance(milliseconds(2999));
    REQUIRE(f.fired.empty());
    f.timers->advance(milliseconds(1));
    REQUIRE(f.fired.size() == 1);
    REQUIRE(f.scheduler.accept_fire(f.state, f.fired.front()));
    REQUIRE_FALSE(f.scheduler.is_armed(f.state));
    REQUIRE_FALSE(f.scheduler.accept_fire(f.state, f.fired.front()));
}

TEST_CASE("re-arming cancels the previous timer") {
    SchedulerFixture f;
    f.scheduler.arm(f.state, milliseconds(1000));
    f.timers->advance(milliseconds(500));
    f.scheduler.arm(f.state, milliseconds(1000));

    f.timers->advance(milliseconds(600));
    REQUIRE(f.fired.empty());
    REQUIRE(f.timers->pending() == 1);
    f.timers->advance(milliseconds(400));
    REQUIRE(f.fired.size() == 1);
}

TEST_CASE("fire from a cleared timer is stale") {
    SchedulerFixture f;
    f.scheduler.arm(f.state, milliseconds(100));
    const auto armed_generation = f.state.generation;
    f.scheduler.clear(f.state);

    REQUIRE_FALSE(f.scheduler.accept_fire(f.state, armed_generation));
    REQUIRE(f.timers->pending() == 0);
}

TEST_CASE("reminder cap is enforced and reset restores it") {
    SchedulerFixture f;
    f.scheduler.set_max_reminders(f.state, 2);
    REQUIRE(f.scheduler.can_remind(f.state));
    f.scheduler.record_reminder(f.state);
    f.scheduler.record_reminder(f.state);
    f.scheduler.record_reminder(f.state);
    REQUIRE(f.state.reminders_sent == 2);
    REQUIRE_FALSE(f.scheduler.can_remind(f.state));

    f.scheduler.reset(f.state);
    REQUIRE(f.scheduler.can_remind(f.state));
}

TEST_CASE("zero reminders disables reminding") {
    SchedulerFixture f;
    f.scheduler.set_max_reminders(f.state, -1);
    REQUIRE(f.state.max_reminders == 0);
    REQUIRE_FALSE(f.scheduler.can_remind(f.state));
}
