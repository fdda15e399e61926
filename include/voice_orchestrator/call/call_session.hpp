#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "voice_orchestrator/call/metrics_collector.hpp"
#include "voice_orchestrator/call/types.hpp"
#include "voice_orchestrator/utils/clock.hpp"
#include "voice_orchestrator/utils/timer.hpp"

namespace voice_orchestrator {

struct CallInfo {
    std::string call_id;
    std::optional<std::string> lead_id;
    std::string product;
    std::optional<std::vector<std::string>> selected_kb_ids;
    std::optional<std::string> audio_url;
    std::optional<std::string> transcript_url;
    std::optional<std::string> greeting;
};

struct ReminderState {
    int reminders_sent = 0;
    int max_reminders = 1;
    std::optional<utils::TimerService::TimerId> idle_timer_handle;
    // Bumped on every arm/clear; a fire carrying an older value is stale.
    uint64_t generation = 0;
};

// Append-only, chronologically ordered list of utterances.
class Transcript {
public:
    // Timestamps earlier than the last appended one are raised to it.
    const Utterance& append(Utterance utterance);

    const std::vector<Utterance>& utterances() const { return utterances_; }
    std::size_t size() const { return utterances_.size(); }
    bool empty() const { return utterances_.empty(); }
    std::size_t count(Role role) const;

    nlohmann::json to_json() const;

private:
    std::vector<Utterance> utterances_;
};

// Everything mutated across events of one call. Owned by its CallOrchestrator.
struct CallSession {
    CallInfo info;
    TurnState state = TurnState::Idle;
    Transcript transcript;
    MetricsCollector metrics;
    ReminderState reminders;

    bool user_speaking = false;
    bool awaiting_agent_turn = false;
    std::optional<utils::Clock::TimePoint> speech_started_at;
    std::string last_user_text;

    uint64_t last_turn_id = 0;
    std::optional<uint64_t> pending_turn;
    std::optional<utils::Clock::TimePoint> processing_started_at;

    int consecutive_turn_failures = 0;
    int tts_stop_failures = 0;
    bool error = false;
    std::string end_reason;
};

}
