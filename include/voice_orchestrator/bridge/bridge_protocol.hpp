#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "voice_orchestrator/call/event.hpp"

namespace voice_orchestrator::bridge {

enum class MessageKind {
    Event,
    TtsStopped,
    Unknown
};

struct InboundMessage {
    MessageKind kind = MessageKind::Unknown;
    std::string type;
    std::optional<Event> event;
    // Sequence number echoed by tts_stopped.
    uint64_t stop_id = 0;
};

// Normalizes one media bridge message. Throws std::invalid_argument when a
// known message is missing a required field.
InboundMessage parse_message(const nlohmann::json& payload);

nlohmann::json speak_command(const std::string& text);
nlohmann::json tts_stop_command(uint64_t stop_id);
nlohmann::json asr_resume_command();
nlohmann::json vad_hints_command(bool aec, bool ns, bool agc);

}
