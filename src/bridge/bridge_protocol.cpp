#include "voice_orchestrator/bridge/bridge_protocol.hpp"

#include <stdexcept>

namespace voice_orchestrator::bridge {

namespace {

std::string require_string(const nlohmann::json& payload,
                           const std::string& type,
                           const char* field) {
    const auto it = payload.find(field);
    if (it == payload.end() || !it->is_string()) {
        throw std::invalid_argument(type + " message requires string field '" + field + "'");
    }
    return it->get<std::string>();
}

InboundMessage event_message(std::string type, Event event) {
    InboundMessage message;
    message.kind = MessageKind::Event;
    message.type = std::move(type);
    message.event = std::move(event);
    return message;
}

}

InboundMessage parse_message(const nlohmann::json& payload) {
    if (!payload.is_object()) {
        throw std::invalid_argument("media bridge message must be a JSON object");
    }
    const std::string type = payload.value("type", "");

    if (type == "speech_start") {
        return event_message(type, Event::speech_start());
    }
    if (type == "speech_end") {
        return event_message(type, Event::speech_end());
    }
    if (type == "silence") {
        const auto it = payload.find("ms");
        if (it == payload.end() || !it->is_number()) {
            throw std::invalid_argument("silence message requires numeric field 'ms'");
        }
        return event_message(type, Event::silence_for(it->get<int64_t>()));
    }
    if (type == "asr_partial") {
        return event_message(type, Event::asr_partial(require_string(payload, type, "text")));
    }
    if (type == "asr_final") {
        return event_message(type, Event::asr_final(require_string(payload, type, "text")));
    }
    if (type == "tts_start") {
        return event_message(type, Event::tts_start());
    }
    if (type == "tts_end") {
        return event_message(type, Event::tts_end());
    }
    if (type == "hangup") {
        return event_message(type, Event::call_end_requested(payload.value("reason", "hangup")));
    }
    if (type == "error") {
        return event_message(type, Event::adapter_failed(payload.value("source", "media_bridge"),
                                                         payload.value("message", "unknown error")));
    }
    if (type == "tts_stopped") {
        InboundMessage message;
        message.kind = MessageKind::TtsStopped;
        message.type = type;
        message.stop_id = payload.value("id", static_cast<uint64_t>(0));
        return message;
    }

    InboundMessage message;
    message.type = type;
    return message;
}

nlohmann::json speak_command(const std::string& text) {
    return {{"type", "speak"}, {"text", text}};
}

nlohmann::json tts_stop_command(uint64_t stop_id) {
    return {{"type", "tts_stop"}, {"id", stop_id}};
}

nlohmann::json asr_resume_command() {
    return {{"type", "asr_resume"}};
}

nlohmann::json vad_hints_command(bool aec, bool ns, bool agc) {
    return {{"type", "vad_hints"}, {"aec", aec}, {"ns", ns}, {"agc", agc}};
}

}
