#include "voice_orchestrator/call/event.hpp"

#include <utility>

namespace voice_orchestrator {

namespace {

Event make(EventType type) {
    Event event;
    event.type = type;
    return event;
}

}

const char* to_string(EventType type) {
    switch (type) {
        case EventType::CallStarted:
            return "call_started";
        case EventType::SpeechStart:
            return "speech_start";
        case EventType::SpeechEnd:
            return "speech_end";
        case EventType::SilenceFor:
            return "silence_for";
        case EventType::AsrPartial:
            return "asr_partial";
        case EventType::AsrFinal:
            return "asr_final";
        case EventType::TtsStart:
            return "tts_start";
        case EventType::TtsEnd:
            return "tts_end";
        case EventType::InactivityElapsed:
            return "inactivity_elapsed";
        case EventType::ReplyReady:
            return "reply_ready";
        case EventType::ReplyFailed:
            return "reply_failed";
        case EventType::ConfigPatchApplied:
            return "config_patch_applied";
        case EventType::AdapterFailed:
            return "adapter_failed";
        case EventType::CallEndRequested:
            return "call_end_requested";
        case EventType::PersistFinished:
            return "persist_finished";
    }
    return "unknown";
}

Event Event::call_started() {
    return make(EventType::CallStarted);
}

Event Event::speech_start() {
    return make(EventType::SpeechStart);
}

Event Event::speech_end() {
    return make(EventType::SpeechEnd);
}

Event Event::silence_for(int64_t ms) {
    auto event = make(EventType::SilenceFor);
    event.silence_ms = ms;
    return event;
}

Event Event::asr_partial(std::string text) {
    auto event = make(EventType::AsrPartial);
    event.text = std::move(text);
    return event;
}

Event Event::asr_final(std::string text) {
    auto event = make(EventType::AsrFinal);
    event.text = std::move(text);
    return event;
}

Event Event::tts_start() {
    return make(EventType::TtsStart);
}

Event Event::tts_end() {
    return make(EventType::TtsEnd);
}

Event Event::inactivity_elapsed(uint64_t generation) {
    auto event = make(EventType::InactivityElapsed);
    event.token = generation;
    return event;
}

Event Event::reply_ready(uint64_t turn_id,
                         std::string text,
                         std::size_t chunk_count,
                         Branch branch) {
    auto event = make(EventType::ReplyReady);
    event.token = turn_id;
    event.text = std::move(text);
    event.chunk_count = chunk_count;
    event.branch = branch;
    return event;
}

Event Event::reply_failed(uint64_t turn_id, std::string error, bool circuit_open) {
    auto event = make(EventType::ReplyFailed);
    event.token = turn_id;
    event.text = std::move(error);
    event.circuit_open = circuit_open;
    return event;
}

Event Event::config_patch_applied(ConfigPatch patch) {
    auto event = make(EventType::ConfigPatchApplied);
    event.patch = std::move(patch);
    return event;
}

Event Event::adapter_failed(std::string source, std::string error) {
    auto event = make(EventType::AdapterFailed);
    event.source = std::move(source);
    event.text = std::move(error);
    return event;
}

Event Event::call_end_requested(std::string reason) {
    auto event = make(EventType::CallEndRequested);
    event.source = std::move(reason);
    return event;
}

Event Event::persist_finished(bool success, std::string error) {
    auto event = make(EventType::PersistFinished);
    event.success = success;
    event.text = std::move(error);
    return event;
}

}
