#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "voice_orchestrator/call/config_controller.hpp"
#include "voice_orchestrator/call/types.hpp"

namespace voice_orchestrator {

enum class EventType {
    CallStarted,
    SpeechStart,
    SpeechEnd,
    SilenceFor,
    AsrPartial,
    AsrFinal,
    TtsStart,
    TtsEnd,
    InactivityElapsed,
    ReplyReady,
    ReplyFailed,
    ConfigPatchApplied,
    AdapterFailed,
    CallEndRequested,
    PersistFinished
};

const char* to_string(EventType type);

// Normalized message consumed by the call actor. Only the fields relevant to
// the event type are populated.
struct Event {
    EventType type = EventType::CallStarted;
    int64_t silence_ms = 0;
    std::string text;
    // Timer generation for InactivityElapsed, turn id for ReplyReady/ReplyFailed.
    uint64_t token = 0;
    std::size_t chunk_count = 0;
    std::optional<Branch> branch;
    bool circuit_open = false;
    bool success = false;
    std::string source;
    std::optional<ConfigPatch> patch;

    static Event call_started();
    static Event speech_start();
    static Event speech_end();
    static Event silence_for(int64_t ms);
    static Event asr_partial(std::string text);
    static Event asr_final(std::string text);
    static Event tts_start();
    static Event tts_end();
    static Event inactivity_elapsed(uint64_t generation);
    static Event reply_ready(uint64_t turn_id,
                             std::string text,
                             std::size_t chunk_count,
                             Branch branch);
    static Event reply_failed(uint64_t turn_id, std::string error, bool circuit_open);
    static Event config_patch_applied(ConfigPatch patch);
    static Event adapter_failed(std::string source, std::string error);
    static Event call_end_requested(std::string reason);
    static Event persist_finished(bool success, std::string error);
};

}
