#pragma once

#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "voice_orchestrator/config.hpp"

namespace voice_orchestrator {

class ConfigPatchError : public std::runtime_error {
public:
    explicit ConfigPatchError(const std::string& message) : std::runtime_error(message) {}
};

// Live thresholds consulted by the orchestrator at each decision point.
struct TurnSettings {
    bool barge_in = true;
    int silence_trigger_ms = 50;
    int vad_hangover_ms = 60;
    int min_speech_ms = 80;
    int inactivity_ms = 3000;
    int max_reminders = 1;
    int reminder_cooldown_ms = 2000;
    bool kb_auto_retrieve = true;
    bool kb_rerank = true;
    int kb_max_chunks = 6;
    bool transcript_color_coding = true;

    static TurnSettings from_config(const Config& config);

    int silence_threshold_ms() const { return silence_trigger_ms + vad_hangover_ms; }
    nlohmann::json to_json() const;

    bool operator==(const TurnSettings& other) const;
    bool operator!=(const TurnSettings& other) const { return !(*this == other); }
};

// Sparse diff: only engaged fields are applied.
struct ConfigPatch {
    std::optional<bool> barge_in;
    std::optional<int> silence_trigger_ms;
    std::optional<int> vad_hangover_ms;
    std::optional<int> min_speech_ms;
    std::optional<int> inactivity_ms;
    std::optional<int> max_reminders;
    std::optional<int> reminder_cooldown_ms;
    std::optional<bool> kb_auto_retrieve;
    std::optional<bool> kb_rerank;
    std::optional<int> kb_max_chunks;
    std::optional<bool> transcript_color_coding;

    /**
     * Parses the nested wire form
     * { bargeIn, turnTaking.silenceDetection, inactivity, kb, ui.transcript }.
     * An optional top-level "voiceAgent" wrapper is unwrapped. Unknown keys,
     * wrong types and out-of-range values throw ConfigPatchError naming the
     * offending field; nothing is returned in that case.
     */
    static ConfigPatch from_json(const nlohmann::json& body);
    nlohmann::json to_json() const;
    bool empty() const;
};

class ConfigController {
public:
    explicit ConfigController(TurnSettings initial = {});

    // Returns the dotted names of the fields whose value changed.
    std::vector<std::string> apply(const ConfigPatch& patch);
    TurnSettings settings() const;

private:
    mutable std::mutex mutex_;
    TurnSettings settings_;
};

}
