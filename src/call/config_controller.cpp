#include "voice_orchestrator/call/config_controller.hpp"

#include <initializer_list>
#include <set>

namespace voice_orchestrator {

namespace {

using json = nlohmann::json;

void reject_unknown_keys(const json& object,
                         const std::string& path,
                         std::initializer_list<const char*> allowed) {
    if (!object.is_object()) {
        throw ConfigPatchError(path + " must be an object");
    }
    const std::set<std::string> known(allowed.begin(), allowed.end());
    for (auto it = object.begin(); it != object.end(); ++it) {
        if (known.count(it.key()) == 0) {
            throw ConfigPatchError("unknown config field: " +
                                   (path.empty() ? it.key() : path + "." + it.key()));
        }
    }
}

std::optional<bool> read_bool(const json& object, const char* key, const std::string& path) {
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_boolean()) {
        throw ConfigPatchError(path + "." + key + " must be a boolean");
    }
    return it->get<bool>();
}

std::optional<int> read_int(const json& object,
                            const char* key,
                            const std::string& path,
                            int min_value) {
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_number_integer()) {
        throw ConfigPatchError(path + "." + key + " must be an integer");
    }
    const auto value = it->get<long long>();
    if (value < min_value || value > 3600000) {
        throw ConfigPatchError(path + "." + key + " is out of range");
    }
    return static_cast<int>(value);
}

template <typename T>
bool assign(T& target, const std::optional<T>& value) {
    if (!value || target == *value) {
        return false;
    }
    target = *value;
    return true;
}

}

TurnSettings TurnSettings::from_config(const Config& config) {
    TurnSettings settings;
    settings.barge_in = config.barge_in_enabled;
    settings.silence_trigger_ms = config.silence_trigger_ms;
    settings.vad_hangover_ms = config.vad_hangover_ms;
    settings.min_speech_ms = config.min_speech_ms;
    settings.inactivity_ms = config.inactivity_ms;
    settings.max_reminders = config.max_reminders;
    settings.reminder_cooldown_ms = config.reminder_cooldown_ms;
    settings.kb_auto_retrieve = config.kb_auto_retrieve;
    settings.kb_rerank = config.kb_rerank;
    settings.kb_max_chunks = config.kb_max_chunks;
    settings.transcript_color_coding = config.transcript_color_coding;
    return settings;
}

json TurnSettings::to_json() const {
    return {
        {"bargeIn", barge_in},
        {"turnTaking",
         {{"silenceDetection",
           {{"appliedValueMs", silence_trigger_ms},
            {"vadHangoverMs", vad_hangover_ms},
            {"minSpeechMs", min_speech_ms}}}}},
        {"inactivity",
         {{"reminderMs", inactivity_ms},
          {"reminderMaxRepeats", max_reminders},
          {"cooldownMs", reminder_cooldown_ms}}},
        {"kb",
         {{"autoRetrieve", kb_auto_retrieve},
          {"rerank", kb_rerank},
          {"maxChunks", kb_max_chunks}}},
        {"ui", {{"transcript", {{"colorCoding", transcript_color_coding}}}}}};
}

bool TurnSettings::operator==(const TurnSettings& other) const {
    return barge_in == other.barge_in &&
           silence_trigger_ms == other.silence_trigger_ms &&
           vad_hangover_ms == other.vad_hangover_ms &&
           min_speech_ms == other.min_speech_ms &&
           inactivity_ms == other.inactivity_ms &&
           max_reminders == other.max_reminders &&
           reminder_cooldown_ms == other.reminder_cooldown_ms &&
           kb_auto_retrieve == other.kb_auto_retrieve &&
           kb_rerank == other.kb_rerank &&
           kb_max_chunks == other.kb_max_chunks &&
           transcript_color_coding == other.transcript_color_coding;
}

ConfigPatch ConfigPatch::from_json(const json& body) {
    const json* root = &body;
    if (body.is_object() && body.size() == 1 && body.contains("voiceAgent")) {
        root = &body.at("voiceAgent");
    }
    reject_unknown_keys(*root, "", {"bargeIn", "turnTaking", "inactivity", "kb", "ui"});

    ConfigPatch patch;
    patch.barge_in = read_bool(*root, "bargeIn", "config");

    if (const auto it = root->find("turnTaking"); it != root->end()) {
        reject_unknown_keys(*it, "turnTaking", {"silenceDetection"});
        if (const auto sd = it->find("silenceDetection"); sd != it->end()) {
            const std::string path = "turnTaking.silenceDetection";
            reject_unknown_keys(*sd, path, {"appliedValueMs", "vadHangoverMs", "minSpeechMs"});
            patch.silence_trigger_ms = read_int(*sd, "appliedValueMs", path, 0);
            patch.vad_hangover_ms = read_int(*sd, "vadHangoverMs", path, 0);
            patch.min_speech_ms = read_int(*sd, "minSpeechMs", path, 0);
        }
    }

    if (const auto it = root->find("inactivity"); it != root->end()) {
        reject_unknown_keys(*it, "inactivity", {"reminderMs", "reminderMaxRepeats", "cooldownMs"});
        patch.inactivity_ms = read_int(*it, "reminderMs", "inactivity", 1);
        patch.max_reminders = read_int(*it, "reminderMaxRepeats", "inactivity", 0);
        patch.reminder_cooldown_ms = read_int(*it, "cooldownMs", "inactivity", 0);
    }

    if (const auto it = root->find("kb"); it != root->end()) {
        reject_unknown_keys(*it, "kb", {"autoRetrieve", "rerank", "maxChunks"});
        patch.kb_auto_retrieve = read_bool(*it, "autoRetrieve", "kb");
        patch.kb_rerank = read_bool(*it, "rerank", "kb");
        patch.kb_max_chunks = read_int(*it, "maxChunks", "kb", 1);
    }

    if (const auto it = root->find("ui"); it != root->end()) {
        reject_unknown_keys(*it, "ui", {"transcript"});
        if (const auto tr = it->find("transcript"); tr != it->end()) {
            reject_unknown_keys(*tr, "ui.transcript", {"colorCoding"});
            patch.transcript_color_coding = read_bool(*tr, "colorCoding", "ui.transcript");
        }
    }

    return patch;
}

json ConfigPatch::to_json() const {
    json body = json::object();
    if (barge_in) body["bargeIn"] = *barge_in;
    if (silence_trigger_ms) {
        body["turnTaking"]["silenceDetection"]["appliedValueMs"] = *silence_trigger_ms;
    }
    if (vad_hangover_ms) {
        body["turnTaking"]["silenceDetection"]["vadHangoverMs"] = *vad_hangover_ms;
    }
    if (min_speech_ms) body["turnTaking"]["silenceDetection"]["minSpeechMs"] = *min_speech_ms;
    if (inactivity_ms) body["inactivity"]["reminderMs"] = *inactivity_ms;
    if (max_reminders) body["inactivity"]["reminderMaxRepeats"] = *max_reminders;
    if (reminder_cooldown_ms) body["inactivity"]["cooldownMs"] = *reminder_cooldown_ms;
    if (kb_auto_retrieve) body["kb"]["autoRetrieve"] = *kb_auto_retrieve;
    if (kb_rerank) body["kb"]["rerank"] = *kb_rerank;
    if (kb_max_chunks) body["kb"]["maxChunks"] = *kb_max_chunks;
    if (transcript_color_coding) {
        body["ui"]["transcript"]["colorCoding"] = *transcript_color_coding;
    }
    return body;
}

bool ConfigPatch::empty() const {
    return !barge_in && !silence_trigger_ms && !vad_hangover_ms && !min_speech_ms &&
           !inactivity_ms && !max_reminders && !reminder_cooldown_ms && !kb_auto_retrieve &&
           !kb_rerank && !kb_max_chunks && !transcript_color_coding;
}

ConfigController::ConfigController(TurnSettings initial) : settings_(initial) {}

std::vector<std::string> ConfigController::apply(const ConfigPatch& patch) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> changed;
    auto track = [&changed](bool updated, const char* name) {
        if (updated) {
            changed.emplace_back(name);
        }
    };
    track(assign(settings_.barge_in, patch.barge_in), "bargeIn");
    track(assign(settings_.silence_trigger_ms, patch.silence_trigger_ms),
          "turnTaking.silenceDetection.appliedValueMs");
    track(assign(settings_.vad_hangover_ms, patch.vad_hangover_ms),
          "turnTaking.silenceDetection.vadHangoverMs");
    track(assign(settings_.min_speech_ms, patch.min_speech_ms),
          "turnTaking.silenceDetection.minSpeechMs");
    track(assign(settings_.inactivity_ms, patch.inactivity_ms), "inactivity.reminderMs");
    track(assign(settings_.max_reminders, patch.max_reminders), "inactivity.reminderMaxRepeats");
    track(assign(settings_.reminder_cooldown_ms, patch.reminder_cooldown_ms),
          "inactivity.cooldownMs");
    track(assign(settings_.kb_auto_retrieve, patch.kb_auto_retrieve), "kb.autoRetrieve");
    track(assign(settings_.kb_rerank, patch.kb_rerank), "kb.rerank");
    track(assign(settings_.kb_max_chunks, patch.kb_max_chunks), "kb.maxChunks");
    track(assign(settings_.transcript_color_coding, patch.transcript_color_coding),
          "ui.transcript.colorCoding");
    return changed;
}

TurnSettings ConfigController::settings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}

}
