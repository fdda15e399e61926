#include <catch2/catch_test_macros.hpp>

#include "voice_orchestrator/call/config_controller.hpp"
#include "voice_orchestrator/config.hpp"

#include <cstdlib>
#include <string>
#include <vector>

using namespace voice_orchestrator;
using nlohmann::json;

TEST_CASE("nested patch body updates the named thresholds") {
    const auto patch = ConfigPatch::from_json(json::parse(R"({
        "bargeIn": false,
        "turnTaking": {"silenceDetection": {"appliedValueMs": 90, "vadHangoverMs": 40}},
        "inactivity": {"reminderMs": 5000, "reminderMaxRepeats": 2},
        "kb": {"maxChunks": 3}
    })"));

    ConfigController controller;
    const auto changed = controller.apply(patch);
    const auto settings = controller.settings();
    REQUIRE_FALSE(settings.barge_in);
    REQUIRE(settings.silence_threshold_ms() == 130);
    REQUIRE(settings.inactivity_ms == 5000);
    REQUIRE(settings.max_reminders == 2);
    REQUIRE(settings.kb_max_chunks == 3);
    REQUIRE(settings.min_speech_ms == 80);
    REQUIRE(changed.size() == 6);
}

TEST_CASE("applying the same patch twice changes nothing the second time") {
    const auto patch = ConfigPatch::from_json(json{{"kb", {{"rerank", false}}}});
    ConfigController controller;
    REQUIRE(controller.apply(patch) == std::vector<std::string>{"kb.rerank"});
    const auto first = controller.settings();

    REQUIRE(controller.apply(patch).empty());
    REQUIRE(controller.settings() == first);
}

TEST_CASE("voiceAgent wrapper is unwrapped") {
    const auto patch =
        ConfigPatch::from_json(json{{"voiceAgent", {{"ui", {{"transcript", {{"colorCoding", false}}}}}}}});
    REQUIRE(patch.transcript_color_coding == std::optional<bool>(false));
    REQUIRE_FALSE(patch.barge_in);
}

TEST_CASE("unknown fields are rejected with their path") {
    REQUIRE_THROWS_AS(ConfigPatch::from_json(json{{"volume", 3}}), ConfigPatchError);
    try {
        ConfigPatch::from_json(json{{"kb", {{"topK", 3}}}});
        FAIL("expected ConfigPatchError");
    } catch (const ConfigPatchError& ex) {
        REQUIRE(std::string(ex.what()) == "unknown config field: kb.topK");
    }
}

TEST_CASE("wrong types and out-of-range values are rejected") {
    REQUIRE_THROWS_AS(ConfigPatch::from_json(json{{"bargeIn", "yes"}}), ConfigPatchError);
    REQUIRE_THROWS_AS(ConfigPatch::from_json(json{{"kb", {{"maxChunks", 0}}}}), ConfigPatchError);
    REQUIRE_THROWS_AS(ConfigPatch::from_json(json{{"inactivity", {{"reminderMs", 1.5}}}}),
                      ConfigPatchError);
    REQUIRE_THROWS_AS(ConfigPatch::from_json(json::array()), ConfigPatchError);
}

TEST_CASE("patch serializes back to the nested wire form") {
    ConfigPatch patch;
    patch.min_speech_ms = 120;
    patch.kb_auto_retrieve = false;
    const auto body = patch.to_json();
    REQUIRE(body["turnTaking"]["silenceDetection"]["minSpeechMs"] == 120);
    REQUIRE(body["kb"]["autoRetrieve"] == false);
    REQUIRE(ConfigPatch::from_json(body).min_speech_ms == std::optional<int>(120));
    REQUIRE(ConfigPatch{}.empty());
}

TEST_CASE("config loads service urls and retry overrides from the environment") {
    setenv("MEDIA_BRIDGE_URL", "http://bridge:9000", 1);
    setenv("KB_SERVICE_URL", "http://kb:8080", 1);
    setenv("PERSIST_SERVICE_URL", "http://store:8081/api", 1);
    setenv("SILENCE_TRIGGER_MS", "70", 1);
    setenv("KB_RETRY_MAX_RETRIES", "2", 1);
    setenv("PERSIST_RETRY_RETRYABLE_ERRORS", "503, timeout", 1);
    setenv("SHUTDOWN_GRACE_MS", "2500", 1);

    const auto config = Config::load();
    REQUIRE_NOTHROW(config.validate());
    REQUIRE(config.media_bridge_url == "http://bridge:9000");
    REQUIRE(config.silence_trigger_ms == 70);
    REQUIRE(config.kb_retry.max_retries == 2);
    REQUIRE(config.reply_retry.max_retries == 3);
    REQUIRE(config.persist_retry.max_retries == 10);
    REQUIRE(config.persist_retry.retryable_error_markers ==
            std::vector<std::string>{"503", "timeout"});
    REQUIRE(TurnSettings::from_config(config).silence_trigger_ms == 70);
    REQUIRE(config.shutdown_grace_ms == 2500);
    REQUIRE(config.media_bridge_connect_timeout_ms == 5000);

    unsetenv("SHUTDOWN_GRACE_MS");
    unsetenv("SILENCE_TRIGGER_MS");
    unsetenv("KB_RETRY_MAX_RETRIES");
    unsetenv("PERSIST_RETRY_RETRYABLE_ERRORS");
}

TEST_CASE("config validation rejects an unknown fallback branch") {
    Config config;
    config.media_bridge_url = "http://bridge";
    config.kb_service_url = "http://kb";
    config.persist_service_url = "http://store";
    REQUIRE_NOTHROW(config.validate());
    config.router_fallback_branch = "billing";
    REQUIRE_THROWS_AS(config.validate(), std::runtime_error);
}

TEST_CASE("config validation rejects non-positive bridge connect timeouts") {
    Config config;
    config.media_bridge_url = "http://bridge";
    config.kb_service_url = "http://kb";
    config.persist_service_url = "http://store";
    config.shutdown_grace_ms = 0;
    REQUIRE_NOTHROW(config.validate());
    config.media_bridge_connect_timeout_ms = 0;
    REQUIRE_THROWS_AS(config.validate(), std::runtime_error);
}
