#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace voice_orchestrator {

struct RetryConfig {
    int max_retries = 3;
    int initial_delay_ms = 1000;
    int max_delay_ms = 30000;
    double backoff_multiplier = 2.0;
    std::vector<std::string> retryable_error_markers;
    int circuit_breaker_threshold = 10;
    int circuit_breaker_timeout_ms = 60000;
};

struct Config {
    std::string log_level = "INFO";
    std::optional<std::string> log_filename;
    std::optional<std::filesystem::path> logs_dir;
    std::string log_name = "voice_orchestrator";

    int rest_api_port = 8000;
    std::optional<std::string> authorization_token;

    std::string media_bridge_url;
    int media_bridge_connect_timeout_ms = 5000;
    std::string kb_service_url;
    std::optional<std::string> reply_service_url;
    std::string persist_service_url;
    double http_connect_timeout = 10.0;
    double http_read_timeout = 30.0;
    double http_write_timeout = 30.0;

    bool barge_in_enabled = true;
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

    std::string reminder_text = "Just checking, shall I proceed?";
    std::string fallback_text = "Sorry, I ran into a problem there. Could you say that again?";
    std::string busy_fallback_text =
        "Sorry, our systems are busy right now. Please bear with me and try again in a moment.";
    std::string router_fallback_branch = "sales_pitch";

    int tts_stop_timeout_ms = 500;
    int max_tts_stop_failures = 3;
    int max_consecutive_turn_failures = 3;

    RetryConfig kb_retry;
    RetryConfig reply_retry;
    RetryConfig persist_retry;

    std::filesystem::path summary_spool_dir;
    int shutdown_grace_ms = 10000;

    static Config load();
    void validate() const;
};

}
