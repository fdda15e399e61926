#include "voice_orchestrator/config.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace voice_orchestrator {

namespace {

const std::vector<std::string> kDefaultRetryableMarkers = {
    "429", "quota", "resource has been exhausted", "rate limit",
    "timeout", "network", "connection", "server error", "500", "502", "503", "504",
    "temporarily unavailable", "overloaded", "busy"};

std::string get_env_str(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : fallback;
}

std::optional<std::string> get_env_optional(const char* name) {
    const char* value = std::getenv(name);
    if (!value) {
        return std::nullopt;
    }
    std::string result(value);
    if (result.empty()) {
        return std::nullopt;
    }
    return result;
}

std::string get_env_required(const char* name) {
    const char* value = std::getenv(name);
    if (!value || std::string(value).empty()) {
        throw std::runtime_error(std::string(name) + " is required");
    }
    return std::string(value);
}

bool get_env_bool(const char* name, bool fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    std::string normalized(value);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return normalized == "true";
}

int get_env_int(const char* name, int fallback) {
    const char* value = std::getenv(name);
    return value ? std::stoi(value) : fallback;
}

double get_env_double(const char* name, double fallback) {
    const char* value = std::getenv(name);
    return value ? std::stod(value) : fallback;
}

std::string trim(std::string value) {
    auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
                                            [&](unsigned char ch) { return !is_space(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
                             [&](unsigned char ch) { return !is_space(ch); }).base(),
                value.end());
    return value;
}

std::vector<std::string> split_csv(const std::string& raw) {
    std::vector<std::string> result;
    std::stringstream stream(raw);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}

// Reads <PREFIX>MAX_RETRIES, <PREFIX>INITIAL_DELAY_MS, ... on top of the given defaults.
RetryConfig load_retry_config(const std::string& prefix, RetryConfig defaults) {
    auto name = [&prefix](const char* suffix) { return prefix + suffix; };
    RetryConfig config = defaults;
    config.max_retries = get_env_int(name("MAX_RETRIES").c_str(), defaults.max_retries);
    config.initial_delay_ms =
        get_env_int(name("INITIAL_DELAY_MS").c_str(), defaults.initial_delay_ms);
    config.max_delay_ms = get_env_int(name("MAX_DELAY_MS").c_str(), defaults.max_delay_ms);
    config.backoff_multiplier =
        get_env_double(name("BACKOFF_MULTIPLIER").c_str(), defaults.backoff_multiplier);
    const auto markers = get_env_str(name("RETRYABLE_ERRORS").c_str(), "");
    config.retryable_error_markers =
        markers.empty() ? kDefaultRetryableMarkers : split_csv(markers);
    config.circuit_breaker_threshold = get_env_int(name("CIRCUIT_BREAKER_THRESHOLD").c_str(),
                                                   defaults.circuit_breaker_threshold);
    config.circuit_breaker_timeout_ms = get_env_int(name("CIRCUIT_BREAKER_TIMEOUT_MS").c_str(),
                                                    defaults.circuit_breaker_timeout_ms);
    return config;
}

void validate_retry_config(const std::string& prefix, const RetryConfig& config) {
    if (config.max_retries <= 0) {
        throw std::runtime_error(prefix + "MAX_RETRIES must be positive");
    }
    if (config.initial_delay_ms < 0 || config.max_delay_ms < 0) {
        throw std::runtime_error(prefix + "delays must be zero or positive");
    }
    if (config.backoff_multiplier < 1.0) {
        throw std::runtime_error(prefix + "BACKOFF_MULTIPLIER must be at least 1");
    }
    if (config.circuit_breaker_threshold <= 0) {
        throw std::runtime_error(prefix + "CIRCUIT_BREAKER_THRESHOLD must be positive");
    }
    if (config.circuit_breaker_timeout_ms < 0) {
        throw std::runtime_error(prefix + "CIRCUIT_BREAKER_TIMEOUT_MS must be zero or positive");
    }
}

std::string timestamp_suffix() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_value{};
#if defined(_WIN32)
    localtime_s(&tm_value, &time_t);
#else
    localtime_r(&time_t, &tm_value);
#endif
    std::ostringstream stream;
    stream << std::put_time(&tm_value, "%Y%m%d_%H%M%S");
    return stream.str();
}

void set_env_value(const std::string& key, const std::string& value) {
#if defined(_WIN32)
    _putenv_s(key.c_str(), value.c_str());
#else
    setenv(key.c_str(), value.c_str(), 1);
#endif
}

std::string strip_quotes(std::string value) {
    if (value.size() < 2) {
        return value;
    }
    if ((value.front() == '"' && value.back() == '"') ||
        (value.front() == '\'' && value.back() == '\'')) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

void load_dotenv() {
    const std::filesystem::path dotenv_path = std::filesystem::current_path() / ".env";
    if (!std::filesystem::exists(dotenv_path)) {
        return;
    }

    std::ifstream stream(dotenv_path);
    if (!stream.is_open()) {
        return;
    }

    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line.rfind("#", 0) == 0) {
            continue;
        }

        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        const auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));
        if (key.empty()) {
            continue;
        }
        // Variables already present in the environment win over .env.
        if (std::getenv(key.c_str())) {
            continue;
        }
        set_env_value(key, strip_quotes(value));
    }
}

}

Config Config::load() {
    load_dotenv();
    Config config;
    const auto cwd = std::filesystem::current_path();

    config.log_level = get_env_str("LOG_LEVEL", "INFO");
    const auto log_filename_raw = get_env_str("LOG_FILENAME", "");
    if (!log_filename_raw.empty()) {
        const std::filesystem::path log_path(log_filename_raw);
        const auto stamped = log_path.stem().string() + "_" + timestamp_suffix() +
                             log_path.extension().string();
        if (const auto log_dir = get_env_optional("LOGS_DIR")) {
            config.logs_dir = std::filesystem::path(*log_dir);
            config.log_filename = (std::filesystem::path(*log_dir) / stamped).string();
        } else {
            config.log_filename = stamped;
        }
    }
    config.log_name = get_env_str("LOG_NAME", "voice_orchestrator");

    config.rest_api_port = get_env_int("REST_API_PORT", 8000);
    config.authorization_token = get_env_optional("AUTHORIZATION_TOKEN");

    config.media_bridge_url = get_env_required("MEDIA_BRIDGE_URL");
    config.media_bridge_connect_timeout_ms = get_env_int("MEDIA_BRIDGE_CONNECT_TIMEOUT_MS", 5000);
    config.kb_service_url = get_env_required("KB_SERVICE_URL");
    config.reply_service_url = get_env_optional("REPLY_SERVICE_URL");
    config.persist_service_url = get_env_required("PERSIST_SERVICE_URL");
    config.http_connect_timeout = get_env_double("HTTP_CONNECT_TIMEOUT", 10.0);
    config.http_read_timeout = get_env_double("HTTP_READ_TIMEOUT", 30.0);
    config.http_write_timeout = get_env_double("HTTP_WRITE_TIMEOUT", 30.0);

    config.barge_in_enabled = get_env_bool("BARGE_IN_ENABLED", true);
    config.silence_trigger_ms = get_env_int("SILENCE_TRIGGER_MS", 50);
    config.vad_hangover_ms = get_env_int("VAD_HANGOVER_MS", 60);
    config.min_speech_ms = get_env_int("MIN_SPEECH_MS", 80);
    config.inactivity_ms = get_env_int("INACTIVITY_MS", 3000);
    config.max_reminders = get_env_int("MAX_REMINDERS", 1);
    config.reminder_cooldown_ms = get_env_int("REMINDER_COOLDOWN_MS", 2000);
    config.kb_auto_retrieve = get_env_bool("KB_AUTO_RETRIEVE", true);
    config.kb_rerank = get_env_bool("KB_RERANK", true);
    config.kb_max_chunks = get_env_int("KB_MAX_CHUNKS", 6);
    config.transcript_color_coding = get_env_bool("TRANSCRIPT_COLOR_CODING", true);

    config.reminder_text = get_env_str("REMINDER_TEXT", config.reminder_text);
    config.fallback_text = get_env_str("FALLBACK_TEXT", config.fallback_text);
    config.busy_fallback_text = get_env_str("BUSY_FALLBACK_TEXT", config.busy_fallback_text);
    config.router_fallback_branch = get_env_str("ROUTER_FALLBACK_BRANCH", "sales_pitch");

    config.tts_stop_timeout_ms = get_env_int("TTS_STOP_TIMEOUT_MS", 500);
    config.max_tts_stop_failures = get_env_int("MAX_TTS_STOP_FAILURES", 3);
    config.max_consecutive_turn_failures = get_env_int("MAX_CONSECUTIVE_TURN_FAILURES", 3);

    // Per-turn operations must give up quickly; the caller is waiting on the line.
    RetryConfig turn_defaults;
    turn_defaults.max_retries = 3;
    turn_defaults.initial_delay_ms = 200;
    turn_defaults.max_delay_ms = 2000;
    turn_defaults.circuit_breaker_threshold = 5;
    turn_defaults.circuit_breaker_timeout_ms = 30000;
    config.kb_retry = load_retry_config("KB_RETRY_", turn_defaults);
    config.reply_retry = load_retry_config("REPLY_RETRY_", turn_defaults);

    RetryConfig persist_defaults;
    persist_defaults.max_retries = 10;
    persist_defaults.initial_delay_ms = 1000;
    persist_defaults.max_delay_ms = 60000;
    persist_defaults.circuit_breaker_threshold = 10;
    persist_defaults.circuit_breaker_timeout_ms = 60000;
    config.persist_retry = load_retry_config("PERSIST_RETRY_", persist_defaults);

    config.summary_spool_dir = get_env_str("SUMMARY_SPOOL_DIR", (cwd / "spool").string());
    config.shutdown_grace_ms = get_env_int("SHUTDOWN_GRACE_MS", 10000);

    return config;
}

void Config::validate() const {
    if (media_bridge_url.empty()) {
        throw std::runtime_error("MEDIA_BRIDGE_URL is required");
    }
    if (kb_service_url.empty()) {
        throw std::runtime_error("KB_SERVICE_URL is required");
    }
    if (persist_service_url.empty()) {
        throw std::runtime_error("PERSIST_SERVICE_URL is required");
    }
    if (rest_api_port <= 0) {
        throw std::runtime_error("REST_API_PORT must be positive");
    }
    if (silence_trigger_ms < 0 || vad_hangover_ms < 0 || min_speech_ms < 0) {
        throw std::runtime_error("turn-taking thresholds must be zero or positive");
    }
    if (inactivity_ms <= 0) {
        throw std::runtime_error("INACTIVITY_MS must be positive");
    }
    if (max_reminders < 0) {
        throw std::runtime_error("MAX_REMINDERS must be zero or positive");
    }
    if (kb_max_chunks <= 0) {
        throw std::runtime_error("KB_MAX_CHUNKS must be positive");
    }
    if (router_fallback_branch != "sales_pitch" && router_fallback_branch != "support_faq") {
        throw std::runtime_error("ROUTER_FALLBACK_BRANCH must be sales_pitch or support_faq");
    }
    if (media_bridge_connect_timeout_ms <= 0) {
        throw std::runtime_error("MEDIA_BRIDGE_CONNECT_TIMEOUT_MS must be positive");
    }
    if (shutdown_grace_ms < 0) {
        throw std::runtime_error("SHUTDOWN_GRACE_MS must be zero or positive");
    }
    if (tts_stop_timeout_ms <= 0) {
        throw std::runtime_error("TTS_STOP_TIMEOUT_MS must be positive");
    }
    if (max_tts_stop_failures <= 0) {
        throw std::runtime_error("MAX_TTS_STOP_FAILURES must be positive");
    }
    if (max_consecutive_turn_failures <= 0) {
        throw std::runtime_error("MAX_CONSECUTIVE_TURN_FAILURES must be positive");
    }
    validate_retry_config("KB_RETRY_", kb_retry);
    validate_retry_config("REPLY_RETRY_", reply_retry);
    validate_retry_config("PERSIST_RETRY_", persist_retry);
}

}
