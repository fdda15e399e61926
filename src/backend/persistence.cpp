#include "voice_orchestrator/backend/persistence.hpp"

#include <utility>

namespace voice_orchestrator {

namespace {

nlohmann::json optional_string(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

}

nlohmann::json CallSummaryPayload::to_json() const {
    return {
        {"call_id", call_id},
        {"lead_id", optional_string(lead_id)},
        {"audio_url", optional_string(audio_url)},
        {"transcript_url", optional_string(transcript_url)},
        {"summary", summary},
        {"metrics", metrics.to_json()},
        {"transcript", transcript},
        {"status", status},
        {"error", error},
    };
}

HttpPersistenceClient::HttpPersistenceClient(std::string base_url,
                                             std::optional<std::string> authorization_token,
                                             HttpRequestOptions options)
    : base_url_(std::move(base_url)),
      authorization_token_(std::move(authorization_token)),
      options_(options) {}

void HttpPersistenceClient::persist_call_summary(const CallSummaryPayload& payload) {
    HttpClient client(base_url_, authorization_token_, options_);
    client.post_json("/call-summaries", payload.to_json());
}

}
