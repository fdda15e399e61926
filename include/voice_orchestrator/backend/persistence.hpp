#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "voice_orchestrator/backend/http_client.hpp"
#include "voice_orchestrator/call/metrics_collector.hpp"

namespace voice_orchestrator {

struct CallSummaryPayload {
    std::string call_id;
    std::optional<std::string> lead_id;
    std::optional<std::string> audio_url;
    std::optional<std::string> transcript_url;
    std::string summary;
    MetricsSummary metrics;
    nlohmann::json transcript = nlohmann::json::array();
    std::string status = "completed";
    bool error = false;

    nlohmann::json to_json() const;
};

class PersistenceClient {
public:
    virtual ~PersistenceClient() = default;

    virtual void persist_call_summary(const CallSummaryPayload& payload) = 0;
};

// POST {base}/call-summaries
class HttpPersistenceClient : public PersistenceClient {
public:
    HttpPersistenceClient(std::string base_url,
                          std::optional<std::string> authorization_token,
                          HttpRequestOptions options);

    void persist_call_summary(const CallSummaryPayload& payload) override;

private:
    std::string base_url_;
    std::optional<std::string> authorization_token_;
    HttpRequestOptions options_;
};

}
