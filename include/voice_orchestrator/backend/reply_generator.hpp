#pragma once

#include <optional>
#include <string>
#include <vector>

#include "voice_orchestrator/backend/http_client.hpp"
#include "voice_orchestrator/call/types.hpp"

namespace voice_orchestrator {

struct ReplyRequest {
    std::string utterance;
    std::vector<KbChunk> chunks;
    Branch branch = Branch::SalesPitch;
    std::string product;
};

class ReplyGenerator {
public:
    virtual ~ReplyGenerator() = default;

    virtual std::string generate(const ReplyRequest& request) = 0;
};

// POST {base}/reply -> {reply}
class HttpReplyGenerator : public ReplyGenerator {
public:
    HttpReplyGenerator(std::string base_url,
                       std::optional<std::string> authorization_token,
                       HttpRequestOptions options);

    std::string generate(const ReplyRequest& request) override;

private:
    std::string base_url_;
    std::optional<std::string> authorization_token_;
    HttpRequestOptions options_;
};

// Fixed grounded replies naming the number of retrieved documents.
class TemplateReplyGenerator : public ReplyGenerator {
public:
    std::string generate(const ReplyRequest& request) override;
};

}
