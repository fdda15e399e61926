#include "voice_orchestrator/backend/reply_generator.hpp"

#include <utility>

namespace voice_orchestrator {

HttpReplyGenerator::HttpReplyGenerator(std::string base_url,
                                       std::optional<std::string> authorization_token,
                                       HttpRequestOptions options)
    : base_url_(std::move(base_url)),
      authorization_token_(std::move(authorization_token)),
      options_(options) {}

std::string HttpReplyGenerator::generate(const ReplyRequest& request) {
    auto chunks = nlohmann::json::array();
    for (const auto& chunk : request.chunks) {
        chunks.push_back({{"id", chunk.id}, {"text", chunk.text}});
    }
    const nlohmann::json body = {
        {"utterance", request.utterance},
        {"chunks", chunks},
        {"branch", to_string(request.branch)},
        {"product", request.product},
    };

    HttpClient client(base_url_, authorization_token_, options_);
    const auto response = client.post_json("/reply", body);
    const auto reply = response.find("reply");
    if (reply == response.end() || !reply->is_string()) {
        throw HttpError(200, "Reply service response has no 'reply' string");
    }
    return reply->get<std::string>();
}

std::string TemplateReplyGenerator::generate(const ReplyRequest& request) {
    const auto count = std::to_string(request.chunks.size());
    if (request.branch == Branch::SalesPitch) {
        return "Here's the best plan for you. (Grounded on " + count +
               " KB docs.) Shall I proceed?";
    }
    return "Let's solve this. Based on " + count + " KB docs, here are the steps.";
}

}
