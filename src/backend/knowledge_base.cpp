#include "voice_orchestrator/backend/knowledge_base.hpp"

#include <utility>

namespace voice_orchestrator {

HttpKnowledgeBase::HttpKnowledgeBase(std::string base_url,
                                     std::optional<std::string> authorization_token,
                                     HttpRequestOptions options)
    : base_url_(std::move(base_url)),
      authorization_token_(std::move(authorization_token)),
      options_(options) {}

std::vector<KbChunk> HttpKnowledgeBase::retrieve(const KbQuery& query) {
    nlohmann::json body = {
        {"product", query.product},
        {"max", query.max_chunks},
        {"rerank", query.rerank},
    };
    if (query.selected_ids) {
        body["selected_ids"] = *query.selected_ids;
    }

    HttpClient client(base_url_, authorization_token_, options_);
    const auto response = client.post_json("/retrieve", body);
    const auto chunks = response.find("chunks");
    if (chunks == response.end() || !chunks->is_array()) {
        throw HttpError(200, "Knowledge base response has no 'chunks' array");
    }

    std::vector<KbChunk> result;
    for (const auto& item : *chunks) {
        if (static_cast<int>(result.size()) >= query.max_chunks) {
            break;
        }
        KbChunk chunk;
        chunk.id = item.value("id", "");
        chunk.text = item.value("text", "");
        result.push_back(std::move(chunk));
    }
    return result;
}

}
