#pragma once

#include <optional>
#include <string>
#include <vector>

#include "voice_orchestrator/backend/http_client.hpp"
#include "voice_orchestrator/call/types.hpp"

namespace voice_orchestrator {

struct KbQuery {
    std::string product;
    // Unset means every document mapped to the product.
    std::optional<std::vector<std::string>> selected_ids;
    int max_chunks = 6;
    bool rerank = true;
};

class KnowledgeBase {
public:
    virtual ~KnowledgeBase() = default;

    virtual std::vector<KbChunk> retrieve(const KbQuery& query) = 0;
};

// POST {base}/retrieve {product, selected_ids?, max, rerank} -> {chunks: [{id, text}]}
class HttpKnowledgeBase : public KnowledgeBase {
public:
    HttpKnowledgeBase(std::string base_url,
                      std::optional<std::string> authorization_token,
                      HttpRequestOptions options);

    std::vector<KbChunk> retrieve(const KbQuery& query) override;

private:
    std::string base_url_;
    std::optional<std::string> authorization_token_;
    HttpRequestOptions options_;
};

}
