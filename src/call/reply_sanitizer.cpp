#include "voice_orchestrator/call/reply_sanitizer.hpp"

#include <utility>

#include "voice_orchestrator/utils/text.hpp"

namespace voice_orchestrator {

ReplySanitizer::ReplySanitizer() : banned_phrases_(default_banned_phrases()) {}

ReplySanitizer::ReplySanitizer(std::vector<std::string> banned_phrases)
    : banned_phrases_(std::move(banned_phrases)) {}

std::vector<std::string> ReplySanitizer::default_banned_phrases() {
    return {
        "should I use the knowledge base",
        "do you want me to check the KB",
        "I cannot access the KB unless you allow",
    };
}

std::string ReplySanitizer::sanitize(const std::string& text) const {
    auto cleaned = utils::remove_phrases(text, banned_phrases_);
    cleaned = utils::remove_emojis(cleaned);
    return utils::collapse_whitespace(cleaned);
}

}
