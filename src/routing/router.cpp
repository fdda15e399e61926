#include "voice_orchestrator/routing/router.hpp"

#include "voice_orchestrator/utils/text.hpp"

namespace voice_orchestrator {

KeywordRouter::KeywordRouter(Branch fallback)
    : fallback_(fallback),
      sales_("renewal|price|discount|plan|upgrade|offer|payment|subscribe",
             std::regex::ECMAScript | std::regex::optimize),
      support_("login|otp|error|fail|issue|refund|help|bug|cannot|problem",
               std::regex::ECMAScript | std::regex::optimize) {}

Branch KeywordRouter::route(const std::string& text) const {
    const auto lowered = utils::to_lower(text);
    if (std::regex_search(lowered, sales_)) {
        return Branch::SalesPitch;
    }
    if (std::regex_search(lowered, support_)) {
        return Branch::SupportFaq;
    }
    return fallback_;
}

}
