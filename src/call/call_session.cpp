#include "voice_orchestrator/call/call_session.hpp"

#include <algorithm>
#include <utility>

namespace voice_orchestrator {

const Utterance& Transcript::append(Utterance utterance) {
    if (!utterances_.empty()) {
        utterance.timestamp_ms = std::max(utterance.timestamp_ms,
                                          utterances_.back().timestamp_ms);
    }
    utterances_.push_back(std::move(utterance));
    return utterances_.back();
}

std::size_t Transcript::count(Role role) const {
    return static_cast<std::size_t>(
        std::count_if(utterances_.begin(), utterances_.end(),
                      [role](const Utterance& utterance) { return utterance.role == role; }));
}

nlohmann::json Transcript::to_json() const {
    auto lines = nlohmann::json::array();
    for (const auto& utterance : utterances_) {
        lines.push_back({{"role", to_string(utterance.role)},
                         {"text", utterance.text},
                         {"ts", utterance.timestamp_ms},
                         {"kind", to_string(utterance.kind)}});
    }
    return lines;
}

}
