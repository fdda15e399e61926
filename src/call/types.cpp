#include "voice_orchestrator/call/types.hpp"

namespace voice_orchestrator {

const char* to_string(Role role) {
    switch (role) {
        case Role::Agent:
            return "agent";
        case Role::User:
            return "user";
    }
    return "unknown";
}

const char* to_string(UtteranceKind kind) {
    switch (kind) {
        case UtteranceKind::Speech:
            return "speech";
        case UtteranceKind::Greeting:
            return "greeting";
        case UtteranceKind::Reply:
            return "reply";
        case UtteranceKind::Reminder:
            return "reminder";
        case UtteranceKind::Fallback:
            return "fallback";
    }
    return "unknown";
}

const char* to_string(Branch branch) {
    switch (branch) {
        case Branch::SalesPitch:
            return "sales_pitch";
        case Branch::SupportFaq:
            return "support_faq";
    }
    return "unknown";
}

const char* to_string(TurnState state) {
    switch (state) {
        case TurnState::Idle:
            return "IDLE";
        case TurnState::Configuring:
            return "CONFIGURING";
        case TurnState::AgentSpeaking:
            return "AGENT_SPEAKING";
        case TurnState::ListeningForUser:
            return "LISTENING_FOR_USER";
        case TurnState::Processing:
            return "PROCESSING";
        case TurnState::Ended:
            return "ENDED";
        case TurnState::Error:
            return "ERROR";
    }
    return "unknown";
}

std::optional<Branch> parse_branch(const std::string& value) {
    if (value == "sales_pitch") {
        return Branch::SalesPitch;
    }
    if (value == "support_faq") {
        return Branch::SupportFaq;
    }
    return std::nullopt;
}

bool is_substantive(const Utterance& utterance) {
    return utterance.role == Role::Agent && utterance.kind != UtteranceKind::Reminder;
}

}
