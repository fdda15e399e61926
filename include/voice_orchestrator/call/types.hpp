#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace voice_orchestrator {

enum class Role {
    Agent,
    User
};

enum class UtteranceKind {
    Speech,
    Greeting,
    Reply,
    Reminder,
    Fallback
};

struct Utterance {
    Role role = Role::User;
    std::string text;
    int64_t timestamp_ms = 0;
    UtteranceKind kind = UtteranceKind::Speech;
};

enum class Branch {
    SalesPitch,
    SupportFaq
};

struct KbChunk {
    std::string id;
    std::string text;
};

enum class TurnState {
    Idle,
    Configuring,
    AgentSpeaking,
    ListeningForUser,
    Processing,
    Ended,
    Error
};

const char* to_string(Role role);
const char* to_string(UtteranceKind kind);
const char* to_string(Branch branch);
const char* to_string(TurnState state);

// Accepts the wire names "sales_pitch" and "support_faq".
std::optional<Branch> parse_branch(const std::string& value);

// Any agent speech other than a reminder is substantive.
bool is_substantive(const Utterance& utterance);

}
