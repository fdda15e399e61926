#pragma once

#include <string>
#include <vector>

namespace voice_orchestrator {

// Cleans generated text before it is spoken: the agent never asks for
// permission to consult the knowledge base.
class ReplySanitizer {
public:
    ReplySanitizer();
    explicit ReplySanitizer(std::vector<std::string> banned_phrases);

    std::string sanitize(const std::string& text) const;
    const std::vector<std::string>& banned_phrases() const { return banned_phrases_; }

    static std::vector<std::string> default_banned_phrases();

private:
    std::vector<std::string> banned_phrases_;
};

}
