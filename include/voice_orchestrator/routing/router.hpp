#pragma once

#include <regex>
#include <string>

#include "voice_orchestrator/call/types.hpp"

namespace voice_orchestrator {

class Router {
public:
    virtual ~Router() = default;

    virtual Branch route(const std::string& text) const = 0;
};

// Sales keywords win over support keywords; no match yields the fallback.
class KeywordRouter : public Router {
public:
    explicit KeywordRouter(Branch fallback = Branch::SalesPitch);

    Branch route(const std::string& text) const override;
    Branch fallback() const { return fallback_; }

private:
    Branch fallback_;
    std::regex sales_;
    std::regex support_;
};

}
