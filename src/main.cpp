#include "voice_orchestrator/call/app.hpp"
#include "voice_orchestrator/config.hpp"
#include "voice_orchestrator/logging.hpp"

#include <atomic>
#include <csignal>
#include <string>

namespace {

std::atomic<voice_orchestrator::OrchestratorApp*> running_app{nullptr};

void handle_signal(int) {
    if (auto* app = running_app.load()) {
        app->request_stop();
    }
}

}

int main() {
    try {
        const auto config = voice_orchestrator::Config::load();
        config.validate();
        voice_orchestrator::logging::init(config);
        voice_orchestrator::info(
            "Starting voice-orchestrator",
            {voice_orchestrator::kv("media_bridge_url", config.media_bridge_url),
             voice_orchestrator::kv("kb_service_url", config.kb_service_url),
             voice_orchestrator::kv("reply_service", config.reply_service_url.value_or("template")),
             voice_orchestrator::kv("rest_port", config.rest_api_port),
             voice_orchestrator::kv("barge_in", config.barge_in_enabled)});
        voice_orchestrator::OrchestratorApp app(config);
        running_app = &app;
        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);
        app.start();
        app.run();
        app.stop();
        running_app = nullptr;
    } catch (const std::exception& ex) {
        voice_orchestrator::error(
            "Startup failed",
            {voice_orchestrator::kv("error", ex.what())});
        return 1;
    }
    return 0;
}
