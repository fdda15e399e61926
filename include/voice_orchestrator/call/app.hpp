#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "voice_orchestrator/call/orchestrator.hpp"
#include "voice_orchestrator/config.hpp"
#include "voice_orchestrator/server/rest_server.hpp"

namespace voice_orchestrator {

// Adapters bound to one call. `close` releases the underlying session.
struct CallEngines {
    std::shared_ptr<TtsEngine> tts;
    std::shared_ptr<AsrEngine> asr;
    std::shared_ptr<VadEngine> vad;
    std::function<void()> close;
};

// Collaborators shared by every call of the process.
struct AppDependencies {
    using EngineFactory =
        std::function<CallEngines(const CallInfo&, const std::shared_ptr<EventInbox>&)>;
    // Runs one call actor to completion.
    using CallRunner = std::function<void(std::function<void()>)>;

    std::shared_ptr<KnowledgeBase> knowledge_base;
    std::shared_ptr<Router> router;
    std::shared_ptr<ReplyGenerator> reply_generator;
    std::shared_ptr<PersistenceClient> persistence;
    std::shared_ptr<ResilientInvoker> kb_invoker;
    std::shared_ptr<ResilientInvoker> reply_invoker;
    std::shared_ptr<ResilientInvoker> persist_invoker;
    std::shared_ptr<utils::TimerService> timers;
    std::shared_ptr<utils::Clock> clock;
    utils::AsyncRunner async_runner;
    EngineFactory engine_factory;
    CallRunner call_runner;

    // Media bridge engines, HTTP collaborators and a process timer thread.
    static AppDependencies from_config(const Config& config);
};

class OrchestratorApp {
public:
    OrchestratorApp(Config config, AppDependencies deps);
    explicit OrchestratorApp(Config config);
    ~OrchestratorApp();

    OrchestratorApp(const OrchestratorApp&) = delete;
    OrchestratorApp& operator=(const OrchestratorApp&) = delete;

    void start();
    // Blocks until stop() is requested.
    void run();
    void request_stop();
    // Ends every call and waits up to the shutdown grace. Summaries of calls
    // still persisting after that are spooled. Runs once.
    void stop();

    RestResponse handle_start_call(const nlohmann::json& body);
    RestResponse handle_patch_defaults(const nlohmann::json& body);
    RestResponse handle_patch_call(const std::string& call_id, const nlohmann::json& body);
    RestResponse handle_end_call(const std::string& call_id);
    RestResponse handle_get_call(const std::string& call_id);

    std::size_t active_calls() const;
    TurnSettings default_settings() const { return defaults_.settings(); }
    const Config& config() const { return config_; }

private:
    struct CallHandle {
        std::shared_ptr<EventInbox> inbox;
        CallEngines engines;
        std::unique_ptr<CallOrchestrator> orchestrator;
    };

    // Lets call actors reach the app until stop() detaches it.
    struct Lifeline {
        std::mutex mutex;
        OrchestratorApp* app = nullptr;
    };

    void on_call_finished(const CallResult& result);
    void spool_summary(const CallResult& result) const;
    void unregister_call(const std::string& call_id);
    std::shared_ptr<CallHandle> find_call(const std::string& call_id) const;

    Config config_;
    AppDependencies deps_;
    ConfigController defaults_;
    std::unordered_map<std::string, std::shared_ptr<CallHandle>> calls_;
    mutable std::mutex calls_mutex_;
    std::condition_variable calls_cv_;
    std::atomic<bool> quitting_{false};
    std::atomic<bool> stopped_{false};
    std::shared_ptr<Lifeline> lifeline_;
    std::unique_ptr<RestServer> rest_server_;
};

}
