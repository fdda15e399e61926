#include "voice_orchestrator/call/app.hpp"

#include <cctype>
#include <chrono>
#include <exception>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

#include "voice_orchestrator/backend/http_client.hpp"
#include "voice_orchestrator/bridge/media_bridge_client.hpp"
#include "voice_orchestrator/logging.hpp"

namespace voice_orchestrator {

namespace {

std::optional<std::string> optional_string(const nlohmann::json& body, const char* field) {
    const auto it = body.find(field);
    if (it == body.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw std::invalid_argument(std::string("'") + field + "' must be a string");
    }
    return it->get<std::string>();
}

std::string required_string(const nlohmann::json& body, const char* field) {
    auto value = optional_string(body, field);
    if (!value || value->empty()) {
        throw std::invalid_argument(std::string("'") + field + "' is required");
    }
    return *value;
}

CallInfo parse_call_info(const nlohmann::json& body) {
    if (!body.is_object()) {
        throw std::invalid_argument("request body must be a JSON object");
    }
    CallInfo info;
    info.call_id = required_string(body, "call_id");
    info.product = required_string(body, "product");
    info.lead_id = optional_string(body, "lead_id");
    info.audio_url = optional_string(body, "audio_url");
    info.transcript_url = optional_string(body, "transcript_url");
    info.greeting = optional_string(body, "greeting");

    const auto ids = body.find("selected_kb_ids");
    if (ids != body.end() && !ids->is_null()) {
        if (!ids->is_array()) {
            throw std::invalid_argument("'selected_kb_ids' must be an array of strings");
        }
        std::vector<std::string> selected;
        for (const auto& id : *ids) {
            if (!id.is_string()) {
                throw std::invalid_argument("'selected_kb_ids' must be an array of strings");
            }
            selected.push_back(id.get<std::string>());
        }
        info.selected_kb_ids = std::move(selected);
    }
    return info;
}

RestResponse error_response(int status, const std::string& message) {
    return {status, {{"message", message}}};
}

std::string spool_file_name(const std::string& call_id, int64_t wall_time_ms) {
    std::string safe;
    for (unsigned char ch : call_id) {
        safe.push_back(std::isalnum(ch) || ch == '-' || ch == '_' ? static_cast<char>(ch) : '_');
    }
    return safe + "-" + std::to_string(wall_time_ms) + ".json";
}

HttpRequestOptions http_options(const Config& config) {
    const auto to_ms = [](double seconds) {
        return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0));
    };
    HttpRequestOptions options;
    options.connect_timeout = to_ms(config.http_connect_timeout);
    options.read_timeout = to_ms(config.http_read_timeout);
    options.write_timeout = to_ms(config.http_write_timeout);
    return options;
}

}

AppDependencies AppDependencies::from_config(const Config& config) {
    const auto options = http_options(config);
    AppDependencies deps;
    deps.knowledge_base = std::make_shared<HttpKnowledgeBase>(
        config.kb_service_url, config.authorization_token, options);
    if (config.reply_service_url) {
        deps.reply_generator = std::make_shared<HttpReplyGenerator>(
            *config.reply_service_url, config.authorization_token, options);
    } else {
        deps.reply_generator = std::make_shared<TemplateReplyGenerator>();
    }
    deps.persistence = std::make_shared<HttpPersistenceClient>(
        config.persist_service_url, config.authorization_token, options);
    deps.router = std::make_shared<KeywordRouter>(
        parse_branch(config.router_fallback_branch).value_or(Branch::SalesPitch));

    deps.clock = utils::SystemClock::shared();
    deps.kb_invoker = std::make_shared<ResilientInvoker>("kb", config.kb_retry, deps.clock);
    deps.reply_invoker = std::make_shared<ResilientInvoker>("reply", config.reply_retry, deps.clock);
    deps.persist_invoker =
        std::make_shared<ResilientInvoker>("persist", config.persist_retry, deps.clock);
    deps.timers = std::make_shared<utils::ThreadTimerService>();
    deps.async_runner = utils::default_async_runner();
    deps.call_runner = utils::default_async_runner();

    const auto media_bridge_url = config.media_bridge_url;
    const auto connect_timeout = std::chrono::milliseconds(config.media_bridge_connect_timeout_ms);
    const auto stop_timeout = std::chrono::milliseconds(config.tts_stop_timeout_ms);
    deps.engine_factory = [media_bridge_url, connect_timeout, stop_timeout](
                              const CallInfo& info, const std::shared_ptr<EventInbox>& inbox) {
        auto client = std::make_shared<bridge::MediaBridgeClient>(
            media_bridge_url, info.call_id, connect_timeout, stop_timeout);
        std::weak_ptr<EventInbox> weak_inbox = inbox;
        // Throws when the bridge does not open; the call is then rejected.
        client->connect([weak_inbox](Event event) {
            if (auto target = weak_inbox.lock()) {
                target->push(std::move(event));
            }
        });
        CallEngines engines;
        engines.tts = client;
        engines.asr = client;
        engines.vad = client;
        engines.close = [client]() { client->disconnect(); };
        return engines;
    };
    return deps;
}

OrchestratorApp::OrchestratorApp(Config config, AppDependencies deps)
    : config_(std::move(config)),
      deps_(std::move(deps)),
      defaults_(TurnSettings::from_config(config_)),
      lifeline_(std::make_shared<Lifeline>()) {
    lifeline_->app = this;
    if (!deps_.call_runner) {
        deps_.call_runner = utils::default_async_runner();
    }
}

OrchestratorApp::OrchestratorApp(Config config)
    : OrchestratorApp(config, AppDependencies::from_config(config)) {}

OrchestratorApp::~OrchestratorApp() {
    stop();
}

void OrchestratorApp::start() {
    RestHandlers handlers;
    handlers.start_call = [this](const nlohmann::json& body) { return handle_start_call(body); };
    handlers.patch_defaults = [this](const nlohmann::json& body) {
        return handle_patch_defaults(body);
    };
    handlers.patch_call = [this](const std::string& call_id, const nlohmann::json& body) {
        return handle_patch_call(call_id, body);
    };
    handlers.end_call = [this](const std::string& call_id) { return handle_end_call(call_id); };
    handlers.get_call = [this](const std::string& call_id) { return handle_get_call(call_id); };

    rest_server_ = std::make_unique<RestServer>(config_, std::move(handlers));
    rest_server_->start();
}

void OrchestratorApp::run() {
    while (!quitting_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

void OrchestratorApp::request_stop() {
    quitting_ = true;
}

void OrchestratorApp::stop() {
    quitting_ = true;
    if (stopped_.exchange(true)) {
        return;
    }
    if (rest_server_) {
        rest_server_->stop();
        rest_server_.reset();
    }

    std::vector<std::shared_ptr<CallHandle>> active;
    {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        for (const auto& item : calls_) {
            active.push_back(item.second);
        }
    }
    for (const auto& handle : active) {
        handle->inbox->push(Event::call_end_requested("shutdown"));
    }

    bool drained = false;
    {
        std::unique_lock<std::mutex> lock(calls_mutex_);
        drained = calls_cv_.wait_for(lock, std::chrono::milliseconds(config_.shutdown_grace_ms),
                                     [this]() { return calls_.empty(); });
    }
    {
        // Actors that outlive the app must not call back into it.
        std::lock_guard<std::mutex> lock(lifeline_->mutex);
        lifeline_->app = nullptr;
    }
    if (drained) {
        return;
    }

    std::vector<std::shared_ptr<CallHandle>> remaining;
    {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        for (const auto& item : calls_) {
            remaining.push_back(item.second);
        }
        calls_.clear();
    }
    logging::warn(
        "Calls still active at shutdown",
        {kv("count", remaining.size())});
    for (const auto& handle : remaining) {
        auto summary = handle->orchestrator->sealed_summary();
        if (!summary) {
            logging::error(
                "Call did not end before shutdown, summary lost",
                {kv("call_id", handle->orchestrator->snapshot().call_id)});
            continue;
        }
        CallResult result;
        result.call_id = summary->call_id;
        result.status = summary->status;
        result.persist_error = "shutdown before persistence completed";
        result.payload = std::move(*summary);
        spool_summary(result);
    }
}

RestResponse OrchestratorApp::handle_start_call(const nlohmann::json& body) {
    if (quitting_) {
        return error_response(503, "shutting down");
    }
    CallInfo info;
    ConfigPatch patch;
    try {
        info = parse_call_info(body);
        const auto config = body.find("config");
        if (config != body.end() && !config->is_null()) {
            patch = ConfigPatch::from_json(*config);
        }
    } catch (const ConfigPatchError& ex) {
        return error_response(400, ex.what());
    } catch (const std::invalid_argument& ex) {
        return error_response(400, ex.what());
    }

    if (find_call(info.call_id)) {
        return error_response(409, "call already exists: " + info.call_id);
    }

    auto handle = std::make_shared<CallHandle>();
    handle->inbox = std::make_shared<EventInbox>();
    try {
        auto started = Event::call_started();
        started.patch = patch;
        handle->inbox->push(std::move(started));
        handle->engines = deps_.engine_factory(info, handle->inbox);

        CallDependencies call_deps;
        call_deps.tts = handle->engines.tts;
        call_deps.asr = handle->engines.asr;
        call_deps.vad = handle->engines.vad;
        call_deps.knowledge_base = deps_.knowledge_base;
        call_deps.router = deps_.router;
        call_deps.reply_generator = deps_.reply_generator;
        call_deps.persistence = deps_.persistence;
        call_deps.kb_invoker = deps_.kb_invoker;
        call_deps.reply_invoker = deps_.reply_invoker;
        call_deps.persist_invoker = deps_.persist_invoker;
        call_deps.timers = deps_.timers;
        call_deps.clock = deps_.clock;
        call_deps.async_runner = deps_.async_runner;

        handle->orchestrator = std::make_unique<CallOrchestrator>(
            info, defaults_.settings(), std::move(call_deps),
            OrchestratorPolicy::from_config(config_), handle->inbox);
        handle->orchestrator->set_on_finished([lifeline = lifeline_](const CallResult& result) {
            std::lock_guard<std::mutex> lock(lifeline->mutex);
            if (lifeline->app) {
                lifeline->app->on_call_finished(result);
            }
        });
    } catch (const std::exception& ex) {
        logging::error(
            "Failed to start call",
            {kv("call_id", info.call_id),
             kv("error", ex.what())});
        if (handle->engines.close) {
            handle->engines.close();
        }
        return error_response(500, "failed to start call");
    }

    bool registered = false;
    {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        registered = calls_.emplace(info.call_id, handle).second;
    }
    if (!registered) {
        handle->inbox->close();
        if (handle->engines.close) {
            handle->engines.close();
        }
        return error_response(409, "call already exists: " + info.call_id);
    }

    const auto call_id = info.call_id;
    deps_.call_runner([lifeline = lifeline_, handle, call_id]() {
        try {
            handle->orchestrator->run();
        } catch (const std::exception& ex) {
            logging::error(
                "Call actor failed",
                {kv("call_id", call_id),
                 kv("error", ex.what())});
            std::lock_guard<std::mutex> lock(lifeline->mutex);
            if (lifeline->app) {
                lifeline->app->unregister_call(call_id);
            }
        }
        if (handle->engines.close) {
            handle->engines.close();
        }
    });

    return {201, {{"call_id", call_id}}};
}

RestResponse OrchestratorApp::handle_patch_defaults(const nlohmann::json& body) {
    try {
        const auto patch = ConfigPatch::from_json(body);
        const auto changed = defaults_.apply(patch);
        logging::info(
            "Default config patched",
            {kv("changed", changed.size())});
        return {200, {{"changed", changed}, {"settings", defaults_.settings().to_json()}}};
    } catch (const ConfigPatchError& ex) {
        return error_response(400, ex.what());
    }
}

RestResponse OrchestratorApp::handle_patch_call(const std::string& call_id,
                                                const nlohmann::json& body) {
    const auto handle = find_call(call_id);
    if (!handle) {
        return error_response(404, "unknown call: " + call_id);
    }
    ConfigPatch patch;
    try {
        patch = ConfigPatch::from_json(body);
    } catch (const ConfigPatchError& ex) {
        return error_response(400, ex.what());
    }
    if (!handle->inbox->push(Event::config_patch_applied(patch))) {
        return error_response(409, "call already ended: " + call_id);
    }
    return {202, {{"call_id", call_id}, {"patch", patch.to_json()}}};
}

RestResponse OrchestratorApp::handle_end_call(const std::string& call_id) {
    const auto handle = find_call(call_id);
    if (!handle) {
        return error_response(404, "unknown call: " + call_id);
    }
    handle->inbox->push(Event::call_end_requested("api"));
    return {202, {{"call_id", call_id}}};
}

RestResponse OrchestratorApp::handle_get_call(const std::string& call_id) {
    const auto handle = find_call(call_id);
    if (!handle || !handle->orchestrator) {
        return error_response(404, "unknown call: " + call_id);
    }
    const auto snapshot = handle->orchestrator->snapshot();
    return {200,
            {{"call_id", snapshot.call_id},
             {"state", to_string(snapshot.state)},
             {"transcript_size", snapshot.transcript_size},
             {"reminders_sent", snapshot.reminders_sent},
             {"turn_failures", snapshot.turn_failures},
             {"error", snapshot.error},
             {"settings", snapshot.settings.to_json()}}};
}

std::size_t OrchestratorApp::active_calls() const {
    std::lock_guard<std::mutex> lock(calls_mutex_);
    return calls_.size();
}

void OrchestratorApp::on_call_finished(const CallResult& result) {
    if (!result.persisted) {
        spool_summary(result);
    }
    unregister_call(result.call_id);
}

void OrchestratorApp::spool_summary(const CallResult& result) const {
    namespace fs = std::filesystem;
    const auto wall_time = deps_.clock ? deps_.clock->wall_time_ms()
                                       : utils::SystemClock::shared()->wall_time_ms();
    const auto path = config_.summary_spool_dir / spool_file_name(result.call_id, wall_time);

    std::error_code ec;
    fs::create_directories(config_.summary_spool_dir, ec);
    if (ec) {
        logging::error(
            "Failed to create summary spool directory",
            {kv("path", config_.summary_spool_dir.string()),
             kv("error", ec.message())});
        return;
    }
    std::ofstream out(path);
    if (!out) {
        logging::error(
            "Failed to open summary spool file",
            {kv("path", path.string())});
        return;
    }
    auto document = result.payload.to_json();
    document["persist_error"] = result.persist_error;
    out << document.dump(2);
    logging::warn(
        "Call summary spooled",
        {kv("call_id", result.call_id),
         kv("path", path.string())});
}

void OrchestratorApp::unregister_call(const std::string& call_id) {
    {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        calls_.erase(call_id);
    }
    calls_cv_.notify_all();
}

std::shared_ptr<OrchestratorApp::CallHandle> OrchestratorApp::find_call(
    const std::string& call_id) const {
    std::lock_guard<std::mutex> lock(calls_mutex_);
    const auto it = calls_.find(call_id);
    if (it == calls_.end()) {
        return nullptr;
    }
    return it->second;
}

}
