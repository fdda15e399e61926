#include "voice_orchestrator/server/rest_server.hpp"

#include <exception>
#include <utility>

#include "voice_orchestrator/logging.hpp"
#include "voice_orchestrator/metrics.hpp"

namespace voice_orchestrator {

namespace {

constexpr const char* kCallIdPattern = "([A-Za-z0-9_.:-]+)";

}

RestServer::RestServer(const Config& config, RestHandlers handlers)
    : config_(config),
      handlers_(std::move(handlers)) {}

RestServer::~RestServer() {
    stop();
}

void RestServer::start() {
    server_ = std::make_unique<httplib::Server>();

    server_->Get("/health", [](const httplib::Request&, httplib::Response& res) {
        nlohmann::json payload{{"status", "ok"}};
        res.set_content(payload.dump(), "application/json");
        logging::debug("Health check served");
    });

    server_->Get("/metrics", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(ServiceMetrics::instance().render_prometheus(),
                        "text/plain; version=0.0.4");
    });

    server_->Post("/calls", [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize_request(req, res)) {
            return;
        }
        nlohmann::json body;
        if (!parse_body(req, res, "/calls", body)) {
            return;
        }
        respond(res, "/calls", [this, &body]() { return handlers_.start_call(body); });
    });

    server_->Post("/config", [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize_request(req, res)) {
            return;
        }
        nlohmann::json body;
        if (!parse_body(req, res, "/config", body)) {
            return;
        }
        respond(res, "/config", [this, &body]() { return handlers_.patch_defaults(body); });
    });

    server_->Post(std::string("/calls/") + kCallIdPattern + "/config",
                  [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize_request(req, res)) {
            return;
        }
        const auto call_id = req.matches[1].str();
        nlohmann::json body;
        if (!parse_body(req, res, "/calls/{id}/config", body)) {
            return;
        }
        respond(res, "/calls/{id}/config",
                [this, &call_id, &body]() { return handlers_.patch_call(call_id, body); });
    });

    server_->Post(std::string("/calls/") + kCallIdPattern + "/end",
                  [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize_request(req, res)) {
            return;
        }
        const auto call_id = req.matches[1].str();
        respond(res, "/calls/{id}/end", [this, &call_id]() { return handlers_.end_call(call_id); });
    });

    server_->Get(std::string("/calls/") + kCallIdPattern,
                 [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize_request(req, res)) {
            return;
        }
        const auto call_id = req.matches[1].str();
        respond(res, "/calls/{id}", [this, &call_id]() { return handlers_.get_call(call_id); });
    });

    server_thread_ = std::thread([this]() {
        logging::info(
            "REST server listening",
            {kv("port", config_.rest_api_port)});
        if (!server_->listen("0.0.0.0", config_.rest_api_port)) {
            logging::error(
                "REST server failed to listen",
                {kv("port", config_.rest_api_port)});
        }
    });
}

void RestServer::stop() {
    if (server_) {
        server_->stop();
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

bool RestServer::authorize_request(const httplib::Request& request,
                                   httplib::Response& response) const {
    if (!config_.authorization_token) {
        return true;
    }
    const auto it = request.headers.find("Authorization");
    if (it == request.headers.end()) {
        response.status = 401;
        response.set_content(R"({"message":"missing authorization"})", "application/json");
        return false;
    }
    const auto expected = "Bearer " + *config_.authorization_token;
    if (it->second != expected) {
        response.status = 403;
        response.set_content(R"({"message":"invalid authorization"})", "application/json");
        return false;
    }
    return true;
}

bool RestServer::parse_body(const httplib::Request& request,
                            httplib::Response& response,
                            const char* route,
                            nlohmann::json& body) const {
    if (request.body.empty()) {
        body = nlohmann::json::object();
        return true;
    }
    try {
        body = nlohmann::json::parse(request.body);
    } catch (const std::exception& ex) {
        logging::warn(
            "Failed to parse request body",
            {kv("route", route),
             kv("error", ex.what())});
        response.status = 400;
        response.set_content(R"({"message":"invalid request body"})", "application/json");
        return false;
    }
    return true;
}

void RestServer::respond(httplib::Response& response,
                         const char* route,
                         const std::function<RestResponse()>& handler) const {
    try {
        write_json(response, handler());
    } catch (const std::exception& ex) {
        logging::error(
            "Failed to handle request",
            {kv("route", route),
             kv("error", ex.what())});
        response.status = 500;
        response.set_content(R"({"message":"internal error"})", "application/json");
    }
}

void RestServer::write_json(httplib::Response& response, const RestResponse& payload) const {
    response.status = payload.status;
    response.set_content(payload.body.dump(), "application/json");
}

}
