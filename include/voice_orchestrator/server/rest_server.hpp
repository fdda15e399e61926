#pragma once

#include <functional>
#include <memory>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "voice_orchestrator/config.hpp"

namespace voice_orchestrator {

struct RestResponse {
    int status = 200;
    nlohmann::json body;
};

struct RestHandlers {
    std::function<RestResponse(const nlohmann::json&)> start_call;
    std::function<RestResponse(const nlohmann::json&)> patch_defaults;
    std::function<RestResponse(const std::string&, const nlohmann::json&)> patch_call;
    std::function<RestResponse(const std::string&)> end_call;
    std::function<RestResponse(const std::string&)> get_call;
};

class RestServer {
public:
    RestServer(const Config& config, RestHandlers handlers);
    ~RestServer();

    RestServer(const RestServer&) = delete;
    RestServer& operator=(const RestServer&) = delete;

    void start();
    void stop();

private:
    bool authorize_request(const httplib::Request& request, httplib::Response& response) const;
    bool parse_body(const httplib::Request& request,
                    httplib::Response& response,
                    const char* route,
                    nlohmann::json& body) const;
    void respond(httplib::Response& response,
                 const char* route,
                 const std::function<RestResponse()>& handler) const;
    void write_json(httplib::Response& response, const RestResponse& payload) const;

    const Config& config_;
    RestHandlers handlers_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
};

}
