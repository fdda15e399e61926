#pragma once

#include <chrono>
#include <httplib.h>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace voice_orchestrator {

class HttpError : public std::runtime_error {
public:
    HttpError(int status, const std::string& message)
        : std::runtime_error(message), status_(status) {}

    // 0 when no response was received.
    int status() const { return status_; }

private:
    int status_;
};

class HttpPermissionError : public HttpError {
public:
    HttpPermissionError(int status, const std::string& message) : HttpError(status, message) {}
};

struct HttpRequestOptions {
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds read_timeout{30000};
    std::chrono::milliseconds write_timeout{30000};
};

// JSON client for one service base URL. Not thread-safe; the collaborators
// built on it create one per request.
class HttpClient {
public:
    HttpClient(std::string base_url,
               std::optional<std::string> authorization_token,
               HttpRequestOptions options);

    nlohmann::json get_json(const std::string& path);
    nlohmann::json post_json(const std::string& path, const nlohmann::json& body);

    const std::string& base_url() const { return base_url_; }

private:
    nlohmann::json handle_response(const char* method,
                                   const std::string& path,
                                   const httplib::Result& result) const;
    httplib::Headers headers(bool with_body) const;
    std::string build_path(const std::string& path) const;
    void apply_timeouts();

    std::string base_url_;
    std::string scheme_;
    std::string host_;
    int port_ = 0;
    std::string base_path_;
    std::optional<std::string> authorization_token_;
    HttpRequestOptions options_;
    std::unique_ptr<httplib::Client> client_http_;
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    std::unique_ptr<httplib::SSLClient> client_https_;
#endif
};

}
