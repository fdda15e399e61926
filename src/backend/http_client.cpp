#include "voice_orchestrator/backend/http_client.hpp"

#include <utility>

#include "voice_orchestrator/utils/http.hpp"

namespace voice_orchestrator {

namespace {

template <typename Client>
void set_timeouts(Client& client, const HttpRequestOptions& options) {
    const auto seconds = [](std::chrono::milliseconds value) {
        return static_cast<time_t>(value.count() / 1000);
    };
    const auto micros = [](std::chrono::milliseconds value) {
        return static_cast<time_t>((value.count() % 1000) * 1000);
    };
    client.set_connection_timeout(seconds(options.connect_timeout), micros(options.connect_timeout));
    client.set_read_timeout(seconds(options.read_timeout), micros(options.read_timeout));
    client.set_write_timeout(seconds(options.write_timeout), micros(options.write_timeout));
}

}

HttpClient::HttpClient(std::string base_url,
                       std::optional<std::string> authorization_token,
                       HttpRequestOptions options)
    : base_url_(std::move(base_url)),
      authorization_token_(std::move(authorization_token)),
      options_(options) {
    utils::parse_url(base_url_, scheme_, host_, port_, base_path_);
    if (host_.empty()) {
        throw HttpError(0, "Invalid service URL: " + base_url_);
    }

    if (scheme_ == "https") {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        client_https_ = std::make_unique<httplib::SSLClient>(host_, port_);
#else
        throw HttpError(0, "HTTPS service requires CPPHTTPLIB_OPENSSL_SUPPORT: " + base_url_);
#endif
    } else {
        client_http_ = std::make_unique<httplib::Client>(host_, port_);
    }
    apply_timeouts();
}

nlohmann::json HttpClient::get_json(const std::string& path) {
    const auto full_path = build_path(path);
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    if (client_https_) {
        return handle_response("GET", full_path, client_https_->Get(full_path, headers(false)));
    }
#endif
    return handle_response("GET", full_path, client_http_->Get(full_path, headers(false)));
}

nlohmann::json HttpClient::post_json(const std::string& path, const nlohmann::json& body) {
    const auto full_path = build_path(path);
    const auto payload = body.dump();
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    if (client_https_) {
        return handle_response("POST", full_path,
                               client_https_->Post(full_path, headers(true), payload,
                                                   "application/json"));
    }
#endif
    return handle_response("POST", full_path,
                           client_http_->Post(full_path, headers(true), payload,
                                              "application/json"));
}

nlohmann::json HttpClient::handle_response(const char* method,
                                           const std::string& path,
                                           const httplib::Result& result) const {
    const std::string target = std::string(method) + " " + utils::build_url(scheme_, host_, port_, path);
    if (!result) {
        const auto error = result.error();
        const std::string kind = error == httplib::Error::ConnectionTimeout ||
                                         error == httplib::Error::Read ||
                                         error == httplib::Error::Write
                                     ? "network timeout"
                                     : "connection error";
        throw HttpError(0, kind + " (" + httplib::to_string(error) + ") on " + target);
    }
    const auto& response = *result;
    if (response.status == 401 || response.status == 403) {
        throw HttpPermissionError(response.status,
                                  "HTTP " + std::to_string(response.status) + " on " + target +
                                      ": " + response.body);
    }
    if (response.status < 200 || response.status >= 300) {
        throw HttpError(response.status,
                        "HTTP " + std::to_string(response.status) + " on " + target + ": " +
                            response.body);
    }
    if (response.body.empty()) {
        return nlohmann::json::object();
    }
    try {
        return nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::parse_error& ex) {
        throw HttpError(response.status, "Invalid JSON on " + target + ": " + ex.what());
    }
}

httplib::Headers HttpClient::headers(bool with_body) const {
    httplib::Headers result{{"Accept", "application/json"}};
    if (with_body) {
        result.emplace("Content-Type", "application/json");
    }
    if (authorization_token_) {
        result.emplace("Authorization", "Bearer " + *authorization_token_);
    }
    return result;
}

std::string HttpClient::build_path(const std::string& path) const {
    return utils::join_path(base_path_, path);
}

void HttpClient::apply_timeouts() {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    if (client_https_) {
        set_timeouts(*client_https_, options_);
        return;
    }
#endif
    if (client_http_) {
        set_timeouts(*client_http_, options_);
    }
}

}
