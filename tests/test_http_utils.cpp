#include <catch2/catch_test_macros.hpp>

#include "voice_orchestrator/utils/http.hpp"

#include <string>

TEST_CASE("url_encode escapes reserved characters") {
    const std::string input = "hello world!";
    const std::string expected = "hello%20world%21";
    REQUIRE(voice_orchestrator::utils::url_encode(input) == expected);
}

TEST_CASE("parse_url splits scheme host port and path") {
    std::string scheme;
    std::string host;
    std::string base_path;
    int port = 0;
    voice_orchestrator::utils::parse_url("https://example.com:8443/path/file",
                                         scheme, host, port, base_path);
    REQUIRE(scheme == "https");
    REQUIRE(host == "example.com");
    REQUIRE(port == 8443);
    REQUIRE(base_path == "/path/file");
}

TEST_CASE("parse_url defaults the port from the scheme") {
    std::string scheme;
    std::string host;
    std::string base_path;
    int port = 0;
    voice_orchestrator::utils::parse_url("http://kb.internal", scheme, host, port, base_path);
    REQUIRE(port == 80);
    REQUIRE(base_path == "/");
}

TEST_CASE("build_url omits default ports") {
    REQUIRE(voice_orchestrator::utils::build_url("https", "host", 443, "/x") == "https://host/x");
    REQUIRE(voice_orchestrator::utils::build_url("http", "host", 8080, "x") ==
            "http://host:8080/x");
}

TEST_CASE("join_path inserts exactly one separator") {
    using voice_orchestrator::utils::join_path;
    REQUIRE(join_path("/api", "retrieve") == "/api/retrieve");
    REQUIRE(join_path("/api/", "/retrieve") == "/api/retrieve");
    REQUIRE(join_path("/", "/calls/1") == "/calls/1");
    REQUIRE(join_path("", "reply") == "/reply");
}

TEST_CASE("to_websocket_url rewrites http schemes") {
    using voice_orchestrator::utils::to_websocket_url;
    REQUIRE(to_websocket_url("https://bridge:9000/calls/1") == "wss://bridge:9000/calls/1");
    REQUIRE(to_websocket_url("http://bridge/calls/1") == "ws://bridge/calls/1");
    REQUIRE(to_websocket_url("ws://bridge") == "ws://bridge");
    REQUIRE(to_websocket_url("bridge:9000") == "ws://bridge:9000");
}
