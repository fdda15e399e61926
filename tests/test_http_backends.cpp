#include <catch2/catch_test_macros.hpp>

#include "voice_orchestrator/backend/knowledge_base.hpp"
#include "voice_orchestrator/backend/persistence.hpp"
#include "voice_orchestrator/backend/reply_generator.hpp"

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace voice_orchestrator;
using nlohmann::json;

namespace {

struct RecordedRequest {
    std::string path;
    std::string authorization;
    json body;
};

// Loopback HTTP service answering with canned responses.
class StubService {
public:
    using Responder = std::function<void(const json& body, httplib::Response& res)>;

    explicit StubService(Responder responder) : responder_(std::move(responder)) {
        server_.Post(".*", [this](const httplib::Request& req, httplib::Response& res) {
            RecordedRequest recorded;
            recorded.path = req.path;
            recorded.authorization = req.get_header_value("Authorization");
            recorded.body = req.body.empty() ? json() : json::parse(req.body);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                requests_.push_back(recorded);
            }
            responder_(recorded.body, res);
        });
        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this]() { server_.listen_after_bind(); });
        while (!server_.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    ~StubService() {
        server_.stop();
        thread_.join();
    }

    std::string url(const std::string& base_path = "") const {
        return "http://127.0.0.1:" + std::to_string(port_) + base_path;
    }

    std::vector<RecordedRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    Responder responder_;
    httplib::Server server_;
    int port_ = 0;
    std::thread thread_;
    mutable std::mutex mutex_;
    std::vector<RecordedRequest> requests_;
};

HttpRequestOptions short_timeouts() {
    HttpRequestOptions options;
    options.connect_timeout = std::chrono::milliseconds(2000);
    options.read_timeout = std::chrono::milliseconds(2000);
    options.write_timeout = std::chrono::milliseconds(2000);
    return options;
}

void reply_json(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

}

TEST_CASE("knowledge base posts the query and keeps at most max chunks") {
    StubService service([](const json&, httplib::Response& res) {
        reply_json(res, 200,
                   {{"chunks",
                     {{{"id", "a"}, {"text", "one"}},
                      {{"id", "b"}, {"text", "two"}},
                      {{"id", "c"}, {"text", "three"}}}}});
    });
    HttpKnowledgeBase kb(service.url("/kb"), std::string("secret"), short_timeouts());

    KbQuery query;
    query.product = "broadband";
    query.selected_ids = std::vector<std::string>{"a", "b"};
    query.max_chunks = 2;
    query.rerank = false;
    const auto chunks = kb.retrieve(query);

    REQUIRE(chunks.size() == 2);
    REQUIRE(chunks[0].id == "a");
    REQUIRE(chunks[1].text == "two");

    const auto requests = service.requests();
    REQUIRE(requests.size() == 1);
    REQUIRE(requests[0].path == "/kb/retrieve");
    REQUIRE(requests[0].authorization == "Bearer secret");
    REQUIRE(requests[0].body["product"] == "broadband");
    REQUIRE(requests[0].body["max"] == 2);
    REQUIRE(requests[0].body["rerank"] == false);
    REQUIRE(requests[0].body["selected_ids"] == json::array({"a", "b"}));
}

TEST_CASE("knowledge base rejects a response without chunks") {
    StubService service([](const json&, httplib::Response& res) {
        reply_json(res, 200, {{"documents", json::array()}});
    });
    HttpKnowledgeBase kb(service.url(), std::nullopt, short_timeouts());

    KbQuery query;
    query.product = "broadband";
    REQUIRE_THROWS_AS(kb.retrieve(query), HttpError);
    REQUIRE(service.requests().front().authorization.empty());
    REQUIRE_FALSE(service.requests().front().body.contains("selected_ids"));
}

TEST_CASE("reply generator sends the routed turn and reads the reply") {
    StubService service([](const json&, httplib::Response& res) {
        reply_json(res, 200, {{"reply", "Restart the router first."}});
    });
    HttpReplyGenerator generator(service.url(), std::nullopt, short_timeouts());

    ReplyRequest request;
    request.utterance = "my internet is down";
    request.chunks = {{"kb-1", "Restart steps"}};
    request.branch = Branch::SupportFaq;
    request.product = "broadband";

    REQUIRE(generator.generate(request) == "Restart the router first.");
    const auto body = service.requests().front().body;
    REQUIRE(service.requests().front().path == "/reply");
    REQUIRE(body["utterance"] == "my internet is down");
    REQUIRE(body["branch"] == "support_faq");
    REQUIRE(body["chunks"][0]["id"] == "kb-1");
}

TEST_CASE("reply generator rejects a non-string reply") {
    StubService service([](const json&, httplib::Response& res) {
        reply_json(res, 200, {{"reply", 42}});
    });
    HttpReplyGenerator generator(service.url(), std::nullopt, short_timeouts());
    REQUIRE_THROWS_AS(generator.generate(ReplyRequest{}), HttpError);
}

TEST_CASE("persistence posts the call summary") {
    StubService service([](const json&, httplib::Response& res) { res.status = 204; });
    HttpPersistenceClient client(service.url(), std::string("secret"), short_timeouts());

    CallSummaryPayload payload;
    payload.call_id = "call-1";
    payload.lead_id = "lead-7";
    payload.summary = "Saved by voice orchestrator";
    client.persist_call_summary(payload);

    const auto requests = service.requests();
    REQUIRE(requests.size() == 1);
    REQUIRE(requests[0].path == "/call-summaries");
    REQUIRE(requests[0].body["call_id"] == "call-1");
    REQUIRE(requests[0].body["lead_id"] == "lead-7");
    REQUIRE(requests[0].body["audio_url"].is_null());
    REQUIRE(requests[0].body["status"] == "completed");
}

TEST_CASE("server errors carry the status code in the error text") {
    StubService service([](const json&, httplib::Response& res) {
        res.status = 503;
        res.set_content("overloaded", "text/plain");
    });
    HttpPersistenceClient client(service.url(), std::nullopt, short_timeouts());

    CallSummaryPayload payload;
    payload.call_id = "call-1";
    try {
        client.persist_call_summary(payload);
        FAIL("expected HttpError");
    } catch (const HttpError& ex) {
        REQUIRE(ex.status() == 503);
        const std::string message = ex.what();
        REQUIRE(message.find("503") != std::string::npos);
        REQUIRE(message.find("overloaded") != std::string::npos);
    }
}

TEST_CASE("rejected credentials are a permission error") {
    StubService service([](const json&, httplib::Response& res) { res.status = 401; });
    HttpPersistenceClient client(service.url(), std::string("wrong"), short_timeouts());
    REQUIRE_THROWS_AS(client.persist_call_summary(CallSummaryPayload{}), HttpPermissionError);
}

TEST_CASE("an unreachable service reports a connection error") {
    std::string url;
    {
        StubService service([](const json&, httplib::Response& res) { res.status = 204; });
        url = service.url();
    }
    HttpPersistenceClient client(url, std::nullopt, short_timeouts());
    try {
        client.persist_call_summary(CallSummaryPayload{});
        FAIL("expected HttpError");
    } catch (const HttpError& ex) {
        REQUIRE(ex.status() == 0);
    }
}
