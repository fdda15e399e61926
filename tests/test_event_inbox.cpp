#include <catch2/catch_test_macros.hpp>

#include "voice_orchestrator/call/event_inbox.hpp"

#include <thread>
#include <vector>

using namespace voice_orchestrator;

TEST_CASE("inbox delivers events in push order") {
    EventInbox inbox;
    REQUIRE(inbox.push(Event::speech_start()));
    REQUIRE(inbox.push(Event::silence_for(120)));
    REQUIRE(inbox.size() == 2);

    REQUIRE(inbox.try_pop()->type == EventType::SpeechStart);
    REQUIRE(inbox.try_pop()->silence_ms == 120);
    REQUIRE_FALSE(inbox.try_pop());
}

TEST_CASE("closed inbox drops new events but drains queued ones") {
    EventInbox inbox;
    inbox.push(Event::tts_end());
    inbox.close();

    REQUIRE(inbox.closed());
    REQUIRE_FALSE(inbox.push(Event::tts_start()));
    REQUIRE(inbox.pop()->type == EventType::TtsEnd);
    REQUIRE_FALSE(inbox.pop());
}

TEST_CASE("blocking pop wakes on producer push") {
    EventInbox inbox;
    std::vector<EventType> received;
    std::thread consumer([&]() {
        while (auto event = inbox.pop()) {
            received.push_back(event->type);
        }
    });
    std::thread producer([&]() {
        inbox.push(Event::speech_start());
        inbox.push(Event::speech_end());
        inbox.close();
    });
    producer.join();
    consumer.join();

    REQUIRE(received == std::vector<EventType>{EventType::SpeechStart, EventType::SpeechEnd});
}
