#include <catch2/catch_test_macros.hpp>

#include "support/fakes.hpp"
#include "voice_orchestrator/call/orchestrator.hpp"

#include <chrono>
#include <memory>
#include <string>

using namespace voice_orchestrator;
using namespace voice_orchestrator::testing;
using std::chrono::milliseconds;

namespace {

struct CallHarness {
    explicit CallHarness(CallInfo info = default_info(),
                         TurnSettings settings = {},
                         RetryConfig kb_retry = single_attempt_retry()) {
        clock = std::make_shared<FakeClock>();
        timers = std::make_shared<ManualTimerService>(clock);
        tts = std::make_shared<RecordingTts>(clock);
        asr = std::make_shared<RecordingAsr>();
        vad = std::make_shared<RecordingVad>();
        kb = std::make_shared<ScriptedKnowledgeBase>();
        generator = std::make_shared<ScriptedReplyGenerator>();
        persistence = std::make_shared<RecordingPersistence>();
        kb_invoker = make_invoker("kb", kb_retry, clock);
        reply_invoker = make_invoker("reply", single_attempt_retry(), clock);
        persist_invoker = make_invoker("persist", single_attempt_retry(), clock);
        inbox = std::make_shared<EventInbox>();

        CallDependencies deps;
        deps.tts = tts;
        deps.asr = asr;
        deps.vad = vad;
        deps.knowledge_base = kb;
        deps.router = std::make_shared<KeywordRouter>();
        deps.reply_generator = generator;
        deps.persistence = persistence;
        deps.kb_invoker = kb_invoker;
        deps.reply_invoker = reply_invoker;
        deps.persist_invoker = persist_invoker;
        deps.timers = timers;
        deps.clock = clock;
        deps.async_runner = [this](std::function<void()> task) {
            if (defer_async) {
                deferred.runner()(std::move(task));
            } else {
                task();
            }
        };

        orchestrator = std::make_unique<CallOrchestrator>(std::move(info), settings,
                                                          std::move(deps), OrchestratorPolicy{},
                                                          inbox);
        orchestrator->set_on_finished([this](const CallResult& result) {
            ++finished_calls;
            last_result = result;
        });
    }

    static CallInfo default_info() {
        CallInfo info;
        info.call_id = "call-1";
        info.lead_id = "lead-7";
        info.product = "broadband";
        info.greeting = "Hello, this is your broadband assistant.";
        return info;
    }

    void send(Event event) {
        inbox->push(std::move(event));
        orchestrator->drain();
    }

    void advance(milliseconds delta) {
        timers->advance(delta);
        orchestrator->drain();
    }

    void release_async() {
        deferred.run_all();
        orchestrator->drain();
    }

    // Agent playback runs to completion.
    void finish_playback() {
        tts->playing = false;
        send(Event::tts_end());
    }

    // A complete user turn, ending with enough silence to hand over the floor.
    void user_turn(const std::string& text, int64_t silence_ms = 200) {
        send(Event::speech_start());
        clock->advance(milliseconds(300));
        send(Event::speech_end());
        send(Event::asr_final(text));
        send(Event::silence_for(silence_ms));
    }

    const CallSession& session() const { return orchestrator->session(); }

    std::size_t agent_utterances(UtteranceKind kind) const {
        std::size_t count = 0;
        for (const auto& utterance : session().transcript.utterances()) {
            if (utterance.role == Role::Agent && utterance.kind == kind) {
                ++count;
            }
        }
        return count;
    }

    std::shared_ptr<FakeClock> clock;
    std::shared_ptr<ManualTimerService> timers;
    std::shared_ptr<RecordingTts> tts;
    std::shared_ptr<RecordingAsr> asr;
    std::shared_ptr<RecordingVad> vad;
    std::shared_ptr<ScriptedKnowledgeBase> kb;
    std::shared_ptr<ScriptedReplyGenerator> generator;
    std::shared_ptr<RecordingPersistence> persistence;
    std::shared_ptr<ResilientInvoker> kb_invoker;
    std::shared_ptr<ResilientInvoker> reply_invoker;
    std::shared_ptr<ResilientInvoker> persist_invoker;
    std::shared_ptr<EventInbox> inbox;
    std::unique_ptr<CallOrchestrator> orchestrator;

    bool defer_async = false;
    DeferredRunner deferred;
    int finished_calls = 0;
    CallResult last_result;
};

}

TEST_CASE("call start speaks the greeting and sends audio hints") {
    CallHarness call;
    call.send(Event::call_started());

    REQUIRE(call.orchestrator->state() == TurnState::AgentSpeaking);
    REQUIRE(call.vad->aec);
    REQUIRE(call.vad->ns);
    REQUIRE(call.vad->agc);
    REQUIRE(call.tts->spoken.size() == 1);
    REQUIRE(call.agent_utterances(UtteranceKind::Greeting) == 1);
}

TEST_CASE("call start without greeting listens for the user") {
    auto info = CallHarness::default_info();
    info.greeting.reset();
    CallHarness call(info);
    call.send(Event::call_started());

    REQUIRE(call.orchestrator->state() == TurnState::ListeningForUser);
    REQUIRE(call.tts->spoken.empty());
}

TEST_CASE("call start applies the per-call config patch") {
    CallHarness call;
    auto started = Event::call_started();
    ConfigPatch patch;
    patch.max_reminders = 3;
    patch.barge_in = false;
    started.patch = patch;
    call.send(started);

    REQUIRE(call.orchestrator->settings().max_reminders == 3);
    REQUIRE_FALSE(call.orchestrator->settings().barge_in);
    REQUIRE(call.session().reminders.max_reminders == 3);
}

TEST_CASE("user speaking into agent playback stops it once and records the cutoff") {
    CallHarness call;
    call.tts->stop_latency = milliseconds(12);
    call.send(Event::call_started());
    call.send(Event::tts_start());
    call.clock->advance(milliseconds(50));
    call.send(Event::speech_start());

    REQUIRE(call.tts->stop_calls == 1);
    REQUIRE(call.tts->operations.back() == "stop");
    REQUIRE(call.session().metrics.barge_in_cutoff_ms().size() == 1);
    REQUIRE(call.session().metrics.barge_in_cutoff_ms().front() == 12.0);
    REQUIRE(call.orchestrator->state() == TurnState::ListeningForUser);
    REQUIRE(call.asr->resume_calls == 1);

    call.send(Event::asr_final("I want to know the price"));
    const auto& utterances = call.session().transcript.utterances();
    REQUIRE(utterances.size() == 2);
    REQUIRE(utterances[0].kind == UtteranceKind::Greeting);
    REQUIRE(utterances[1].role == Role::User);
}

TEST_CASE("barge-in disabled lets the agent finish") {
    TurnSettings settings;
    settings.barge_in = false;
    CallHarness call(CallHarness::default_info(), settings);
    call.send(Event::call_started());
    call.send(Event::tts_start());
    call.send(Event::speech_start());

    REQUIRE(call.tts->stop_calls == 0);
    REQUIRE(call.session().metrics.barge_in_cutoff_ms().empty());
}

TEST_CASE("speech start while idle does not stop playback") {
    CallHarness call;
    call.send(Event::call_started());
    call.finish_playback();
    call.send(Event::speech_start());

    REQUIRE(call.tts->stop_calls == 0);
    REQUIRE(call.session().metrics.barge_in_cutoff_ms().empty());
}

TEST_CASE("only silence at or above trigger plus hangover starts processing") {
    CallHarness call;
    call.send(Event::call_started());
    call.finish_playback();

    call.user_turn("tell me about the renewal offer", 109);
    REQUIRE(call.orchestrator->state() == TurnState::ListeningForUser);
    REQUIRE(call.kb->queries.empty());

    call.send(Event::silence_for(110));
    REQUIRE(call.kb->queries.size() == 1);
    REQUIRE(call.agent_utterances(UtteranceKind::Reply) == 1);
    REQUIRE(call.tts->spoken.back() ==
            "Here's the best plan for you. (Grounded on 2 KB docs.) Shall I proceed?");
    REQUIRE(call.orchestrator->state() == TurnState::AgentSpeaking);
    REQUIRE(call.session().metrics.first_response_ms().size() == 1);
}

TEST_CASE("silence while the agent is playing never starts processing") {
    CallHarness call;
    call.send(Event::call_started());
    call.send(Event::speech_start());
    call.clock->advance(milliseconds(300));
    call.send(Event::speech_end());
    call.tts->playing = true;
    call.send(Event::silence_for(500));

    REQUIRE(call.kb->queries.empty());
}

TEST_CASE("a speech burst shorter than the minimum is ignored") {
    CallHarness call;
    call.send(Event::call_started());
    call.finish_playback();
    call.send(Event::speech_start());
    call.clock->advance(milliseconds(20));
    call.send(Event::speech_end());
    call.send(Event::silence_for(500));

    REQUIRE(call.kb->queries.empty());
    REQUIRE_FALSE(call.session().awaiting_agent_turn);
}

TEST_CASE("a second speech start before silence returns to listening") {
    CallHarness call;
    call.send(Event::call_started());
    call.finish_playback();
    call.send(Event::speech_start());
    call.clock->advance(milliseconds(300));
    call.send(Event::speech_end());
    REQUIRE(call.session().awaiting_agent_turn);

    call.send(Event::speech_start());
    REQUIRE_FALSE(call.session().awaiting_agent_turn);
    REQUIRE(call.orchestrator->state() == TurnState::ListeningForUser);
}

TEST_CASE("support questions are routed to the support reply") {
    CallHarness call;
    call.send(Event::call_started());
    call.finish_playback();
    call.user_turn("I cannot login, the otp fails");

    REQUIRE(call.generator->requests.size() == 1);
    REQUIRE(call.generator->requests.front().branch == Branch::SupportFaq);
    REQUIRE(call.tts->spoken.back() ==
            "Let's solve this. Based on 2 KB docs, here are the steps.");
}

TEST_CASE("retrieval is skipped when auto retrieve is off") {
    TurnSettings settings;
    settings.kb_auto_retrieve = false;
    CallHarness call(CallHarness::default_info(), settings);
    call.send(Event::call_started());
    call.finish_playback();
    call.user_turn("price please");

    REQUIRE(call.kb->queries.empty());
    REQUIRE(call.generator->requests.front().chunks.empty());
}

TEST_CASE("retrieval query carries product selection and limits") {
    auto info = CallHarness::default_info();
    info.selected_kb_ids = std::vector<std::string>{"doc-a", "doc-b"};
    TurnSettings settings;
    settings.kb_max_chunks = 4;
    settings.kb_rerank = false;
    CallHarness call(info, settings);
    call.send(Event::call_started());
    call.finish_playback();
    call.user_turn("price please");

    REQUIRE(call.kb->queries.size() == 1);
    const auto& query = call.kb->queries.front();
    REQUIRE(query.product == "broadband");
    REQUIRE(query.selected_ids->size() == 2);
    REQUIRE(query.max_chunks == 4);
    REQUIRE_FALSE(query.rerank);
}

TEST_CASE("generated replies are sanitized before they are spoken") {
    CallHarness call;
    call.generator->reply = "Should I use the knowledge base? Our premium plan fits you \xF0\x9F\x98\x80";
    call.send(Event::call_started());
    call.finish_playback();
    call.user_turn("which plan");

    REQUIRE(call.tts->spoken.back() == "? Our premium plan fits you");
}

TEST_CASE("inactivity after agent playback sends exactly one reminder") {
    CallHarness call;
    call.send(Event::call_started());
    call.finish_playback();

    call.advance(milliseconds(2999));
    REQUIRE(call.agent_utterances(UtteranceKind::Reminder) == 0);

    call.advance(milliseconds(2));
    REQUIRE(call.agent_utterances(UtteranceKind::Reminder) == 1);
    REQUIRE(call.session().reminders.reminders_sent == 1);
    REQUIRE(call.session().metrics.reminders_sent() == 1);
    REQUIRE(call.tts->stop_calls == 0);

    call.finish_playback();
    call.advance(milliseconds(60000));
    REQUIRE(call.agent_utterances(UtteranceKind::Reminder) == 1);
    REQUIRE(call.session().reminders.reminders_sent == 1);
}

TEST_CASE("reminder timer is suppressed while the agent speaks") {
    CallHarness call;
    call.send(Event::call_started());
    call.send(Event::tts_start());
    call.advance(milliseconds(10000));

    REQUIRE(call.agent_utterances(UtteranceKind::Reminder) == 0);
}

TEST_CASE("a due reminder is withheld while playback is active") {
    CallHarness call;
    call.send(Event::call_started());
    call.send(Event::tts_end());
    REQUIRE(call.tts->playing);

    call.advance(milliseconds(3001));
    REQUIRE(call.agent_utterances(UtteranceKind::Reminder) == 0);
    REQUIRE(call.session().metrics.reminders_during_tts() == 1);
    REQUIRE(call.tts->stop_calls == 0);
}

TEST_CASE("a due reminder is withheld while the user speaks") {
    TurnSettings settings;
    settings.barge_in = false;
    CallHarness call(CallHarness::default_info(), settings);
    call.send(Event::call_started());
    call.send(Event::speech_start());
    call.finish_playback();

    call.advance(milliseconds(3001));
    REQUIRE(call.agent_utterances(UtteranceKind::Reminder) == 0);
    REQUIRE(call.session().metrics.reminders_during_speech() == 1);
}

TEST_CASE("a new user turn re-enables reminders") {
    CallHarness call;
    call.send(Event::call_started());
    call.finish_playback();
    call.advance(milliseconds(3001));
    REQUIRE(call.session().reminders.reminders_sent == 1);

    call.finish_playback();
    call.user_turn("what is the price");
    REQUIRE(call.session().reminders.reminders_sent == 0);

    call.finish_playback();
    call.advance(milliseconds(3001));
    REQUIRE(call.agent_utterances(UtteranceKind::Reminder) == 2);
}

TEST_CASE("reply completing after the user took the floor is discarded") {
    CallHarness call;
    call.defer_async = true;
    call.send(Event::call_started());
    call.finish_playback();
    call.user_turn("price of the upgrade");
    REQUIRE(call.orchestrator->state() == TurnState::Processing);

    call.send(Event::speech_start());
    call.release_async();

    REQUIRE(call.agent_utterances(UtteranceKind::Reply) == 0);
    REQUIRE(call.orchestrator->state() == TurnState::ListeningForUser);
    REQUIRE(call.session().metrics.first_response_ms().empty());
}

TEST_CASE("retrieval failure speaks the fallback and keeps listening") {
    CallHarness call;
    call.kb->error = "HTTP 503 service unavailable";
    call.send(Event::call_started());
    call.finish_playback();
    call.user_turn("price please");

    REQUIRE(call.agent_utterances(UtteranceKind::Fallback) == 1);
    REQUIRE(call.tts->spoken.back() == OrchestratorPolicy{}.fallback_text);
    REQUIRE(call.session().metrics.turn_failures() == 1);
    REQUIRE(call.orchestrator->state() == TurnState::AgentSpeaking);
    REQUIRE_FALSE(call.session().error);
}

TEST_CASE("an empty reply after sanitization is a turn failure") {
    CallHarness call;
    call.generator->reply = "do you want me to check the KB";
    call.send(Event::call_started());
    call.finish_playback();
    call.user_turn("price please");

    REQUIRE(call.agent_utterances(UtteranceKind::Reply) == 0);
    REQUIRE(call.agent_utterances(UtteranceKind::Fallback) == 1);
}

TEST_CASE("open circuit answers with the busy fallback") {
    CallHarness call(CallHarness::default_info(), TurnSettings{}, single_attempt_retry(1));
    call.kb->error = "HTTP 503 service unavailable";
    call.send(Event::call_started());
    call.finish_playback();

    call.user_turn("price please");
    REQUIRE(call.kb_invoker->status().state == CircuitState::Open);
    REQUIRE(call.tts->spoken.back() == OrchestratorPolicy{}.fallback_text);

    call.finish_playback();
    call.user_turn("price please");
    REQUIRE(call.kb->queries.size() == 1);
    REQUIRE(call.tts->spoken.back() == OrchestratorPolicy{}.busy_fallback_text);
    REQUIRE(call.session().metrics.turn_failures() == 2);
    REQUIRE_FALSE(call.session().error);
}

TEST_CASE("repeated turn failures escalate to an error end") {
    CallHarness call;
    call.generator->error = "HTTP 400 bad request";
    call.send(Event::call_started());
    for (int turn = 0; turn < 3; ++turn) {
        call.finish_playback();
        call.user_turn("price please");
    }

    REQUIRE(call.orchestrator->state() == TurnState::Ended);
    REQUIRE(call.session().error);
    REQUIRE(call.persistence->payloads.size() == 1);
    REQUIRE(call.persistence->payloads.front().status == "error");
    REQUIRE(call.persistence->payloads.front().error);
    REQUIRE(call.agent_utterances(UtteranceKind::Fallback) == 2);
}

TEST_CASE("adapter failure force-ends the call with the partial transcript") {
    CallHarness call;
    call.send(Event::call_started());
    call.send(Event::asr_final("hello"));
    call.send(Event::adapter_failed("media_bridge", "connection closed"));

    REQUIRE(call.finished_calls == 1);
    REQUIRE(call.last_result.status == "error");
    REQUIRE(call.persistence->payloads.size() == 1);
    const auto& payload = call.persistence->payloads.front();
    REQUIRE(payload.error);
    REQUIRE(payload.transcript.size() == 2);
    REQUIRE(call.tts->stop_calls == 1);
}

TEST_CASE("unconfirmed playback stops escalate to an error end") {
    CallHarness call;
    call.tts->confirm_stop = false;
    call.send(Event::call_started());
    for (int attempt = 0; attempt < 3; ++attempt) {
        call.send(Event::speech_start());
        call.clock->advance(milliseconds(10));
        call.send(Event::speech_end());
    }

    REQUIRE(call.session().error);
    REQUIRE(call.orchestrator->state() == TurnState::Ended);
    REQUIRE(call.persistence->payloads.size() == 1);
    REQUIRE(call.session().metrics.barge_in_cutoff_ms().empty());
}

TEST_CASE("call end persists the summary exactly once") {
    CallHarness call;
    call.send(Event::call_started());
    call.send(Event::tts_start());
    call.clock->advance(milliseconds(40));
    call.send(Event::speech_start());
    call.clock->advance(milliseconds(300));
    call.send(Event::speech_end());
    call.send(Event::asr_final("any discount on the plan"));
    call.send(Event::silence_for(150));

    call.send(Event::call_end_requested("hangup"));
    call.send(Event::call_end_requested("api"));

    REQUIRE(call.persistence->attempts == 1);
    REQUIRE(call.finished_calls == 1);
    REQUIRE(call.last_result.persisted);
    REQUIRE(call.inbox->closed());

    const auto& payload = call.persistence->payloads.front();
    REQUIRE(payload.call_id == "call-1");
    REQUIRE(payload.lead_id == std::optional<std::string>("lead-7"));
    REQUIRE(payload.status == "completed");
    REQUIRE(payload.transcript.size() == call.session().transcript.size());
    REQUIRE(payload.metrics.barge_in_samples == 1);
    REQUIRE(payload.metrics.barge_in_avg_ms >= 0.0);
    REQUIRE(payload.metrics.first_response_p95_ms >= 0.0);
    REQUIRE(payload.metrics.kb_chunks_used == 2);
}

TEST_CASE("call end without samples reports zero latencies") {
    CallHarness call;
    call.send(Event::call_started());
    call.send(Event::call_end_requested("hangup"));

    const auto& metrics = call.persistence->payloads.front().metrics;
    REQUIRE(metrics.barge_in_avg_ms == 0.0);
    REQUIRE(metrics.barge_in_p95_ms == 0.0);
    REQUIRE(metrics.first_response_avg_ms == 0.0);
    REQUIRE(metrics.first_response_p95_ms == 0.0);
}

TEST_CASE("events after the call ended are discarded") {
    CallHarness call;
    call.defer_async = true;
    call.send(Event::call_started());
    call.send(Event::call_end_requested("hangup"));
    const auto spoken = call.tts->spoken.size();

    call.send(Event::speech_start());
    call.send(Event::silence_for(500));
    REQUIRE(call.tts->spoken.size() == spoken);
    REQUIRE(call.orchestrator->state() == TurnState::Ended);

    call.release_async();
    REQUIRE(call.finished_calls == 1);
}

TEST_CASE("persistence failure is reported to the finish handler") {
    CallHarness call;
    call.persistence->error = "HTTP 500 server error";
    call.send(Event::call_started());
    call.send(Event::call_end_requested("hangup"));

    REQUIRE(call.finished_calls == 1);
    REQUIRE_FALSE(call.last_result.persisted);
    REQUIRE(call.last_result.persist_error.find("500") != std::string::npos);
    REQUIRE(call.last_result.payload.call_id == "call-1");
}

TEST_CASE("live config patch takes effect at the next decision") {
    CallHarness call;
    call.send(Event::call_started());
    ConfigPatch patch;
    patch.barge_in = false;
    patch.silence_trigger_ms = 400;
    call.send(Event::config_patch_applied(patch));

    call.send(Event::speech_start());
    REQUIRE(call.tts->stop_calls == 0);

    call.finish_playback();
    call.clock->advance(milliseconds(300));
    call.send(Event::speech_end());
    call.send(Event::silence_for(200));
    REQUIRE(call.kb->queries.empty());
    call.send(Event::silence_for(460));
    REQUIRE(call.kb->queries.size() == 1);
}

TEST_CASE("reply ready during playback waits for playback to end") {
    CallHarness call;
    call.defer_async = true;
    call.send(Event::call_started());
    call.finish_playback();
    call.user_turn("price please");

    call.tts->playing = true;
    call.release_async();
    REQUIRE(call.agent_utterances(UtteranceKind::Reply) == 0);
    REQUIRE(call.tts->spoken.size() == 1);

    call.finish_playback();
    REQUIRE(call.agent_utterances(UtteranceKind::Reply) == 1);
    REQUIRE(call.tts->spoken.size() == 2);
    REQUIRE(call.tts->stop_calls == 0);
}

TEST_CASE("fallback finishing during playback is spoken as a fallback") {
    CallHarness call;
    call.defer_async = true;
    call.kb->error = "HTTP 503 service unavailable";
    call.send(Event::call_started());
    call.finish_playback();
    call.user_turn("price please");

    call.tts->playing = true;
    call.release_async();
    REQUIRE(call.agent_utterances(UtteranceKind::Fallback) == 0);

    call.finish_playback();
    REQUIRE(call.agent_utterances(UtteranceKind::Fallback) == 1);
    REQUIRE(call.agent_utterances(UtteranceKind::Reply) == 0);
    REQUIRE(call.tts->spoken.back() == OrchestratorPolicy{}.fallback_text);
}

TEST_CASE("a greeting the bridge drops ends the call with an error") {
    CallHarness call;
    call.tts->deliver = false;
    call.send(Event::call_started());

    REQUIRE(call.orchestrator->state() == TurnState::Ended);
    REQUIRE(call.session().error);
    REQUIRE(call.session().transcript.size() == 0);
    REQUIRE(call.tts->spoken.empty());
    REQUIRE(call.finished_calls == 1);
    REQUIRE(call.last_result.status == "error");
    REQUIRE(call.persistence->payloads.size() == 1);
    REQUIRE(call.persistence->payloads.front().error);
}

TEST_CASE("a reply the bridge drops ends the call instead of waiting silently") {
    CallHarness call;
    call.send(Event::call_started());
    call.finish_playback();

    call.tts->deliver = false;
    call.user_turn("price please");

    REQUIRE(call.orchestrator->state() == TurnState::Ended);
    REQUIRE(call.agent_utterances(UtteranceKind::Reply) == 0);
    REQUIRE(call.last_result.status == "error");
}

TEST_CASE("the sealed summary is visible once the call has ended") {
    CallHarness call;
    call.defer_async = true;
    call.send(Event::call_started());
    REQUIRE_FALSE(call.orchestrator->sealed_summary().has_value());

    call.send(Event::call_end_requested("api"));
    const auto summary = call.orchestrator->sealed_summary();
    REQUIRE(summary.has_value());
    REQUIRE(summary->call_id == "call-1");
    REQUIRE(summary->status == "completed");
    REQUIRE(call.finished_calls == 0);

    call.release_async();
    REQUIRE(call.finished_calls == 1);
}
