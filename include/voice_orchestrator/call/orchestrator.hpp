#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "voice_orchestrator/backend/knowledge_base.hpp"
#include "voice_orchestrator/backend/persistence.hpp"
#include "voice_orchestrator/backend/reply_generator.hpp"
#include "voice_orchestrator/bridge/engines.hpp"
#include "voice_orchestrator/call/call_session.hpp"
#include "voice_orchestrator/call/config_controller.hpp"
#include "voice_orchestrator/call/event.hpp"
#include "voice_orchestrator/call/event_inbox.hpp"
#include "voice_orchestrator/call/inactivity_scheduler.hpp"
#include "voice_orchestrator/call/reply_sanitizer.hpp"
#include "voice_orchestrator/config.hpp"
#include "voice_orchestrator/resilience/resilient_invoker.hpp"
#include "voice_orchestrator/routing/router.hpp"
#include "voice_orchestrator/utils/async.hpp"
#include "voice_orchestrator/utils/clock.hpp"
#include "voice_orchestrator/utils/timer.hpp"

namespace voice_orchestrator {

// Fixed utterances and escalation limits of a call.
struct OrchestratorPolicy {
    std::string reminder_text = "Just checking, shall I proceed?";
    std::string fallback_text = "Sorry, I ran into a problem there. Could you say that again?";
    std::string busy_fallback_text =
        "Sorry, our systems are busy right now. Please bear with me and try again in a moment.";
    std::string summary_text = "Saved by voice orchestrator";
    int max_tts_stop_failures = 3;
    int max_consecutive_turn_failures = 3;

    static OrchestratorPolicy from_config(const Config& config);
};

struct CallDependencies {
    std::shared_ptr<TtsEngine> tts;
    std::shared_ptr<AsrEngine> asr;
    std::shared_ptr<VadEngine> vad;
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
};

struct CallResult {
    std::string call_id;
    std::string status;
    bool persisted = false;
    std::string persist_error;
    CallSummaryPayload payload;
};

// Thread-safe view of a running call for the control API.
struct CallSnapshot {
    std::string call_id;
    TurnState state = TurnState::Idle;
    std::size_t transcript_size = 0;
    int reminders_sent = 0;
    int turn_failures = 0;
    bool error = false;
    TurnSettings settings;
};

/**
 * Turn-taking state machine of one call.
 *
 * Events are taken from the inbox and processed strictly one at a time;
 * every side effect on the TTS/ASR/VAD adapters originates here. Retrieval,
 * generation and persistence run on the async runner and report back as
 * ReplyReady/ReplyFailed/PersistFinished events, so barge-in keeps being
 * served while a reply is in flight. A completion whose turn id is no longer
 * pending is discarded.
 *
 * After the call has ended only PersistFinished is processed; the finish
 * handler then runs exactly once and the inbox is closed.
 */
class CallOrchestrator {
public:
    using FinishHandler = std::function<void(const CallResult&)>;

    CallOrchestrator(CallInfo info,
                     TurnSettings settings,
                     CallDependencies deps,
                     OrchestratorPolicy policy,
                     std::shared_ptr<EventInbox> inbox);

    CallOrchestrator(const CallOrchestrator&) = delete;
    CallOrchestrator& operator=(const CallOrchestrator&) = delete;

    void set_on_finished(FinishHandler handler);

    void dispatch(const Event& event);
    // Processes every queued event, including those queued while draining.
    std::size_t drain();
    // Blocks processing events until the call has finished.
    void run();

    const CallSession& session() const { return session_; }
    TurnState state() const { return session_.state; }
    TurnSettings settings() const { return controller_.settings(); }
    bool finished() const { return finished_; }
    CallSnapshot snapshot() const;
    // Summary sealed at call end; empty until the call has ended. Thread-safe.
    std::optional<CallSummaryPayload> sealed_summary() const;
    const std::shared_ptr<EventInbox>& inbox() const { return inbox_; }

private:
    void on_call_started(const Event& event);
    void on_speech_start();
    void on_speech_end();
    void on_silence(int64_t silence_ms);
    void on_asr_final(const std::string& text);
    void on_tts_start();
    void on_tts_end();
    void on_inactivity_elapsed(uint64_t generation);
    void on_reply_ready(const Event& event);
    void on_reply_failed(const Event& event);
    void on_config_patch(const Event& event);
    void on_persist_finished(const Event& event);

    void start_processing();
    void handle_turn_failure(const std::string& error, bool circuit_open);
    // False when the command did not reach the TTS engine; the call has then failed.
    bool speak(const std::string& text, UtteranceKind kind);
    void send_reminder();
    void fail(const std::string& source, const std::string& error);
    void end_call(const std::string& reason);
    void transition(TurnState next);
    bool terminal() const;
    void update_snapshot();

    CallSession session_;
    ConfigController controller_;
    CallDependencies deps_;
    OrchestratorPolicy policy_;
    std::shared_ptr<EventInbox> inbox_;
    InactivityScheduler scheduler_;
    ReplySanitizer sanitizer_;
    FinishHandler on_finished_;

    struct QueuedUtterance {
        std::string text;
        UtteranceKind kind = UtteranceKind::Reply;
    };

    // Reply or fallback that arrived while the agent was still talking; spoken on TtsEnd.
    std::optional<QueuedUtterance> queued_reply_;
    bool persist_started_ = false;
    bool finished_ = false;
    CallResult result_;

    mutable std::mutex snapshot_mutex_;
    CallSnapshot snapshot_;
    std::optional<CallSummaryPayload> sealed_summary_;
};

}
