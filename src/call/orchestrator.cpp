#include "voice_orchestrator/call/orchestrator.hpp"

#include <chrono>
#include <exception>
#include <utility>
#include <vector>

#include "voice_orchestrator/logging.hpp"
#include "voice_orchestrator/metrics.hpp"
#include "voice_orchestrator/utils/text.hpp"

namespace voice_orchestrator {

namespace {

InactivityScheduler::FireHandler make_fire_handler(const std::shared_ptr<EventInbox>& inbox) {
    std::weak_ptr<EventInbox> weak_inbox = inbox;
    return [weak_inbox](uint64_t generation) {
        if (auto target = weak_inbox.lock()) {
            target->push(Event::inactivity_elapsed(generation));
        }
    };
}

// Runs one outbound operation through its invoker and records its latency.
template <typename Fn>
auto timed_invoke(ResilientInvoker& invoker,
                  const std::string& operation,
                  const std::shared_ptr<utils::Clock>& clock,
                  Fn&& fn) {
    const auto started = clock->now();
    struct Observe {
        const std::string& operation;
        const std::shared_ptr<utils::Clock>& clock;
        utils::Clock::TimePoint started;
        ~Observe() {
            ServiceMetrics::instance().observe_outbound_call(
                operation, utils::elapsed_ms(started, clock->now()) / 1000.0);
        }
    } observe{operation, clock, started};
    return invoker.invoke(operation, std::forward<Fn>(fn));
}

}

OrchestratorPolicy OrchestratorPolicy::from_config(const Config& config) {
    OrchestratorPolicy policy;
    policy.reminder_text = config.reminder_text;
    policy.fallback_text = config.fallback_text;
    policy.busy_fallback_text = config.busy_fallback_text;
    policy.max_tts_stop_failures = config.max_tts_stop_failures;
    policy.max_consecutive_turn_failures = config.max_consecutive_turn_failures;
    return policy;
}

CallOrchestrator::CallOrchestrator(CallInfo info,
                                   TurnSettings settings,
                                   CallDependencies deps,
                                   OrchestratorPolicy policy,
                                   std::shared_ptr<EventInbox> inbox)
    : controller_(settings),
      deps_(std::move(deps)),
      policy_(std::move(policy)),
      inbox_(std::move(inbox)),
      scheduler_(deps_.timers, make_fire_handler(inbox_)) {
    if (!deps_.clock) {
        deps_.clock = utils::SystemClock::shared();
    }
    if (!deps_.async_runner) {
        deps_.async_runner = utils::default_async_runner();
    }
    session_.info = std::move(info);
    scheduler_.set_max_reminders(session_.reminders, settings.max_reminders);
    result_.call_id = session_.info.call_id;
    update_snapshot();
}

void CallOrchestrator::set_on_finished(FinishHandler handler) {
    on_finished_ = std::move(handler);
}

void CallOrchestrator::dispatch(const Event& event) {
    logging::trace(
        "Dispatching event",
        {kv("call_id", session_.info.call_id),
         kv("event", to_string(event.type)),
         kv("state", to_string(session_.state))});

    if (finished_) {
        return;
    }
    if (terminal() && event.type != EventType::PersistFinished) {
        logging::debug(
            "Event after call end discarded",
            {kv("call_id", session_.info.call_id),
             kv("event", to_string(event.type))});
        return;
    }

    switch (event.type) {
        case EventType::CallStarted:
            on_call_started(event);
            break;
        case EventType::SpeechStart:
            on_speech_start();
            break;
        case EventType::SpeechEnd:
            on_speech_end();
            break;
        case EventType::SilenceFor:
            on_silence(event.silence_ms);
            break;
        case EventType::AsrPartial:
            logging::trace(
                "ASR partial",
                {kv("call_id", session_.info.call_id),
                 kv("text", event.text)});
            break;
        case EventType::AsrFinal:
            on_asr_final(event.text);
            break;
        case EventType::TtsStart:
            on_tts_start();
            break;
        case EventType::TtsEnd:
            on_tts_end();
            break;
        case EventType::InactivityElapsed:
            on_inactivity_elapsed(event.token);
            break;
        case EventType::ReplyReady:
            on_reply_ready(event);
            break;
        case EventType::ReplyFailed:
            on_reply_failed(event);
            break;
        case EventType::ConfigPatchApplied:
            on_config_patch(event);
            break;
        case EventType::AdapterFailed:
            fail(event.source, event.text);
            break;
        case EventType::CallEndRequested:
            end_call(event.source.empty() ? "requested" : event.source);
            break;
        case EventType::PersistFinished:
            on_persist_finished(event);
            break;
    }
    update_snapshot();
}

std::size_t CallOrchestrator::drain() {
    std::size_t processed = 0;
    while (auto event = inbox_->try_pop()) {
        dispatch(*event);
        ++processed;
    }
    return processed;
}

void CallOrchestrator::run() {
    while (!finished_) {
        auto event = inbox_->pop();
        if (!event) {
            break;
        }
        dispatch(*event);
    }
}

CallSnapshot CallOrchestrator::snapshot() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return snapshot_;
}

std::optional<CallSummaryPayload> CallOrchestrator::sealed_summary() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return sealed_summary_;
}

void CallOrchestrator::on_call_started(const Event& event) {
    if (session_.state != TurnState::Idle) {
        logging::warn(
            "Duplicate call start ignored",
            {kv("call_id", session_.info.call_id),
             kv("state", to_string(session_.state))});
        return;
    }
    transition(TurnState::Configuring);
    if (event.patch && !event.patch->empty()) {
        controller_.apply(*event.patch);
        scheduler_.set_max_reminders(session_.reminders, controller_.settings().max_reminders);
    }

    deps_.vad->enable_aec();
    deps_.vad->enable_ns();
    deps_.vad->enable_agc();

    ServiceMetrics::instance().increment_calls_started();
    logging::info(
        "Call started",
        {kv("call_id", session_.info.call_id),
         kv("lead_id", session_.info.lead_id.value_or("")),
         kv("product", session_.info.product)});

    const auto& greeting = session_.info.greeting;
    if (greeting && !utils::collapse_whitespace(*greeting).empty()) {
        speak(*greeting, UtteranceKind::Greeting);
    } else {
        transition(TurnState::ListeningForUser);
    }
}

void CallOrchestrator::on_speech_start() {
    scheduler_.clear(session_.reminders);
    session_.user_speaking = true;
    session_.speech_started_at = deps_.clock->now();

    const auto settings = controller_.settings();
    if (settings.barge_in && deps_.tts->is_playing()) {
        queued_reply_.reset();
        const auto requested = deps_.clock->now();
        const bool confirmed = deps_.tts->stop();
        const auto cutoff_ms = utils::elapsed_ms(requested, deps_.clock->now());
        if (confirmed) {
            session_.tts_stop_failures = 0;
            session_.metrics.record_barge_in_cutoff(cutoff_ms);
            ServiceMetrics::instance().increment_barge_ins();
            ServiceMetrics::instance().observe_barge_in_cutoff(cutoff_ms / 1000.0);
            logging::debug(
                "Barge-in stopped playback",
                {kv("call_id", session_.info.call_id),
                 kv("cutoff_ms", cutoff_ms)});
        } else {
            ++session_.tts_stop_failures;
            logging::warn(
                "Barge-in stop not confirmed",
                {kv("call_id", session_.info.call_id),
                 kv("failures", session_.tts_stop_failures)});
            if (session_.tts_stop_failures >= policy_.max_tts_stop_failures) {
                fail("tts", "playback stop not confirmed " +
                                std::to_string(session_.tts_stop_failures) + " times");
                return;
            }
        }
    }

    deps_.asr->resume();
    session_.awaiting_agent_turn = false;
    if (session_.pending_turn) {
        logging::debug(
            "User took the floor, pending reply invalidated",
            {kv("call_id", session_.info.call_id),
             kv("turn", *session_.pending_turn)});
        session_.pending_turn.reset();
        session_.processing_started_at.reset();
    }
    transition(TurnState::ListeningForUser);
}

void CallOrchestrator::on_speech_end() {
    session_.user_speaking = false;
    const auto min_speech_ms = controller_.settings().min_speech_ms;
    if (session_.speech_started_at) {
        const auto duration_ms = utils::elapsed_ms(*session_.speech_started_at, deps_.clock->now());
        session_.speech_started_at.reset();
        if (duration_ms < min_speech_ms) {
            logging::debug(
                "Speech burst ignored as noise",
                {kv("call_id", session_.info.call_id),
                 kv("duration_ms", duration_ms),
                 kv("min_speech_ms", min_speech_ms)});
            return;
        }
    }
    session_.awaiting_agent_turn = true;
}

void CallOrchestrator::on_silence(int64_t silence_ms) {
    if (!session_.awaiting_agent_turn || deps_.tts->is_playing()) {
        return;
    }
    const auto threshold = controller_.settings().silence_threshold_ms();
    if (silence_ms < threshold) {
        return;
    }
    session_.awaiting_agent_turn = false;
    start_processing();
}

void CallOrchestrator::on_asr_final(const std::string& text) {
    const auto cleaned = utils::collapse_whitespace(text);
    if (cleaned.empty()) {
        return;
    }
    Utterance utterance;
    utterance.role = Role::User;
    utterance.text = cleaned;
    utterance.timestamp_ms = deps_.clock->wall_time_ms();
    utterance.kind = UtteranceKind::Speech;
    session_.transcript.append(std::move(utterance));
    session_.last_user_text = cleaned;
    scheduler_.reset(session_.reminders);
}

void CallOrchestrator::on_tts_start() {
    scheduler_.clear(session_.reminders);
}

void CallOrchestrator::on_tts_end() {
    if (queued_reply_) {
        auto queued = std::move(*queued_reply_);
        queued_reply_.reset();
        speak(queued.text, queued.kind);
        return;
    }
    if (session_.state == TurnState::AgentSpeaking) {
        transition(TurnState::ListeningForUser);
    }
    scheduler_.arm(session_.reminders,
                   std::chrono::milliseconds(controller_.settings().inactivity_ms));
}

void CallOrchestrator::on_inactivity_elapsed(uint64_t generation) {
    if (!scheduler_.accept_fire(session_.reminders, generation)) {
        logging::trace(
            "Stale inactivity timer ignored",
            {kv("call_id", session_.info.call_id),
             kv("generation", generation)});
        return;
    }
    if (deps_.tts->is_playing()) {
        session_.metrics.increment_reminders_during_tts();
        return;
    }
    if (session_.user_speaking) {
        session_.metrics.increment_reminders_during_speech();
        return;
    }
    if (session_.state == TurnState::Processing) {
        return;
    }
    if (!scheduler_.can_remind(session_.reminders)) {
        logging::debug(
            "Reminder cap reached",
            {kv("call_id", session_.info.call_id),
             kv("reminders_sent", session_.reminders.reminders_sent)});
        return;
    }
    send_reminder();
}

void CallOrchestrator::send_reminder() {
    if (!speak(policy_.reminder_text, UtteranceKind::Reminder)) {
        return;
    }
    scheduler_.record_reminder(session_.reminders);
    session_.metrics.increment_reminders_sent();
    ServiceMetrics::instance().increment_reminders_sent();

    const auto settings = controller_.settings();
    scheduler_.arm(session_.reminders,
                   std::chrono::milliseconds(settings.inactivity_ms + settings.reminder_cooldown_ms));
}

void CallOrchestrator::start_processing() {
    if (session_.pending_turn) {
        logging::debug(
            "New turn supersedes pending reply",
            {kv("call_id", session_.info.call_id),
             kv("turn", *session_.pending_turn)});
    }
    const auto turn_id = ++session_.last_turn_id;
    session_.pending_turn = turn_id;
    session_.processing_started_at = deps_.clock->now();
    transition(TurnState::Processing);

    const auto settings = controller_.settings();
    KbQuery query;
    query.product = session_.info.product;
    query.selected_ids = session_.info.selected_kb_ids;
    query.max_chunks = settings.kb_max_chunks;
    query.rerank = settings.kb_rerank;

    logging::debug(
        "Processing user turn",
        {kv("call_id", session_.info.call_id),
         kv("turn", turn_id),
         kv("kb_auto_retrieve", settings.kb_auto_retrieve)});

    auto deps = deps_;
    auto inbox = inbox_;
    auto text = session_.last_user_text;
    const bool retrieve = settings.kb_auto_retrieve;
    deps_.async_runner([deps, inbox, text, query, retrieve, turn_id]() {
        try {
            std::vector<KbChunk> chunks;
            if (retrieve) {
                chunks = timed_invoke(*deps.kb_invoker, "kb.retrieve", deps.clock, [&]() {
                    return deps.knowledge_base->retrieve(query);
                });
            }
            const auto branch = deps.router->route(text);

            ReplyRequest request;
            request.utterance = text;
            request.chunks = chunks;
            request.branch = branch;
            request.product = query.product;
            auto reply = timed_invoke(*deps.reply_invoker, "reply.generate", deps.clock, [&]() {
                return deps.reply_generator->generate(request);
            });
            inbox->push(Event::reply_ready(turn_id, std::move(reply), chunks.size(), branch));
        } catch (const InvokeError& ex) {
            inbox->push(Event::reply_failed(turn_id, ex.what(),
                                            ex.kind() == InvokeError::Kind::CircuitOpen));
        } catch (const std::exception& ex) {
            inbox->push(Event::reply_failed(turn_id, ex.what(), false));
        }
    });
}

void CallOrchestrator::on_reply_ready(const Event& event) {
    if (!session_.pending_turn || *session_.pending_turn != event.token) {
        logging::debug(
            "Stale reply discarded",
            {kv("call_id", session_.info.call_id),
             kv("turn", event.token)});
        return;
    }
    const auto reply = sanitizer_.sanitize(event.text);
    if (reply.empty()) {
        handle_turn_failure("reply empty after sanitization", false);
        return;
    }
    session_.pending_turn.reset();
    session_.consecutive_turn_failures = 0;
    session_.metrics.add_kb_chunks(event.chunk_count);

    if (session_.processing_started_at) {
        const auto first_response_ms =
            utils::elapsed_ms(*session_.processing_started_at, deps_.clock->now());
        session_.processing_started_at.reset();
        session_.metrics.record_first_response(first_response_ms);
        ServiceMetrics::instance().observe_first_response(first_response_ms / 1000.0);
    }

    logging::debug(
        "Reply ready",
        {kv("call_id", session_.info.call_id),
         kv("turn", event.token),
         kv("branch", event.branch ? to_string(*event.branch) : "unknown"),
         kv("kb_chunks", event.chunk_count)});

    if (deps_.tts->is_playing()) {
        queued_reply_ = QueuedUtterance{reply, UtteranceKind::Reply};
        return;
    }
    speak(reply, UtteranceKind::Reply);
}

void CallOrchestrator::on_reply_failed(const Event& event) {
    if (!session_.pending_turn || *session_.pending_turn != event.token) {
        logging::debug(
            "Stale reply failure discarded",
            {kv("call_id", session_.info.call_id),
             kv("turn", event.token)});
        return;
    }
    handle_turn_failure(event.text, event.circuit_open);
}

void CallOrchestrator::handle_turn_failure(const std::string& error, bool circuit_open) {
    session_.pending_turn.reset();
    session_.processing_started_at.reset();
    ++session_.consecutive_turn_failures;
    session_.metrics.increment_turn_failures();
    ServiceMetrics::instance().increment_turn_failures();
    logging::warn(
        "Turn failed, speaking fallback",
        {kv("call_id", session_.info.call_id),
         kv("consecutive_failures", session_.consecutive_turn_failures),
         kv("circuit_open", circuit_open),
         kv("error", error)});

    if (session_.consecutive_turn_failures >= policy_.max_consecutive_turn_failures) {
        fail("turn", std::to_string(session_.consecutive_turn_failures) +
                         " consecutive turn failures, last: " + error);
        return;
    }
    const auto& text = circuit_open ? policy_.busy_fallback_text : policy_.fallback_text;
    if (deps_.tts->is_playing()) {
        queued_reply_ = QueuedUtterance{text, UtteranceKind::Fallback};
        return;
    }
    speak(text, UtteranceKind::Fallback);
}

void CallOrchestrator::on_config_patch(const Event& event) {
    if (!event.patch) {
        return;
    }
    const auto changed = controller_.apply(*event.patch);
    scheduler_.set_max_reminders(session_.reminders, controller_.settings().max_reminders);
    std::string names;
    for (const auto& name : changed) {
        if (!names.empty()) {
            names += ",";
        }
        names += name;
    }
    logging::info(
        "Config patch applied",
        {kv("call_id", session_.info.call_id),
         kv("changed", names.empty() ? "none" : names)});
}

bool CallOrchestrator::speak(const std::string& text, UtteranceKind kind) {
    if (!deps_.tts->speak(text)) {
        fail("tts", std::string("speak command not delivered (") + to_string(kind) + ")");
        return false;
    }
    Utterance utterance;
    utterance.role = Role::Agent;
    utterance.text = text;
    utterance.timestamp_ms = deps_.clock->wall_time_ms();
    utterance.kind = kind;
    const auto& appended = session_.transcript.append(std::move(utterance));
    if (is_substantive(appended)) {
        scheduler_.reset(session_.reminders);
    }
    transition(TurnState::AgentSpeaking);
    return true;
}

void CallOrchestrator::fail(const std::string& source, const std::string& error) {
    if (terminal()) {
        return;
    }
    session_.error = true;
    logging::error(
        "Unrecoverable call failure",
        {kv("call_id", session_.info.call_id),
         kv("source", source),
         kv("state", to_string(session_.state)),
         kv("error", error)});
    transition(TurnState::Error);
    end_call(source + ": " + error);
}

void CallOrchestrator::end_call(const std::string& reason) {
    if (persist_started_) {
        return;
    }
    persist_started_ = true;
    session_.end_reason = reason;

    scheduler_.clear(session_.reminders);
    session_.pending_turn.reset();
    session_.processing_started_at.reset();
    queued_reply_.reset();
    if (deps_.tts->is_playing() && !deps_.tts->stop()) {
        logging::warn(
            "Playback stop at call end not confirmed",
            {kv("call_id", session_.info.call_id)});
    }
    session_.metrics.seal();

    CallSummaryPayload payload;
    payload.call_id = session_.info.call_id;
    payload.lead_id = session_.info.lead_id;
    payload.audio_url = session_.info.audio_url;
    payload.transcript_url = session_.info.transcript_url;
    payload.summary = policy_.summary_text;
    payload.metrics = session_.metrics.summarize();
    payload.transcript = session_.transcript.to_json();
    payload.error = session_.error;
    payload.status = session_.error ? "error" : "completed";

    transition(TurnState::Ended);
    ServiceMetrics::instance().increment_calls_ended(payload.status);
    logging::info(
        "Call ended",
        {kv("call_id", session_.info.call_id),
         kv("status", payload.status),
         kv("reason", reason),
         kv("utterances", session_.transcript.size())});

    result_.status = payload.status;
    result_.payload = payload;
    {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        sealed_summary_ = payload;
    }

    auto deps = deps_;
    auto inbox = inbox_;
    deps_.async_runner([deps, inbox, payload]() {
        try {
            timed_invoke(*deps.persist_invoker, "persist.summary", deps.clock, [&]() {
                deps.persistence->persist_call_summary(payload);
            });
            inbox->push(Event::persist_finished(true, ""));
        } catch (const std::exception& ex) {
            inbox->push(Event::persist_finished(false, ex.what()));
        }
    });
}

void CallOrchestrator::on_persist_finished(const Event& event) {
    if (!persist_started_) {
        return;
    }
    result_.persisted = event.success;
    result_.persist_error = event.text;
    if (!event.success) {
        ServiceMetrics::instance().increment_persist_failures();
        logging::error(
            "Call summary not persisted",
            {kv("call_id", session_.info.call_id),
             kv("error", event.text)});
    }
    finished_ = true;
    if (on_finished_) {
        on_finished_(result_);
    }
    inbox_->close();
}

void CallOrchestrator::transition(TurnState next) {
    if (session_.state == next) {
        return;
    }
    logging::debug(
        "State transition",
        {kv("call_id", session_.info.call_id),
         kv("from", to_string(session_.state)),
         kv("to", to_string(next))});
    session_.state = next;
}

bool CallOrchestrator::terminal() const {
    return session_.state == TurnState::Ended || session_.state == TurnState::Error ||
           persist_started_;
}

void CallOrchestrator::update_snapshot() {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    snapshot_.call_id = session_.info.call_id;
    snapshot_.state = session_.state;
    snapshot_.transcript_size = session_.transcript.size();
    snapshot_.reminders_sent = session_.metrics.reminders_sent();
    snapshot_.turn_failures = session_.metrics.turn_failures();
    snapshot_.error = session_.error;
    snapshot_.settings = controller_.settings();
}

}
