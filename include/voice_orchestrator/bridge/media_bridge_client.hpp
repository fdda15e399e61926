#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "voice_orchestrator/bridge/engines.hpp"
#include "voice_orchestrator/call/event.hpp"

namespace voice_orchestrator::bridge {

/**
 * WebSocket session with the media gateway that hosts the VAD, ASR and TTS
 * engines of one call.
 *
 * Inbound messages are normalized into events and handed to the sink (the
 * call inbox). connect() returns once the WebSocket is open and throws when
 * it does not open within the connect timeout. A connection that drops
 * afterwards is reported once as AdapterFailed; there is no reconnect.
 */
class MediaBridgeClient : public TtsEngine, public AsrEngine, public VadEngine {
public:
    using EventSink = std::function<void(Event)>;

    MediaBridgeClient(std::string base_url,
                      std::string call_id,
                      std::chrono::milliseconds connect_timeout,
                      std::chrono::milliseconds stop_timeout);
    ~MediaBridgeClient() override;

    MediaBridgeClient(const MediaBridgeClient&) = delete;
    MediaBridgeClient& operator=(const MediaBridgeClient&) = delete;

    void connect(EventSink sink);
    void disconnect();

    bool is_playing() const override;
    bool stop() override;
    bool speak(const std::string& text) override;

    void resume() override;

    void enable_aec() override;
    void enable_ns() override;
    void enable_agc() override;

    std::string url() const;

private:
    enum class ConnectState { Idle, Connecting, Open, Failed };

    void run_loop();
    void mark_open();
    void handle_payload(const std::string& raw);
    void report_failure(const std::string& error);
    bool send_json(const nlohmann::json& payload);
    void send_vad_hints();

    std::string base_url_;
    std::string call_id_;
    std::chrono::milliseconds connect_timeout_;
    std::chrono::milliseconds stop_timeout_;
    EventSink sink_;
    std::atomic<bool> running_{false};
    std::atomic<bool> failure_reported_{false};
    std::atomic<bool> playing_{false};
    std::thread worker_;

    std::mutex ws_mutex_;
    struct WsState;
    std::unique_ptr<WsState> ws_state_;

    std::mutex connect_mutex_;
    std::condition_variable connect_cv_;
    ConnectState connect_state_ = ConnectState::Idle;
    std::string connect_error_;

    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
    uint64_t next_stop_id_ = 0;
    uint64_t acked_stop_id_ = 0;

    std::mutex hints_mutex_;
    bool aec_ = false;
    bool ns_ = false;
    bool agc_ = false;
};

}
