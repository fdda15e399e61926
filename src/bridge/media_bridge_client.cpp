#include "voice_orchestrator/bridge/media_bridge_client.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_client.hpp>

#include "voice_orchestrator/bridge/bridge_protocol.hpp"
#include "voice_orchestrator/logging.hpp"
#include "voice_orchestrator/utils/http.hpp"

namespace voice_orchestrator::bridge {

namespace {

using WsClient = websocketpp::client<websocketpp::config::asio_client>;

}

struct MediaBridgeClient::WsState {
    std::shared_ptr<WsClient> client;
    websocketpp::connection_hdl connection;
};

MediaBridgeClient::MediaBridgeClient(std::string base_url,
                                     std::string call_id,
                                     std::chrono::milliseconds connect_timeout,
                                     std::chrono::milliseconds stop_timeout)
    : base_url_(std::move(base_url)),
      call_id_(std::move(call_id)),
      connect_timeout_(connect_timeout),
      stop_timeout_(stop_timeout) {}

MediaBridgeClient::~MediaBridgeClient() {
    disconnect();
}

void MediaBridgeClient::connect(EventSink sink) {
    if (running_) {
        return;
    }
    sink_ = std::move(sink);
    {
        std::lock_guard<std::mutex> lock(connect_mutex_);
        connect_state_ = ConnectState::Connecting;
        connect_error_.clear();
    }
    running_ = true;
    worker_ = std::thread([this]() { run_loop(); });

    std::string error;
    {
        std::unique_lock<std::mutex> lock(connect_mutex_);
        const bool settled = connect_cv_.wait_for(lock, connect_timeout_, [this]() {
            return connect_state_ != ConnectState::Connecting;
        });
        if (settled && connect_state_ == ConnectState::Open) {
            return;
        }
        error = settled ? connect_error_
                        : "no open within " + std::to_string(connect_timeout_.count()) + " ms";
        connect_state_ = ConnectState::Failed;
    }
    disconnect();
    throw std::runtime_error("Media bridge connect failed for " + url() + ": " + error);
}

void MediaBridgeClient::disconnect() {
    running_ = false;
    bool open = false;
    {
        std::lock_guard<std::mutex> lock(connect_mutex_);
        open = connect_state_ == ConnectState::Open;
    }
    {
        std::lock_guard<std::mutex> lock(ws_mutex_);
        if (ws_state_ && ws_state_->client && !open) {
            // Handshake still pending; closing would wait for it.
            ws_state_->client->stop();
        } else if (ws_state_ && ws_state_->client && !ws_state_->connection.expired()) {
            websocketpp::lib::error_code ec;
            ws_state_->client->close(ws_state_->connection,
                                     websocketpp::close::status::going_away,
                                     "call ended", ec);
            if (ec) {
                logging::debug(
                    "Media bridge close failed",
                    {kv("call_id", call_id_),
                     kv("error", ec.message())});
            }
        }
    }
    stop_cv_.notify_all();
    if (worker_.joinable()) {
        if (worker_.get_id() == std::this_thread::get_id()) {
            worker_.detach();
        } else {
            worker_.join();
        }
    }
}

bool MediaBridgeClient::is_playing() const {
    return playing_;
}

bool MediaBridgeClient::stop() {
    if (!playing_) {
        return true;
    }
    uint64_t stop_id = 0;
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stop_id = ++next_stop_id_;
    }
    if (!send_json(tts_stop_command(stop_id))) {
        return false;
    }

    std::unique_lock<std::mutex> lock(stop_mutex_);
    const bool confirmed = stop_cv_.wait_for(lock, stop_timeout_, [this, stop_id]() {
        return acked_stop_id_ >= stop_id || !running_;
    }) && acked_stop_id_ >= stop_id;
    if (confirmed) {
        playing_ = false;
    } else {
        logging::warn(
            "TTS stop not confirmed",
            {kv("call_id", call_id_),
             kv("stop_id", stop_id),
             kv("timeout_ms", stop_timeout_.count())});
    }
    return confirmed;
}

bool MediaBridgeClient::speak(const std::string& text) {
    // Playback counts from the request so a barge-in racing tts_start still stops it.
    if (!send_json(speak_command(text))) {
        return false;
    }
    playing_ = true;
    return true;
}

void MediaBridgeClient::resume() {
    send_json(asr_resume_command());
}

void MediaBridgeClient::enable_aec() {
    {
        std::lock_guard<std::mutex> lock(hints_mutex_);
        aec_ = true;
    }
    send_vad_hints();
}

void MediaBridgeClient::enable_ns() {
    {
        std::lock_guard<std::mutex> lock(hints_mutex_);
        ns_ = true;
    }
    send_vad_hints();
}

void MediaBridgeClient::enable_agc() {
    {
        std::lock_guard<std::mutex> lock(hints_mutex_);
        agc_ = true;
    }
    send_vad_hints();
}

std::string MediaBridgeClient::url() const {
    return utils::to_websocket_url(utils::join_path(base_url_, "/calls/" + utils::url_encode(call_id_)));
}

void MediaBridgeClient::send_vad_hints() {
    nlohmann::json command;
    {
        std::lock_guard<std::mutex> lock(hints_mutex_);
        command = vad_hints_command(aec_, ns_, agc_);
    }
    send_json(command);
}

bool MediaBridgeClient::send_json(const nlohmann::json& payload) {
    std::lock_guard<std::mutex> lock(ws_mutex_);
    if (!ws_state_ || !ws_state_->client || ws_state_->connection.expired()) {
        logging::warn(
            "Media bridge not connected, command dropped",
            {kv("call_id", call_id_),
             kv("type", payload.value("type", ""))});
        return false;
    }
    websocketpp::lib::error_code ec;
    ws_state_->client->send(ws_state_->connection, payload.dump(),
                            websocketpp::frame::opcode::text, ec);
    if (ec) {
        logging::warn(
            "Media bridge send failed",
            {kv("call_id", call_id_),
             kv("type", payload.value("type", "")),
             kv("error", ec.message())});
        return false;
    }
    return true;
}

void MediaBridgeClient::handle_payload(const std::string& raw) {
    InboundMessage message;
    try {
        message = parse_message(nlohmann::json::parse(raw));
    } catch (const std::exception& ex) {
        logging::warn(
            "Malformed media bridge message dropped",
            {kv("call_id", call_id_),
             kv("error", ex.what())});
        return;
    }

    switch (message.kind) {
        case MessageKind::TtsStopped: {
            {
                std::lock_guard<std::mutex> lock(stop_mutex_);
                if (message.stop_id == 0) {
                    acked_stop_id_ = next_stop_id_;
                } else if (message.stop_id > acked_stop_id_) {
                    acked_stop_id_ = message.stop_id;
                }
            }
            playing_ = false;
            stop_cv_.notify_all();
            return;
        }
        case MessageKind::Event:
            if (message.event->type == EventType::TtsStart) {
                playing_ = true;
            } else if (message.event->type == EventType::TtsEnd) {
                playing_ = false;
            }
            if (sink_) {
                sink_(std::move(*message.event));
            }
            return;
        case MessageKind::Unknown:
            logging::debug(
                "Unknown media bridge message dropped",
                {kv("call_id", call_id_),
                 kv("type", message.type)});
            return;
    }
}

void MediaBridgeClient::mark_open() {
    {
        std::lock_guard<std::mutex> lock(connect_mutex_);
        if (connect_state_ != ConnectState::Connecting) {
            return;
        }
        connect_state_ = ConnectState::Open;
    }
    connect_cv_.notify_all();
    logging::info(
        "Media bridge connected",
        {kv("call_id", call_id_)});
}

void MediaBridgeClient::report_failure(const std::string& error) {
    if (!running_) {
        return;
    }
    {
        // Failures before open surface as the exception thrown by connect().
        std::lock_guard<std::mutex> lock(connect_mutex_);
        if (connect_state_ == ConnectState::Connecting) {
            connect_state_ = ConnectState::Failed;
            connect_error_ = error;
            connect_cv_.notify_all();
            return;
        }
        if (connect_state_ != ConnectState::Open) {
            return;
        }
    }
    if (failure_reported_.exchange(true)) {
        return;
    }
    logging::error(
        "Media bridge connection failed",
        {kv("call_id", call_id_),
         kv("error", error)});
    if (sink_) {
        sink_(Event::adapter_failed("media_bridge", error));
    }
}

void MediaBridgeClient::run_loop() {
    auto client = std::make_shared<WsClient>();
    client->clear_access_channels(websocketpp::log::alevel::all);
    client->clear_error_channels(websocketpp::log::elevel::all);
    client->init_asio();

    client->set_message_handler([this](websocketpp::connection_hdl,
                                       WsClient::message_ptr msg) {
        handle_payload(msg->get_payload());
    });
    client->set_open_handler([this](websocketpp::connection_hdl) {
        mark_open();
    });
    client->set_close_handler([this](websocketpp::connection_hdl) {
        report_failure("connection closed");
    });
    client->set_fail_handler([this, client](websocketpp::connection_hdl hdl) {
        std::string reason = "connection failed";
        websocketpp::lib::error_code ec;
        auto conn = client->get_con_from_hdl(hdl, ec);
        if (!ec && conn) {
            reason = conn->get_ec().message();
        }
        report_failure(reason);
    });

    websocketpp::lib::error_code ec;
    auto conn = client->get_connection(url(), ec);
    if (ec) {
        report_failure(ec.message());
        return;
    }
    {
        std::lock_guard<std::mutex> lock(ws_mutex_);
        if (!running_) {
            return;
        }
        ws_state_ = std::make_unique<WsState>();
        ws_state_->client = client;
        ws_state_->connection = conn->get_handle();
    }
    client->connect(conn);
    try {
        client->run();
    } catch (const std::exception& ex) {
        report_failure(ex.what());
    }

    report_failure("connection loop exited");
    {
        std::lock_guard<std::mutex> lock(ws_mutex_);
        ws_state_.reset();
    }
    playing_ = false;
    stop_cv_.notify_all();
}

}
