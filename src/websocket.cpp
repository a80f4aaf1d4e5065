#include "websocket.hpp"
#include "compact_log.hpp"
#include "easy.hpp"
#include <algorithm>
#include <format>

namespace curlmux {

namespace {

constexpr int kDataBits = CURLWS_TEXT | CURLWS_BINARY;
constexpr int kControlBits = CURLWS_PING | CURLWS_PONG | CURLWS_CLOSE;

} // namespace

FrameAction classify_frame(int flags, std::string payload) {
    if (flags & CURLWS_CLOSE) {
        return ControlTerminal{parse_close_payload(payload)};
    }
    if (flags & CURLWS_PING) {
        return ControlAutoHandled{WsMessage{WsMessageType::Pong, std::move(payload)}};
    }
    if (flags & CURLWS_PONG) {
        return DataFrame{WsMessage{WsMessageType::Pong, std::move(payload)}};
    }
    if (flags & CURLWS_TEXT) {
        return DataFrame{WsMessage{WsMessageType::Text, std::move(payload)}};
    }
    return DataFrame{WsMessage{WsMessageType::Binary, std::move(payload)}};
}

WsCloseEvent parse_close_payload(std::string_view payload) {
    WsCloseEvent event;
    event.was_clean = true;
    if (payload.size() < 2) return event;
    auto hi = static_cast<unsigned char>(payload[0]);
    auto lo = static_cast<unsigned char>(payload[1]);
    event.code = (hi << 8) | lo;
    event.reason = std::string(payload.substr(2));
    return event;
}

std::string build_close_payload(int code, std::string_view reason) {
    std::string payload;
    payload.reserve(2 + reason.size());
    payload.push_back(static_cast<char>((code >> 8) & 0xff));
    payload.push_back(static_cast<char>(code & 0xff));
    payload.append(reason);
    return payload;
}

WebSocket::WebSocket(Token, std::string url, const WebSocketConfig& config, ICurlEngine& engine, std::unique_ptr<Easy> easy)
    : url_(std::move(url)), config_(config), engine_(engine), easy_(std::move(easy)), state_(WsState::Open) {
    size_t size = std::min(config_.receive_buffer_size, config_.max_message_size);
    buffer_.resize(std::max<size_t>(size, 1));
}

WebSocket::~WebSocket() {
    close();
}

std::expected<std::unique_ptr<WebSocket>, CurlErrorInfo> WebSocket::connect(
    std::string_view url, const WebSocketConfig& config, ICurlEngine& engine) {
    auto created = Easy::create(engine);
    if (!created) return std::unexpected(created.error());
    auto easy = std::move(*created);

    auto configure = [&]() -> std::expected<void, CurlErrorInfo> {
        if (auto ok = easy->set_option(CURLOPT_URL, url); !ok) return ok;
        // 2 = keep the connection for curl_ws_send/curl_ws_recv after the upgrade.
        if (auto ok = easy->set_option(CURLOPT_CONNECT_ONLY, 2L); !ok) return ok;
        if (auto ok = easy->set_headers(config.headers); !ok) return ok;
        if (config.timeout_sec > 0) {
            if (auto ok = easy->set_option(CURLOPT_TIMEOUT, config.timeout_sec); !ok) return ok;
        }
        if (!config.verify) {
            if (auto ok = easy->set_option(CURLOPT_SSL_VERIFYPEER, 0L); !ok) return ok;
            if (auto ok = easy->set_option(CURLOPT_SSL_VERIFYHOST, 0L); !ok) return ok;
        }
        if (!config.proxy.empty()) {
            if (auto ok = easy->set_option(CURLOPT_PROXY, config.proxy); !ok) return ok;
        }
        if (!config.impersonate.empty()) {
            if (auto ok = easy->impersonate(config.impersonate); !ok) return ok;
        }
#ifdef CURLWS_NOAUTOPONG
        if (auto ok = easy->set_option(CURLOPT_WS_OPTIONS, static_cast<long>(CURLWS_NOAUTOPONG)); !ok) return ok;
#endif
        return {};
    };

    if (auto ok = configure(); !ok) return std::unexpected(ok.error());

    if (auto ok = easy->perform(); !ok) {
        compact::Writer::debug(std::format("[ws] connect to {} failed: {}\n", url, ok.error().message));
        return std::unexpected(websocket_error(
            std::format("WebSocket connect failed: {}", ok.error().message), ok.error().code));
    }

    compact::Writer::debug(std::format("[ws] connected to {}\n", url));
    return std::make_unique<WebSocket>(Token{}, std::string(url), config, engine, std::move(easy));
}

CurlErrorInfo WebSocket::closed_error_locked() const {
    if (close_event_) return websocket_closed(close_event_->code, close_event_->reason);
    return websocket_closed(1006, "Connection closed");
}

std::expected<WsMessage, CurlErrorInfo> WebSocket::receive(std::optional<std::chrono::milliseconds> timeout) {
    using clock = std::chrono::steady_clock;
    std::optional<clock::time_point> deadline;
    if (timeout) deadline = clock::now() + *timeout;

    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        if (!queue_.empty()) {
            WsMessage msg = std::move(queue_.front());
            queue_.pop_front();
            return msg;
        }
        if (state_ != WsState::Open) return std::unexpected(closed_error_locked());

        if (auto ok = read_available_locked(); !ok) return std::unexpected(ok.error());
        if (!queue_.empty() || state_ != WsState::Open) continue;

        auto wait = config_.poll_interval;
        if (deadline) {
            auto now = clock::now();
            if (now >= *deadline) {
                return std::unexpected(CurlErrorInfo{
                    CurlError::ReceiveTimeout,
                    std::format("No message received within {}ms", timeout->count())
                });
            }
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - now);
            wait = std::min(wait, std::max(left, std::chrono::milliseconds(1)));
        }
        cv_.wait_for(lock, wait, [this] { return state_ != WsState::Open; });
    }
}

std::expected<std::string, CurlErrorInfo> WebSocket::receive_text(std::optional<std::chrono::milliseconds> timeout) {
    auto msg = receive(timeout);
    if (!msg) return std::unexpected(msg.error());
    return std::move(msg->data);
}

std::expected<json::Value, CurlErrorInfo> WebSocket::receive_json(std::optional<std::chrono::milliseconds> timeout) {
    auto text = receive_text(timeout);
    if (!text) return std::unexpected(text.error());
    auto value = json::parse(*text);
    if (!value) return std::unexpected(websocket_error(std::format("Invalid JSON message: {}", value.error().message)));
    return std::move(*value);
}

// Drains every frame the engine has ready. Stops on CURLE_AGAIN.
std::expected<void, CurlErrorInfo> WebSocket::read_available_locked() {
    while (state_ == WsState::Open && easy_ && !easy_->released()) {
        auto r = engine_.ws_recv(easy_->native(), buffer_);
        if (r.code == CURLE_AGAIN) return {};
        if (r.code != CURLE_OK) {
            return std::unexpected(websocket_error(
                std::format("WebSocket receive failed: {}", engine_.easy_strerror(r.code)), r.code));
        }

        bool control = (r.flags & kControlBits) != 0;
        std::string& partial = control ? control_partial_ : data_partial_;
        int& partial_flags = control ? control_flags_ : data_flags_;
        bool& discarding = control ? control_discarding_ : data_discarding_;
        bool message_ends = r.bytes_left == 0 && (control || !(r.flags & CURLWS_CONT));

        if (discarding) {
            if (message_ends) discarding = false;
            continue;
        }

        if (partial_flags == 0) {
            partial_flags = control ? (r.flags & kControlBits) : (r.flags & kDataBits);
            if (partial_flags == 0) partial_flags = CURLWS_BINARY;
        }
        partial.append(buffer_.data(), r.received);
        if (partial.size() > config_.max_message_size) {
            partial.clear();
            partial_flags = 0;
            discarding = !message_ends;
            return std::unexpected(websocket_error(
                std::format("WebSocket message exceeds {} bytes", config_.max_message_size), CURLE_FILESIZE_EXCEEDED));
        }

        if (!message_ends) continue;

        int flags = partial_flags;
        std::string payload = std::move(partial);
        partial.clear();
        partial_flags = 0;
        handle_frame_locked(flags, std::move(payload));
    }
    return {};
}

void WebSocket::handle_frame_locked(int flags, std::string payload) {
    FrameAction action = classify_frame(flags, std::move(payload));

    if (auto* data = std::get_if<DataFrame>(&action)) {
        queue_.push_back(std::move(data->message));
        return;
    }

    if (auto* control = std::get_if<ControlAutoHandled>(&action)) {
        auto sent = send_frame_locked(control->reply.data, CURLWS_PONG);
        if (!sent) compact::Writer::debug(std::format("[ws] pong failed: {}\n", sent.error().message));
        return;
    }

    auto& terminal = std::get<ControlTerminal>(action);
    close_event_ = terminal.close_event;
    compact::Writer::debug(std::format("[ws] peer closed {} {}\n", close_event_->code, close_event_->reason));

    auto echo = send_frame_locked(build_close_payload(close_event_->code, {}), CURLWS_CLOSE);
    if (!echo) compact::Writer::debug(std::format("[ws] close echo failed: {}\n", echo.error().message));

    state_ = WsState::Closed;
    easy_->release();
    cv_.notify_all();
}

std::expected<void, CurlErrorInfo> WebSocket::send_frame(std::span<const char> data, unsigned int flags) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != WsState::Open) return std::unexpected(closed_error_locked());
    return send_frame_locked(data, flags);
}

std::expected<void, CurlErrorInfo> WebSocket::send_frame_locked(std::span<const char> data, unsigned int flags) {
    if (!easy_ || easy_->released()) return std::unexpected(closed_error_locked());

    auto r = engine_.ws_send(easy_->native(), data, flags);
    if (r.code != CURLE_OK) {
        return std::unexpected(websocket_error(
            std::format("WebSocket send failed: {}", engine_.easy_strerror(r.code)), r.code));
    }
    if (r.sent != data.size()) {
        return std::unexpected(websocket_error(
            std::format("Incomplete WebSocket send: {} of {} bytes", r.sent, data.size()), CURLE_SEND_ERROR));
    }
    return {};
}

std::expected<void, CurlErrorInfo> WebSocket::send(std::span<const char> data) {
    return send_frame(data, CURLWS_BINARY);
}

std::expected<void, CurlErrorInfo> WebSocket::send_text(std::string_view text) {
    return send_frame(std::span<const char>(text.data(), text.size()), CURLWS_TEXT);
}

std::expected<void, CurlErrorInfo> WebSocket::ping(std::string_view payload) {
    return send_frame(std::span<const char>(payload.data(), payload.size()), CURLWS_PING);
}

std::expected<void, CurlErrorInfo> WebSocket::pong(std::string_view payload) {
    return send_frame(std::span<const char>(payload.data(), payload.size()), CURLWS_PONG);
}

void WebSocket::close(int code, std::string_view reason) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (state_ == WsState::Closed) return;
    state_ = WsState::Closing;

    if (easy_ && !easy_->released()) {
        auto sent = send_frame_locked(build_close_payload(code, reason), CURLWS_CLOSE);
        if (!sent) compact::Writer::debug(std::format("[ws] close frame failed: {}\n", sent.error().message));
        easy_->release();
    }
    if (!close_event_) close_event_ = WsCloseEvent{code, std::string(reason), true};
    state_ = WsState::Closed;

    lock.unlock();
    cv_.notify_all();
}

WsState WebSocket::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<WsCloseEvent> WebSocket::close_event() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return close_event_;
}

WebSocket::Iterator WebSocket::begin() {
    return Iterator(this);
}

void WebSocket::Iterator::advance() {
    current_.reset();
    if (!ws_ || failed_) return;

    auto msg = ws_->receive();
    if (msg) {
        current_.emplace(std::move(msg));
        return;
    }
    if (msg.error().error == CurlError::WebSocketClosed) return;

    failed_ = true;
    current_.emplace(std::move(msg));
}

} // namespace curlmux
