#pragma once

#include "curl_engine.hpp"
#include "curl_error.hpp"
#include "json.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <expected>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace curlmux {

class Easy;

enum class WsMessageType { Text, Binary, Ping, Pong, Close };

struct WsMessage {
    WsMessageType type;
    std::string data;
};

struct WsCloseEvent {
    int code = 1000;
    std::string reason;
    bool was_clean = false;
};

enum class WsState { Connecting, Open, Closing, Closed };

// What the receive path does with one complete frame.
struct DataFrame { WsMessage message; };            // hand to the caller
struct ControlAutoHandled { WsMessage reply; };     // answer internally, hide from the caller
struct ControlTerminal { WsCloseEvent close_event; };
using FrameAction = std::variant<DataFrame, ControlAutoHandled, ControlTerminal>;

FrameAction classify_frame(int flags, std::string payload);

// Close payload: 2-byte big-endian code followed by a UTF-8 reason.
// An empty payload means 1000 with no reason.
WsCloseEvent parse_close_payload(std::string_view payload);
std::string build_close_payload(int code, std::string_view reason);

struct WebSocketConfig {
    std::vector<std::string> headers;          // "Name: value"
    long timeout_sec = 0;                      // connect timeout, 0 = none
    bool verify = true;
    std::string proxy;
    std::string impersonate;
    size_t max_message_size = 64 * 1024 * 1024;
    size_t receive_buffer_size = 1024 * 1024;
    std::chrono::milliseconds poll_interval{10};
};

// A WebSocket connection on one connect-only Easy handle. The session owns
// the handle outright; it is never handed to a Multi.
//
// receive() may run on one thread while close() is called from another;
// close() stops the polling promptly.
class WebSocket {
    struct Token {
        explicit Token() = default;
    };

public:
    class Iterator;

    static std::expected<std::unique_ptr<WebSocket>, CurlErrorInfo> connect(
        std::string_view url, const WebSocketConfig& config = {}, ICurlEngine& engine = default_engine());

    WebSocket(Token, std::string url, const WebSocketConfig& config, ICurlEngine& engine, std::unique_ptr<Easy> easy);
    ~WebSocket();

    WebSocket(const WebSocket&) = delete;
    WebSocket& operator=(const WebSocket&) = delete;

    // Waits for the next data or pong message. No timeout means wait until
    // a message arrives or the session closes.
    std::expected<WsMessage, CurlErrorInfo> receive(
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    std::expected<std::string, CurlErrorInfo> receive_text(
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    // Malformed JSON is a WebSocket error; the message is consumed.
    std::expected<json::Value, CurlErrorInfo> receive_json(
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    std::expected<void, CurlErrorInfo> send(std::span<const char> data);
    std::expected<void, CurlErrorInfo> send_binary(std::span<const char> data) { return send(data); }
    std::expected<void, CurlErrorInfo> send_text(std::string_view text);
    std::expected<void, CurlErrorInfo> send_json(const json::Value& value) { return send_text(json::dump(value)); }
    std::expected<void, CurlErrorInfo> ping(std::string_view payload = {});
    // Unsolicited pong, e.g. as a heartbeat.
    std::expected<void, CurlErrorInfo> pong(std::string_view payload = {});

    // Idempotent. Best-effort close frame, then the handle is released.
    void close(int code = 1000, std::string_view reason = {});

    const std::string& url() const { return url_; }
    WsState state() const;
    bool is_connected() const { return state() == WsState::Open; }
    bool is_closed() const { return state() == WsState::Closed; }
    std::optional<WsCloseEvent> close_event() const;

    // Yields messages until a clean close; any other error is yielded once
    // and ends the range.
    Iterator begin();
    std::default_sentinel_t end() { return {}; }

    class Iterator {
    public:
        using value_type = std::expected<WsMessage, CurlErrorInfo>;
        using difference_type = std::ptrdiff_t;

        Iterator() = default;
        explicit Iterator(WebSocket* ws) : ws_(ws) { advance(); }

        value_type& operator*() { return *current_; }
        value_type* operator->() { return &*current_; }
        Iterator& operator++() { advance(); return *this; }
        void operator++(int) { advance(); }
        bool operator==(std::default_sentinel_t) const { return !current_.has_value(); }

    private:
        void advance();

        WebSocket* ws_ = nullptr;
        std::optional<value_type> current_;
        bool failed_ = false;
    };

private:
    std::expected<void, CurlErrorInfo> send_frame(std::span<const char> data, unsigned int flags);
    std::expected<void, CurlErrorInfo> send_frame_locked(std::span<const char> data, unsigned int flags);
    std::expected<void, CurlErrorInfo> read_available_locked();
    void handle_frame_locked(int flags, std::string payload);
    CurlErrorInfo closed_error_locked() const;

    std::string url_;
    WebSocketConfig config_;
    ICurlEngine& engine_;
    std::unique_ptr<Easy> easy_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    WsState state_ = WsState::Connecting;
    std::optional<WsCloseEvent> close_event_;
    std::deque<WsMessage> queue_;
    std::vector<char> buffer_;

    // Fragment reassembly; control frames never interleave with each other
    // but may arrive between fragments of a data message.
    std::string data_partial_;
    int data_flags_ = 0;
    std::string control_partial_;
    int control_flags_ = 0;

    // Set after an oversized message; its remaining bytes are dropped.
    bool data_discarding_ = false;
    bool control_discarding_ = false;
};

} // namespace curlmux
