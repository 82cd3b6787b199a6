#pragma once

#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <queue>
#include <string>
#include <string_view>

namespace voxfleet {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

/**
 * WsClientCoro - coroutine WebSocket client for one JSON text session.
 *
 * connect_once() performs a single bounded attempt. On success the session
 * (reader, writer, heartbeat) keeps running in the background until either
 * side closes; subclasses see each message through process_message() and
 * the end of the session through on_disconnected(). A closed client is not
 * reused.
 *
 * Everything runs on the io_context given at construction.
 */
class WsClientCoro : public std::enable_shared_from_this<WsClientCoro> {
public:
    enum class State {
        INIT,
        CONNECTING,
        CONNECTED,
        CLOSED,
    };

    // url must be ws:// or wss://; name is used in log lines
    WsClientCoro(net::io_context& ioc, const std::string& url, std::string name);
    virtual ~WsClientCoro() = default;

    WsClientCoro(const WsClientCoro&) = delete;
    WsClientCoro& operator=(const WsClientCoro&) = delete;

    // True once the WebSocket handshake completed within timeout
    net::awaitable<bool> connect_once(std::chrono::milliseconds timeout);

    // Close the session; pending reads abort and on_disconnected() runs
    void disconnect();

    // Queue a text frame, dropped when not connected
    void send_text(std::string text);

    // Sent as "Authorization: Bearer <token>" on the upgrade request
    void set_bearer_token(std::string token) { bearer_token_ = std::move(token); }

    State state() const { return state_; }
    bool is_connected() const { return state_ == State::CONNECTED; }
    bool url_valid() const { return url_valid_; }
    const std::string& url() const { return url_; }
    const std::string& name() const { return name_; }

protected:
    virtual net::awaitable<void> on_connected() = 0;
    virtual net::awaitable<void> process_message(std::string_view text) = 0;
    virtual net::awaitable<void> on_disconnected(const std::string& reason) = 0;

    net::io_context& ioc_;

private:
    net::awaitable<void> handshake();
    // self keeps the client alive while the session runs
    net::awaitable<void> run_session(std::shared_ptr<WsClientCoro> self);

    net::awaitable<void> reader();
    net::awaitable<void> writer();
    net::awaitable<void> heartbeat();

    void set_state(State next);
    void reset_streams();

    // Apply f to whichever stream is active
    template<typename F>
    auto with_stream(F&& f) {
        return wss_ ? f(*wss_) : f(*ws_);
    }

    std::string url_;
    std::string name_;
    std::string host_;
    std::string port_;
    std::string target_;
    bool use_ssl_{false};
    bool url_valid_{false};
    std::string bearer_token_;

    ssl::context ssl_ctx_{ssl::context::tlsv12_client};

    using WssStream = websocket::stream<ssl::stream<tcp::socket>>;
    using WsStream = websocket::stream<tcp::socket>;
    std::unique_ptr<WssStream> wss_;
    std::unique_ptr<WsStream> ws_;

    std::queue<std::string> write_queue_;
    net::steady_timer write_signal_;

    State state_{State::INIT};
    bool closing_{false};

    static constexpr std::chrono::seconds kHeartbeatInterval{30};
    static constexpr uint32_t kMaxMissedPongs{3};
    uint32_t missed_pongs_{0};
};

} // namespace voxfleet
