#include "common/ws_client_coro.hpp"
#include "common/async_utils.hpp"
#include "common/log.hpp"
#include "common/net_utils.hpp"
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/beast/http/field.hpp>
#include <openssl/err.h>

namespace voxfleet {

using namespace boost::asio::experimental::awaitable_operators;

namespace {

const log::Logger& logger() { return log::Logger::get("common.ws"); }

const char* state_name(WsClientCoro::State s) {
    switch (s) {
        case WsClientCoro::State::INIT: return "INIT";
        case WsClientCoro::State::CONNECTING: return "CONNECTING";
        case WsClientCoro::State::CONNECTED: return "CONNECTED";
        case WsClientCoro::State::CLOSED: return "CLOSED";
        default: return "UNKNOWN";
    }
}

} // anonymous namespace

WsClientCoro::WsClientCoro(net::io_context& ioc, const std::string& url, std::string name)
    : ioc_(ioc)
    , url_(url)
    , name_(std::move(name))
    , write_signal_(ioc)
{
    auto parsed = parse_url(url);
    if (parsed && (parsed->scheme == "ws" || parsed->scheme == "wss")) {
        host_ = parsed->host;
        port_ = std::to_string(parsed->port);
        target_ = parsed->target;
        use_ssl_ = parsed->use_ssl;
        url_valid_ = true;
    } else {
        logger().error("{}: invalid WebSocket URL {}", name_, url);
    }

    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
}

net::awaitable<bool> WsClientCoro::connect_once(std::chrono::milliseconds timeout) {
    if (!url_valid_ || state_ != State::INIT) {
        co_return false;
    }

    set_state(State::CONNECTING);
    bool connected = false;
    try {
        connected = co_await async::timed_op(handshake(), timeout);
        if (!connected) {
            logger().warn("{}: connect to {} timed out after {}ms", name_, url_, timeout.count());
        }
    } catch (const boost::system::system_error& e) {
        logger().warn("{}: connect to {} failed: {}", name_, url_, e.code().message());
    }

    if (!connected) {
        reset_streams();
        set_state(State::CLOSED);
        co_return false;
    }

    set_state(State::CONNECTED);
    async::spawn(ioc_, run_session(shared_from_this()), name_);
    co_return true;
}

void WsClientCoro::disconnect() {
    closing_ = true;
    write_signal_.cancel();

    // Closing the socket aborts the pending read, which ends the session
    beast::error_code ec;
    if (wss_) beast::get_lowest_layer(*wss_).close(ec);
    if (ws_) beast::get_lowest_layer(*ws_).close(ec);

    if (state_ != State::CONNECTED) {
        set_state(State::CLOSED);
    }
}

void WsClientCoro::send_text(std::string text) {
    if (state_ != State::CONNECTED) {
        logger().debug("{}: dropping message, not connected", name_);
        return;
    }
    write_queue_.push(std::move(text));
    write_signal_.cancel();
}

void WsClientCoro::set_state(State next) {
    if (state_ != next) {
        logger().debug("{}: {} -> {}", name_, state_name(state_), state_name(next));
        state_ = next;
    }
}

void WsClientCoro::reset_streams() {
    wss_.reset();
    ws_.reset();
    std::queue<std::string>().swap(write_queue_);
}

net::awaitable<void> WsClientCoro::handshake() {
    tcp::resolver resolver(ioc_);
    auto endpoints = co_await resolver.async_resolve(host_, port_, net::use_awaitable);

    auto decorate = [token = bearer_token_](websocket::request_type& req) {
        req.set(beast::http::field::user_agent, "VoxFleet/1.0");
        if (!token.empty()) {
            req.set(beast::http::field::authorization, "Bearer " + token);
        }
    };

    auto on_control = [this](websocket::frame_type kind, beast::string_view) {
        if (kind == websocket::frame_type::pong) {
            missed_pongs_ = 0;
        }
    };

    auto configure = [&](auto& ws) {
        ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws.set_option(websocket::stream_base::decorator(decorate));
        ws.control_callback(on_control);
        ws.text(true);
    };

    if (use_ssl_) {
        wss_ = std::make_unique<WssStream>(ioc_, ssl_ctx_);

        // SNI
        if (!SSL_set_tlsext_host_name(wss_->next_layer().native_handle(), host_.c_str())) {
            throw boost::system::system_error(
                boost::system::error_code(static_cast<int>(::ERR_get_error()),
                                          net::error::get_ssl_category()));
        }

        co_await net::async_connect(beast::get_lowest_layer(*wss_), endpoints, net::use_awaitable);
        co_await wss_->next_layer().async_handshake(ssl::stream_base::client, net::use_awaitable);
        configure(*wss_);
        co_await wss_->async_handshake(host_, target_, net::use_awaitable);
    } else {
        ws_ = std::make_unique<WsStream>(ioc_);

        co_await net::async_connect(beast::get_lowest_layer(*ws_), endpoints, net::use_awaitable);
        configure(*ws_);
        co_await ws_->async_handshake(host_, target_, net::use_awaitable);
    }

    logger().info("{}: connected to {}", name_, url_);
}

net::awaitable<void> WsClientCoro::run_session(std::shared_ptr<WsClientCoro> self) {
    std::string reason = "session ended";

    try {
        co_await on_connected();
        // Reader, writer and heartbeat run until the first of them finishes
        co_await (reader() || writer() || heartbeat());
        if (closing_) reason = "closed locally";
    } catch (const boost::system::system_error& e) {
        if (closing_) {
            reason = "closed locally";
        } else if (e.code() == websocket::error::closed) {
            reason = "peer closed";
        } else {
            reason = e.code().message();
            logger().warn("{}: connection error: {}", name_, reason);
        }
    } catch (const std::exception& e) {
        reason = e.what();
        logger().error("{}: session failed: {}", name_, reason);
    }

    reset_streams();
    set_state(State::CLOSED);
    co_await on_disconnected(reason);
}

net::awaitable<void> WsClientCoro::reader() {
    beast::flat_buffer buffer;

    while (state_ == State::CONNECTED && !closing_) {
        co_await with_stream([&](auto& ws) {
            return ws.async_read(buffer, net::use_awaitable);
        });

        std::string text = beast::buffers_to_string(buffer.data());
        buffer.consume(buffer.size());

        logger().trace("{}: RX {}", name_, text);
        co_await process_message(text);
    }
}

net::awaitable<void> WsClientCoro::writer() {
    while (state_ == State::CONNECTED && !closing_) {
        while (write_queue_.empty() && state_ == State::CONNECTED && !closing_) {
            write_signal_.expires_after(std::chrono::seconds(30));
            boost::system::error_code ec;
            co_await write_signal_.async_wait(net::redirect_error(net::use_awaitable, ec));
        }

        while (!write_queue_.empty() && state_ == State::CONNECTED) {
            auto item = std::move(write_queue_.front());
            write_queue_.pop();

            logger().trace("{}: TX {}", name_, item);
            co_await with_stream([&](auto& ws) {
                return ws.async_write(net::buffer(item), net::use_awaitable);
            });
        }
    }
}

net::awaitable<void> WsClientCoro::heartbeat() {
    net::steady_timer timer(ioc_);

    while (state_ == State::CONNECTED && !closing_) {
        timer.expires_after(kHeartbeatInterval);
        boost::system::error_code ec;
        co_await timer.async_wait(net::redirect_error(net::use_awaitable, ec));
        if (ec || state_ != State::CONNECTED) {
            break;
        }

        if (missed_pongs_++ >= kMaxMissedPongs) {
            logger().warn("{}: too many missed pongs, closing", name_);
            break;
        }

        co_await with_stream([](auto& ws) {
            return ws.async_ping({}, net::use_awaitable);
        });
    }
}

} // namespace voxfleet
