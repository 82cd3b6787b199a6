#pragma once

#include "node/command_executor.hpp"
#include "node/http_router.hpp"
#include "node/local_host.hpp"
#include "node/services.hpp"
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>

namespace voxfleet::node {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

/**
 * NodeApiServer - HTTP/WebSocket API of a node.
 *
 * REST endpoints for transfers, pause/resume, broadcast and remote commands,
 * plus the openlink control channel (/openlink/{roomId}/control) that
 * carries remote commands tagged with a commandId. With an access token
 * configured, everything except /api/health and /api/device-id needs
 * "Authorization: Bearer <token>".
 */
class NodeApiServer {
public:
    struct Options {
        std::string bind_address = "0.0.0.0";
        bool tls = false;
        std::string cert_file;
        std::string key_file;
        std::string access_token;
        std::string device_id;
        std::string device_name;
    };

    NodeApiServer(net::io_context& ioc,
                  Options options,
                  RoomDirectory& rooms,
                  LocalServer& server,
                  CommandExecutor& executor);

    // Bind server.port(), listen and accept until stop(); throws when the port cannot be bound
    net::awaitable<void> run();

    void stop();

    // Route one request (auth check included)
    HttpResponse handle_request(const HttpRequest& req);

    bool authorized(const HttpRequest& req) const;

    bool has_control_room(const std::string& room_id) const { return control_rooms_.count(room_id) != 0; }
    size_t control_room_count() const { return control_rooms_.size(); }

private:
    void setup_routes();

    net::awaitable<void> accept_loop(uint64_t generation);
    net::awaitable<void> handle_connection(tcp::socket socket);

    template<typename Stream>
    net::awaitable<void> serve(Stream stream);

    template<typename Stream>
    net::awaitable<void> run_control_channel(Stream stream, HttpRequest req);

    net::io_context& ioc_;
    Options options_;
    RoomDirectory& rooms_;
    LocalServer& server_;
    CommandExecutor& executor_;

    std::optional<ssl::context> ssl_ctx_;
    tcp::acceptor acceptor_;
    HttpRouter router_;
    std::unordered_set<std::string> control_rooms_;
    bool running_{false};
    uint64_t generation_{0};  // Bumped per run(); an older accept loop exits
};

// Pause before accepting again after a failed accept
std::chrono::milliseconds accept_retry_delay(const boost::system::error_code& ec);

// SSL context setup utilities
namespace ssl_util {

// Server context with certificate chain and private key (PEM)
ssl::context create_server_context(const std::string& cert_file, const std::string& key_file);

} // namespace ssl_util

} // namespace voxfleet::node
