#include "node/api_server.hpp"
#include "common/json_util.hpp"
#include "common/async_utils.hpp"
#include "common/log.hpp"
#include <boost/asio/redirect_error.hpp>
#include <expected>
#include <type_traits>

namespace voxfleet::node {

namespace {

const log::Logger& logger() { return log::Logger::get("node.api"); }

constexpr auto kRequestTimeout = std::chrono::seconds(30);
constexpr const char* kControlRoute = "/openlink/:id/control";

bool is_public(std::string_view target) {
    auto path = target.substr(0, target.find('?'));
    return path == "/api/health" || path == "/api/device-id";
}

std::expected<std::vector<HostedRoom>, std::string> parse_rooms(const json::object& body) {
    auto* list = jarray(body, "rooms");
    if (!list) {
        return std::unexpected("Missing rooms array");
    }

    std::vector<HostedRoom> rooms;
    for (const auto& item : *list) {
        if (!item.is_object()) {
            return std::unexpected("Room entries must be objects");
        }
        auto room = HostedRoom::from_json(item.as_object());
        if (!room) {
            return std::unexpected("Room entry without id");
        }
        rooms.push_back(std::move(*room));
    }
    return rooms;
}

} // anonymous namespace

// ============================================================================
// NodeApiServer
// ============================================================================

NodeApiServer::NodeApiServer(net::io_context& ioc,
                             Options options,
                             RoomDirectory& rooms,
                             LocalServer& server,
                             CommandExecutor& executor)
    : ioc_(ioc)
    , options_(std::move(options))
    , rooms_(rooms)
    , server_(server)
    , executor_(executor)
    , acceptor_(ioc) {
    if (options_.tls) {
        ssl_ctx_.emplace(ssl_util::create_server_context(options_.cert_file, options_.key_file));
    }
    setup_routes();
}

bool NodeApiServer::authorized(const HttpRequest& req) const {
    if (options_.access_token.empty()) {
        return true;
    }

    std::string_view value = req[http::field::authorization];
    constexpr std::string_view bearer = "Bearer ";
    if (value.substr(0, bearer.size()) == bearer) {
        value.remove_prefix(bearer.size());
    }
    return value == options_.access_token;
}

HttpResponse NodeApiServer::handle_request(const HttpRequest& req) {
    auto target = req.target();

    if (!is_public(target) && !authorized(req)) {
        logger().warn("Unauthorized {} {}", std::string(req.method_string()), std::string(target));
        return make_error_response(http::status::unauthorized, "Unauthorized", req.version());
    }

    auto [handler, param] = router_.find_route(req.method(), target);
    if (!handler) {
        if (router_.has_path(target)) {
            return make_error_response(http::status::method_not_allowed, "Method not allowed", req.version());
        }
        return make_error_response(http::status::not_found, "Not found", req.version());
    }

    try {
        auto res = handler(req, param);
        res.version(req.version());
        return res;
    } catch (const std::exception& e) {
        logger().error("{} {} failed: {}", std::string(req.method_string()), std::string(target), e.what());
        return make_error_response(http::status::internal_server_error, "Internal error", req.version());
    }
}

void NodeApiServer::setup_routes() {
    router_.add_route(http::verb::get, "/api/health", [this](const HttpRequest&, const std::string&) {
        json::object body;
        body["status"] = "ok";
        body["running"] = server_.is_running();
        return make_json_response(http::status::ok, body);
    });

    router_.add_route(http::verb::get, "/api/device-id", [this](const HttpRequest&, const std::string&) {
        json::object body;
        body["deviceId"] = options_.device_id;
        body["deviceName"] = options_.device_name;
        return make_json_response(http::status::ok, body);
    });

    router_.add_route(http::verb::post, "/api/remote/command", [this](const HttpRequest& req, const std::string&) {
        auto body = parse_object(req.body());
        if (!body) {
            return make_error_response(http::status::bad_request, "Invalid JSON body");
        }

        auto reply = executor_.parse_and_handle(*body);
        auto status = http::status::ok;
        if (!reply.success) {
            status = executor_.remote_control_enabled() ? http::status::bad_request : http::status::forbidden;
        }
        return make_json_response(status, reply.to_json());
    });

    router_.add_route(http::verb::get, "/api/remote/history", [this](const HttpRequest&, const std::string&) {
        json::array list;
        for (const auto& entry : executor_.history().entries()) {
            list.push_back(command_log_json(entry));
        }
        json::object body;
        body["commands"] = std::move(list);
        return make_json_response(http::status::ok, body);
    });

    router_.add_route(http::verb::post, "/api/rooms/transfer-accept", [this](const HttpRequest& req, const std::string&) {
        auto body = parse_object(req.body());
        if (!body) {
            return make_error_response(http::status::bad_request, "Invalid JSON body");
        }
        auto rooms = parse_rooms(*body);
        if (!rooms) {
            return make_error_response(http::status::bad_request, rooms.error());
        }

        logger().info("Transfer from device {} ({}): {} room(s)", jstr(*body, "sourceDeviceId"),
                      jstr(*body, "transferType"), rooms->size());

        json::object res;
        res["success"] = true;
        res["accepted"] = rooms_.accept(*rooms, options_.device_id);
        return make_json_response(http::status::ok, res);
    });

    router_.add_route(http::verb::post, "/api/rooms/federated-transfer", [this](const HttpRequest& req, const std::string&) {
        auto body = parse_object(req.body());
        if (!body) {
            return make_error_response(http::status::bad_request, "Invalid JSON body");
        }
        auto rooms = parse_rooms(*body);
        if (!rooms) {
            return make_error_response(http::status::bad_request, rooms.error());
        }

        bool preserve_ids = jbool(*body, "preserveRoomIds", false);
        if (!preserve_ids) {
            for (auto& room : *rooms) {
                room.id = generate_id();
            }
        }

        logger().info("Federated transfer from {}: {} room(s)", jstr(*body, "sourceServer"), rooms->size());

        json::object res;
        res["success"] = true;
        res["accepted"] = rooms_.accept(*rooms, options_.device_id);
        return make_json_response(http::status::ok, res);
    });

    router_.add_route(http::verb::post, "/api/rooms/:id/pause", [this](const HttpRequest& req, const std::string& id) {
        auto body = parse_object(req.body());
        if (body) {
            logger().debug("Pause {} (reason {})", id, jstr(*body, "reason"));
        }
        if (!rooms_.set_paused(id, true)) {
            return make_error_response(http::status::not_found, "Room not found");
        }
        json::object res;
        res["success"] = true;
        return make_json_response(http::status::ok, res);
    });

    router_.add_route(http::verb::post, "/api/rooms/:id/resume", [this](const HttpRequest&, const std::string& id) {
        if (!rooms_.set_paused(id, false)) {
            return make_error_response(http::status::not_found, "Room not found");
        }
        json::object res;
        res["success"] = true;
        return make_json_response(http::status::ok, res);
    });

    router_.add_route(http::verb::post, "/api/broadcast", [](const HttpRequest& req, const std::string&) {
        auto body = parse_object(req.body());
        if (!body || jstr(*body, "type").empty()) {
            return make_error_response(http::status::bad_request, "Broadcast needs a type");
        }
        logger().info("Broadcast [{}]: {}", jstr(*body, "type"), jstr(*body, "message"));
        json::object res;
        res["success"] = true;
        return make_json_response(http::status::ok, res);
    });

    router_.add_route(http::verb::post, "/api/clients/:id/disconnect", [this](const HttpRequest&, const std::string& id) {
        if (!server_.disconnect_client(id)) {
            return make_error_response(http::status::not_found, "Client not connected");
        }
        json::object res;
        res["success"] = true;
        return make_json_response(http::status::ok, res);
    });

    router_.add_route(http::verb::post, "/api/rooms/create-openlink", [this](const HttpRequest& req, const std::string&) {
        auto body = parse_object(req.body());
        if (!body || jstr(*body, "initiatorId").empty()) {
            return make_error_response(http::status::bad_request, "initiatorId required");
        }

        auto room_id = generate_id();
        control_rooms_.insert(room_id);
        logger().info("Control room {} for {} (hidden: {})", room_id, jstr(*body, "initiatorId"),
                      jbool(*body, "isHidden", false));

        json::object res;
        res["success"] = true;
        res["roomId"] = room_id;
        return make_json_response(http::status::ok, res);
    });
}

// ============================================================================
// Accept loop
// ============================================================================

std::chrono::milliseconds accept_retry_delay(const boost::system::error_code& ec) {
    // Out of descriptors or memory: give connections time to close
    if (ec == boost::system::errc::too_many_files_open ||
        ec == boost::system::errc::too_many_files_open_in_system ||
        ec == boost::system::errc::no_buffer_space ||
        ec == boost::system::errc::not_enough_memory) {
        return std::chrono::milliseconds(1000);
    }
    return std::chrono::milliseconds(100);
}

net::awaitable<void> NodeApiServer::run() {
    const uint16_t port = server_.port();
    tcp::endpoint endpoint(net::ip::make_address(options_.bind_address), port);

    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(net::socket_base::max_listen_connections);

    running_ = true;
    const uint64_t generation = ++generation_;
    logger().info("API listening on {}:{} (TLS: {})",
                  options_.bind_address, port, ssl_ctx_ ? "enabled" : "disabled");

    co_await accept_loop(generation);
}

void NodeApiServer::stop() {
    running_ = false;
    boost::system::error_code ec;
    acceptor_.close(ec);
}

net::awaitable<void> NodeApiServer::accept_loop(uint64_t generation) {
    while (running_ && generation == generation_) {
        boost::system::error_code ec;
        tcp::socket socket = co_await acceptor_.async_accept(net::redirect_error(net::use_awaitable, ec));
        if (generation != generation_) {
            break;
        }
        if (ec) {
            if (ec == net::error::operation_aborted) {
                continue;
            }
            logger().error("Accept error: {}", ec.message());
            co_await async::sleep_for(accept_retry_delay(ec));
            continue;
        }
        net::co_spawn(ioc_, handle_connection(std::move(socket)), net::detached);
    }
}

net::awaitable<void> NodeApiServer::handle_connection(tcp::socket socket) {
    try {
        if (ssl_ctx_) {
            beast::ssl_stream<beast::tcp_stream> stream(std::move(socket), *ssl_ctx_);
            beast::get_lowest_layer(stream).expires_after(kRequestTimeout);
            co_await stream.async_handshake(ssl::stream_base::server, net::use_awaitable);
            co_await serve(std::move(stream));
        } else {
            co_await serve(beast::tcp_stream(std::move(socket)));
        }
    } catch (const boost::system::system_error& e) {
        logger().debug("Connection error: {}", e.what());
    }
}

// ============================================================================
// HTTP session
// ============================================================================

template<typename Stream>
net::awaitable<void> NodeApiServer::serve(Stream stream) {
    beast::flat_buffer buffer;
    boost::system::error_code ec;

    for (;;) {
        beast::get_lowest_layer(stream).expires_after(kRequestTimeout);

        HttpRequest req;
        co_await http::async_read(stream, buffer, req, net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            break;
        }

        if (websocket::is_upgrade(req)) {
            co_await run_control_channel(std::move(stream), std::move(req));
            co_return;
        }

        auto res = handle_request(req);
        res.keep_alive(req.keep_alive());
        bool keep_alive = res.keep_alive();

        co_await http::async_write(stream, res, net::redirect_error(net::use_awaitable, ec));
        if (ec || !keep_alive) {
            break;
        }
    }

    if constexpr (std::is_same_v<Stream, beast::tcp_stream>) {
        stream.socket().shutdown(tcp::socket::shutdown_send, ec);
    } else {
        co_await stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
    }
}

// ============================================================================
// Control channel
// ============================================================================

template<typename Stream>
net::awaitable<void> NodeApiServer::run_control_channel(Stream stream, HttpRequest req) {
    boost::system::error_code ec;

    std::string room_id;
    std::string path(req.target().substr(0, req.target().find('?')));
    http::status reject = http::status::ok;
    if (!HttpRouter::match_pattern(kControlRoute, path, room_id)) {
        reject = http::status::not_found;
    } else if (!authorized(req)) {
        reject = http::status::unauthorized;
    } else if (!control_rooms_.count(room_id)) {
        reject = http::status::not_found;
    }

    if (reject != http::status::ok) {
        logger().warn("Rejected WebSocket upgrade for {} ({})", path, static_cast<unsigned>(reject));
        auto res = make_error_response(reject, reject == http::status::unauthorized ? "Unauthorized" : "Not found",
                                       req.version());
        res.keep_alive(false);
        co_await http::async_write(stream, res, net::redirect_error(net::use_awaitable, ec));
        co_return;
    }

    websocket::stream<Stream> ws(std::move(stream));
    beast::get_lowest_layer(ws).expires_never();
    ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws.set_option(websocket::stream_base::decorator(
        [](websocket::response_type& res) {
            res.set(http::field::server, "VoxFleet Node");
        }));

    co_await ws.async_accept(req, net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        logger().debug("Control channel handshake failed: {}", ec.message());
        co_return;
    }
    ws.text(true);

    const std::string client_id = "control:" + room_id;
    server_.add_client(client_id, [&ws] {
        beast::get_lowest_layer(ws).close();
    });
    logger().info("Control channel open (room {})", room_id);

    for (;;) {
        beast::flat_buffer buffer;
        co_await ws.async_read(buffer, net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            break;
        }

        auto obj = parse_object(beast::buffers_to_string(buffer.data()));
        if (!obj || jstr(*obj, "type") != "remote_command") {
            logger().debug("Control channel {}: ignoring message", room_id);
            continue;
        }

        auto reply = executor_.parse_and_handle(*obj);
        auto out = reply.to_json();
        out["commandId"] = jstr(*obj, "commandId");

        co_await ws.async_write(net::buffer(json::serialize(out)), net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            break;
        }
    }

    server_.remove_client(client_id);
    control_rooms_.erase(room_id);
    logger().info("Control channel closed (room {}): {}", room_id, ec.message());
}

// ============================================================================
// SSL utilities
// ============================================================================

namespace ssl_util {

ssl::context create_server_context(const std::string& cert_file, const std::string& key_file) {
    ssl::context ctx(ssl::context::tlsv12);

    ctx.set_options(
        ssl::context::default_workarounds |
        ssl::context::no_sslv2 |
        ssl::context::no_sslv3 |
        ssl::context::single_dh_use);

    ctx.use_certificate_chain_file(cert_file);
    ctx.use_private_key_file(key_file, ssl::context::pem);

    return ctx;
}

} // namespace ssl_util

} // namespace voxfleet::node
