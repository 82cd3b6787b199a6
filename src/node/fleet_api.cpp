#include "node/fleet_api.hpp"
#include "common/async_utils.hpp"
#include "common/json_util.hpp"
#include "common/log.hpp"
#include "common/net_utils.hpp"

namespace voxfleet::node {

namespace {

const log::Logger& logger() { return log::Logger::get("node.fleet"); }

// {success: bool} from a transfer endpoint
std::expected<bool, FleetError> read_success(const std::expected<HttpResult, FleetError>& result) {
    if (!result) {
        return std::unexpected(result.error());
    }
    auto body = result->json();
    if (!body) {
        return std::unexpected(FleetError::MALFORMED_RESPONSE);
    }
    auto it = body->find("success");
    if (it == body->end() || !it->value().is_bool()) {
        return std::unexpected(FleetError::MALFORMED_RESPONSE);
    }
    return it->value().as_bool();
}

net::awaitable<void> post_in_background(HttpClient& http, std::string url, json::object body,
                                        std::string token, std::chrono::milliseconds timeout) {
    auto result = co_await http.post_json(url, body, token, timeout);
    if (!result) {
        logger().debug("POST {} failed: {}", url, fleet_error_message(result.error()));
    } else if (!result->ok()) {
        logger().debug("POST {} answered HTTP {}", url, result->status);
    }
}

} // anonymous namespace

HttpFleetApi::HttpFleetApi(net::any_io_executor executor, HttpClient& http, Options options)
    : executor_(std::move(executor))
    , http_(http)
    , options_(std::move(options)) {}

net::awaitable<std::expected<bool, FleetError>> HttpFleetApi::transfer_to_device(
    const LinkedDevice& device, const std::vector<HostedRoom>& rooms) {
    json::array room_list;
    for (const auto& room : rooms) {
        room_list.push_back(room_transfer_json(room));
    }

    json::object body;
    body["rooms"] = std::move(room_list);
    body["sourceDeviceId"] = options_.device_id;
    body["transferType"] = "device_exit";

    auto url = join_url(device.url, "/api/rooms/transfer-accept");
    logger().info("Transferring {} room(s) to {} ({})", rooms.size(), device.name, url);

    auto result = co_await http_.post_json(url, body, device.access_token, options_.timeout);
    auto success = read_success(result);
    if (!success) {
        logger().warn("Device transfer to {} failed: {}", device.name, fleet_error_message(success.error()));
    }
    co_return success;
}

net::awaitable<std::expected<bool, FleetError>> HttpFleetApi::transfer_to_federated(
    const FederatedServer& server, const std::vector<HostedRoom>& rooms) {
    json::array room_list;
    for (const auto& room : rooms) {
        room_list.push_back(room_federated_json(room));
    }

    json::object body;
    body["rooms"] = std::move(room_list);
    body["sourceServer"] = options_.server_name;
    body["preserveRoomIds"] = true;

    auto url = join_url(server.url, "/api/rooms/federated-transfer");
    logger().info("Transferring {} room(s) to federated server {} ({})", rooms.size(), server.name, url);

    auto result = co_await http_.post_json(url, body, {}, options_.timeout);
    auto success = read_success(result);
    if (!success) {
        logger().warn("Federated transfer to {} failed: {}", server.name, fleet_error_message(success.error()));
    }
    co_return success;
}

net::awaitable<std::vector<FederatedServer>> HttpFleetApi::fetch_federated_servers() {
    std::vector<FederatedServer> servers;

    auto result = co_await http_.get(options_.discovery_url, {}, options_.timeout);
    if (!result || !result->ok()) {
        logger().warn("Federation node list unavailable from {}", options_.discovery_url);
        co_return servers;
    }

    auto body = result->json();
    const json::array* nodes = body ? jarray(*body, "nodes") : nullptr;
    if (!nodes) {
        logger().warn("Federation node list from {} has no 'nodes' array", options_.discovery_url);
        co_return servers;
    }

    for (const auto& item : *nodes) {
        if (!item.is_object()) continue;
        if (auto server = FederatedServer::from_json(item.as_object())) {
            servers.push_back(std::move(*server));
        }
    }
    logger().debug("{} federated server(s) listed", servers.size());
    co_return servers;
}

void HttpFleetApi::post_local(std::string path, json::object body) {
    async::spawn(executor_,
                 post_in_background(http_, join_url(options_.local_server_url, path), std::move(body),
                                    options_.local_token, options_.timeout),
                 "fleet.post");
}

void HttpFleetApi::pause_room(const std::string& room_id) {
    json::object body;
    body["reason"] = "server_exit";
    body["waitingRoom"] = true;
    body["ambienceEnabled"] = true;
    post_local("/api/rooms/" + room_id + "/pause", std::move(body));
}

void HttpFleetApi::resume_room(const std::string& room_id) {
    post_local("/api/rooms/" + room_id + "/resume", {});
}

void HttpFleetApi::broadcast(const std::string& type, const std::string& message, json::object extra) {
    json::object body = std::move(extra);
    body["type"] = type;
    body["message"] = message;
    post_local("/api/broadcast", std::move(body));
}

} // namespace voxfleet::node
