#include "remote/relay_transport.hpp"
#include "common/json_util.hpp"
#include "common/log.hpp"
#include "common/net_utils.hpp"

namespace voxfleet::remote {

namespace {

const log::Logger& logger() { return log::Logger::get("remote.relay"); }

} // anonymous namespace

RelayTransport::RelayTransport(net::io_context& ioc, HttpClient& http, Options options)
    : ioc_(ioc)
    , http_(http)
    , options_(std::move(options)) {}

RelayTransport::~RelayTransport() {
    close();
}

bool RelayTransport::has_channel(const std::string& peer_id) const {
    auto it = channels_.find(peer_id);
    return it != channels_.end() && it->second->is_connected();
}

void RelayTransport::close() {
    auto channels = std::move(channels_);
    channels_.clear();
    for (auto& [peer, channel] : channels) {
        logger().info("Closing control channel to {}", peer);
        channel->set_closed_handler(nullptr);
        channel->disconnect();
    }
}

net::awaitable<std::expected<std::string, FleetError>> RelayTransport::create_control_room(const LinkedDevice& device) {
    const std::string& host = options_.relay_host_url.empty() ? device.url : options_.relay_host_url;

    json::object body;
    body["initiatorId"] = options_.local_device_id;
    body["visitorId"] = device.id;
    body["isHidden"] = true;
    body["type"] = "openlink";
    body["deviceId"] = options_.local_device_id;

    auto result = co_await http_.post_json(
        join_url(host, "/api/rooms/create-openlink"), body, device.access_token, options_.request_timeout);
    if (!result) {
        logger().warn("Control room request to {} failed: {}", host, fleet_error_message(result.error()));
        co_return std::unexpected(FleetError::CHANNEL_UNAVAILABLE);
    }

    auto obj = result->json();
    if (!obj || !jbool(*obj, "success") || jstr(*obj, "roomId").empty()) {
        logger().warn("Control room request to {} rejected (HTTP {}): {}", host, result->status,
                      obj ? jstr(*obj, "error", "no roomId") : std::string("malformed body"));
        co_return std::unexpected(FleetError::CHANNEL_UNAVAILABLE);
    }

    co_return jstr(*obj, "roomId");
}

net::awaitable<std::shared_ptr<RelayChannel>> RelayTransport::ensure_channel(const LinkedDevice& device) {
    if (auto it = channels_.find(device.id); it != channels_.end()) {
        if (it->second->is_connected()) {
            co_return it->second;
        }
        channels_.erase(it);
    }

    auto room_id = co_await create_control_room(device);
    if (!room_id) {
        co_return nullptr;
    }

    auto ws_base = to_websocket_url(device.url);
    if (!ws_base) {
        logger().warn("Peer {} has no usable URL '{}'", device.id, device.url);
        co_return nullptr;
    }

    auto channel = std::make_shared<RelayChannel>(
        ioc_, join_url(*ws_base, "/openlink/" + *room_id + "/control"), device.id, *room_id);
    channel->set_bearer_token(device.access_token);

    if (!co_await channel->connect_once(options_.connect_timeout)) {
        co_return nullptr;
    }

    // Another send may have opened a channel while this one was connecting
    if (auto it = channels_.find(device.id); it != channels_.end() && it->second->is_connected()) {
        channel->disconnect();
        co_return it->second;
    }

    std::weak_ptr<RelayChannel> weak = channel;
    channel->set_closed_handler([this, peer = device.id, weak](const std::string&) {
        auto it = channels_.find(peer);
        if (it != channels_.end() && it->second == weak.lock()) {
            channels_.erase(it);
        }
    });
    channels_[device.id] = channel;
    co_return channel;
}

net::awaitable<std::expected<CommandReply, FleetError>> RelayTransport::send(
    const PeerTarget& target, const CommandRequest& request) {
    auto channel = co_await ensure_channel(target.device);
    if (!channel) {
        co_return std::unexpected(FleetError::CHANNEL_UNAVAILABLE);
    }

    auto command_id = generate_id();
    auto message = request.to_json(method());
    message["type"] = "remote_command";
    message["commandId"] = command_id;

    // Register before writing so an immediate reply is matched
    auto waiter = channel->pending().add(command_id, options_.response_timeout);
    channel->send_text(json::serialize(message));

    logger().debug("{} -> {} via relay (commandId {})",
                   remote_command_name(request.command), target.device.id, command_id);

    switch (co_await channel->pending().wait(waiter)) {
        case CorrelationTable::Outcome::REPLIED:
            co_return *waiter->reply;
        case CorrelationTable::Outcome::TIMED_OUT:
            logger().warn("No reply from {} for {} within {}ms", target.device.id, command_id,
                          options_.response_timeout.count());
            co_return std::unexpected(FleetError::TIMEOUT);
        case CorrelationTable::Outcome::CLOSED:
        default:
            co_return std::unexpected(FleetError::CHANNEL_UNAVAILABLE);
    }
}

} // namespace voxfleet::remote
