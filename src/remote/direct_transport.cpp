#include "remote/direct_transport.hpp"
#include "common/log.hpp"
#include "common/net_utils.hpp"

namespace voxfleet::remote {

namespace {

const log::Logger& logger() { return log::Logger::get("remote.direct"); }

} // anonymous namespace

DirectTransport::DirectTransport(HttpClient& http, Kind kind, std::chrono::milliseconds timeout)
    : http_(http)
    , kind_(kind)
    , timeout_(timeout) {}

const char* DirectTransport::method() const {
    return kind_ == Kind::LOCAL_DIRECT ? "local_direct" : "direct_ip";
}

std::expected<std::string, FleetError> DirectTransport::endpoint_for(const PeerTarget& target) const {
    auto registered = parse_url(target.device.url);

    std::string host;
    if (kind_ == Kind::LOCAL_DIRECT) {
        if (!target.address || target.address->empty()) {
            return std::unexpected(FleetError::INVALID_PARAMETERS);
        }
        host = *target.address;
    } else {
        if (!registered) {
            return std::unexpected(FleetError::INVALID_URL);
        }
        host = registered->host;
    }

    uint16_t port = (registered && registered->has_port) ? registered->port : DEFAULT_PORT;
    if (host.find(':') != std::string::npos) {
        host = "[" + host + "]";
    }
    return "http://" + host + ":" + std::to_string(port) + "/api/remote/command";
}

net::awaitable<std::expected<CommandReply, FleetError>> DirectTransport::send(
    const PeerTarget& target, const CommandRequest& request) {
    auto url = endpoint_for(target);
    if (!url) {
        logger().warn("No direct endpoint for {}: {}", target.device.id, fleet_error_message(url.error()));
        co_return std::unexpected(url.error());
    }

    logger().debug("{} -> {} via {}", remote_command_name(request.command), *url, method());

    auto result = co_await http_.post_json(*url, request.to_json(method()), target.device.access_token, timeout_);
    if (!result) {
        logger().info("{} to {} failed: {}", remote_command_name(request.command), *url,
                      fleet_error_message(result.error()));
        co_return std::unexpected(result.error());
    }

    // Rejections (403 with {success:false,...}) still carry a reply body
    if (auto body = result->json()) {
        if (auto reply = CommandReply::from_json(*body)) {
            co_return *reply;
        }
    }

    if (!result->ok()) {
        logger().info("{} answered HTTP {}", *url, result->status);
        co_return std::unexpected(FleetError::HTTP_STATUS);
    }

    co_return std::unexpected(FleetError::MALFORMED_RESPONSE);
}

} // namespace voxfleet::remote
