#include "remote/command_router.hpp"
#include "common/log.hpp"

namespace voxfleet::remote {

namespace {

const log::Logger& logger() { return log::Logger::get("remote.router"); }

} // anonymous namespace

RemoteCommandRouter::RemoteCommandRouter(Identity identity,
                                         PeerLocator& locator,
                                         CommandTransport& local_direct,
                                         CommandTransport& relay,
                                         CommandTransport& registration,
                                         ConnectionMode mode)
    : identity_(std::move(identity))
    , locator_(locator)
    , local_direct_(local_direct)
    , relay_(relay)
    , registration_(registration)
    , mode_(mode) {}

void RemoteCommandRouter::set_mode(ConnectionMode mode) {
    if (mode == mode_) {
        return;
    }

    bool drop_relay = mode_ == ConnectionMode::TUNNEL_ONLY || mode == ConnectionMode::DIRECT_ONLY;
    logger().info("Connection mode {} -> {}", connection_mode_name(mode_), connection_mode_name(mode));
    mode_ = mode;

    if (drop_relay) {
        relay_.close();
    }
}

net::awaitable<std::optional<std::string>> RemoteCommandRouter::discover(const LinkedDevice& peer) {
    co_return co_await locator_.locate(peer);
}

net::awaitable<std::expected<CommandReply, FleetError>> RemoteCommandRouter::dispatch(
    const LinkedDevice& peer, const CommandRequest& request) {
    switch (mode_) {
        case ConnectionMode::DIRECT_ONLY:
            co_return co_await registration_.send(PeerTarget{peer, std::nullopt}, request);

        case ConnectionMode::TUNNEL_ONLY:
            co_return co_await relay_.send(PeerTarget{peer, std::nullopt}, request);

        case ConnectionMode::HYBRID: {
            auto relayed = co_await relay_.send(PeerTarget{peer, std::nullopt}, request);
            if (relayed && relayed->success) {
                co_return relayed;
            }
            logger().info("Relay attempt to {} failed ({}), trying registered address",
                          peer.id, relayed ? relayed->result : fleet_error_message(relayed.error()));
            co_return co_await registration_.send(PeerTarget{peer, std::nullopt}, request);
        }

        case ConnectionMode::AUTO:
        default: {
            auto address = co_await locator_.locate(peer);
            if (address) {
                co_return co_await local_direct_.send(PeerTarget{peer, address}, request);
            }
            co_return co_await relay_.send(PeerTarget{peer, std::nullopt}, request);
        }
    }
}

net::awaitable<CommandReply> RemoteCommandRouter::send_command(const LinkedDevice& peer,
                                                               RemoteCommand command,
                                                               json::object params) {
    CommandRequest request;
    request.command = command;
    request.source_device_id = identity_.device_id;
    request.source_device_name = identity_.device_name;
    request.params = std::move(params);

    auto id = log_.append(command, identity_.device_id, identity_.device_name);
    log_.mark_executing(id);

    logger().info("Sending {} to {} ({})", remote_command_name(command), peer.name.empty() ? peer.id : peer.name,
                  connection_mode_name(mode_));

    auto outcome = co_await dispatch(peer, request);

    CommandReply reply = outcome ? std::move(*outcome) : CommandReply::fail(fleet_error_message(outcome.error()));
    if (reply.success) {
        log_.mark_completed(id, reply.result);
    } else {
        log_.mark_failed(id, reply.result);
        logger().warn("{} to {} failed: {}", remote_command_name(command), peer.id, reply.result);
    }
    co_return reply;
}

} // namespace voxfleet::remote
