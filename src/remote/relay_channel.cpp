#include "remote/relay_channel.hpp"
#include "common/json_util.hpp"
#include "common/log.hpp"

namespace voxfleet::remote {

namespace {

const log::Logger& logger() { return log::Logger::get("remote.relay"); }

} // anonymous namespace

RelayChannel::RelayChannel(net::io_context& ioc, const std::string& url, std::string peer_id, std::string room_id)
    : WsClientCoro(ioc, url, "relay:" + peer_id)
    , peer_id_(std::move(peer_id))
    , room_id_(std::move(room_id))
    , pending_(ioc.get_executor())
{
}

net::awaitable<void> RelayChannel::on_connected() {
    logger().info("Control channel to {} open (room {})", peer_id_, room_id_);
    co_return;
}

net::awaitable<void> RelayChannel::process_message(std::string_view text) {
    auto obj = parse_object(text);
    if (!obj) {
        logger().debug("{}: ignoring non-JSON message", peer_id_);
        co_return;
    }

    auto command_id = jstr(*obj, "commandId");
    if (command_id.empty()) {
        // Presence or room events share the channel
        logger().trace("{}: uncorrelated message type={}", peer_id_, jstr(*obj, "type"));
        co_return;
    }

    auto reply = CommandReply::from_json(*obj);
    if (!reply) {
        reply = CommandReply::fail("Malformed reply");
    }
    pending_.resolve(command_id, std::move(*reply));
    co_return;
}

net::awaitable<void> RelayChannel::on_disconnected(const std::string& reason) {
    logger().info("Control channel to {} closed: {} ({} waiting)", peer_id_, reason, pending_.size());
    pending_.fail_all();
    if (closed_handler_) {
        closed_handler_(reason);
    }
    co_return;
}

} // namespace voxfleet::remote
