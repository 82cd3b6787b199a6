#pragma once

#include "remote/transport.hpp"
#include "remote/relay_channel.hpp"
#include "common/http_client.hpp"
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <unordered_map>

namespace voxfleet::remote {

/**
 * RelayTransport - commands over a tunneled control channel.
 *
 * Per peer: create a hidden openlink control room on the relay host
 * (POST /api/rooms/create-openlink), then open the WebSocket control
 * channel for that room with the peer's bearer token. The channel is kept
 * and reused until it closes or close() is called.
 */
class RelayTransport : public CommandTransport {
public:
    struct Options {
        std::string local_device_id;
        std::string relay_host_url;  // Empty = create the room on the peer itself
        std::chrono::milliseconds response_timeout{10000};
        std::chrono::milliseconds connect_timeout{10000};
        std::chrono::milliseconds request_timeout{10000};
    };

    RelayTransport(net::io_context& ioc, HttpClient& http, Options options);
    ~RelayTransport() override;

    net::awaitable<std::expected<CommandReply, FleetError>> send(
        const PeerTarget& target, const CommandRequest& request) override;

    void close() override;

    const char* method() const override { return "openlink"; }

    bool has_channel(const std::string& peer_id) const;
    size_t channel_count() const { return channels_.size(); }

private:
    net::awaitable<std::expected<std::string, FleetError>> create_control_room(const LinkedDevice& device);
    net::awaitable<std::shared_ptr<RelayChannel>> ensure_channel(const LinkedDevice& device);

    net::io_context& ioc_;
    HttpClient& http_;
    Options options_;
    std::unordered_map<std::string, std::shared_ptr<RelayChannel>> channels_;
};

} // namespace voxfleet::remote
