#pragma once

#include "remote/transport.hpp"
#include "common/http_client.hpp"
#include <chrono>

namespace voxfleet::remote {

/**
 * DirectTransport - POST /api/remote/command straight to the peer.
 *
 * LOCAL_DIRECT targets the address PeerDiscovery found on the LAN.
 * REGISTRATION targets the host of the peer's registered URL.
 * Both use the registered URL's port, 3000 when it names none.
 */
class DirectTransport : public CommandTransport {
public:
    enum class Kind {
        LOCAL_DIRECT,
        REGISTRATION,
    };

    static constexpr uint16_t DEFAULT_PORT = 3000;

    DirectTransport(HttpClient& http, Kind kind, std::chrono::milliseconds timeout);

    net::awaitable<std::expected<CommandReply, FleetError>> send(
        const PeerTarget& target, const CommandRequest& request) override;

    const char* method() const override;

    // http://<host>:<port>/api/remote/command for the target, or INVALID_URL
    std::expected<std::string, FleetError> endpoint_for(const PeerTarget& target) const;

private:
    HttpClient& http_;
    Kind kind_;
    std::chrono::milliseconds timeout_;
};

} // namespace voxfleet::remote
