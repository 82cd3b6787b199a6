#pragma once

#include "remote/peer_discovery.hpp"
#include "remote/transport.hpp"
#include "common/command_log.hpp"
#include "common/types.hpp"
#include <boost/asio/awaitable.hpp>
#include <optional>
#include <string>

namespace voxfleet::remote {

/**
 * RemoteCommandRouter - picks a delivery path per connection mode.
 *
 *   DIRECT_ONLY  registration address only
 *   TUNNEL_ONLY  relay channel only
 *   AUTO         discovery first; local-direct when found, relay otherwise
 *   HYBRID       relay first; one registration attempt if that fails
 *
 * Every command is recorded in the audit log before it is dispatched.
 * Transport errors come back as a failed CommandReply whose text is the
 * error message.
 */
class RemoteCommandRouter {
public:
    struct Identity {
        std::string device_id;
        std::string device_name;
    };

    RemoteCommandRouter(Identity identity,
                        PeerLocator& locator,
                        CommandTransport& local_direct,
                        CommandTransport& relay,
                        CommandTransport& registration,
                        ConnectionMode mode = ConnectionMode::AUTO);

    net::awaitable<CommandReply> send_command(const LinkedDevice& peer,
                                              RemoteCommand command,
                                              json::object params = {});

    // Leaving TUNNEL_ONLY or selecting DIRECT_ONLY closes the relay channel
    void set_mode(ConnectionMode mode);
    ConnectionMode mode() const { return mode_; }

    const CommandLog& history() const { return log_; }

    // Address discovery on its own, as AUTO would run it
    net::awaitable<std::optional<std::string>> discover(const LinkedDevice& peer);

private:
    net::awaitable<std::expected<CommandReply, FleetError>> dispatch(
        const LinkedDevice& peer, const CommandRequest& request);

    Identity identity_;
    PeerLocator& locator_;
    CommandTransport& local_direct_;
    CommandTransport& relay_;
    CommandTransport& registration_;
    ConnectionMode mode_;
    CommandLog log_;
};

} // namespace voxfleet::remote
