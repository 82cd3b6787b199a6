#pragma once

#include "common/errors.hpp"
#include "common/types.hpp"
#include <boost/asio/awaitable.hpp>
#include <expected>
#include <optional>
#include <string>

namespace voxfleet::remote {

namespace net = boost::asio;

// Where a command goes: the registered peer plus, when discovery found one,
// a reachable address on the local network
struct PeerTarget {
    LinkedDevice device;
    std::optional<std::string> address;
};

/**
 * CommandTransport - "send command, await result" over one delivery path.
 *
 * A transport error (no route, timeout, channel down) is an unexpected
 * FleetError. A peer that answered, even with success=false, yields a
 * CommandReply.
 */
class CommandTransport {
public:
    virtual ~CommandTransport() = default;

    virtual net::awaitable<std::expected<CommandReply, FleetError>> send(
        const PeerTarget& target, const CommandRequest& request) = 0;

    // Release any persistent channel; later sends may re-establish it
    virtual void close() {}

    // Value of the connectionMethod field
    virtual const char* method() const = 0;
};

} // namespace voxfleet::remote
