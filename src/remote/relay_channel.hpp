#pragma once

#include "common/ws_client_coro.hpp"
#include "remote/correlation_table.hpp"
#include <functional>

namespace voxfleet::remote {

/**
 * RelayChannel - persistent control channel to one peer through its
 * openlink control room (ws(s)://<peer>/openlink/{roomId}/control).
 *
 * The WsClientCoro reader is the only consumer of incoming messages: every
 * {commandId, success, result} reply is routed through the correlation
 * table. The channel does not reconnect; RelayTransport opens a
 * fresh one on the next send.
 */
class RelayChannel : public WsClientCoro {
public:
    RelayChannel(net::io_context& ioc, const std::string& url, std::string peer_id, std::string room_id);

    CorrelationTable& pending() { return pending_; }
    const std::string& peer_id() const { return peer_id_; }
    const std::string& room_id() const { return room_id_; }

    // Called once when the session ends
    void set_closed_handler(std::function<void(const std::string&)> handler) {
        closed_handler_ = std::move(handler);
    }

protected:
    net::awaitable<void> on_connected() override;
    net::awaitable<void> process_message(std::string_view text) override;
    net::awaitable<void> on_disconnected(const std::string& reason) override;

private:
    std::string peer_id_;
    std::string room_id_;
    CorrelationTable pending_;
    std::function<void(const std::string&)> closed_handler_;
};

} // namespace voxfleet::remote
