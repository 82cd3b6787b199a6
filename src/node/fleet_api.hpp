#pragma once

#include "common/errors.hpp"
#include "common/http_client.hpp"
#include "common/types.hpp"
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <expected>
#include <string>
#include <vector>

namespace voxfleet::node {

namespace net = boost::asio;

/**
 * FleetApi - calls this node makes on its siblings, federation peers and
 * its own voice server.
 *
 * The transfer calls return the peer's success flag; an unreachable peer or
 * an unreadable answer is an error. Pause, resume and broadcast are
 * fire-and-forget.
 */
class FleetApi {
public:
    virtual ~FleetApi() = default;

    // POST <device>/api/rooms/transfer-accept
    virtual net::awaitable<std::expected<bool, FleetError>> transfer_to_device(
        const LinkedDevice& device, const std::vector<HostedRoom>& rooms) = 0;

    // POST <server>/api/rooms/federated-transfer
    virtual net::awaitable<std::expected<bool, FleetError>> transfer_to_federated(
        const FederatedServer& server, const std::vector<HostedRoom>& rooms) = 0;

    // GET <discovery url>; empty on any failure
    virtual net::awaitable<std::vector<FederatedServer>> fetch_federated_servers() = 0;

    virtual void pause_room(const std::string& room_id) = 0;
    virtual void resume_room(const std::string& room_id) = 0;
    virtual void broadcast(const std::string& type, const std::string& message, json::object extra = {}) = 0;
};

class HttpFleetApi : public FleetApi {
public:
    struct Options {
        std::string device_id;         // sourceDeviceId of device transfers
        std::string server_name;       // sourceServer of federated transfers
        std::string discovery_url;
        std::string local_server_url;  // Pause/resume/broadcast target
        std::string local_token;
        std::chrono::milliseconds timeout{10000};
    };

    HttpFleetApi(net::any_io_executor executor, HttpClient& http, Options options);

    net::awaitable<std::expected<bool, FleetError>> transfer_to_device(
        const LinkedDevice& device, const std::vector<HostedRoom>& rooms) override;

    net::awaitable<std::expected<bool, FleetError>> transfer_to_federated(
        const FederatedServer& server, const std::vector<HostedRoom>& rooms) override;

    net::awaitable<std::vector<FederatedServer>> fetch_federated_servers() override;

    void pause_room(const std::string& room_id) override;
    void resume_room(const std::string& room_id) override;
    void broadcast(const std::string& type, const std::string& message, json::object extra = {}) override;

private:
    // POST to the local server in the background, failures logged at debug
    void post_local(std::string path, json::object body);

    net::any_io_executor executor_;
    HttpClient& http_;
    Options options_;
};

} // namespace voxfleet::node
