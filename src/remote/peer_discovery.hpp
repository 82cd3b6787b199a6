#pragma once

#include "common/http_client.hpp"
#include "common/types.hpp"
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace voxfleet::remote {

namespace net = boost::asio;

// Checks whether a LAN address answers as the given device
class IdentityChecker {
public:
    virtual ~IdentityChecker() = default;

    virtual net::awaitable<bool> check_identity(const std::string& address,
                                       uint16_t port,
                                       const std::string& device_id,
                                       std::chrono::milliseconds timeout) = 0;
};

// GET http://<address>:<port>/api/device-id and compare deviceId
class HttpIdentityChecker : public IdentityChecker {
public:
    explicit HttpIdentityChecker(HttpClient& http) : http_(http) {}

    net::awaitable<bool> check_identity(const std::string& address,
                               uint16_t port,
                               const std::string& device_id,
                               std::chrono::milliseconds timeout) override;

private:
    HttpClient& http_;
};

// Resolves a linked device to a reachable LAN address
class PeerLocator {
public:
    virtual ~PeerLocator() = default;

    virtual net::awaitable<std::optional<std::string>> locate(const LinkedDevice& device) = 0;
};

/**
 * PeerDiscovery - race advertisement listening against a subnet sweep.
 *
 * The first leg to confirm the device settles the race; the other legs see
 * the done flag and stop, and the advertisement socket is closed. When the
 * deadline passes (or every leg gives up) without a confirmed address, the
 * host of the registered URL is returned if it is a private IPv4 literal.
 */
class PeerDiscovery : public PeerLocator {
public:
    struct Options {
        std::chrono::milliseconds timeout{10000};
        std::chrono::milliseconds sweep_timeout{500};
        uint16_t sweep_port = 3000;
        uint16_t advertise_port = 41234;
        std::vector<std::string> subnets = {"192.168.1", "192.168.0", "10.0.0", "10.0.1", "172.16.0"};
        bool include_local_subnets = true;
        bool listen_advertisements = true;
        size_t max_in_flight = 256;  // Concurrent identity checks
    };

    PeerDiscovery(net::any_io_executor executor, IdentityChecker& checker, Options options);

    net::awaitable<std::optional<std::string>> locate(const LinkedDevice& device) override;

    // Prefixes in sweep order (local interfaces first, duplicates removed)
    std::vector<std::string> sweep_prefixes() const;

    // Private IPv4 host of the registered URL, if any
    static std::optional<std::string> registration_fallback(const LinkedDevice& device);

private:
    struct Race;

    net::awaitable<void> advertisement_leg(std::shared_ptr<Race> race, std::string device_id);
    net::awaitable<void> sweep_worker(std::shared_ptr<Race> race, std::shared_ptr<std::vector<std::string>> targets,
                                      std::shared_ptr<size_t> next, std::string device_id);

    net::any_io_executor executor_;
    IdentityChecker& checker_;
    Options options_;
};

} // namespace voxfleet::remote
