#include "remote/peer_discovery.hpp"
#include "common/async_utils.hpp"
#include "common/json_util.hpp"
#include "common/log.hpp"
#include "common/net_utils.hpp"
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <algorithm>
#include <array>

namespace voxfleet::remote {

namespace {

const log::Logger& logger() { return log::Logger::get("remote.discovery"); }

constexpr const char* ADVERTISED_SERVICE = "voxfleet";

} // anonymous namespace

// ============================================================================
// HttpIdentityChecker
// ============================================================================

net::awaitable<bool> HttpIdentityChecker::check_identity(const std::string& address,
                                               uint16_t port,
                                               const std::string& device_id,
                                               std::chrono::milliseconds timeout) {
    auto result = co_await http_.get(
        "http://" + address + ":" + std::to_string(port) + "/api/device-id", {}, timeout);
    if (!result || !result->ok()) {
        co_return false;
    }
    auto body = result->json();
    co_return body && jstr(*body, "deviceId") == device_id;
}

// ============================================================================
// Race state
// ============================================================================

// Single writer: whichever leg calls settle() first. Every later call is
// ignored because done is already set.
struct PeerDiscovery::Race {
    explicit Race(net::any_io_executor ex) : signal(ex) {}

    net::steady_timer signal;
    std::optional<std::string> address;
    std::string found_by;
    bool done{false};
    size_t legs_pending{0};
    std::shared_ptr<net::ip::udp::socket> advert_socket;

    void settle(std::string addr, std::string via) {
        if (done) return;
        done = true;
        address = std::move(addr);
        found_by = std::move(via);
        signal.cancel();
    }

    void leg_finished() {
        if (legs_pending > 0 && --legs_pending == 0 && !done) {
            done = true;
            signal.cancel();
        }
    }
};

// ============================================================================
// PeerDiscovery
// ============================================================================

PeerDiscovery::PeerDiscovery(net::any_io_executor executor, IdentityChecker& checker, Options options)
    : executor_(std::move(executor))
    , checker_(checker)
    , options_(std::move(options)) {}

std::vector<std::string> PeerDiscovery::sweep_prefixes() const {
    std::vector<std::string> prefixes;
    auto add = [&](const std::string& prefix) {
        if (std::find(prefixes.begin(), prefixes.end(), prefix) == prefixes.end()) {
            prefixes.push_back(prefix);
        }
    };

    if (options_.include_local_subnets) {
        for (const auto& prefix : local_ipv4_prefixes()) {
            add(prefix);
        }
    }
    for (const auto& prefix : options_.subnets) {
        add(prefix);
    }
    return prefixes;
}

std::optional<std::string> PeerDiscovery::registration_fallback(const LinkedDevice& device) {
    auto url = parse_url(device.url);
    if (!url) {
        return std::nullopt;
    }
    if (!is_ipv4_literal(url->host) || !is_private_address(url->host)) {
        return std::nullopt;
    }
    return url->host;
}

net::awaitable<std::optional<std::string>> PeerDiscovery::locate(const LinkedDevice& device) {
    auto race = std::make_shared<Race>(executor_);
    race->signal.expires_after(options_.timeout);

    auto targets = std::make_shared<std::vector<std::string>>();
    for (const auto& prefix : sweep_prefixes()) {
        for (int host = 1; host <= 254; ++host) {
            targets->push_back(prefix + "." + std::to_string(host));
        }
    }

    logger().info("Discovering {} ({} sweep targets, timeout {}ms)",
                  device.id, targets->size(), options_.timeout.count());

    if (options_.listen_advertisements) {
        ++race->legs_pending;
        async::spawn(executor_, advertisement_leg(race, device.id), "discovery.advert");
    }

    auto next = std::make_shared<size_t>(0);
    size_t workers = std::min(options_.max_in_flight, targets->size());
    race->legs_pending += workers;
    for (size_t i = 0; i < workers; ++i) {
        async::spawn(executor_, sweep_worker(race, targets, next, device.id), "discovery.sweep");
    }

    if (race->legs_pending > 0) {
        boost::system::error_code ec;
        co_await race->signal.async_wait(net::redirect_error(net::use_awaitable, ec));
    }

    race->done = true;
    if (race->advert_socket) {
        boost::system::error_code ec;
        race->advert_socket->close(ec);
    }

    if (race->address) {
        logger().info("Found {} at {} via {}", device.id, *race->address, race->found_by);
        co_return race->address;
    }

    auto fallback = registration_fallback(device);
    if (fallback) {
        logger().info("{} not confirmed on the LAN, using registered address {}", device.id, *fallback);
    } else {
        logger().info("{} not found on the local network", device.id);
    }
    co_return fallback;
}

net::awaitable<void> PeerDiscovery::advertisement_leg(std::shared_ptr<Race> race, std::string device_id) {
    using net::ip::udp;

    auto socket = std::make_shared<udp::socket>(executor_);
    boost::system::error_code ec;
    socket->open(udp::v4(), ec);
    if (!ec) socket->set_option(net::socket_base::reuse_address(true), ec);
    if (!ec) socket->bind(udp::endpoint(udp::v4(), options_.advertise_port), ec);
    if (ec) {
        logger().debug("Advertisement listener unavailable on port {}: {}", options_.advertise_port, ec.message());
        race->leg_finished();
        co_return;
    }
    race->advert_socket = socket;

    std::array<char, 2048> buffer;
    udp::endpoint sender;
    while (!race->done) {
        auto n = co_await socket->async_receive_from(
            net::buffer(buffer), sender, net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            break;
        }

        auto obj = parse_object(std::string_view(buffer.data(), n));
        if (!obj || jstr(*obj, "service") != ADVERTISED_SERVICE || jstr(*obj, "deviceId") != device_id) {
            continue;
        }
        if (!sender.address().is_v4()) {
            continue;
        }
        race->settle(sender.address().to_string(), "advertisement");
    }

    race->leg_finished();
}

net::awaitable<void> PeerDiscovery::sweep_worker(std::shared_ptr<Race> race,
                                                 std::shared_ptr<std::vector<std::string>> targets,
                                                 std::shared_ptr<size_t> next,
                                                 std::string device_id) {
    while (!race->done && *next < targets->size()) {
        std::string address = (*targets)[(*next)++];
        bool matched = co_await checker_.check_identity(address, options_.sweep_port, device_id,
                                                        options_.sweep_timeout);
        if (matched) {
            race->settle(address, "subnet sweep");
        }
    }
    race->leg_finished();
}

} // namespace voxfleet::remote
