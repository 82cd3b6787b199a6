#include <gtest/gtest.h>
#include "remote/peer_discovery.hpp"
#include "test_support.hpp"
#include <algorithm>
#include <set>

using namespace voxfleet;
using namespace voxfleet::remote;
using namespace voxfleet::test;
using namespace std::chrono_literals;

namespace {

class FakeChecker : public IdentityChecker {
public:
    net::awaitable<bool> check_identity(const std::string& address,
                               uint16_t port,
                               const std::string& device_id,
                               std::chrono::milliseconds) override {
        checked.insert(address);
        last_port = port;
        last_device = device_id;
        peak_in_flight = std::max(peak_in_flight, ++in_flight);
        if (delay.count() > 0) {
            co_await async::sleep_for(delay);
        }
        --in_flight;
        co_return address == answering;
    }

    std::string answering;
    std::chrono::milliseconds delay{0};
    std::set<std::string> checked;
    uint16_t last_port{0};
    std::string last_device;
    size_t in_flight{0};
    size_t peak_in_flight{0};
};

PeerDiscovery::Options sweep_only(std::vector<std::string> subnets) {
    PeerDiscovery::Options options;
    options.subnets = std::move(subnets);
    options.include_local_subnets = false;
    options.listen_advertisements = false;
    options.max_in_flight = 4;
    return options;
}

} // anonymous namespace

TEST(PeerDiscoveryTest, SweepFindsAnsweringHost) {
    net::io_context ioc;
    FakeChecker checker;
    checker.answering = "10.0.0.42";
    PeerDiscovery discovery(ioc.get_executor(), checker, sweep_only({"192.168.1", "10.0.0"}));

    auto device = make_device("studio", true);
    device.url = "https://studio.example.net";
    auto address = run_sync(ioc, discovery.locate(device));

    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(*address, "10.0.0.42");
    EXPECT_EQ(checker.last_port, 3000);
    EXPECT_EQ(checker.last_device, "studio");
    // Workers stop once the race is settled
    EXPECT_FALSE(checker.checked.count("10.0.0.254"));
}

TEST(PeerDiscoveryTest, ExhaustedSweepUsesPrivateRegistrationHost) {
    net::io_context ioc;
    FakeChecker checker;
    auto options = sweep_only({"192.168.7"});
    options.timeout = 10s;
    PeerDiscovery discovery(ioc.get_executor(), checker, options);

    auto device = make_device("studio", true);
    device.url = "http://192.168.1.50:3000";

    auto start = std::chrono::steady_clock::now();
    auto address = run_sync(ioc, discovery.locate(device));
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(*address, "192.168.1.50");
    EXPECT_EQ(checker.checked.size(), 254u);
    // Every leg gave up, so the deadline was not waited out
    EXPECT_LT(elapsed, 5s);
}

TEST(PeerDiscoveryTest, TimeoutWithPublicRegistrationFindsNothing) {
    net::io_context ioc;
    FakeChecker checker;
    checker.delay = 100ms;
    auto options = sweep_only({"192.168.7"});
    options.timeout = 30ms;
    PeerDiscovery discovery(ioc.get_executor(), checker, options);

    auto device = make_device("studio", true);
    device.url = "https://studio.example.net";
    auto address = run_sync(ioc, discovery.locate(device));

    EXPECT_FALSE(address.has_value());
    EXPECT_LE(checker.checked.size(), 4u);
}

TEST(PeerDiscoveryTest, RegistrationFallback) {
    auto device = make_device("studio", true);

    device.url = "http://192.168.1.50:3000";
    EXPECT_EQ(PeerDiscovery::registration_fallback(device), "192.168.1.50");

    device.url = "http://172.20.4.9";
    EXPECT_EQ(PeerDiscovery::registration_fallback(device), "172.20.4.9");

    device.url = "http://8.8.8.8:3000";
    EXPECT_FALSE(PeerDiscovery::registration_fallback(device).has_value());

    device.url = "https://studio.local:3000";
    EXPECT_FALSE(PeerDiscovery::registration_fallback(device).has_value());

    device.url = "not a url";
    EXPECT_FALSE(PeerDiscovery::registration_fallback(device).has_value());
}

TEST(PeerDiscoveryTest, SweepPrefixesDeduplicated) {
    net::io_context ioc;
    FakeChecker checker;
    PeerDiscovery discovery(ioc.get_executor(), checker, sweep_only({"10.0.0", "192.168.1", "10.0.0"}));

    auto prefixes = discovery.sweep_prefixes();
    EXPECT_EQ(prefixes, (std::vector<std::string>{"10.0.0", "192.168.1"}));
}

TEST(PeerDiscoveryTest, SweepKeepsInFlightRequestsBounded) {
    net::io_context ioc;
    FakeChecker checker;
    checker.delay = 1ms;
    auto options = sweep_only({"192.168.7", "10.9.9"});
    options.max_in_flight = 16;
    PeerDiscovery discovery(ioc.get_executor(), checker, options);

    auto device = make_device("studio", true);
    device.url = "https://studio.example.net";
    auto address = run_sync(ioc, discovery.locate(device));

    EXPECT_FALSE(address.has_value());
    EXPECT_EQ(checker.checked.size(), 508u);
    EXPECT_EQ(checker.peak_in_flight, 16u);
}
