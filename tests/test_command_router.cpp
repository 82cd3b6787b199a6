#include <gtest/gtest.h>
#include "remote/command_router.hpp"
#include "test_support.hpp"
#include <deque>

using namespace voxfleet;
using namespace voxfleet::remote;
using namespace voxfleet::test;

namespace {

class FakeTransport : public CommandTransport {
public:
    explicit FakeTransport(const char* name) : name_(name) {}

    net::awaitable<std::expected<CommandReply, FleetError>> send(
        const PeerTarget& target, const CommandRequest& request) override {
        targets.push_back(target);
        requests.push_back(request);
        if (results.empty()) {
            co_return CommandReply::ok(std::string(name_) + " ok");
        }
        auto result = results.front();
        results.pop_front();
        co_return result;
    }

    void close() override { ++closes; }
    const char* method() const override { return name_; }

    std::deque<std::expected<CommandReply, FleetError>> results;
    std::vector<PeerTarget> targets;
    std::vector<CommandRequest> requests;
    int closes{0};

private:
    const char* name_;
};

class FakeLocator : public PeerLocator {
public:
    net::awaitable<std::optional<std::string>> locate(const LinkedDevice& device) override {
        located.push_back(device.id);
        co_return address;
    }

    std::optional<std::string> address;
    std::vector<std::string> located;
};

} // anonymous namespace

class CommandRouterTest : public ::testing::Test {
protected:
    CommandReply send(RemoteCommandRouter& router, RemoteCommand command = RemoteCommand::GET_STATUS,
                      json::object params = {}) {
        return run_sync(ioc, router.send_command(peer, command, std::move(params)));
    }

    RemoteCommandRouter make(ConnectionMode mode) {
        return RemoteCommandRouter({"ctl-1", "Laptop"}, locator, local_direct, relay, registration, mode);
    }

    net::io_context ioc;
    LinkedDevice peer = make_device("studio", true);
    FakeLocator locator;
    FakeTransport local_direct{"local_direct"};
    FakeTransport relay{"openlink"};
    FakeTransport registration{"direct_ip"};
};

TEST_F(CommandRouterTest, AutoUsesDiscoveredAddress) {
    locator.address = "192.168.1.20";
    auto router = make(ConnectionMode::AUTO);

    auto reply = send(router);

    EXPECT_TRUE(reply.success);
    EXPECT_EQ(reply.result, "local_direct ok");
    ASSERT_EQ(local_direct.targets.size(), 1u);
    EXPECT_EQ(local_direct.targets[0].address, "192.168.1.20");
    EXPECT_EQ(local_direct.targets[0].device.id, "studio");
    EXPECT_TRUE(relay.requests.empty());
    EXPECT_TRUE(registration.requests.empty());
}

TEST_F(CommandRouterTest, AutoFallsBackToRelay) {
    auto router = make(ConnectionMode::AUTO);

    auto reply = send(router);

    EXPECT_EQ(reply.result, "openlink ok");
    EXPECT_EQ(locator.located.size(), 1u);
    EXPECT_TRUE(local_direct.requests.empty());
    EXPECT_EQ(relay.requests.size(), 1u);
}

TEST_F(CommandRouterTest, TunnelOnlySkipsDiscovery) {
    auto router = make(ConnectionMode::TUNNEL_ONLY);

    send(router);

    EXPECT_TRUE(locator.located.empty());
    EXPECT_EQ(relay.requests.size(), 1u);
    EXPECT_TRUE(registration.requests.empty());
}

TEST_F(CommandRouterTest, DirectOnlyUsesRegisteredAddress) {
    auto router = make(ConnectionMode::DIRECT_ONLY);

    auto reply = send(router);

    EXPECT_EQ(reply.result, "direct_ip ok");
    EXPECT_TRUE(locator.located.empty());
    EXPECT_TRUE(relay.requests.empty());
    ASSERT_EQ(registration.targets.size(), 1u);
    EXPECT_FALSE(registration.targets[0].address.has_value());
}

TEST_F(CommandRouterTest, HybridRelaySuccessSkipsDirect) {
    auto router = make(ConnectionMode::HYBRID);

    send(router);

    EXPECT_EQ(relay.requests.size(), 1u);
    EXPECT_TRUE(registration.requests.empty());
}

TEST_F(CommandRouterTest, HybridTriesDirectExactlyOnce) {
    relay.results.push_back(std::unexpected(FleetError::CHANNEL_UNAVAILABLE));
    registration.results.push_back(std::unexpected(FleetError::CONNECTION_FAILED));
    auto router = make(ConnectionMode::HYBRID);

    auto reply = send(router);

    EXPECT_FALSE(reply.success);
    EXPECT_EQ(reply.result, "Connection failed");
    EXPECT_EQ(relay.requests.size(), 1u);
    EXPECT_EQ(registration.requests.size(), 1u);
}

TEST_F(CommandRouterTest, HybridRejectedRelayTriesDirect) {
    relay.results.push_back(CommandReply::fail("busy"));
    auto router = make(ConnectionMode::HYBRID);

    auto reply = send(router);

    EXPECT_TRUE(reply.success);
    EXPECT_EQ(reply.result, "direct_ip ok");
    EXPECT_EQ(registration.requests.size(), 1u);
}

TEST_F(CommandRouterTest, RequestCarriesIdentityAndParams) {
    auto router = make(ConnectionMode::TUNNEL_ONLY);
    json::object params;
    params["targetDeviceId"] = "other";

    send(router, RemoteCommand::TRANSFER_ROOMS, params);

    ASSERT_EQ(relay.requests.size(), 1u);
    const auto& request = relay.requests[0];
    EXPECT_EQ(request.command, RemoteCommand::TRANSFER_ROOMS);
    EXPECT_EQ(request.source_device_id, "ctl-1");
    EXPECT_EQ(request.source_device_name, "Laptop");
    EXPECT_EQ(request.params.at("targetDeviceId").as_string(), "other");
}

TEST_F(CommandRouterTest, TransportErrorRecordedInHistory) {
    relay.results.push_back(std::unexpected(FleetError::TIMEOUT));
    auto router = make(ConnectionMode::TUNNEL_ONLY);

    auto failed = send(router);
    auto ok = send(router);

    EXPECT_FALSE(failed.success);
    EXPECT_EQ(failed.result, "Request timed out");
    EXPECT_TRUE(ok.success);

    const auto& entries = router.history().entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].status, CommandStatus::FAILED);
    EXPECT_EQ(entries[0].result, "Request timed out");
    EXPECT_EQ(entries[1].status, CommandStatus::COMPLETED);
}

TEST_F(CommandRouterTest, ModeChangesCloseRelay) {
    auto router = make(ConnectionMode::TUNNEL_ONLY);

    router.set_mode(ConnectionMode::AUTO);
    EXPECT_EQ(relay.closes, 1);

    router.set_mode(ConnectionMode::HYBRID);
    EXPECT_EQ(relay.closes, 1);

    router.set_mode(ConnectionMode::DIRECT_ONLY);
    EXPECT_EQ(relay.closes, 2);

    router.set_mode(ConnectionMode::DIRECT_ONLY);
    EXPECT_EQ(relay.closes, 2);
    EXPECT_EQ(router.mode(), ConnectionMode::DIRECT_ONLY);
}
