#include <gtest/gtest.h>
#include "remote/direct_transport.hpp"
#include "test_support.hpp"

using namespace voxfleet;
using namespace voxfleet::remote;
using namespace voxfleet::test;

class DirectTransportTest : public ::testing::Test {
protected:
    net::io_context ioc;
    HttpClient http{ioc.get_executor()};
};

TEST_F(DirectTransportTest, LocalDirectUsesDiscoveredAddress) {
    DirectTransport transport(http, DirectTransport::Kind::LOCAL_DIRECT, std::chrono::seconds(1));
    auto device = make_device("studio", true);
    device.url = "https://studio.example.net:3443";

    auto url = transport.endpoint_for(PeerTarget{device, std::string("192.168.1.77")});
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(*url, "http://192.168.1.77:3443/api/remote/command");
    EXPECT_STREQ(transport.method(), "local_direct");
}

TEST_F(DirectTransportTest, LocalDirectNeedsAddress) {
    DirectTransport transport(http, DirectTransport::Kind::LOCAL_DIRECT, std::chrono::seconds(1));
    auto url = transport.endpoint_for(PeerTarget{make_device("studio", true), std::nullopt});
    ASSERT_FALSE(url.has_value());
    EXPECT_EQ(url.error(), FleetError::INVALID_PARAMETERS);
}

TEST_F(DirectTransportTest, RegistrationUsesRegisteredHost) {
    DirectTransport transport(http, DirectTransport::Kind::REGISTRATION, std::chrono::seconds(1));
    auto device = make_device("studio", true);
    device.url = "https://studio.example.net";

    auto url = transport.endpoint_for(PeerTarget{device, std::nullopt});
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(*url, "http://studio.example.net:3000/api/remote/command");
    EXPECT_STREQ(transport.method(), "direct_ip");
}

TEST_F(DirectTransportTest, RegistrationRejectsBadUrl) {
    DirectTransport transport(http, DirectTransport::Kind::REGISTRATION, std::chrono::seconds(1));
    auto device = make_device("studio", true);
    device.url = "studio";

    auto url = transport.endpoint_for(PeerTarget{device, std::nullopt});
    ASSERT_FALSE(url.has_value());
    EXPECT_EQ(url.error(), FleetError::INVALID_URL);
}
