#include <gtest/gtest.h>
#include "remote/relay_transport.hpp"
#include "test_support.hpp"
#include <boost/asio/redirect_error.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/json.hpp>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace voxfleet;
using namespace voxfleet::remote;
using namespace voxfleet::test;
using namespace std::chrono_literals;

namespace {

// Drive one coroutine while background sessions keep the context busy
template<typename T>
T run_until_done(net::io_context& ioc, net::awaitable<T> task) {
    std::optional<T> out;
    std::exception_ptr error;
    net::co_spawn(ioc, std::move(task), [&](std::exception_ptr e, T value) {
        error = e;
        if (!e) out = std::move(value);
        ioc.stop();
    });
    ioc.restart();
    ioc.run_for(5s);
    if (error) std::rethrow_exception(error);
    if (!out) throw std::runtime_error("task did not finish");
    return std::move(*out);
}

// Exposes the reply routing of a channel that is never connected
class DetachedChannel : public RelayChannel {
public:
    explicit DetachedChannel(net::io_context& ioc)
        : RelayChannel(ioc, "ws://127.0.0.1:9/openlink/r1/control", "d1", "r1")
        , ioc_ref_(ioc) {}

    void deliver(std::string_view text) {
        net::co_spawn(ioc_ref_, process_message(text), net::detached);
        ioc_ref_.restart();
        ioc_ref_.run();
    }

private:
    net::io_context& ioc_ref_;
};

// Openlink control endpoint: answers each remote_command with its commandId,
// preceded by an uncorrelated presence event
class ControlPeer {
public:
    explicit ControlPeer(net::io_context& ioc)
        : acceptor_(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)) {
        net::co_spawn(ioc, accept_loop(), net::detached);
    }

    std::string url() const {
        return "http://127.0.0.1:" + std::to_string(acceptor_.local_endpoint().port());
    }

    int connections{0};
    std::vector<std::string> targets;
    std::vector<std::string> authorizations;
    std::vector<std::string> commands;

private:
    net::awaitable<void> accept_loop() {
        for (;;) {
            boost::system::error_code ec;
            tcp::socket socket = co_await acceptor_.async_accept(net::redirect_error(net::use_awaitable, ec));
            if (ec) co_return;
            net::co_spawn(acceptor_.get_executor(), session(std::move(socket)), net::detached);
        }
    }

    net::awaitable<void> session(tcp::socket socket) {
        websocket::stream<tcp::socket> ws(std::move(socket));
        boost::system::error_code ec;

        beast::flat_buffer buffer;
        http::request<http::string_body> req;
        co_await http::async_read(ws.next_layer(), buffer, req, net::redirect_error(net::use_awaitable, ec));
        if (ec) co_return;

        ++connections;
        targets.emplace_back(req.target());
        authorizations.emplace_back(req[http::field::authorization]);

        co_await ws.async_accept(req, net::redirect_error(net::use_awaitable, ec));
        if (ec) co_return;
        ws.text(true);

        for (;;) {
            beast::flat_buffer frame;
            co_await ws.async_read(frame, net::redirect_error(net::use_awaitable, ec));
            if (ec) co_return;

            auto message = boost::json::parse(beast::buffers_to_string(frame.data())).as_object();
            std::string command(message.at("command").as_string());
            commands.push_back(command);

            std::string presence = R"({"type":"presence","online":true})";
            co_await ws.async_write(net::buffer(presence), net::redirect_error(net::use_awaitable, ec));
            if (ec) co_return;

            json::object reply;
            reply["commandId"] = message.at("commandId");
            reply["success"] = true;
            reply["result"] = "ran " + command;
            std::string text = json::serialize(reply);
            co_await ws.async_write(net::buffer(text), net::redirect_error(net::use_awaitable, ec));
            if (ec) co_return;
        }
    }

    tcp::acceptor acceptor_;
};

std::expected<HttpResult, FleetError> control_room_created(const FakeHttpClient::Call&) {
    return HttpResult{200, R"({"success":true,"roomId":"room-7"})"};
}

} // anonymous namespace

// ============================================================================
// RelayChannel reply routing
// ============================================================================

TEST(RelayChannelTest, ReplyMatchedByCommandId) {
    net::io_context ioc;
    DetachedChannel channel(ioc);
    auto first = channel.pending().add("c1", 1s);
    auto second = channel.pending().add("c2", 1s);

    channel.deliver(R"({"commandId":"c2","success":true,"result":"second"})");

    ASSERT_TRUE(second->reply.has_value());
    EXPECT_EQ(second->reply->result, "second");
    EXPECT_FALSE(first->reply.has_value());
    EXPECT_TRUE(channel.pending().contains("c1"));
    EXPECT_FALSE(channel.pending().contains("c2"));
}

TEST(RelayChannelTest, FramesWithoutCommandIdIgnored) {
    net::io_context ioc;
    DetachedChannel channel(ioc);
    auto waiter = channel.pending().add("c1", 1s);

    channel.deliver(R"({"type":"presence","success":true})");
    channel.deliver("not json at all");
    channel.deliver(R"({"commandId":"","success":true})");

    EXPECT_FALSE(waiter->reply.has_value());
    EXPECT_EQ(channel.pending().size(), 1u);
}

TEST(RelayChannelTest, MalformedReplyFailsCommand) {
    net::io_context ioc;
    DetachedChannel channel(ioc);
    auto waiter = channel.pending().add("c1", 1s);

    channel.deliver(R"({"commandId":"c1","result":"no success flag"})");

    ASSERT_TRUE(waiter->reply.has_value());
    EXPECT_FALSE(waiter->reply->success);
    EXPECT_EQ(waiter->reply->result, "Malformed reply");
}

TEST(RelayChannelTest, ReplyAfterTimeoutIsDropped) {
    net::io_context ioc;
    DetachedChannel channel(ioc);
    auto waiter = channel.pending().add("c1", 10ms);

    EXPECT_EQ(run_sync(ioc, channel.pending().wait(waiter)), CorrelationTable::Outcome::TIMED_OUT);

    channel.deliver(R"({"commandId":"c1","success":true,"result":"late"})");
    EXPECT_FALSE(waiter->reply.has_value());
    EXPECT_EQ(channel.pending().size(), 0u);
}

// ============================================================================
// RelayTransport
// ============================================================================

class RelayTransportTest : public ::testing::Test {
protected:
    RelayTransportTest() : http(ioc.get_executor()) {}

    RelayTransport::Options transport_options() const {
        RelayTransport::Options o;
        o.local_device_id = "ctl-1";
        o.response_timeout = 2s;
        o.connect_timeout = 2s;
        return o;
    }

    static CommandRequest request(RemoteCommand command) {
        CommandRequest r;
        r.command = command;
        r.source_device_id = "ctl-1";
        r.source_device_name = "Laptop";
        return r;
    }

    net::io_context ioc;
    FakeHttpClient http;
};

TEST_F(RelayTransportTest, ControlRoomRequestFailureIsChannelUnavailable) {
    http.responder = [](const FakeHttpClient::Call&) -> std::expected<HttpResult, FleetError> {
        return std::unexpected(FleetError::CONNECTION_FAILED);
    };
    RelayTransport transport(ioc, http, transport_options());

    auto reply = run_sync(ioc, transport.send(PeerTarget{make_device("d1", true), std::nullopt},
                                              request(RemoteCommand::GET_STATUS)));

    ASSERT_FALSE(reply.has_value());
    EXPECT_EQ(reply.error(), FleetError::CHANNEL_UNAVAILABLE);
    EXPECT_EQ(transport.channel_count(), 0u);

    ASSERT_EQ(http.calls.size(), 1u);
    EXPECT_EQ(http.calls[0].url, "http://192.168.1.50:3000/api/rooms/create-openlink");
    EXPECT_EQ(http.calls[0].bearer_token, "token-d1");
    auto body = http.calls[0].json();
    EXPECT_EQ(body.at("initiatorId").as_string(), "ctl-1");
    EXPECT_EQ(body.at("visitorId").as_string(), "d1");
    EXPECT_TRUE(body.at("isHidden").as_bool());
}

TEST_F(RelayTransportTest, ControlRoomWithoutIdIsChannelUnavailable) {
    http.responder = [](const FakeHttpClient::Call&) -> std::expected<HttpResult, FleetError> {
        return HttpResult{200, R"({"success":true})"};
    };
    RelayTransport transport(ioc, http, transport_options());

    auto reply = run_sync(ioc, transport.send(PeerTarget{make_device("d1", true), std::nullopt},
                                              request(RemoteCommand::GET_STATUS)));

    ASSERT_FALSE(reply.has_value());
    EXPECT_EQ(reply.error(), FleetError::CHANNEL_UNAVAILABLE);
}

TEST_F(RelayTransportTest, RelayHostOverridesPeerUrl) {
    http.responder = [](const FakeHttpClient::Call&) -> std::expected<HttpResult, FleetError> {
        return HttpResult{403, R"({"success":false,"error":"not linked"})"};
    };
    auto options = transport_options();
    options.relay_host_url = "https://relay.example.net";
    RelayTransport transport(ioc, http, options);

    auto reply = run_sync(ioc, transport.send(PeerTarget{make_device("d1", true), std::nullopt},
                                              request(RemoteCommand::GET_STATUS)));

    ASSERT_FALSE(reply.has_value());
    ASSERT_EQ(http.calls.size(), 1u);
    EXPECT_EQ(http.calls[0].url, "https://relay.example.net/api/rooms/create-openlink");
}

TEST_F(RelayTransportTest, ChannelReusedAcrossCommands) {
    ControlPeer peer(ioc);
    http.responder = control_room_created;
    RelayTransport transport(ioc, http, transport_options());

    auto device = make_device("d1", true);
    device.url = peer.url();
    PeerTarget target{device, std::nullopt};

    auto status = run_until_done(ioc, transport.send(target, request(RemoteCommand::GET_STATUS)));
    ASSERT_TRUE(status.has_value());
    EXPECT_TRUE(status->success);
    EXPECT_EQ(status->result, "ran get_status");
    EXPECT_TRUE(transport.has_channel("d1"));

    auto rooms = run_until_done(ioc, transport.send(target, request(RemoteCommand::GET_ACTIVE_ROOMS)));
    ASSERT_TRUE(rooms.has_value());
    EXPECT_EQ(rooms->result, "ran get_active_rooms");

    EXPECT_EQ(http.calls.size(), 1u);
    EXPECT_EQ(peer.connections, 1);
    EXPECT_EQ(transport.channel_count(), 1u);
    ASSERT_EQ(peer.targets.size(), 1u);
    EXPECT_EQ(peer.targets[0], "/openlink/room-7/control");
    EXPECT_EQ(peer.authorizations[0], "Bearer token-d1");
    EXPECT_EQ(peer.commands, (std::vector<std::string>{"get_status", "get_active_rooms"}));

    transport.close();
    EXPECT_EQ(transport.channel_count(), 0u);
}
