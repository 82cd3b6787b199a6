#include <gtest/gtest.h>
#include "node/command_executor.hpp"
#include "node/local_host.hpp"
#include "node/room_directory.hpp"
#include "test_support.hpp"
#include <string>
#include <vector>

using namespace voxfleet;
using namespace voxfleet::node;
using namespace voxfleet::test;
using namespace std::chrono_literals;

class CommandExecutorTest : public ::testing::Test {
protected:
    CommandExecutorTest()
        : rooms({make_room("a", 2), make_room("b", 0)})
        , devices({make_device("d1", true)})
        , exit(ioc.get_executor(), rooms, devices, server, audio, host, fleet, exit_options())
        , executor(exit, rooms, server, true) {}

    static ExitOrchestrator::Options exit_options() {
        ExitOrchestrator::Options o;
        o.device_id = "self";
        o.waiting_room_timeout = 1h;
        o.shutdown_grace = 1h;
        o.exit_delay = 1h;
        return o;
    }

    CommandReply send(RemoteCommand command, json::object params = {}) {
        params["sourceDeviceName"] = "Studio Mac";
        return executor.handle(command, "remote-1", params);
    }

    net::io_context ioc;
    InMemoryRoomDirectory rooms;
    InMemoryDeviceRegistry devices;
    FakeServerControl server;
    FakeAudioCues audio;
    FakeHostControl host;
    FakeFleetApi fleet;
    ExitOrchestrator exit;
    CommandExecutor executor;
};

TEST_F(CommandExecutorTest, DisabledRejectsEveryCommand) {
    executor.set_remote_control_enabled(false);

    for (auto command : ALL_REMOTE_COMMANDS) {
        auto reply = send(command);
        EXPECT_FALSE(reply.success) << remote_command_name(command);
        EXPECT_EQ(reply.result, "Remote control is disabled on this device");
    }

    EXPECT_EQ(server.stops, 0);
    EXPECT_EQ(server.restarts, 0);
    EXPECT_EQ(exit.progress().phase, ExitPhase::IDLE);
    EXPECT_TRUE(fleet.paused.empty());

    ASSERT_EQ(executor.history().size(), ALL_REMOTE_COMMANDS.size());
    for (const auto& entry : executor.history().entries()) {
        EXPECT_EQ(entry.status, CommandStatus::FAILED);
    }
}

TEST_F(CommandExecutorTest, StopServer) {
    auto reply = send(RemoteCommand::STOP_SERVER);

    EXPECT_TRUE(reply.success);
    EXPECT_EQ(reply.result, "Server stopping");
    EXPECT_EQ(server.stops, 1);
    EXPECT_EQ(exit.progress().phase, ExitPhase::COMPLETE);
}

TEST_F(CommandExecutorTest, RestartServer) {
    auto reply = send(RemoteCommand::RESTART_SERVER);

    EXPECT_TRUE(reply.success);
    EXPECT_EQ(reply.result, "Server restarting");
    EXPECT_EQ(server.restarts, 1);
}

TEST_F(CommandExecutorTest, TransferRoomsText) {
    EXPECT_EQ(send(RemoteCommand::TRANSFER_ROOMS).result, "Rooms transferring to first available device");

    json::object params;
    params["targetDeviceId"] = "d1";
    EXPECT_EQ(send(RemoteCommand::TRANSFER_ROOMS, params).result, "Rooms transferring to d1");

    ioc.run_for(5ms);
    EXPECT_FALSE(fleet.device_targets.empty());
}

TEST_F(CommandExecutorTest, PauseAndResume) {
    auto paused = send(RemoteCommand::PAUSE_ROOMS);
    EXPECT_EQ(paused.result, "Rooms paused, users in waiting room");
    EXPECT_TRUE(exit.waiting_room_active());
    EXPECT_EQ(fleet.paused, (std::vector<std::string>{"a"}));

    auto resumed = send(RemoteCommand::RESUME_ROOMS);
    EXPECT_EQ(resumed.result, "Rooms resumed");
    EXPECT_FALSE(exit.waiting_room_active());
    EXPECT_EQ(fleet.resumed, (std::vector<std::string>{"a"}));
}

TEST_F(CommandExecutorTest, RebootDevice) {
    auto reply = send(RemoteCommand::REBOOT_DEVICE);
    EXPECT_EQ(reply.result, "Device rebooting");
    EXPECT_EQ(exit.progress().phase, ExitPhase::SHUTTING_DOWN);
}

TEST_F(CommandExecutorTest, GetStatusReportsServerState) {
    server.clients = {"c1", "c2"};

    auto reply = send(RemoteCommand::GET_STATUS);
    ASSERT_TRUE(reply.success);

    auto status = json::parse(reply.result).as_object();
    EXPECT_TRUE(status.at("isRunning").as_bool());
    EXPECT_EQ(status.at("port").to_number<int64_t>(), 3000);
    EXPECT_EQ(status.at("connectedClients").to_number<int64_t>(), 2);
    EXPECT_EQ(status.at("activeRooms").to_number<int64_t>(), 2);
    EXPECT_FALSE(status.at("waitingRoomActive").as_bool());
}

TEST_F(CommandExecutorTest, GetActiveRoomsListsRooms) {
    auto reply = send(RemoteCommand::GET_ACTIVE_ROOMS);
    ASSERT_TRUE(reply.success);

    auto list = json::parse(reply.result).as_array();
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].as_object().at("id").as_string(), "a");
    EXPECT_EQ(list[0].as_object().at("currentMembers").to_number<int64_t>(), 2);
}

TEST_F(CommandExecutorTest, ForceDisconnectNeedsClientId) {
    auto missing = send(RemoteCommand::FORCE_DISCONNECT);
    EXPECT_FALSE(missing.success);
    EXPECT_EQ(missing.result, "No client ID specified");

    server.clients = {"c1"};
    json::object params;
    params["clientId"] = "c1";
    auto reply = send(RemoteCommand::FORCE_DISCONNECT, params);
    EXPECT_TRUE(reply.success);
    EXPECT_EQ(server.disconnected, (std::vector<std::string>{"c1"}));
}

TEST_F(CommandExecutorTest, UpdateSettings) {
    auto missing = send(RemoteCommand::UPDATE_SETTINGS);
    EXPECT_FALSE(missing.success);
    EXPECT_EQ(missing.result, "No settings provided");

    json::object bad;
    bad["settings"] = json::object{{"serverPort", 70000}};
    EXPECT_FALSE(send(RemoteCommand::UPDATE_SETTINGS, bad).success);
    EXPECT_EQ(server.port_value, 3000);

    json::object good;
    good["settings"] = json::object{{"serverPort", 3100}, {"remoteControlEnabled", false}};
    EXPECT_TRUE(send(RemoteCommand::UPDATE_SETTINGS, good).success);
    EXPECT_EQ(server.port_value, 3100);
    EXPECT_FALSE(executor.remote_control_enabled());
}

TEST_F(CommandExecutorTest, AuditTrailCompletesEntries) {
    send(RemoteCommand::RESTART_SERVER);
    send(RemoteCommand::FORCE_DISCONNECT);

    const auto& entries = executor.history().entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].status, CommandStatus::COMPLETED);
    EXPECT_EQ(entries[0].source_device_id, "remote-1");
    EXPECT_EQ(entries[0].source_device_name, "Studio Mac");
    EXPECT_EQ(entries[1].status, CommandStatus::FAILED);
    EXPECT_EQ(entries[1].result, "No client ID specified");
}

TEST_F(CommandExecutorTest, ParseUnknownCommand) {
    json::object body;
    body["command"] = "launch_rockets";
    body["sourceDeviceId"] = "remote-1";

    auto reply = executor.parse_and_handle(body);
    EXPECT_FALSE(reply.success);
    EXPECT_EQ(reply.result, "Unknown command: launch_rockets");
}

TEST_F(CommandExecutorTest, ParseDefaultsSourceName) {
    json::object body;
    body["command"] = "get_status";
    body["sourceDeviceId"] = "remote-2";

    auto reply = executor.parse_and_handle(body);
    EXPECT_TRUE(reply.success);
    ASSERT_EQ(executor.history().size(), 1u);
    EXPECT_EQ(executor.history().entries()[0].source_device_name, "Unknown");
    EXPECT_EQ(executor.history().entries()[0].source_device_id, "remote-2");
}

// ============================================================================
// LocalServer listener hooks
// ============================================================================

class LocalServerCommandTest : public ::testing::Test {
protected:
    LocalServerCommandTest()
        : rooms({make_room("a", 2)})
        , devices(std::vector<LinkedDevice>{})
        , local(ioc.get_executor(), 3000)
        , exit(ioc.get_executor(), rooms, devices, local, audio, host, fleet, exit_options())
        , executor(exit, rooms, local, true) {
        local.set_listener({
            [this] { events.push_back("stop"); },
            [this](uint16_t port) { events.push_back("start:" + std::to_string(port)); },
        });
    }

    static ExitOrchestrator::Options exit_options() {
        ExitOrchestrator::Options o;
        o.device_id = "self";
        o.shutdown_grace = 1h;
        o.exit_delay = 1h;
        return o;
    }

    CommandReply send(RemoteCommand command, json::object params = {}) {
        return executor.handle(command, "remote-1", params);
    }

    void drain() {
        ioc.restart();
        ioc.poll();
    }

    net::io_context ioc;
    InMemoryRoomDirectory rooms;
    InMemoryDeviceRegistry devices;
    LocalServer local;
    FakeAudioCues audio;
    FakeHostControl host;
    FakeFleetApi fleet;
    ExitOrchestrator exit;
    CommandExecutor executor;
    std::vector<std::string> events;
};

TEST_F(LocalServerCommandTest, RestartRebindsListenerAfterReply) {
    bool closed = false;
    local.add_client("control:r1", [&] { closed = true; });

    auto reply = send(RemoteCommand::RESTART_SERVER);
    EXPECT_TRUE(reply.success);
    // Nothing torn down before the reply goes out
    EXPECT_TRUE(events.empty());
    EXPECT_FALSE(closed);

    drain();
    EXPECT_EQ(events, (std::vector<std::string>{"stop", "start:3000"}));
    EXPECT_TRUE(closed);
    EXPECT_TRUE(local.is_running());
    EXPECT_EQ(local.connected_clients(), 0u);
}

TEST_F(LocalServerCommandTest, StopClosesListener) {
    auto reply = send(RemoteCommand::STOP_SERVER);
    EXPECT_TRUE(reply.success);
    EXPECT_FALSE(local.is_running());
    EXPECT_EQ(events, (std::vector<std::string>{"stop"}));

    // Already stopped
    local.stop();
    EXPECT_EQ(events.size(), 1u);
}

TEST_F(LocalServerCommandTest, PortChangeMovesListener) {
    json::object settings;
    settings["serverPort"] = 4100;
    json::object params;
    params["settings"] = settings;

    auto reply = send(RemoteCommand::UPDATE_SETTINGS, params);
    EXPECT_TRUE(reply.success);
    EXPECT_EQ(local.port(), 4100);

    drain();
    EXPECT_EQ(events, (std::vector<std::string>{"stop", "start:4100"}));

    // Same port again leaves the listener alone
    send(RemoteCommand::UPDATE_SETTINGS, params);
    drain();
    EXPECT_EQ(events.size(), 2u);
}

TEST_F(LocalServerCommandTest, PortChangeWhileStoppedWaitsForRestart) {
    local.stop();
    events.clear();

    local.set_port(4200);
    drain();
    EXPECT_TRUE(events.empty());

    local.restart();
    drain();
    EXPECT_EQ(events, (std::vector<std::string>{"stop", "start:4200"}));
}
