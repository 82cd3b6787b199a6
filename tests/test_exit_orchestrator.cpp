#include <gtest/gtest.h>
#include "node/exit_orchestrator.hpp"
#include "node/room_directory.hpp"
#include "test_support.hpp"
#include <memory>

using namespace voxfleet;
using namespace voxfleet::node;
using namespace voxfleet::test;
using namespace std::chrono_literals;

class ExitOrchestratorTest : public ::testing::Test {
protected:
    void build(std::vector<HostedRoom> hosted, std::vector<LinkedDevice> linked) {
        rooms = std::make_unique<InMemoryRoomDirectory>(std::move(hosted));
        devices = std::make_unique<InMemoryDeviceRegistry>(std::move(linked));
        exit = std::make_unique<ExitOrchestrator>(ioc.get_executor(), *rooms, *devices, server, audio, host,
                                                  fleet, options);
        exit->set_progress_listener([this](const ExitProgress& p) { phases.push_back(p); });
    }

    bool saw_phase(ExitPhase phase) const {
        for (const auto& p : phases) {
            if (p.phase == phase) return true;
        }
        return false;
    }

    // Index of the first ERROR entry, or -1
    int error_index() const {
        for (size_t i = 0; i < phases.size(); ++i) {
            if (phases[i].phase == ExitPhase::ERROR) return static_cast<int>(i);
        }
        return -1;
    }

    void run(std::chrono::milliseconds d) {
        ioc.restart();
        ioc.run_for(d);
    }

    net::io_context ioc;
    ExitOrchestrator::Options options = [] {
        ExitOrchestrator::Options o;
        o.device_id = "self";
        o.waiting_room_timeout = 1h;
        o.auto_move_interval = 1h;
        o.shutdown_grace = 5ms;
        o.exit_delay = 5ms;
        return o;
    }();

    std::unique_ptr<InMemoryRoomDirectory> rooms;
    std::unique_ptr<InMemoryDeviceRegistry> devices;
    FakeServerControl server;
    FakeAudioCues audio;
    FakeHostControl host;
    FakeFleetApi fleet;
    std::unique_ptr<ExitOrchestrator> exit;
    std::vector<ExitProgress> phases;
};

TEST_F(ExitOrchestratorTest, EmptyRoomsExitWithoutOptions) {
    build({make_room("a", 0), make_room("b", 0)}, {});

    exit->initiate_exit();

    EXPECT_FALSE(saw_phase(ExitPhase::SHOWING_OPTIONS));
    EXPECT_EQ(exit->progress().phase, ExitPhase::COMPLETE);
    EXPECT_EQ(server.stops, 1);
    ASSERT_NE(fleet.find_broadcast("server_shutdown"), nullptr);

    run(50ms);
    EXPECT_EQ(host.terminations, 1);
}

TEST_F(ExitOrchestratorTest, RoomsHostedElsewhereDoNotCount) {
    build({make_room("a", 4, "other-device")}, {});

    exit->initiate_exit();

    EXPECT_FALSE(saw_phase(ExitPhase::SHOWING_OPTIONS));
    EXPECT_EQ(exit->progress().phase, ExitPhase::COMPLETE);
}

TEST_F(ExitOrchestratorTest, ActiveRoomsShowOptions) {
    build({make_room("a", 3)}, {});

    exit->initiate_exit();

    EXPECT_EQ(exit->progress().phase, ExitPhase::SHOWING_OPTIONS);
    EXPECT_EQ(server.stops, 0);

    exit->cancel();
    EXPECT_EQ(exit->progress().phase, ExitPhase::IDLE);
    EXPECT_FALSE(exit->is_exit_in_progress());
}

TEST_F(ExitOrchestratorTest, DefaultOptionAppliedOnInitiate) {
    options.default_option = ExitOption::WAITING_ROOM;
    build({make_room("a", 3)}, {});

    exit->initiate_exit();

    EXPECT_TRUE(saw_phase(ExitPhase::SHOWING_OPTIONS));
    EXPECT_EQ(exit->progress().phase, ExitPhase::WAITING_FOR_RESTART);
    EXPECT_TRUE(exit->waiting_room_active());
}

TEST_F(ExitOrchestratorTest, DangerousDefaultOptionWaitsForConfirmation) {
    options.default_option = ExitOption::JUST_EXIT;
    build({make_room("a", 3)}, {});

    exit->initiate_exit();

    EXPECT_EQ(exit->progress().phase, ExitPhase::SHOWING_OPTIONS);
    EXPECT_EQ(server.stops, 0);
}

TEST_F(ExitOrchestratorTest, DangerousDefaultOptionAppliedWhenAllowed) {
    options.default_option = ExitOption::JUST_EXIT;
    options.allow_dangerous_default = true;
    build({make_room("a", 3)}, {});

    exit->initiate_exit();

    EXPECT_EQ(exit->progress().phase, ExitPhase::COMPLETE);
    EXPECT_EQ(server.stops, 1);
}

TEST_F(ExitOrchestratorTest, DeviceTransferWithoutDevicesReturnsToOptions) {
    build({make_room("a", 3)}, {make_device("d1", false)});

    exit->initiate_exit();
    exit->handle_option(ExitOption::TRANSFER_TO_DEVICE);
    run(20ms);

    int err = error_index();
    ASSERT_GE(err, 0);
    EXPECT_EQ(phases[err].message, "No other online devices available");
    ASSERT_LT(static_cast<size_t>(err + 1), phases.size());
    EXPECT_EQ(phases[err + 1].phase, ExitPhase::SHOWING_OPTIONS);
    EXPECT_EQ(exit->progress().phase, ExitPhase::SHOWING_OPTIONS);
    EXPECT_TRUE(fleet.device_targets.empty());
}

TEST_F(ExitOrchestratorTest, DeviceTransferPicksFirstOnlineSibling) {
    build({make_room("a", 2), make_room("b", 0), make_room("c", 5)},
          {make_device("self", true), make_device("d1", false), make_device("d2", true), make_device("d3", true)});

    exit->handle_option(ExitOption::TRANSFER_TO_DEVICE);
    run(2ms);

    ASSERT_EQ(fleet.device_targets.size(), 1u);
    EXPECT_EQ(fleet.device_targets[0], "d2");
    EXPECT_EQ(fleet.transferred_rooms.size(), 2u);
    EXPECT_EQ(exit->progress().phase, ExitPhase::COMPLETE);
    EXPECT_EQ(audio.completions, 1);

    auto* b = fleet.find_broadcast("room_transfer");
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(b->extra.at("targetDevice").as_string(), "Device d2");
    EXPECT_TRUE(b->extra.at("seamless").as_bool());

    ASSERT_TRUE(exit->transfer_status().has_value());
    EXPECT_EQ(exit->transfer_status()->transferred_rooms, 2u);
    EXPECT_DOUBLE_EQ(exit->transfer_status()->progress(), 1.0);

    run(50ms);
    EXPECT_EQ(server.stops, 1);
    EXPECT_EQ(host.terminations, 1);
}

TEST_F(ExitOrchestratorTest, DeviceTransferPrefersRequestedDevice) {
    build({make_room("a", 2)}, {make_device("d1", true), make_device("d2", true)});

    exit->transfer_to_device(std::string("d2"));
    run(2ms);

    ASSERT_EQ(fleet.device_targets.size(), 1u);
    EXPECT_EQ(fleet.device_targets[0], "d2");
}

TEST_F(ExitOrchestratorTest, DeviceTransferRejectedReportsFailure) {
    build({make_room("a", 2)}, {make_device("d1", true)});
    fleet.device_result = false;

    exit->handle_option(ExitOption::TRANSFER_TO_DEVICE);
    run(20ms);

    int err = error_index();
    ASSERT_GE(err, 0);
    EXPECT_EQ(phases[err].message, "Transfer failed");
    EXPECT_EQ(exit->progress().phase, ExitPhase::SHOWING_OPTIONS);
    EXPECT_EQ(server.stops, 0);
}

TEST_F(ExitOrchestratorTest, FederatedTransferReportsTotalsBeforeCompletion) {
    build({make_room("a", 2), make_room("b", 0), make_room("c", 5)}, {});
    fleet.servers = {make_server("A"), make_server("B")};

    std::optional<TransferStatus> seen;
    ExitPhase phase_at_transfer = ExitPhase::IDLE;
    fleet.on_transfer = [&] {
        seen = exit->transfer_status();
        phase_at_transfer = exit->progress().phase;
    };

    exit->handle_option(ExitOption::TRANSFER_TO_FEDERATED);
    run(2ms);

    ASSERT_TRUE(seen.has_value());
    EXPECT_EQ(seen->total_rooms, 2u);
    EXPECT_EQ(seen->total_users, 7u);
    EXPECT_EQ(seen->transferred_rooms, 0u);
    EXPECT_EQ(phase_at_transfer, ExitPhase::TRANSFERRING_TO_FEDERATED);

    ASSERT_EQ(fleet.federated_targets.size(), 1u);
    const auto& target = fleet.federated_targets[0];
    EXPECT_TRUE(target == "A" || target == "B");

    EXPECT_EQ(exit->progress().phase, ExitPhase::COMPLETE);
    EXPECT_EQ(audio.completions, 1);
    auto* b = fleet.find_broadcast("federated_transfer");
    ASSERT_NE(b, nullptr);
    EXPECT_TRUE(b->extra.at("sameRoom").as_bool());
}

TEST_F(ExitOrchestratorTest, FederatedTransferWithNewRoomsSkipsCue) {
    build({make_room("a", 2)}, {});
    fleet.servers = {make_server("A")};
    fleet.federated_result = false;

    exit->handle_option(ExitOption::TRANSFER_TO_FEDERATED);
    run(2ms);

    EXPECT_EQ(exit->progress().phase, ExitPhase::COMPLETE);
    EXPECT_EQ(audio.completions, 0);
    auto* b = fleet.find_broadcast("federated_transfer");
    ASSERT_NE(b, nullptr);
    EXPECT_FALSE(b->extra.at("sameRoom").as_bool());
}

TEST_F(ExitOrchestratorTest, FederatedTransferWithoutServers) {
    build({make_room("a", 2)}, {});

    exit->handle_option(ExitOption::TRANSFER_TO_FEDERATED);
    run(20ms);

    int err = error_index();
    ASSERT_GE(err, 0);
    EXPECT_EQ(phases[err].message, "No federated servers available");
    EXPECT_EQ(exit->progress().phase, ExitPhase::SHOWING_OPTIONS);
}

TEST_F(ExitOrchestratorTest, FederatedTransferUnreachable) {
    build({make_room("a", 2)}, {});
    fleet.servers = {make_server("A")};
    fleet.federated_result = std::unexpected(FleetError::CONNECTION_FAILED);

    exit->handle_option(ExitOption::TRANSFER_TO_FEDERATED);
    run(20ms);

    int err = error_index();
    ASSERT_GE(err, 0);
    EXPECT_EQ(phases[err].message, "Transfer failed");
}

TEST_F(ExitOrchestratorTest, WaitingRoomPausesAndStartsAmbience) {
    build({make_room("a", 2), make_room("b", 1), make_room("c", 0)}, {});

    exit->handle_option(ExitOption::WAITING_ROOM);

    EXPECT_EQ(exit->progress().phase, ExitPhase::WAITING_FOR_RESTART);
    EXPECT_TRUE(saw_phase(ExitPhase::MOVING_TO_WAITING_ROOM));
    EXPECT_TRUE(exit->waiting_room_active());
    EXPECT_TRUE(exit->waiting_room_timer_active());
    EXPECT_TRUE(audio.ambience);
    EXPECT_EQ(fleet.paused, (std::vector<std::string>{"a", "b"}));

    auto* b = fleet.find_broadcast("waiting_room");
    ASSERT_NE(b, nullptr);
    EXPECT_TRUE(b->extra.at("ambienceEnabled").as_bool());
    EXPECT_EQ(b->extra.at("estimatedWait").as_string(), "A few minutes");
}

TEST_F(ExitOrchestratorTest, WaitingRoomDeadlineTriggersAutoMoveOnce) {
    options.waiting_room_timeout = 20ms;
    options.shutdown_grace = 1h;
    build({make_room("a", 2)}, {make_device("d1", true)});

    exit->handle_option(ExitOption::WAITING_ROOM);
    run(100ms);

    ASSERT_EQ(fleet.device_targets.size(), 1u);
    EXPECT_EQ(fleet.device_targets[0], "d1");
    EXPECT_EQ(exit->progress().phase, ExitPhase::COMPLETE);
    EXPECT_FALSE(exit->waiting_room_timer_active());
    EXPECT_FALSE(exit->waiting_room_active());
    EXPECT_FALSE(audio.ambience);

    run(50ms);
    EXPECT_EQ(fleet.device_targets.size(), 1u);
}

TEST_F(ExitOrchestratorTest, LeavingWaitingRoomForTransferStopsAmbience) {
    options.shutdown_grace = 1h;
    build({make_room("a", 2)}, {make_device("d1", true)});

    exit->handle_option(ExitOption::WAITING_ROOM);
    ASSERT_TRUE(exit->waiting_room_active());
    ASSERT_TRUE(audio.ambience);

    exit->transfer_to_device("d1");
    run(10ms);

    EXPECT_EQ(exit->progress().phase, ExitPhase::COMPLETE);
    EXPECT_FALSE(exit->waiting_room_active());
    EXPECT_FALSE(exit->waiting_room_timer_active());
    EXPECT_FALSE(audio.ambience);
}

TEST_F(ExitOrchestratorTest, FederatedOptionFromWaitingRoomClearsWaitingState) {
    options.shutdown_grace = 1h;
    build({make_room("a", 2)}, {});
    fleet.servers = {make_server("A")};

    exit->handle_option(ExitOption::WAITING_ROOM);
    exit->handle_option(ExitOption::TRANSFER_TO_FEDERATED);
    run(10ms);

    EXPECT_EQ(fleet.federated_targets.size(), 1u);
    EXPECT_FALSE(exit->waiting_room_active());
    EXPECT_FALSE(audio.ambience);
}

TEST_F(ExitOrchestratorTest, ResumeDisarmsWaitingRoomDeadline) {
    options.waiting_room_timeout = 20ms;
    build({make_room("a", 2)}, {make_device("d1", true)});

    exit->handle_option(ExitOption::WAITING_ROOM);
    run(5ms);
    exit->resume_from_waiting_room();
    run(100ms);

    EXPECT_TRUE(fleet.device_targets.empty());
    EXPECT_EQ(exit->progress().phase, ExitPhase::IDLE);
    EXPECT_FALSE(exit->waiting_room_active());
    EXPECT_FALSE(exit->waiting_room_timer_active());
    EXPECT_FALSE(audio.ambience);
    EXPECT_EQ(fleet.resumed, (std::vector<std::string>{"a"}));
}

TEST_F(ExitOrchestratorTest, AutoMoveRecheckStopsOnceDeviceAppears) {
    options.auto_move_interval = 10ms;
    options.shutdown_grace = 1h;
    build({make_room("a", 2)}, {make_device("d1", false)});

    exit->handle_option(ExitOption::AUTO_MOVE);
    run(25ms);

    EXPECT_EQ(exit->progress().phase, ExitPhase::WAITING_FOR_RESTART);
    EXPECT_TRUE(exit->auto_move_timer_active());
    EXPECT_TRUE(fleet.device_targets.empty());

    devices->set_online("d1", true);
    run(40ms);

    ASSERT_EQ(fleet.device_targets.size(), 1u);
    EXPECT_FALSE(exit->auto_move_timer_active());
    EXPECT_FALSE(exit->waiting_room_timer_active());
    EXPECT_FALSE(audio.ambience);
    EXPECT_EQ(exit->progress().phase, ExitPhase::COMPLETE);
    EXPECT_NE(fleet.find_broadcast("auto_move"), nullptr);

    run(40ms);
    EXPECT_EQ(fleet.device_targets.size(), 1u);
}

TEST_F(ExitOrchestratorTest, AutoMovePrefersDeviceOverFederation) {
    build({make_room("a", 2)}, {make_device("d1", true)});
    fleet.servers = {make_server("A")};

    exit->handle_option(ExitOption::AUTO_MOVE);
    run(2ms);

    EXPECT_EQ(fleet.device_targets.size(), 1u);
    EXPECT_TRUE(fleet.federated_targets.empty());
    EXPECT_EQ(exit->progress().phase, ExitPhase::COMPLETE);
}

TEST_F(ExitOrchestratorTest, AutoMoveFallsBackToFederation) {
    build({make_room("a", 2)}, {});
    fleet.servers = {make_server("A")};

    exit->handle_option(ExitOption::AUTO_MOVE);
    run(2ms);

    EXPECT_EQ(fleet.federated_targets.size(), 1u);
    EXPECT_EQ(fleet.fetches, 1);
    EXPECT_EQ(exit->progress().phase, ExitPhase::COMPLETE);
}

TEST_F(ExitOrchestratorTest, SupersededTransferResultIsIgnored) {
    build({make_room("a", 2)}, {make_device("d1", true)});
    fleet.delay = 30ms;

    exit->handle_option(ExitOption::TRANSFER_TO_DEVICE);
    run(5ms);
    ASSERT_EQ(fleet.device_targets.size(), 1u);

    exit->handle_option(ExitOption::WAITING_ROOM);
    run(60ms);

    EXPECT_EQ(fleet.find_broadcast("room_transfer"), nullptr);
    EXPECT_EQ(exit->progress().phase, ExitPhase::WAITING_FOR_RESTART);
    EXPECT_EQ(audio.completions, 0);
}

TEST_F(ExitOrchestratorTest, RebootFallsBackToPrivilegedCommand) {
    build({make_room("a", 2)}, {});
    host.results = {false, true};

    exit->handle_option(ExitOption::SYSTEM_REBOOT);
    run(2ms);

    ASSERT_EQ(host.commands.size(), 2u);
    EXPECT_EQ(host.commands[0], options.reboot_command);
    EXPECT_EQ(host.commands[1], options.privileged_reboot_command);
    EXPECT_EQ(error_index(), -1);
    EXPECT_EQ(server.stops, 1);
    EXPECT_NE(fleet.find_broadcast("server_shutdown"), nullptr);
}

TEST_F(ExitOrchestratorTest, RebootFailureReported) {
    build({make_room("a", 2)}, {});
    host.results = {false, false};

    exit->handle_option(ExitOption::SYSTEM_REBOOT);
    run(2ms);

    int err = error_index();
    ASSERT_GE(err, 0);
    EXPECT_EQ(phases[err].message, "System reboot failed");
    EXPECT_EQ(exit->progress().phase, ExitPhase::SHOWING_OPTIONS);
}

TEST_F(ExitOrchestratorTest, RebootMovesRoomsToOnlineDeviceFirst) {
    build({make_room("a", 2)}, {make_device("d1", true)});

    exit->handle_option(ExitOption::SYSTEM_REBOOT);
    run(2ms);

    EXPECT_EQ(fleet.device_targets.size(), 1u);
    EXPECT_EQ(fleet.find_broadcast("server_shutdown"), nullptr);
    EXPECT_EQ(host.commands.size(), 1u);
}
