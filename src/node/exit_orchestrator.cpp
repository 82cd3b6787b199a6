#include "node/exit_orchestrator.hpp"
#include "common/log.hpp"
#include <random>

namespace voxfleet::node {

namespace {

const log::Logger& logger() { return log::Logger::get("node.exit"); }

uint32_t count_members(const std::vector<HostedRoom>& rooms) {
    uint32_t total = 0;
    for (const auto& room : rooms) {
        total += room.current_members;
    }
    return total;
}

const FederatedServer& pick_random(const std::vector<FederatedServer>& servers) {
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<size_t> dist(0, servers.size() - 1);
    return servers[dist(rng)];
}

} // anonymous namespace

ExitOrchestrator::ExitOrchestrator(net::any_io_executor executor,
                                   RoomDirectory& rooms,
                                   DeviceRegistry& devices,
                                   ServerControl& server,
                                   AudioCues& audio,
                                   HostControl& host,
                                   FleetApi& fleet,
                                   Options options)
    : executor_(executor)
    , rooms_(rooms)
    , devices_(devices)
    , server_(server)
    , audio_(audio)
    , host_(host)
    , fleet_(fleet)
    , options_(std::move(options))
    , waiting_room_timer_(executor)
    , auto_move_timer_(executor)
    , shutdown_timer_(executor) {}

// ============================================================================
// State
// ============================================================================

void ExitOrchestrator::set_progress(ExitProgress progress) {
    if (progress == progress_) {
        return;
    }
    progress_ = std::move(progress);

    if (progress_.phase == ExitPhase::ERROR) {
        logger().warn("Exit error: {}", progress_.message);
    } else {
        logger().info("Exit phase {}", exit_phase_name(progress_.phase));
    }

    if (listener_) {
        listener_(progress_);
    }
}

void ExitOrchestrator::fail(const std::string& reason) {
    set_progress(ExitProgress::error(reason));
    set_progress(ExitProgress::of(ExitPhase::SHOWING_OPTIONS));
}

void ExitOrchestrator::cancel_timers() {
    waiting_room_timer_.cancel();
    auto_move_timer_.cancel();
}

std::vector<HostedRoom> ExitOrchestrator::active_hosted_rooms() const {
    std::vector<HostedRoom> active;
    for (auto& room : rooms_.rooms()) {
        if (room.host_device_id == options_.device_id && room.current_members > 0) {
            active.push_back(std::move(room));
        }
    }
    return active;
}

std::optional<LinkedDevice> ExitOrchestrator::pick_device(const std::optional<std::string>& preferred) const {
    std::optional<LinkedDevice> first;
    for (auto& device : devices_.devices()) {
        if (!device.is_online || device.id == options_.device_id) {
            continue;
        }
        if (preferred && device.id == *preferred) {
            return device;
        }
        if (!first) {
            first = std::move(device);
        }
    }
    return first;
}

void ExitOrchestrator::begin_transfer(const std::vector<HostedRoom>& rooms,
                                      std::optional<std::string> device,
                                      std::optional<std::string> server) {
    TransferStatus status;
    status.total_rooms = static_cast<uint32_t>(rooms.size());
    status.total_users = count_members(rooms);
    status.target_device = std::move(device);
    status.target_server = std::move(server);
    transfer_status_ = std::move(status);
    logger().info("{}", transfer_status_->status_text());
}

// ============================================================================
// Entry points
// ============================================================================

void ExitOrchestrator::initiate_exit() {
    if (exit_in_progress_ || progress_.phase != ExitPhase::IDLE) {
        logger().debug("Exit already in progress ({})", exit_phase_name(progress_.phase));
        return;
    }

    ++epoch_;
    auto active = active_hosted_rooms();
    if (active.empty()) {
        logger().info("No active rooms, shutting down");
        exit_in_progress_ = true;
        perform_just_exit();
        return;
    }

    logger().info("{} active room(s) with {} member(s), choosing exit option",
                  active.size(), count_members(active));
    set_progress(ExitProgress::of(ExitPhase::SHOWING_OPTIONS));

    if (options_.default_option && is_dangerous(*options_.default_option) && !options_.allow_dangerous_default) {
        logger().warn("Configured exit option '{}' needs confirmation, waiting for a choice",
                      exit_option_name(*options_.default_option));
    } else if (options_.default_option) {
        logger().info("Applying configured exit option '{}'", exit_option_name(*options_.default_option));
        handle_option(*options_.default_option);
    }
}

void ExitOrchestrator::handle_option(ExitOption option) {
    exit_in_progress_ = true;
    ++epoch_;
    cancel_timers();
    leave_waiting_room();

    logger().info("Exit option: {}", exit_option_label(option));

    switch (option) {
        case ExitOption::TRANSFER_TO_DEVICE:
            set_progress(ExitProgress::of(ExitPhase::TRANSFERRING_TO_DEVICE));
            async::spawn(executor_, run_device_transfer(epoch_, std::nullopt), "exit.device");
            break;
        case ExitOption::TRANSFER_TO_FEDERATED:
            set_progress(ExitProgress::of(ExitPhase::TRANSFERRING_TO_FEDERATED));
            async::spawn(executor_, run_federated_transfer(epoch_, {}), "exit.federated");
            break;
        case ExitOption::WAITING_ROOM:
            move_to_waiting_room();
            break;
        case ExitOption::AUTO_MOVE:
            set_progress(ExitProgress::of(ExitPhase::MOVING_TO_WAITING_ROOM));
            async::spawn(executor_, run_auto_move(epoch_), "exit.auto_move");
            break;
        case ExitOption::JUST_EXIT:
            perform_just_exit();
            break;
        case ExitOption::SYSTEM_REBOOT:
            set_progress(ExitProgress::of(ExitPhase::SHUTTING_DOWN));
            async::spawn(executor_, run_system_reboot(epoch_), "exit.reboot");
            break;
    }
}

void ExitOrchestrator::transfer_to_device(std::optional<std::string> preferred_device_id) {
    exit_in_progress_ = true;
    ++epoch_;
    cancel_timers();
    leave_waiting_room();

    set_progress(ExitProgress::of(ExitPhase::TRANSFERRING_TO_DEVICE));
    async::spawn(executor_, run_device_transfer(epoch_, std::move(preferred_device_id)), "exit.device");
}

void ExitOrchestrator::cancel() {
    if (progress_.phase != ExitPhase::SHOWING_OPTIONS && progress_.phase != ExitPhase::ERROR) {
        logger().debug("Nothing to cancel in phase {}", exit_phase_name(progress_.phase));
        return;
    }

    ++epoch_;
    cancel_timers();
    exit_in_progress_ = false;
    transfer_status_.reset();
    set_progress(ExitProgress::of(ExitPhase::IDLE));
}

void ExitOrchestrator::resume_from_waiting_room() {
    ++epoch_;
    cancel_timers();
    leave_waiting_room();

    for (const auto& room : active_hosted_rooms()) {
        fleet_.resume_room(room.id);
    }

    audio_.play_completion();

    exit_in_progress_ = false;
    transfer_status_.reset();
    set_progress(ExitProgress::of(ExitPhase::IDLE));
}

// ============================================================================
// Transfers
// ============================================================================

net::awaitable<void> ExitOrchestrator::run_device_transfer(uint64_t epoch, std::optional<std::string> preferred) {
    set_progress(ExitProgress::of(ExitPhase::TRANSFERRING_TO_DEVICE));

    auto device = pick_device(preferred);
    if (!device) {
        fail(fleet_error_message(FleetError::NO_DEVICES_AVAILABLE));
        co_return;
    }

    auto active = active_hosted_rooms();
    begin_transfer(active, device->name, std::nullopt);

    auto result = co_await fleet_.transfer_to_device(*device, active);
    if (epoch != epoch_) {
        logger().debug("Discarding stale device transfer result");
        co_return;
    }

    if (!result || !*result) {
        fail(fleet_error_message(FleetError::TRANSFER_FAILED));
        co_return;
    }

    transfer_status_->mark_rooms_transferred(transfer_status_->total_rooms, transfer_status_->total_users);
    audio_.play_completion();

    json::object extra;
    extra["targetDevice"] = device->name;
    extra["seamless"] = true;
    fleet_.broadcast("room_transfer", "Room transferred to " + device->name, std::move(extra));

    set_progress(ExitProgress::of(ExitPhase::COMPLETE));
    schedule_delayed_shutdown();
}

net::awaitable<void> ExitOrchestrator::run_federated_transfer(uint64_t epoch,
                                                              std::vector<FederatedServer> servers) {
    set_progress(ExitProgress::of(ExitPhase::TRANSFERRING_TO_FEDERATED));

    if (servers.empty()) {
        servers = co_await fleet_.fetch_federated_servers();
        if (epoch != epoch_) {
            co_return;
        }
    }
    if (servers.empty()) {
        fail(fleet_error_message(FleetError::NO_FEDERATED_SERVERS_AVAILABLE));
        co_return;
    }

    const FederatedServer target = pick_random(servers);
    auto active = active_hosted_rooms();
    begin_transfer(active, std::nullopt, target.name);

    auto result = co_await fleet_.transfer_to_federated(target, active);
    if (epoch != epoch_) {
        logger().debug("Discarding stale federated transfer result");
        co_return;
    }

    if (!result) {
        fail(fleet_error_message(FleetError::TRANSFER_FAILED));
        co_return;
    }

    // The peer answered; rooms moved either way, only their ids may differ
    bool same_room = *result;
    transfer_status_->mark_rooms_transferred(transfer_status_->total_rooms, transfer_status_->total_users);
    if (same_room) {
        audio_.play_completion();
    }

    json::object extra;
    extra["targetServer"] = target.name;
    extra["sameRoom"] = same_room;
    fleet_.broadcast("federated_transfer",
                     same_room ? "Transferred to " + target.name
                               : "Room moved to " + target.name + " - new room created",
                     std::move(extra));

    set_progress(ExitProgress::of(ExitPhase::COMPLETE));
    schedule_delayed_shutdown();
}

// ============================================================================
// Waiting room and auto-move
// ============================================================================

void ExitOrchestrator::leave_waiting_room() {
    if (!waiting_room_active_) return;
    waiting_room_active_ = false;
    audio_.stop_ambience();
}

void ExitOrchestrator::move_to_waiting_room() {
    set_progress(ExitProgress::of(ExitPhase::MOVING_TO_WAITING_ROOM));
    waiting_room_active_ = true;

    audio_.start_ambience();

    json::object extra;
    extra["ambienceEnabled"] = true;
    extra["estimatedWait"] = "A few minutes";
    fleet_.broadcast("waiting_room", "Server is restarting - you're in the waiting room", std::move(extra));

    waiting_room_timer_.schedule_once(options_.waiting_room_timeout, [this] {
        logger().info("Waiting room timed out, starting auto-move");
        ++epoch_;
        auto_move_timer_.cancel();
        leave_waiting_room();
        set_progress(ExitProgress::of(ExitPhase::MOVING_TO_WAITING_ROOM));
        async::spawn(executor_, run_auto_move(epoch_), "exit.auto_move");
    });

    set_progress(ExitProgress::of(ExitPhase::WAITING_FOR_RESTART));

    for (const auto& room : active_hosted_rooms()) {
        fleet_.pause_room(room.id);
    }
}

net::awaitable<void> ExitOrchestrator::run_auto_move(uint64_t epoch) {
    set_progress(ExitProgress::of(ExitPhase::MOVING_TO_WAITING_ROOM));

    if (pick_device(std::nullopt)) {
        co_await run_device_transfer(epoch, std::nullopt);
        co_return;
    }

    auto servers = co_await fleet_.fetch_federated_servers();
    if (epoch != epoch_) {
        co_return;
    }
    if (!servers.empty()) {
        co_await run_federated_transfer(epoch, std::move(servers));
        co_return;
    }

    logger().info("No transfer target, waiting room with re-check every {}ms", options_.auto_move_interval.count());
    move_to_waiting_room();

    auto_move_timer_.schedule_repeating(options_.auto_move_interval, [this] {
        auto device = pick_device(std::nullopt);
        if (!device) {
            logger().debug("Auto-move: still no online device");
            return;
        }

        auto_move_timer_.cancel();
        waiting_room_timer_.cancel();
        leave_waiting_room();

        ++epoch_;
        async::spawn(executor_, run_auto_move_check(epoch_, std::move(*device)), "exit.auto_move");
    });
}

net::awaitable<void> ExitOrchestrator::run_auto_move_check(uint64_t epoch, LinkedDevice device) {
    auto active = active_hosted_rooms();
    begin_transfer(active, device.name, std::nullopt);

    auto result = co_await fleet_.transfer_to_device(device, active);
    if (epoch != epoch_) {
        co_return;
    }

    if (!result || !*result) {
        fail(fleet_error_message(FleetError::TRANSFER_FAILED));
        co_return;
    }

    transfer_status_->mark_rooms_transferred(transfer_status_->total_rooms, transfer_status_->total_users);
    audio_.play_completion();

    json::object extra;
    extra["targetDevice"] = device.name;
    fleet_.broadcast("auto_move", "Automatically transferred to " + device.name, std::move(extra));

    set_progress(ExitProgress::of(ExitPhase::COMPLETE));
    schedule_delayed_shutdown();
}

// ============================================================================
// Shutdown
// ============================================================================

void ExitOrchestrator::perform_just_exit() {
    set_progress(ExitProgress::of(ExitPhase::SHUTTING_DOWN));

    fleet_.broadcast("server_shutdown", "Server is shutting down");
    server_.stop();

    set_progress(ExitProgress::of(ExitPhase::COMPLETE));

    shutdown_timer_.schedule_once(options_.exit_delay, [this] {
        host_.terminate_process();
    });
}

void ExitOrchestrator::schedule_delayed_shutdown() {
    shutdown_timer_.schedule_once(options_.shutdown_grace, [this] {
        server_.stop();
        shutdown_timer_.schedule_once(options_.exit_delay, [this] {
            host_.terminate_process();
        });
    });
}

net::awaitable<void> ExitOrchestrator::run_system_reboot(uint64_t epoch) {
    set_progress(ExitProgress::of(ExitPhase::SHUTTING_DOWN));

    auto device = pick_device(std::nullopt);
    auto active = active_hosted_rooms();

    if (device && !active.empty()) {
        // Best effort, the reboot goes ahead either way
        auto result = co_await fleet_.transfer_to_device(*device, active);
        logger().info("Pre-reboot transfer to {}: {}", device->name,
                      result && *result ? "done" : "failed");
        if (epoch != epoch_) {
            co_return;
        }
    } else {
        fleet_.broadcast("server_shutdown", "Server is shutting down");
    }

    server_.stop();
    issue_reboot();
}

void ExitOrchestrator::issue_reboot() {
    logger().warn("Rebooting host: {}", options_.reboot_command);
    if (host_.run_command(options_.reboot_command)) {
        return;
    }

    logger().warn("Reboot command failed, trying {}", options_.privileged_reboot_command);
    if (!host_.run_command(options_.privileged_reboot_command)) {
        fail("System reboot failed");
    }
}

} // namespace voxfleet::node
