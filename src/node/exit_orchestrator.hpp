#pragma once

#include "node/fleet_api.hpp"
#include "node/services.hpp"
#include "common/async_utils.hpp"
#include "common/types.hpp"
#include <boost/asio/any_io_executor.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace voxfleet::node {

using ProgressListener = std::function<void(const ExitProgress&)>;

/**
 * ExitOrchestrator - decides what happens to hosted rooms when the node is
 * about to stop.
 *
 * IDLE -> SHOWING_OPTIONS -> one of the transfer / waiting-room / shutdown
 * phases -> COMPLETE. A failed option reports ERROR and returns to
 * SHOWING_OPTIONS. Only the auto-move re-check retries on its own.
 *
 * Every entry point bumps an epoch; a transfer that finishes after the
 * operator picked something else is ignored.
 */
class ExitOrchestrator {
public:
    struct Options {
        std::string device_id;
        std::chrono::milliseconds waiting_room_timeout{300000};
        std::chrono::milliseconds auto_move_interval{180000};
        std::chrono::milliseconds shutdown_grace{2000};
        std::chrono::milliseconds exit_delay{1000};
        std::optional<ExitOption> default_option;
        bool allow_dangerous_default = false;
        std::string reboot_command = "systemctl reboot";
        std::string privileged_reboot_command = "pkexec shutdown -r now";
    };

    ExitOrchestrator(net::any_io_executor executor,
                     RoomDirectory& rooms,
                     DeviceRegistry& devices,
                     ServerControl& server,
                     AudioCues& audio,
                     HostControl& host,
                     FleetApi& fleet,
                     Options options);

    ExitOrchestrator(const ExitOrchestrator&) = delete;
    ExitOrchestrator& operator=(const ExitOrchestrator&) = delete;

    // Shut down at once when nobody is connected, else offer options
    void initiate_exit();

    void handle_option(ExitOption option);

    // Device transfer, preferring the given device when it is online
    void transfer_to_device(std::optional<std::string> preferred_device_id);

    // Back out of the option prompt
    void cancel();

    void resume_from_waiting_room();

    // Rooms hosted here with at least one member
    std::vector<HostedRoom> active_hosted_rooms() const;

    const ExitProgress& progress() const { return progress_; }
    bool is_exit_in_progress() const { return exit_in_progress_; }
    bool waiting_room_active() const { return waiting_room_active_; }
    const std::optional<TransferStatus>& transfer_status() const { return transfer_status_; }

    bool waiting_room_timer_active() const { return waiting_room_timer_.active(); }
    bool auto_move_timer_active() const { return auto_move_timer_.active(); }

    void set_progress_listener(ProgressListener listener) { listener_ = std::move(listener); }

private:
    void set_progress(ExitProgress progress);
    void fail(const std::string& reason);
    void cancel_timers();

    std::optional<LinkedDevice> pick_device(const std::optional<std::string>& preferred) const;

    net::awaitable<void> run_device_transfer(uint64_t epoch, std::optional<std::string> preferred);
    // An empty list is fetched from the discovery service first
    net::awaitable<void> run_federated_transfer(uint64_t epoch, std::vector<FederatedServer> servers);
    net::awaitable<void> run_auto_move(uint64_t epoch);
    net::awaitable<void> run_auto_move_check(uint64_t epoch, LinkedDevice device);
    net::awaitable<void> run_system_reboot(uint64_t epoch);

    void move_to_waiting_room();
    // Clears the waiting-room flag and stops ambience
    void leave_waiting_room();
    void perform_just_exit();
    void schedule_delayed_shutdown();
    void issue_reboot();

    void begin_transfer(const std::vector<HostedRoom>& rooms,
                        std::optional<std::string> device,
                        std::optional<std::string> server);

    net::any_io_executor executor_;
    RoomDirectory& rooms_;
    DeviceRegistry& devices_;
    ServerControl& server_;
    AudioCues& audio_;
    HostControl& host_;
    FleetApi& fleet_;
    Options options_;

    ExitProgress progress_;
    bool exit_in_progress_{false};
    bool waiting_room_active_{false};
    std::optional<TransferStatus> transfer_status_;
    uint64_t epoch_{0};

    async::ScheduledTask waiting_room_timer_;
    async::ScheduledTask auto_move_timer_;
    async::ScheduledTask shutdown_timer_;

    ProgressListener listener_;
};

} // namespace voxfleet::node
