#pragma once

#include <boost/json.hpp>
#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace voxfleet {

namespace json = boost::json;

// ============================================================================
// Exit Progress
// ============================================================================

enum class ExitPhase : uint8_t {
    IDLE,
    SHOWING_OPTIONS,
    TRANSFERRING_TO_DEVICE,
    TRANSFERRING_TO_FEDERATED,
    MOVING_TO_WAITING_ROOM,
    WAITING_FOR_RESTART,
    SHUTTING_DOWN,
    COMPLETE,
    ERROR,
};

const char* exit_phase_name(ExitPhase phase);

struct ExitProgress {
    ExitPhase phase{ExitPhase::IDLE};
    std::string message;  // Only set for ERROR

    static ExitProgress of(ExitPhase phase) { return ExitProgress{phase, {}}; }
    static ExitProgress error(std::string message) { return ExitProgress{ExitPhase::ERROR, std::move(message)}; }

    // Human readable text shown while the phase is active
    std::string description() const;

    bool operator==(const ExitProgress& other) const = default;
};

// ============================================================================
// Exit Options
// ============================================================================

enum class ExitOption : uint8_t {
    TRANSFER_TO_DEVICE,
    TRANSFER_TO_FEDERATED,
    WAITING_ROOM,
    AUTO_MOVE,
    JUST_EXIT,
    SYSTEM_REBOOT,
};

inline constexpr std::array<ExitOption, 6> ALL_EXIT_OPTIONS = {
    ExitOption::TRANSFER_TO_DEVICE,
    ExitOption::TRANSFER_TO_FEDERATED,
    ExitOption::WAITING_ROOM,
    ExitOption::AUTO_MOVE,
    ExitOption::JUST_EXIT,
    ExitOption::SYSTEM_REBOOT,
};

// Stable config name ("transfer_to_device", ...)
const char* exit_option_name(ExitOption option);
const char* exit_option_label(ExitOption option);
const char* exit_option_summary(ExitOption option);
std::optional<ExitOption> exit_option_from_string(std::string_view name);

// Options that disconnect users outright and need explicit confirmation
constexpr bool is_dangerous(ExitOption option) {
    return option == ExitOption::JUST_EXIT || option == ExitOption::SYSTEM_REBOOT;
}

// ============================================================================
// Transfer Status
// ============================================================================

struct TransferStatus {
    uint32_t total_rooms{0};
    uint32_t transferred_rooms{0};
    uint32_t total_users{0};
    uint32_t transferred_users{0};
    std::optional<std::string> target_device;
    std::optional<std::string> target_server;

    double progress() const {
        if (total_rooms == 0) return 0.0;
        return static_cast<double>(transferred_rooms) / static_cast<double>(total_rooms);
    }

    std::string status_text() const;

    // Counts only move forward
    void mark_rooms_transferred(uint32_t rooms, uint32_t users);
};

// ============================================================================
// Rooms and Peers
// ============================================================================

struct HostedRoom {
    std::string id;
    std::string name;
    std::string description;
    std::string owner_id;
    std::string owner_username;
    std::string host_device_id;
    bool is_private{false};
    uint32_t max_members{0};
    uint32_t current_members{0};
    bool has_password{false};
    bool paused{false};

    static std::optional<HostedRoom> from_json(const json::object& obj);
};

// Payload for a sibling device's transfer-accept endpoint
json::object room_transfer_json(const HostedRoom& room);

// Payload for a federation peer's federated-transfer endpoint
json::object room_federated_json(const HostedRoom& room);

// Entry of the get_active_rooms reply
json::object room_summary_json(const HostedRoom& room);

struct LinkedDevice {
    std::string id;
    std::string name;
    std::string url;
    std::string access_token;
    bool is_online{false};
};

struct FederatedServer {
    std::string id;
    std::string name;
    std::string url;
    bool is_online{true};
    double load{0.0};
    uint32_t room_count{0};

    // nullopt when id, name or url is missing
    static std::optional<FederatedServer> from_json(const json::object& obj);
};

// ============================================================================
// Remote Control
// ============================================================================

enum class ConnectionMode : uint8_t {
    AUTO,
    TUNNEL_ONLY,
    DIRECT_ONLY,
    HYBRID,
};

const char* connection_mode_name(ConnectionMode mode);
const char* connection_mode_label(ConnectionMode mode);
std::optional<ConnectionMode> connection_mode_from_string(std::string_view name);

enum class RemoteCommand : uint8_t {
    STOP_SERVER,
    RESTART_SERVER,
    TRANSFER_ROOMS,
    REBOOT_DEVICE,
    PAUSE_ROOMS,
    RESUME_ROOMS,
    GET_STATUS,
    GET_ACTIVE_ROOMS,
    FORCE_DISCONNECT,
    UPDATE_SETTINGS,
};

inline constexpr std::array<RemoteCommand, 10> ALL_REMOTE_COMMANDS = {
    RemoteCommand::STOP_SERVER,
    RemoteCommand::RESTART_SERVER,
    RemoteCommand::TRANSFER_ROOMS,
    RemoteCommand::REBOOT_DEVICE,
    RemoteCommand::PAUSE_ROOMS,
    RemoteCommand::RESUME_ROOMS,
    RemoteCommand::GET_STATUS,
    RemoteCommand::GET_ACTIVE_ROOMS,
    RemoteCommand::FORCE_DISCONNECT,
    RemoteCommand::UPDATE_SETTINGS,
};

// Wire name ("stop_server", ...)
const char* remote_command_name(RemoteCommand command);
std::optional<RemoteCommand> remote_command_from_string(std::string_view name);

constexpr bool requires_confirmation(RemoteCommand command) {
    switch (command) {
        case RemoteCommand::STOP_SERVER:
        case RemoteCommand::RESTART_SERVER:
        case RemoteCommand::REBOOT_DEVICE:
        case RemoteCommand::FORCE_DISCONNECT:
            return true;
        default:
            return false;
    }
}

enum class CommandStatus : uint8_t {
    PENDING,
    EXECUTING,
    COMPLETED,
    FAILED,
};

const char* command_status_name(CommandStatus status);

struct RemoteCommandLog {
    std::string id;
    RemoteCommand command{RemoteCommand::GET_STATUS};
    std::string source_device_id;
    std::string source_device_name;
    std::chrono::system_clock::time_point timestamp;
    CommandStatus status{CommandStatus::PENDING};
    std::optional<std::string> result;
};

// A command as the sender builds it and the receiver decodes it
struct CommandRequest {
    RemoteCommand command{RemoteCommand::GET_STATUS};
    std::string source_device_id;
    std::string source_device_name;
    json::object params;

    // {command, sourceDeviceId, sourceDeviceName, timestamp, connectionMethod, ...params}
    json::object to_json(std::string_view connection_method) const;
};

struct CommandReply {
    bool success{false};
    std::string result;

    static CommandReply ok(std::string result) { return CommandReply{true, std::move(result)}; }
    static CommandReply fail(std::string result) { return CommandReply{false, std::move(result)}; }

    json::object to_json() const;

    // Accepts {success, result?}; result may be a string or any JSON value
    static std::optional<CommandReply> from_json(const json::object& obj);
};

// ============================================================================
// Helpers
// ============================================================================

// RFC 3339 UTC timestamp with milliseconds
std::string format_timestamp(std::chrono::system_clock::time_point tp);

// Random UUID string
std::string generate_id();

} // namespace voxfleet
