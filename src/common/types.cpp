#include "common/types.hpp"
#include "common/json_util.hpp"
#include <algorithm>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/chrono.h>

namespace voxfleet {

// ============================================================================
// ExitPhase / ExitProgress
// ============================================================================

const char* exit_phase_name(ExitPhase phase) {
    switch (phase) {
        case ExitPhase::IDLE: return "IDLE";
        case ExitPhase::SHOWING_OPTIONS: return "SHOWING_OPTIONS";
        case ExitPhase::TRANSFERRING_TO_DEVICE: return "TRANSFERRING_TO_DEVICE";
        case ExitPhase::TRANSFERRING_TO_FEDERATED: return "TRANSFERRING_TO_FEDERATED";
        case ExitPhase::MOVING_TO_WAITING_ROOM: return "MOVING_TO_WAITING_ROOM";
        case ExitPhase::WAITING_FOR_RESTART: return "WAITING_FOR_RESTART";
        case ExitPhase::SHUTTING_DOWN: return "SHUTTING_DOWN";
        case ExitPhase::COMPLETE: return "COMPLETE";
        case ExitPhase::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

std::string ExitProgress::description() const {
    switch (phase) {
        case ExitPhase::IDLE: return "";
        case ExitPhase::SHOWING_OPTIONS: return "Choosing exit option...";
        case ExitPhase::TRANSFERRING_TO_DEVICE: return "Transferring rooms to your other device...";
        case ExitPhase::TRANSFERRING_TO_FEDERATED: return "Transferring to federated server...";
        case ExitPhase::MOVING_TO_WAITING_ROOM: return "Moving users to waiting room...";
        case ExitPhase::WAITING_FOR_RESTART: return "Waiting room active - restart to resume";
        case ExitPhase::SHUTTING_DOWN: return "Shutting down server...";
        case ExitPhase::COMPLETE: return "Exit complete";
        case ExitPhase::ERROR: return "Error: " + message;
        default: return "";
    }
}

// ============================================================================
// ExitOption
// ============================================================================

const char* exit_option_name(ExitOption option) {
    switch (option) {
        case ExitOption::TRANSFER_TO_DEVICE: return "transfer_to_device";
        case ExitOption::TRANSFER_TO_FEDERATED: return "transfer_to_federated";
        case ExitOption::WAITING_ROOM: return "waiting_room";
        case ExitOption::AUTO_MOVE: return "auto_move";
        case ExitOption::JUST_EXIT: return "just_exit";
        case ExitOption::SYSTEM_REBOOT: return "system_reboot";
        default: return "unknown";
    }
}

const char* exit_option_label(ExitOption option) {
    switch (option) {
        case ExitOption::TRANSFER_TO_DEVICE: return "Transfer to Another Device";
        case ExitOption::TRANSFER_TO_FEDERATED: return "Transfer to Federated Server";
        case ExitOption::WAITING_ROOM: return "Put Users in Waiting Room";
        case ExitOption::AUTO_MOVE: return "Auto-Move After Timeout";
        case ExitOption::JUST_EXIT: return "Just Exit (Users Disconnected)";
        case ExitOption::SYSTEM_REBOOT: return "Reboot Device (If Stuck)";
        default: return "Unknown";
    }
}

const char* exit_option_summary(ExitOption option) {
    switch (option) {
        case ExitOption::TRANSFER_TO_DEVICE:
            return "Move all rooms and users to one of your other online devices";
        case ExitOption::TRANSFER_TO_FEDERATED:
            return "Transfer to a random federated server node, keeping rooms if possible";
        case ExitOption::WAITING_ROOM:
            return "Put users in a waiting room with ambient audio until you restart";
        case ExitOption::AUTO_MOVE:
            return "Wait a few minutes, then auto-transfer to next available option";
        case ExitOption::JUST_EXIT:
            return "Stop the server immediately - all users will be disconnected";
        case ExitOption::SYSTEM_REBOOT:
            return "Reboot the device if it's stuck - use when other options fail";
        default:
            return "";
    }
}

std::optional<ExitOption> exit_option_from_string(std::string_view name) {
    for (auto option : ALL_EXIT_OPTIONS) {
        if (name == exit_option_name(option)) {
            return option;
        }
    }
    return std::nullopt;
}

// ============================================================================
// TransferStatus
// ============================================================================

std::string TransferStatus::status_text() const {
    if (target_device) {
        return fmt::format("Transferring to {}: {}/{} rooms", *target_device, transferred_rooms, total_rooms);
    }
    if (target_server) {
        return fmt::format("Transferring to {}: {}/{} rooms", *target_server, transferred_rooms, total_rooms);
    }
    return "Preparing transfer...";
}

void TransferStatus::mark_rooms_transferred(uint32_t rooms, uint32_t users) {
    transferred_rooms = std::max(transferred_rooms, std::min(rooms, total_rooms));
    transferred_users = std::max(transferred_users, std::min(users, total_users));
}

// ============================================================================
// Rooms and peers
// ============================================================================

std::optional<HostedRoom> HostedRoom::from_json(const json::object& obj) {
    HostedRoom room;
    room.id = jstr(obj, "id");
    if (room.id.empty()) {
        return std::nullopt;
    }
    room.name = jstr(obj, "name", room.id);
    room.description = jstr(obj, "description");
    room.owner_id = jstr(obj, "ownerId");
    room.owner_username = jstr(obj, "ownerUsername");
    room.host_device_id = jstr(obj, "hostDeviceId");
    room.is_private = jbool(obj, "isPrivate");
    room.max_members = static_cast<uint32_t>(juint(obj, "maxMembers", 50));
    room.current_members = static_cast<uint32_t>(juint(obj, "currentMembers"));
    room.has_password = jbool(obj, "hasPassword");
    room.paused = jbool(obj, "paused");
    return room;
}

json::object room_transfer_json(const HostedRoom& room) {
    json::object obj;
    obj["id"] = room.id;
    obj["name"] = room.name;
    obj["description"] = room.description;
    obj["ownerId"] = room.owner_id;
    obj["ownerUsername"] = room.owner_username;
    obj["isPrivate"] = room.is_private;
    obj["maxMembers"] = room.max_members;
    obj["currentMembers"] = room.current_members;
    obj["hasPassword"] = room.has_password;
    return obj;
}

json::object room_federated_json(const HostedRoom& room) {
    json::object obj;
    obj["id"] = room.id;
    obj["name"] = room.name;
    obj["description"] = room.description;
    obj["ownerId"] = room.owner_id;
    obj["ownerUsername"] = room.owner_username;
    obj["currentMembers"] = room.current_members;
    return obj;
}

json::object room_summary_json(const HostedRoom& room) {
    json::object obj;
    obj["id"] = room.id;
    obj["name"] = room.name;
    obj["currentMembers"] = room.current_members;
    obj["maxMembers"] = room.max_members;
    obj["isOnline"] = !room.paused;
    return obj;
}

std::optional<FederatedServer> FederatedServer::from_json(const json::object& obj) {
    FederatedServer server;
    server.id = jstr(obj, "id");
    server.name = jstr(obj, "name");
    server.url = jstr(obj, "url");
    if (server.id.empty() || server.name.empty() || server.url.empty()) {
        return std::nullopt;
    }
    server.is_online = jbool(obj, "isOnline", true);
    server.load = jdouble(obj, "load");
    server.room_count = static_cast<uint32_t>(juint(obj, "roomCount"));
    return server;
}

// ============================================================================
// ConnectionMode
// ============================================================================

const char* connection_mode_name(ConnectionMode mode) {
    switch (mode) {
        case ConnectionMode::AUTO: return "auto";
        case ConnectionMode::TUNNEL_ONLY: return "tunnel";
        case ConnectionMode::DIRECT_ONLY: return "direct";
        case ConnectionMode::HYBRID: return "hybrid";
        default: return "unknown";
    }
}

const char* connection_mode_label(ConnectionMode mode) {
    switch (mode) {
        case ConnectionMode::AUTO: return "Auto-Detect";
        case ConnectionMode::TUNNEL_ONLY: return "Tunnel Only";
        case ConnectionMode::DIRECT_ONLY: return "Direct IP Only";
        case ConnectionMode::HYBRID: return "Hybrid (Both)";
        default: return "Unknown";
    }
}

std::optional<ConnectionMode> connection_mode_from_string(std::string_view name) {
    if (name == "auto") return ConnectionMode::AUTO;
    if (name == "tunnel" || name == "openlink") return ConnectionMode::TUNNEL_ONLY;
    if (name == "direct") return ConnectionMode::DIRECT_ONLY;
    if (name == "hybrid") return ConnectionMode::HYBRID;
    return std::nullopt;
}

// ============================================================================
// RemoteCommand
// ============================================================================

const char* remote_command_name(RemoteCommand command) {
    switch (command) {
        case RemoteCommand::STOP_SERVER: return "stop_server";
        case RemoteCommand::RESTART_SERVER: return "restart_server";
        case RemoteCommand::TRANSFER_ROOMS: return "transfer_rooms";
        case RemoteCommand::REBOOT_DEVICE: return "reboot_device";
        case RemoteCommand::PAUSE_ROOMS: return "pause_rooms";
        case RemoteCommand::RESUME_ROOMS: return "resume_rooms";
        case RemoteCommand::GET_STATUS: return "get_status";
        case RemoteCommand::GET_ACTIVE_ROOMS: return "get_active_rooms";
        case RemoteCommand::FORCE_DISCONNECT: return "force_disconnect";
        case RemoteCommand::UPDATE_SETTINGS: return "update_settings";
        default: return "unknown";
    }
}

std::optional<RemoteCommand> remote_command_from_string(std::string_view name) {
    for (auto command : ALL_REMOTE_COMMANDS) {
        if (name == remote_command_name(command)) {
            return command;
        }
    }
    return std::nullopt;
}

const char* command_status_name(CommandStatus status) {
    switch (status) {
        case CommandStatus::PENDING: return "pending";
        case CommandStatus::EXECUTING: return "executing";
        case CommandStatus::COMPLETED: return "completed";
        case CommandStatus::FAILED: return "failed";
        default: return "unknown";
    }
}

json::object CommandRequest::to_json(std::string_view connection_method) const {
    json::object obj;
    // Params first so the envelope fields always win
    for (const auto& [key, value] : params) {
        obj[key] = value;
    }
    obj["command"] = remote_command_name(command);
    obj["sourceDeviceId"] = source_device_id;
    obj["sourceDeviceName"] = source_device_name;
    obj["timestamp"] = format_timestamp(std::chrono::system_clock::now());
    obj["connectionMethod"] = connection_method;
    return obj;
}

json::object CommandReply::to_json() const {
    json::object obj;
    obj["success"] = success;
    if (!result.empty()) {
        obj["result"] = result;
    }
    return obj;
}

std::optional<CommandReply> CommandReply::from_json(const json::object& obj) {
    auto it = obj.find("success");
    if (it == obj.end() || !it->value().is_bool()) {
        return std::nullopt;
    }

    CommandReply reply;
    reply.success = it->value().as_bool();
    if (auto r = obj.find("result"); r != obj.end() && !r->value().is_null()) {
        reply.result = r->value().is_string()
            ? std::string(r->value().as_string())
            : json::serialize(r->value());
    } else if (auto e = obj.find("error"); e != obj.end() && e->value().is_string()) {
        reply.result = std::string(e->value().as_string());
    }
    return reply;
}

// ============================================================================
// Helpers
// ============================================================================

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count();
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03d}Z", fmt::gmtime(std::chrono::system_clock::to_time_t(secs)), ms);
}

std::string generate_id() {
    static thread_local boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}

} // namespace voxfleet
