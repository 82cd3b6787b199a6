#include "node/command_executor.hpp"
#include "common/json_util.hpp"
#include "common/log.hpp"

namespace voxfleet::node {

namespace {

const log::Logger& logger() { return log::Logger::get("node.executor"); }

constexpr const char* DISABLED_TEXT = "Remote control is disabled on this device";

} // anonymous namespace

CommandExecutor::CommandExecutor(ExitOrchestrator& exit, RoomDirectory& rooms, ServerControl& server,
                                 bool remote_control_enabled)
    : exit_(exit)
    , rooms_(rooms)
    , server_(server)
    , enabled_(remote_control_enabled) {}

void CommandExecutor::set_remote_control_enabled(bool enabled) {
    if (enabled != enabled_) {
        logger().info("Remote control {}", enabled ? "enabled" : "disabled");
    }
    enabled_ = enabled;
}

CommandReply CommandExecutor::handle(RemoteCommand command, const std::string& source_device_id,
                                     const json::object& params) {
    auto source_name = jstr(params, "sourceDeviceName", "Unknown");
    auto id = log_.append(command, source_device_id, source_name);

    if (!enabled_) {
        logger().warn("Rejected {} from {}: remote control disabled", remote_command_name(command), source_device_id);
        log_.mark_failed(id, DISABLED_TEXT);
        return CommandReply::fail(DISABLED_TEXT);
    }

    logger().info("Executing {} from {} ({})", remote_command_name(command), source_name, source_device_id);
    log_.mark_executing(id);

    auto reply = execute(command, params);
    if (reply.success) {
        log_.mark_completed(id, reply.result);
    } else {
        log_.mark_failed(id, reply.result);
    }
    return reply;
}

CommandReply CommandExecutor::parse_and_handle(const json::object& body) {
    auto name = jstr(body, "command");
    auto command = remote_command_from_string(name);
    if (!command) {
        logger().warn("{}: unknown command '{}'", fleet_error_name(FleetError::INVALID_PARAMETERS), name);
        return CommandReply::fail("Unknown command: " + name);
    }
    return handle(*command, jstr(body, "sourceDeviceId"), body);
}

CommandReply CommandExecutor::execute(RemoteCommand command, const json::object& params) {
    switch (command) {
        case RemoteCommand::STOP_SERVER:
            exit_.handle_option(ExitOption::JUST_EXIT);
            return CommandReply::ok("Server stopping");

        case RemoteCommand::RESTART_SERVER:
            server_.restart();
            return CommandReply::ok("Server restarting");

        case RemoteCommand::TRANSFER_ROOMS: {
            auto target = jstr(params, "targetDeviceId");
            if (target.empty()) {
                exit_.transfer_to_device(std::nullopt);
                return CommandReply::ok("Rooms transferring to first available device");
            }
            exit_.transfer_to_device(target);
            return CommandReply::ok("Rooms transferring to " + target);
        }

        case RemoteCommand::REBOOT_DEVICE:
            exit_.handle_option(ExitOption::SYSTEM_REBOOT);
            return CommandReply::ok("Device rebooting");

        case RemoteCommand::PAUSE_ROOMS:
            exit_.handle_option(ExitOption::WAITING_ROOM);
            return CommandReply::ok("Rooms paused, users in waiting room");

        case RemoteCommand::RESUME_ROOMS:
            exit_.resume_from_waiting_room();
            return CommandReply::ok("Rooms resumed");

        case RemoteCommand::GET_STATUS:
            return CommandReply::ok(status_json());

        case RemoteCommand::GET_ACTIVE_ROOMS:
            return CommandReply::ok(rooms_json());

        case RemoteCommand::FORCE_DISCONNECT: {
            auto client_id = jstr(params, "clientId");
            if (client_id.empty()) {
                return CommandReply::fail("No client ID specified");
            }
            if (!server_.disconnect_client(client_id)) {
                logger().info("Client {} was not connected", client_id);
            }
            return CommandReply::ok("Client " + client_id + " disconnected");
        }

        case RemoteCommand::UPDATE_SETTINGS: {
            auto* settings = jsection(params, "settings");
            if (!settings) {
                return CommandReply::fail("No settings provided");
            }
            return apply_settings(*settings);
        }
    }
    return CommandReply::fail(fleet_error_message(FleetError::INVALID_PARAMETERS));
}

std::string CommandExecutor::status_json() const {
    json::object status;
    status["isRunning"] = server_.is_running();
    status["port"] = server_.port();
    status["connectedClients"] = server_.connected_clients();
    status["activeRooms"] = rooms_.rooms().size();
    status["waitingRoomActive"] = exit_.waiting_room_active();
    return json::serialize(status);
}

std::string CommandExecutor::rooms_json() const {
    json::array list;
    for (const auto& room : rooms_.rooms()) {
        list.push_back(room_summary_json(room));
    }
    return json::serialize(list);
}

CommandReply CommandExecutor::apply_settings(const json::object& settings) {
    if (auto it = settings.find("serverPort"); it != settings.end()) {
        auto port = jint(settings, "serverPort", -1);
        if (!it->value().is_number() || port <= 0 || port > 65535) {
            return CommandReply::fail(fleet_error_message(FleetError::INVALID_PARAMETERS));
        }
        logger().info("Server port -> {}", port);
        server_.set_port(static_cast<uint16_t>(port));
    }

    if (auto it = settings.find("remoteControlEnabled"); it != settings.end() && it->value().is_bool()) {
        set_remote_control_enabled(it->value().as_bool());
    }

    return CommandReply::ok("Settings updated");
}

} // namespace voxfleet::node
