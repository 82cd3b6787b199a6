#pragma once

#include "node/exit_orchestrator.hpp"
#include "node/services.hpp"
#include "common/command_log.hpp"
#include "common/types.hpp"
#include <string>

namespace voxfleet::node {

/**
 * CommandExecutor - applies remote commands received by this node.
 *
 * Every command, accepted or not, gets an audit entry. With remote control
 * disabled nothing runs and the entry goes straight to FAILED.
 */
class CommandExecutor {
public:
    CommandExecutor(ExitOrchestrator& exit, RoomDirectory& rooms, ServerControl& server, bool remote_control_enabled);

    CommandReply handle(RemoteCommand command, const std::string& source_device_id, const json::object& params);

    // Decode a {command, sourceDeviceId, ...params} body and handle it
    CommandReply parse_and_handle(const json::object& body);

    bool remote_control_enabled() const { return enabled_; }
    void set_remote_control_enabled(bool enabled);

    const CommandLog& history() const { return log_; }

private:
    CommandReply execute(RemoteCommand command, const json::object& params);

    std::string status_json() const;
    std::string rooms_json() const;
    CommandReply apply_settings(const json::object& settings);

    ExitOrchestrator& exit_;
    RoomDirectory& rooms_;
    ServerControl& server_;
    bool enabled_;
    CommandLog log_;
};

} // namespace voxfleet::node
