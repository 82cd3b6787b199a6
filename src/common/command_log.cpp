#include "common/command_log.hpp"
#include "common/log.hpp"
#include <algorithm>

namespace voxfleet {

namespace {

const log::Logger& logger() { return log::Logger::get("common.audit"); }

bool is_terminal(CommandStatus status) {
    return status == CommandStatus::COMPLETED || status == CommandStatus::FAILED;
}

} // anonymous namespace

std::string CommandLog::append(RemoteCommand command,
                               std::string source_device_id,
                               std::string source_device_name) {
    RemoteCommandLog entry;
    entry.id = generate_id();
    entry.command = command;
    entry.source_device_id = std::move(source_device_id);
    entry.source_device_name = std::move(source_device_name);
    entry.timestamp = std::chrono::system_clock::now();
    entry.status = CommandStatus::PENDING;

    logger().debug("{} {} from {}", entry.id, remote_command_name(command), entry.source_device_id);
    entries_.push_back(std::move(entry));
    return entries_.back().id;
}

bool CommandLog::mark_executing(const std::string& id) {
    return transition(id, CommandStatus::EXECUTING, std::nullopt);
}

bool CommandLog::mark_completed(const std::string& id, std::string result) {
    return transition(id, CommandStatus::COMPLETED, std::move(result));
}

bool CommandLog::mark_failed(const std::string& id, std::string result) {
    return transition(id, CommandStatus::FAILED, std::move(result));
}

const RemoteCommandLog* CommandLog::find(const std::string& id) const {
    // Newest entries are the ones being updated
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->id == id) return &*it;
    }
    return nullptr;
}

bool CommandLog::transition(const std::string& id, CommandStatus next, std::optional<std::string> result) {
    auto it = std::find_if(entries_.rbegin(), entries_.rend(),
                           [&](const RemoteCommandLog& e) { return e.id == id; });
    if (it == entries_.rend()) {
        return false;
    }

    if (is_terminal(it->status)) {
        logger().warn("{} already {}, ignoring {}", id,
                      command_status_name(it->status), command_status_name(next));
        return false;
    }
    if (next == CommandStatus::EXECUTING && it->status != CommandStatus::PENDING) {
        return false;
    }

    it->status = next;
    if (result) {
        it->result = std::move(result);
    }
    logger().debug("{} -> {}", id, command_status_name(next));
    return true;
}

boost::json::object command_log_json(const RemoteCommandLog& entry) {
    boost::json::object obj;
    obj["id"] = entry.id;
    obj["command"] = remote_command_name(entry.command);
    obj["sourceDeviceId"] = entry.source_device_id;
    obj["sourceDeviceName"] = entry.source_device_name;
    obj["timestamp"] = format_timestamp(entry.timestamp);
    obj["status"] = command_status_name(entry.status);
    if (entry.result) {
        obj["result"] = *entry.result;
    }
    return obj;
}

} // namespace voxfleet
