#pragma once

#include "common/types.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace voxfleet {

/**
 * CommandLog - append-only audit trail of remote commands.
 *
 * Entries are created as PENDING and only move forward:
 * PENDING -> EXECUTING -> COMPLETED | FAILED, or PENDING -> FAILED for a
 * command that was rejected before it ran. Entries are never removed.
 */
class CommandLog {
public:
    // Append a PENDING entry, returns its id
    std::string append(RemoteCommand command,
                       std::string source_device_id,
                       std::string source_device_name);

    // False when the id is unknown or the transition would move backwards
    bool mark_executing(const std::string& id);
    bool mark_completed(const std::string& id, std::string result);
    bool mark_failed(const std::string& id, std::string result);

    const std::vector<RemoteCommandLog>& entries() const { return entries_; }
    const RemoteCommandLog* find(const std::string& id) const;
    size_t size() const { return entries_.size(); }

private:
    bool transition(const std::string& id, CommandStatus next, std::optional<std::string> result);

    std::vector<RemoteCommandLog> entries_;
};

// Serialized form used by the CLI and the history endpoint
boost::json::object command_log_json(const RemoteCommandLog& entry);

} // namespace voxfleet
