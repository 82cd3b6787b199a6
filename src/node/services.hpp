#pragma once

#include "common/types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace voxfleet::node {

// ============================================================================
// Collaborators of the exit orchestrator and command executor
// ============================================================================

// Room table of this node
class RoomDirectory {
public:
    virtual ~RoomDirectory() = default;

    virtual std::vector<HostedRoom> rooms() const = 0;

    // False when the room is unknown
    virtual bool set_paused(const std::string& room_id, bool paused) = 0;

    // Take over rooms handed off by another node; returns how many were added or updated
    virtual size_t accept(const std::vector<HostedRoom>& rooms, const std::string& host_device_id) = 0;
};

// Other devices of the same operator
class DeviceRegistry {
public:
    virtual ~DeviceRegistry() = default;

    virtual std::vector<LinkedDevice> devices() const = 0;
    virtual void set_online(const std::string& device_id, bool online) = 0;
};

// The local voice server
class ServerControl {
public:
    virtual ~ServerControl() = default;

    virtual bool is_running() const = 0;
    virtual uint16_t port() const = 0;
    virtual void set_port(uint16_t port) = 0;
    virtual uint32_t connected_clients() const = 0;

    virtual void stop() = 0;
    virtual void restart() = 0;

    // False when no such client is connected
    virtual bool disconnect_client(const std::string& client_id) = 0;
};

// Completion cue and waiting-room ambience
class AudioCues {
public:
    virtual ~AudioCues() = default;

    virtual void play_completion() = 0;
    virtual void start_ambience() = 0;
    virtual void stop_ambience() = 0;
};

// Operating system actions
class HostControl {
public:
    virtual ~HostControl() = default;

    // False when the command could not be issued
    virtual bool run_command(const std::string& command) = 0;

    virtual void terminate_process() = 0;
};

} // namespace voxfleet::node
