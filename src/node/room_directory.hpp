#pragma once

#include "node/services.hpp"
#include <string>
#include <vector>

namespace voxfleet::node {

// Room table seeded from configuration and fed by incoming transfers
class InMemoryRoomDirectory : public RoomDirectory {
public:
    InMemoryRoomDirectory() = default;
    explicit InMemoryRoomDirectory(std::vector<HostedRoom> rooms) : rooms_(std::move(rooms)) {}

    std::vector<HostedRoom> rooms() const override { return rooms_; }
    bool set_paused(const std::string& room_id, bool paused) override;
    size_t accept(const std::vector<HostedRoom>& rooms, const std::string& host_device_id) override;

    const HostedRoom* find(const std::string& room_id) const;

private:
    std::vector<HostedRoom> rooms_;
};

// Linked devices from configuration; LinkMonitor flips the online flags
class InMemoryDeviceRegistry : public DeviceRegistry {
public:
    explicit InMemoryDeviceRegistry(std::vector<LinkedDevice> devices) : devices_(std::move(devices)) {}

    std::vector<LinkedDevice> devices() const override { return devices_; }
    void set_online(const std::string& device_id, bool online) override;

private:
    std::vector<LinkedDevice> devices_;
};

} // namespace voxfleet::node
