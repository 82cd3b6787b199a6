#include "node/room_directory.hpp"
#include "common/log.hpp"
#include <algorithm>

namespace voxfleet::node {

namespace {

const log::Logger& logger() { return log::Logger::get("node.rooms"); }

} // anonymous namespace

const HostedRoom* InMemoryRoomDirectory::find(const std::string& room_id) const {
    for (const auto& room : rooms_) {
        if (room.id == room_id) return &room;
    }
    return nullptr;
}

bool InMemoryRoomDirectory::set_paused(const std::string& room_id, bool paused) {
    for (auto& room : rooms_) {
        if (room.id == room_id) {
            if (room.paused != paused) {
                logger().info("Room {} ({}) {}", room.name, room.id, paused ? "paused" : "resumed");
            }
            room.paused = paused;
            return true;
        }
    }
    return false;
}

size_t InMemoryRoomDirectory::accept(const std::vector<HostedRoom>& rooms, const std::string& host_device_id) {
    size_t count = 0;
    for (const auto& incoming : rooms) {
        HostedRoom room = incoming;
        room.host_device_id = host_device_id;
        room.paused = false;

        auto it = std::find_if(rooms_.begin(), rooms_.end(),
                               [&](const HostedRoom& r) { return r.id == room.id; });
        if (it != rooms_.end()) {
            *it = std::move(room);
        } else {
            rooms_.push_back(std::move(room));
        }
        ++count;
    }
    logger().info("Accepted {} room(s), now hosting {}", count, rooms_.size());
    return count;
}

void InMemoryDeviceRegistry::set_online(const std::string& device_id, bool online) {
    for (auto& device : devices_) {
        if (device.id == device_id && device.is_online != online) {
            logger().info("Device {} is now {}", device.name, online ? "online" : "offline");
            device.is_online = online;
        }
    }
}

} // namespace voxfleet::node
