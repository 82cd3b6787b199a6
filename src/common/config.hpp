#pragma once

#include "common/log.hpp"
#include "common/types.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <chrono>
#include <expected>

namespace voxfleet {

// ============================================================================
// Configuration Error
// ============================================================================

enum class ConfigError {
    FILE_NOT_FOUND,
    PARSE_ERROR,
    INVALID_VALUE,
    MISSING_REQUIRED,
};

std::string config_error_message(ConfigError error);

// ============================================================================
// Shared sections
// ============================================================================

struct LogSection {
    std::string level = "info";
    std::string file;
    std::unordered_map<std::string, std::string> modules;  // module -> level

    log::LogConfig to_log_config() const;
};

// ============================================================================
// Node Configuration (voxfleet-node)
// ============================================================================

struct NodeConfig {
    // Identity
    std::string device_id;
    std::string device_name = "voxfleet-node";

    // HTTP/WebSocket API
    std::string bind_address = "0.0.0.0";
    uint16_t port = 3000;
    bool tls = false;
    std::string cert_file;
    std::string key_file;
    std::string access_token;           // Empty = no bearer check
    bool remote_control_enabled = true;

    // Exit orchestration
    struct ExitSection {
        std::chrono::milliseconds waiting_room_timeout{300000};
        std::chrono::milliseconds auto_move_interval{180000};
        std::chrono::milliseconds shutdown_grace{2000};
        std::chrono::milliseconds exit_delay{1000};
        std::optional<ExitOption> default_option;  // Headless choice when options would be shown
        bool allow_dangerous_default = false;       // Required for just_exit / system_reboot defaults
        std::string local_server_url;               // Pause/resume/broadcast target, empty = self
        std::string reboot_command = "systemctl reboot";
        std::string privileged_reboot_command = "pkexec shutdown -r now";
    } exit;

    // Federation
    struct FederationSection {
        std::string discovery_url = "https://voicelink.app/api/federation/nodes";
        std::string server_name;  // Announced as sourceServer, empty = device_name
    } federation;

    // Local network advertisement
    struct AdvertiseSection {
        bool enabled = true;
        uint16_t port = 41234;
        std::chrono::milliseconds interval{5000};
    } advertise;

    // Linked device health checks
    struct HealthSection {
        std::chrono::milliseconds interval{30000};
        std::chrono::milliseconds timeout{5000};
    } health;

    std::vector<LinkedDevice> linked_devices;
    std::vector<HostedRoom> rooms;

    LogSection log;

    // Base URL of this node's own API ("http://127.0.0.1:3000")
    std::string self_url() const;

    static std::expected<NodeConfig, ConfigError> load(const std::string& path);
    static std::expected<NodeConfig, ConfigError> parse(const std::string& json_content);
};

// ============================================================================
// Control Configuration (voxfleet-ctl)
// ============================================================================

struct CtlConfig {
    std::string device_id;
    std::string device_name = "voxfleet-ctl";

    ConnectionMode mode = ConnectionMode::AUTO;

    struct DiscoverySection {
        std::chrono::milliseconds timeout{10000};
        std::chrono::milliseconds sweep_timeout{500};
        uint16_t sweep_port = 3000;
        uint16_t advertise_port = 41234;
        std::vector<std::string> subnets = {"192.168.1", "192.168.0", "10.0.0", "10.0.1", "172.16.0"};
        bool include_local_subnets = true;
    } discovery;

    struct RelaySection {
        std::string host_url;  // Control-room host, empty = the peer itself
        std::chrono::milliseconds response_timeout{10000};
        std::chrono::milliseconds connect_timeout{10000};
    } relay;

    std::chrono::milliseconds request_timeout{10000};

    std::vector<LinkedDevice> linked_devices;

    LogSection log;

    const LinkedDevice* find_device(std::string_view id_or_name) const;

    static std::expected<CtlConfig, ConfigError> load(const std::string& path);
    static std::expected<CtlConfig, ConfigError> parse(const std::string& json_content);
};

} // namespace voxfleet
