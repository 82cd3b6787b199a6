#include "common/config.hpp"
#include "common/json_util.hpp"
#include <fstream>
#include <sstream>

namespace voxfleet {

namespace {

const log::Logger& logger() { return log::Logger::get("common.config"); }

std::expected<std::string, ConfigError> read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(ConfigError::FILE_NOT_FOUND);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::optional<std::chrono::milliseconds> jmillis(const json::object& obj, std::string_view key) {
    if (auto it = obj.find(key); it == obj.end()) {
        return std::nullopt;
    }
    auto v = jint(obj, key, -1);
    if (v < 0) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(v);
}

void parse_log_section(const json::object& root, LogSection& out) {
    auto* log_sec = jsection(root, "log");
    if (!log_sec) return;

    out.level = jstr(*log_sec, "level", out.level);
    out.file = jstr(*log_sec, "file", out.file);
    if (auto* modules = jsection(*log_sec, "modules")) {
        for (const auto& [key, value] : *modules) {
            if (value.is_string())
                out.modules[std::string(key)] = std::string(value.as_string());
        }
    }
}

std::expected<std::vector<LinkedDevice>, ConfigError> parse_linked_devices(const json::object& root) {
    std::vector<LinkedDevice> devices;
    auto* arr = jarray(root, "linked_devices");
    if (!arr) return devices;

    for (const auto& item : *arr) {
        if (!item.is_object()) {
            return std::unexpected(ConfigError::INVALID_VALUE);
        }
        const auto& obj = item.as_object();
        LinkedDevice dev;
        dev.id = jstr(obj, "id");
        dev.name = jstr(obj, "name", dev.id);
        dev.url = jstr(obj, "url");
        dev.access_token = jstr(obj, "access_token");
        dev.is_online = jbool(obj, "online", false);
        if (dev.id.empty() || dev.url.empty()) {
            logger().error("linked_devices entry needs both 'id' and 'url'");
            return std::unexpected(ConfigError::MISSING_REQUIRED);
        }
        devices.push_back(std::move(dev));
    }
    return devices;
}

} // anonymous namespace

std::string config_error_message(ConfigError error) {
    switch (error) {
        case ConfigError::FILE_NOT_FOUND: return "Configuration file not found";
        case ConfigError::PARSE_ERROR: return "Failed to parse configuration file";
        case ConfigError::INVALID_VALUE: return "Invalid configuration value";
        case ConfigError::MISSING_REQUIRED: return "Missing required configuration";
        default: return "Unknown configuration error";
    }
}

log::LogConfig LogSection::to_log_config() const {
    log::LogConfig cfg;
    cfg.level = log::parse_level(level);
    cfg.file_path = file;
    for (const auto& [name, lvl] : modules) {
        cfg.module_levels[name] = log::parse_level(lvl);
    }
    return cfg;
}

// ============================================================================
// NodeConfig
// ============================================================================

std::string NodeConfig::self_url() const {
    std::string host = (bind_address.empty() || bind_address == "0.0.0.0") ? "127.0.0.1" : bind_address;
    return std::string(tls ? "https://" : "http://") + host + ":" + std::to_string(port);
}

std::expected<NodeConfig, ConfigError> NodeConfig::load(const std::string& path) {
    auto content = read_file(path);
    if (!content) {
        return std::unexpected(content.error());
    }
    return parse(*content);
}

std::expected<NodeConfig, ConfigError> NodeConfig::parse(const std::string& json_content) {
    try {
        auto jv = json::parse(json_content);
        if (!jv.is_object()) {
            return std::unexpected(ConfigError::PARSE_ERROR);
        }
        auto& root = jv.as_object();

        NodeConfig config;

        // node section
        if (auto* node = jsection(root, "node")) {
            config.device_id = jstr(*node, "device_id");
            config.device_name = jstr(*node, "device_name", config.device_name);
            config.bind_address = jstr(*node, "bind", config.bind_address);
            config.port = static_cast<uint16_t>(juint(*node, "port", config.port));
            config.tls = jbool(*node, "tls", config.tls);
            config.cert_file = jstr(*node, "cert");
            config.key_file = jstr(*node, "key");
            config.access_token = jstr(*node, "access_token");
            config.remote_control_enabled = jbool(*node, "remote_control", config.remote_control_enabled);
        }

        if (config.device_id.empty()) {
            logger().error("node.device_id is required");
            return std::unexpected(ConfigError::MISSING_REQUIRED);
        }
        if (config.tls && (config.cert_file.empty() || config.key_file.empty())) {
            logger().error("node.tls requires node.cert and node.key");
            return std::unexpected(ConfigError::MISSING_REQUIRED);
        }

        // exit section
        if (auto* ex = jsection(root, "exit")) {
            if (auto v = jmillis(*ex, "waiting_room_timeout_ms")) config.exit.waiting_room_timeout = *v;
            if (auto v = jmillis(*ex, "auto_move_interval_ms")) config.exit.auto_move_interval = *v;
            if (auto v = jmillis(*ex, "shutdown_grace_ms")) config.exit.shutdown_grace = *v;
            if (auto v = jmillis(*ex, "exit_delay_ms")) config.exit.exit_delay = *v;

            auto opt = jstr(*ex, "default_option");
            if (!opt.empty()) {
                config.exit.default_option = exit_option_from_string(opt);
                if (!config.exit.default_option) {
                    logger().error("Unknown exit.default_option '{}'", opt);
                    return std::unexpected(ConfigError::INVALID_VALUE);
                }
            }
            config.exit.allow_dangerous_default =
                jbool(*ex, "allow_dangerous_default", config.exit.allow_dangerous_default);
            if (config.exit.default_option && is_dangerous(*config.exit.default_option) &&
                !config.exit.allow_dangerous_default) {
                logger().error("exit.default_option '{}' disconnects users; set exit.allow_dangerous_default",
                               exit_option_name(*config.exit.default_option));
                return std::unexpected(ConfigError::INVALID_VALUE);
            }
            config.exit.local_server_url = jstr(*ex, "local_server_url");
            config.exit.reboot_command = jstr(*ex, "reboot_command", config.exit.reboot_command);
            config.exit.privileged_reboot_command =
                jstr(*ex, "privileged_reboot_command", config.exit.privileged_reboot_command);
        }

        if (config.exit.auto_move_interval.count() == 0) {
            logger().error("exit.auto_move_interval_ms must be positive");
            return std::unexpected(ConfigError::INVALID_VALUE);
        }

        // federation section
        if (auto* fed = jsection(root, "federation")) {
            config.federation.discovery_url = jstr(*fed, "discovery_url", config.federation.discovery_url);
            config.federation.server_name = jstr(*fed, "server_name");
        }

        // advertise section
        if (auto* adv = jsection(root, "advertise")) {
            config.advertise.enabled = jbool(*adv, "enabled", config.advertise.enabled);
            config.advertise.port = static_cast<uint16_t>(juint(*adv, "port", config.advertise.port));
            if (auto v = jmillis(*adv, "interval_ms")) config.advertise.interval = *v;
        }

        // health section
        if (auto* health = jsection(root, "health")) {
            if (auto v = jmillis(*health, "interval_ms")) config.health.interval = *v;
            if (auto v = jmillis(*health, "timeout_ms")) config.health.timeout = *v;
        }

        auto devices = parse_linked_devices(root);
        if (!devices) {
            return std::unexpected(devices.error());
        }
        config.linked_devices = std::move(*devices);

        // rooms seed the hosted room directory
        if (auto* rooms = jarray(root, "rooms")) {
            for (const auto& item : *rooms) {
                if (!item.is_object()) continue;
                auto room = HostedRoom::from_json(item.as_object());
                if (!room) {
                    logger().warn("Skipping room entry without id");
                    continue;
                }
                if (room->host_device_id.empty()) {
                    room->host_device_id = config.device_id;
                }
                config.rooms.push_back(std::move(*room));
            }
        }

        parse_log_section(root, config.log);

        return config;

    } catch (const boost::system::system_error& e) {
        logger().error("JSON parse error: {}", e.what());
        return std::unexpected(ConfigError::PARSE_ERROR);
    } catch (const std::exception& e) {
        logger().error("Config parse error: {}", e.what());
        return std::unexpected(ConfigError::PARSE_ERROR);
    }
}

// ============================================================================
// CtlConfig
// ============================================================================

const LinkedDevice* CtlConfig::find_device(std::string_view id_or_name) const {
    for (const auto& dev : linked_devices) {
        if (dev.id == id_or_name) return &dev;
    }
    for (const auto& dev : linked_devices) {
        if (dev.name == id_or_name) return &dev;
    }
    return nullptr;
}

std::expected<CtlConfig, ConfigError> CtlConfig::load(const std::string& path) {
    auto content = read_file(path);
    if (!content) {
        return std::unexpected(content.error());
    }
    return parse(*content);
}

std::expected<CtlConfig, ConfigError> CtlConfig::parse(const std::string& json_content) {
    try {
        auto jv = json::parse(json_content);
        if (!jv.is_object()) {
            return std::unexpected(ConfigError::PARSE_ERROR);
        }
        auto& root = jv.as_object();

        CtlConfig config;

        // device section
        if (auto* dev = jsection(root, "device")) {
            config.device_id = jstr(*dev, "id");
            config.device_name = jstr(*dev, "name", config.device_name);
        }
        if (config.device_id.empty()) {
            config.device_id = generate_id();
        }

        auto mode = jstr(root, "mode");
        if (!mode.empty()) {
            auto parsed = connection_mode_from_string(mode);
            if (!parsed) {
                logger().error("Unknown connection mode '{}'", mode);
                return std::unexpected(ConfigError::INVALID_VALUE);
            }
            config.mode = *parsed;
        }

        // discovery section
        if (auto* disc = jsection(root, "discovery")) {
            if (auto v = jmillis(*disc, "timeout_ms")) config.discovery.timeout = *v;
            if (auto v = jmillis(*disc, "sweep_timeout_ms")) config.discovery.sweep_timeout = *v;
            config.discovery.sweep_port = static_cast<uint16_t>(juint(*disc, "sweep_port", config.discovery.sweep_port));
            config.discovery.advertise_port =
                static_cast<uint16_t>(juint(*disc, "advertise_port", config.discovery.advertise_port));
            config.discovery.include_local_subnets =
                jbool(*disc, "include_local_subnets", config.discovery.include_local_subnets);
            if (auto* subnets = jarray(*disc, "subnets")) {
                config.discovery.subnets.clear();
                for (const auto& item : *subnets) {
                    if (item.is_string())
                        config.discovery.subnets.emplace_back(item.as_string());
                }
            }
        }

        // relay section
        if (auto* relay = jsection(root, "relay")) {
            config.relay.host_url = jstr(*relay, "host_url");
            if (auto v = jmillis(*relay, "response_timeout_ms")) config.relay.response_timeout = *v;
            if (auto v = jmillis(*relay, "connect_timeout_ms")) config.relay.connect_timeout = *v;
        }

        if (auto v = jmillis(root, "request_timeout_ms")) config.request_timeout = *v;

        auto devices = parse_linked_devices(root);
        if (!devices) {
            return std::unexpected(devices.error());
        }
        config.linked_devices = std::move(*devices);

        parse_log_section(root, config.log);

        return config;

    } catch (const boost::system::system_error& e) {
        logger().error("JSON parse error: {}", e.what());
        return std::unexpected(ConfigError::PARSE_ERROR);
    } catch (const std::exception& e) {
        logger().error("Config parse error: {}", e.what());
        return std::unexpected(ConfigError::PARSE_ERROR);
    }
}

} // namespace voxfleet
