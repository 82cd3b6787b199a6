#include "common/async_utils.hpp"
#include "common/config.hpp"
#include "common/http_client.hpp"
#include "common/log.hpp"
#include "node/api_server.hpp"
#include "node/beacon.hpp"
#include "node/command_executor.hpp"
#include "node/exit_orchestrator.hpp"
#include "node/fleet_api.hpp"
#include "node/link_monitor.hpp"
#include "node/local_host.hpp"
#include "node/room_directory.hpp"
#include <boost/asio.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <functional>
#include <iostream>
#include <string>

using namespace voxfleet;
using namespace voxfleet::node;

void print_usage(const char* prog) {
    std::cout << "VoxFleet Node\n\n"
              << "Usage:\n"
              << "  " << prog << " -c <config.json>     Start node\n\n"
              << "Options:\n"
              << "  -c, --config <file>   Config file\n"
              << "  -l, --log-level <lvl> Log level (trace|debug|info|warn|error)\n"
              << "  -q, --quiet           Suppress log output\n"
              << "  -h, --help            Show help\n\n"
              << "Signals:\n"
              << "  SIGINT/SIGTERM once   Graceful exit (rooms are moved first)\n"
              << "  SIGINT/SIGTERM twice  Exit without moving rooms\n\n"
              << "Examples:\n"
              << "  " << prog << " -c /etc/voxfleet/node.json\n"
              << "  VOXFLEET_LOG_LEVEL=debug " << prog << " -c node.json\n"
              << std::endl;
}

// The node is useless without its API, so a bind failure ends the process
static boost::asio::awaitable<void> run_api(NodeApiServer& api, boost::asio::io_context& ioc) {
    try {
        co_await api.run();
    } catch (const boost::system::system_error& e) {
        LOG_CRITICAL("API server failed: {}", e.what());
        ioc.stop();
    }
}

// A failed rebind keeps the node up; RESTART_SERVER can try again
static boost::asio::awaitable<void> rerun_api(NodeApiServer& api, uint16_t port) {
    try {
        co_await api.run();
    } catch (const boost::system::system_error& e) {
        LOG_ERROR("API server could not listen on port {}: {}", port, e.what());
    }
}

int main(int argc, char* argv[]) {
    std::string config_file;
    std::string level_override;
    bool quiet = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) config_file = argv[++i];
        } else if (arg == "-l" || arg == "--log-level") {
            if (i + 1 < argc) level_override = argv[++i];
        } else if (arg == "-q" || arg == "--quiet") {
            quiet = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (config_file.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    auto loaded = NodeConfig::load(config_file);
    if (!loaded) {
        std::cerr << "Error: " << config_error_message(loaded.error()) << ": " << config_file << "\n";
        return 1;
    }
    NodeConfig config = std::move(*loaded);
    if (config.device_id.empty()) {
        config.device_id = generate_id();
    }

    auto log_config = log::apply_env(config.log.to_log_config());
    if (!level_override.empty()) {
        log_config.level = log::parse_level(level_override);
    }
    if (quiet) {
        log_config.level = log::Level::Off;
    }
    log::init(log_config);

    try {
        boost::asio::io_context ioc;
        auto executor = ioc.get_executor();

        HttpClient http(executor);

        // Local state
        InMemoryRoomDirectory rooms(config.rooms);
        InMemoryDeviceRegistry devices(config.linked_devices);
        LocalServer server(executor, config.port);
        LoggingAudioCues audio;

        NodeApiServer* api_ptr = nullptr;
        AdvertisementBeacon* beacon_ptr = nullptr;
        LinkMonitor* monitor_ptr = nullptr;
        SystemHostControl host([&] {
            if (api_ptr) api_ptr->stop();
            if (beacon_ptr) beacon_ptr->stop();
            if (monitor_ptr) monitor_ptr->stop();
            ioc.stop();
        });

        HttpFleetApi::Options fleet_options;
        fleet_options.device_id = config.device_id;
        fleet_options.server_name = config.federation.server_name.empty()
            ? config.device_name : config.federation.server_name;
        fleet_options.discovery_url = config.federation.discovery_url;
        fleet_options.local_server_url = config.exit.local_server_url.empty()
            ? config.self_url() : config.exit.local_server_url;
        fleet_options.local_token = config.access_token;
        HttpFleetApi fleet(executor, http, fleet_options);

        ExitOrchestrator::Options exit_options;
        exit_options.device_id = config.device_id;
        exit_options.waiting_room_timeout = config.exit.waiting_room_timeout;
        exit_options.auto_move_interval = config.exit.auto_move_interval;
        exit_options.shutdown_grace = config.exit.shutdown_grace;
        exit_options.exit_delay = config.exit.exit_delay;
        exit_options.default_option = config.exit.default_option;
        exit_options.allow_dangerous_default = config.exit.allow_dangerous_default;
        exit_options.reboot_command = config.exit.reboot_command;
        exit_options.privileged_reboot_command = config.exit.privileged_reboot_command;
        ExitOrchestrator orchestrator(executor, rooms, devices, server, audio, host, fleet, exit_options);

        orchestrator.set_progress_listener([](const ExitProgress& progress) {
            if (progress.phase == ExitPhase::ERROR) {
                LOG_ERROR("Exit: {}", progress.message);
            } else {
                LOG_INFO("Exit: {}", progress.description());
            }
        });

        CommandExecutor commands(orchestrator, rooms, server, config.remote_control_enabled);

        NodeApiServer::Options api_options;
        api_options.bind_address = config.bind_address;
        api_options.tls = config.tls;
        api_options.cert_file = config.cert_file;
        api_options.key_file = config.key_file;
        api_options.access_token = config.access_token;
        api_options.device_id = config.device_id;
        api_options.device_name = config.device_name;
        NodeApiServer api(ioc, api_options, rooms, server, commands);
        api_ptr = &api;
        server.set_listener({
            [&api] { api.stop(); },
            [&api, executor](uint16_t port) { async::spawn(executor, rerun_api(api, port), "api_server"); },
        });

        AdvertisementBeacon::Options beacon_options;
        beacon_options.device_id = config.device_id;
        beacon_options.device_name = config.device_name;
        beacon_options.api_port = config.port;
        beacon_options.advertise_port = config.advertise.port;
        beacon_options.interval = config.advertise.interval;
        AdvertisementBeacon beacon(executor, beacon_options);
        beacon_ptr = &beacon;

        LinkMonitor::Options monitor_options;
        monitor_options.interval = config.health.interval;
        monitor_options.timeout = config.health.timeout;
        LinkMonitor monitor(executor, http, devices, monitor_options);
        monitor_ptr = &monitor;

        // First signal starts the exit flow, any later one leaves at once
        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        int signal_count = 0;
        std::function<void(boost::system::error_code, int)> on_signal;
        on_signal = [&](boost::system::error_code ec, int signal_number) {
            if (ec) return;
            ++signal_count;
            LOG_INFO("Received signal {}", signal_number);

            if (signal_count == 1 && !orchestrator.is_exit_in_progress()) {
                orchestrator.initiate_exit();
                if (orchestrator.progress().phase == ExitPhase::SHOWING_OPTIONS) {
                    LOG_WARN("{} active room(s) waiting for an exit choice; "
                             "signal again to exit without moving them",
                             orchestrator.active_hosted_rooms().size());
                    for (auto option : ALL_EXIT_OPTIONS) {
                        LOG_INFO("  {}: {}", exit_option_name(option), exit_option_summary(option));
                    }
                }
            } else {
                orchestrator.handle_option(ExitOption::JUST_EXIT);
            }
            signals.async_wait(on_signal);
        };
        signals.async_wait(on_signal);

        LOG_INFO("Node {} ({}) starting, {} room(s), {} linked device(s)",
                 config.device_name, config.device_id, config.rooms.size(), config.linked_devices.size());

        async::spawn(executor, run_api(api, ioc), "api_server");
        if (config.advertise.enabled) {
            beacon.start();
        }
        if (!config.linked_devices.empty()) {
            monitor.start();
        }

        ioc.run();

        LOG_INFO("Node stopped");
        log::shutdown();
        return 0;

    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        log::shutdown();
        return 1;
    }
}
