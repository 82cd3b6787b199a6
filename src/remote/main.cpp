#include "common/config.hpp"
#include "common/http_client.hpp"
#include "common/log.hpp"
#include "remote/command_router.hpp"
#include "remote/direct_transport.hpp"
#include "remote/peer_discovery.hpp"
#include "remote/relay_transport.hpp"
#include "common/async_utils.hpp"
#include <boost/asio.hpp>
#include <charconv>
#include <iostream>
#include <string>
#include <vector>

using namespace voxfleet;

void print_usage(const char* prog) {
    std::cout << "VoxFleet Remote Control\n\n"
              << "Usage:\n"
              << "  " << prog << " [options] send <peer> <command> [key=value...]\n"
              << "  " << prog << " [options] discover <peer>\n"
              << "  " << prog << " [options] commands\n\n"
              << "Options:\n"
              << "  -c, --config <file>   Config file (linked devices, discovery, relay)\n"
              << "  -m, --mode <mode>     Connection mode (auto|tunnel|direct|hybrid)\n"
              << "  -l, --log-level <lvl> Log level (trace|debug|info|warn|error)\n"
              << "  -y, --yes             Do not ask before disruptive commands\n"
              << "  -q, --quiet           Suppress log output\n"
              << "  -h, --help            Show help\n\n"
              << "Values: true/false become booleans, digits become numbers,\n"
              << "{...} is parsed as JSON, anything else is a string.\n\n"
              << "Examples:\n"
              << "  " << prog << " -c ctl.json send studio get_status\n"
              << "  " << prog << " -c ctl.json -m hybrid send studio pause_rooms\n"
              << "  " << prog << " -c ctl.json send studio update_settings 'settings={\"serverPort\":3100}'\n"
              << std::endl;
}

namespace {

json::value parse_param_value(const std::string& text) {
    if (text == "true") return true;
    if (text == "false") return false;

    int64_t number = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), number);
    if (ec == std::errc() && ptr == text.data() + text.size() && !text.empty()) {
        return number;
    }

    if (!text.empty() && (text.front() == '{' || text.front() == '[')) {
        boost::system::error_code jec;
        auto jv = json::parse(text, jec);
        if (!jec) return jv;
    }
    return json::string(text);
}

bool confirm(RemoteCommand command, const LinkedDevice& peer) {
    std::cout << "'" << remote_command_name(command) << "' disrupts users on "
              << (peer.name.empty() ? peer.id : peer.name) << ". Proceed? [y/N] " << std::flush;
    std::string answer;
    std::getline(std::cin, answer);
    return answer == "y" || answer == "Y" || answer == "yes";
}

int list_commands() {
    for (auto command : ALL_REMOTE_COMMANDS) {
        std::cout << "  " << remote_command_name(command)
                  << (requires_confirmation(command) ? "  (asks for confirmation)" : "") << "\n";
    }
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::string config_file;
    std::string mode_override;
    std::string level_override;
    bool quiet = false;
    bool assume_yes = false;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) config_file = argv[++i];
        } else if (arg == "-m" || arg == "--mode") {
            if (i + 1 < argc) mode_override = argv[++i];
        } else if (arg == "-l" || arg == "--log-level") {
            if (i + 1 < argc) level_override = argv[++i];
        } else if (arg == "-y" || arg == "--yes") {
            assume_yes = true;
        } else if (arg == "-q" || arg == "--quiet") {
            quiet = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    if (args[0] == "commands") {
        return list_commands();
    }

    CtlConfig config;
    if (!config_file.empty()) {
        auto loaded = CtlConfig::load(config_file);
        if (!loaded) {
            std::cerr << "Error: " << config_error_message(loaded.error()) << ": " << config_file << "\n";
            return 1;
        }
        config = std::move(*loaded);
    }
    if (config.device_id.empty()) {
        config.device_id = generate_id();
    }

    // Logging
    auto log_config = log::apply_env(config.log.to_log_config());
    if (!level_override.empty()) {
        log_config.level = log::parse_level(level_override);
    }
    if (quiet) {
        log_config.level = log::Level::Off;
    }
    log::init(log_config);

    if (!mode_override.empty()) {
        auto mode = connection_mode_from_string(mode_override);
        if (!mode) {
            std::cerr << "Error: Unknown mode '" << mode_override << "'\n";
            return 1;
        }
        config.mode = *mode;
    }

    bool is_send = args[0] == "send";
    bool is_discover = args[0] == "discover";
    if ((!is_send && !is_discover) || (is_send && args.size() < 3) || (is_discover && args.size() < 2)) {
        print_usage(argv[0]);
        return 1;
    }

    const LinkedDevice* peer = config.find_device(args[1]);
    if (!peer) {
        std::cerr << "Error: No linked device named '" << args[1] << "'\n";
        return 1;
    }

    std::optional<RemoteCommand> command;
    json::object params;
    if (is_send) {
        command = remote_command_from_string(args[2]);
        if (!command) {
            std::cerr << "Error: Unknown command '" << args[2] << "' (see '" << argv[0] << " commands')\n";
            return 1;
        }
        for (size_t i = 3; i < args.size(); ++i) {
            auto eq = args[i].find('=');
            if (eq == std::string::npos || eq == 0) {
                std::cerr << "Error: Expected key=value, got '" << args[i] << "'\n";
                return 1;
            }
            params[args[i].substr(0, eq)] = parse_param_value(args[i].substr(eq + 1));
        }
        if (requires_confirmation(*command) && !assume_yes && !confirm(*command, *peer)) {
            std::cout << "Cancelled.\n";
            return 1;
        }
    }

    boost::asio::io_context ioc;
    HttpClient http(ioc.get_executor());

    remote::HttpIdentityChecker checker(http);
    remote::PeerDiscovery::Options discovery_options;
    discovery_options.timeout = config.discovery.timeout;
    discovery_options.sweep_timeout = config.discovery.sweep_timeout;
    discovery_options.sweep_port = config.discovery.sweep_port;
    discovery_options.advertise_port = config.discovery.advertise_port;
    discovery_options.subnets = config.discovery.subnets;
    discovery_options.include_local_subnets = config.discovery.include_local_subnets;
    remote::PeerDiscovery discovery(ioc.get_executor(), checker, discovery_options);

    remote::DirectTransport local_direct(http, remote::DirectTransport::Kind::LOCAL_DIRECT, config.request_timeout);
    remote::DirectTransport registration(http, remote::DirectTransport::Kind::REGISTRATION, config.request_timeout);

    remote::RelayTransport::Options relay_options;
    relay_options.local_device_id = config.device_id;
    relay_options.relay_host_url = config.relay.host_url;
    relay_options.response_timeout = config.relay.response_timeout;
    relay_options.connect_timeout = config.relay.connect_timeout;
    relay_options.request_timeout = config.request_timeout;
    remote::RelayTransport relay(ioc, http, relay_options);

    remote::RemoteCommandRouter router(
        {config.device_id, config.device_name}, discovery, local_direct, relay, registration, config.mode);

    int exit_code = 1;
    LinkedDevice target = *peer;

    auto run = [&]() -> boost::asio::awaitable<void> {
        if (is_discover) {
            auto address = co_await router.discover(target);
            if (address) {
                std::cout << target.id << " reachable at " << *address << "\n";
                exit_code = 0;
            } else {
                std::cout << target.id << " not found on the local network\n";
            }
            co_return;
        }

        LOG_INFO("Sending {} to {} ({})", remote_command_name(*command), target.id,
                 connection_mode_label(router.mode()));
        auto reply = co_await router.send_command(target, *command, std::move(params));
        relay.close();

        std::cout << (reply.success ? "OK" : "FAILED");
        if (!reply.result.empty()) {
            std::cout << ": " << reply.result;
        }
        std::cout << "\n";
        exit_code = reply.success ? 0 : 2;
    };

    async::spawn(ioc.get_executor(), run(), "ctl");
    ioc.run();

    log::shutdown();
    return exit_code;
}
