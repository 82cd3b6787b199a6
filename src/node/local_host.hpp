#pragma once

#include "node/services.hpp"
#include <boost/asio/any_io_executor.hpp>
#include <functional>
#include <string>
#include <unordered_map>

namespace voxfleet::node {

namespace net = boost::asio;

/**
 * LocalServer - run state of this node's voice listener.
 *
 * Connected clients are the control-channel sessions NodeApiServer
 * registers; disconnecting one closes its socket.
 *
 * The listener itself is driven through the hooks given to set_listener().
 * restart() and port changes run on the executor after the caller returns.
 */
class LocalServer : public ServerControl {
public:
    struct Listener {
        std::function<void()> stop;
        std::function<void(uint16_t port)> start;
    };

    LocalServer(net::any_io_executor executor, uint16_t port) : executor_(std::move(executor)), port_(port) {}

    void set_listener(Listener listener) { listener_ = std::move(listener); }

    bool is_running() const override { return running_; }
    uint16_t port() const override { return port_; }
    // Rebinds the listener when running
    void set_port(uint16_t port) override;
    uint32_t connected_clients() const override { return static_cast<uint32_t>(clients_.size()); }

    void stop() override;
    void restart() override;
    bool disconnect_client(const std::string& client_id) override;

    void add_client(const std::string& client_id, std::function<void()> closer);
    void remove_client(const std::string& client_id);

private:
    void close_all_clients();
    void stop_listener();
    void start_listener();

    net::any_io_executor executor_;
    Listener listener_;
    bool running_{true};
    uint16_t port_;
    std::unordered_map<std::string, std::function<void()>> clients_;
};

// Runs host commands through the shell
class SystemHostControl : public HostControl {
public:
    explicit SystemHostControl(std::function<void()> on_terminate) : on_terminate_(std::move(on_terminate)) {}

    bool run_command(const std::string& command) override;
    void terminate_process() override;

private:
    std::function<void()> on_terminate_;
};

// Headless node: cues are logged instead of played
class LoggingAudioCues : public AudioCues {
public:
    void play_completion() override;
    void start_ambience() override;
    void stop_ambience() override;

    bool ambience_playing() const { return ambience_; }

private:
    bool ambience_{false};
};

} // namespace voxfleet::node
