#include "node/local_host.hpp"
#include "common/log.hpp"
#include <boost/asio/post.hpp>
#include <cstdlib>

#ifndef _WIN32
#include <sys/wait.h>
#endif

namespace voxfleet::node {

namespace {

const log::Logger& logger() { return log::Logger::get("node.host"); }

} // anonymous namespace

// ============================================================================
// LocalServer
// ============================================================================

void LocalServer::close_all_clients() {
    auto clients = std::move(clients_);
    clients_.clear();
    for (auto& [id, closer] : clients) {
        if (closer) closer();
    }
}

void LocalServer::stop_listener() {
    if (listener_.stop) listener_.stop();
}

void LocalServer::start_listener() {
    if (listener_.start) listener_.start(port_);
}

void LocalServer::stop() {
    if (!running_) return;
    logger().info("Stopping server on port {} ({} client(s))", port_, clients_.size());
    running_ = false;
    close_all_clients();
    stop_listener();
}

void LocalServer::restart() {
    logger().info("Restarting server on port {}", port_);
    running_ = true;
    net::post(executor_, [this] {
        close_all_clients();
        stop_listener();
        if (running_) start_listener();
    });
}

void LocalServer::set_port(uint16_t port) {
    if (port == port_) return;
    port_ = port;
    if (!running_) return;

    logger().info("Moving listener to port {}", port_);
    net::post(executor_, [this] {
        stop_listener();
        if (running_) start_listener();
    });
}

bool LocalServer::disconnect_client(const std::string& client_id) {
    auto it = clients_.find(client_id);
    if (it == clients_.end()) {
        return false;
    }
    auto closer = std::move(it->second);
    clients_.erase(it);
    logger().info("Disconnecting client {}", client_id);
    if (closer) closer();
    return true;
}

void LocalServer::add_client(const std::string& client_id, std::function<void()> closer) {
    clients_[client_id] = std::move(closer);
}

void LocalServer::remove_client(const std::string& client_id) {
    clients_.erase(client_id);
}

// ============================================================================
// SystemHostControl
// ============================================================================

bool SystemHostControl::run_command(const std::string& command) {
    if (command.empty()) {
        return false;
    }

    int status = std::system(command.c_str());
    if (status == -1) {
        logger().error("Could not start '{}'", command);
        return false;
    }
#ifndef _WIN32
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        logger().error("'{}' exited with status {}", command, WIFEXITED(status) ? WEXITSTATUS(status) : -1);
        return false;
    }
#else
    if (status != 0) {
        logger().error("'{}' exited with status {}", command, status);
        return false;
    }
#endif
    return true;
}

void SystemHostControl::terminate_process() {
    logger().info("Terminating");
    if (on_terminate_) {
        on_terminate_();
    }
}

// ============================================================================
// LoggingAudioCues
// ============================================================================

void LoggingAudioCues::play_completion() {
    logger().info("Cue: transfer complete");
}

void LoggingAudioCues::start_ambience() {
    ambience_ = true;
    logger().info("Cue: waiting-room ambience started");
}

void LoggingAudioCues::stop_ambience() {
    if (ambience_) {
        logger().info("Cue: waiting-room ambience stopped");
    }
    ambience_ = false;
}

} // namespace voxfleet::node
