#include "node/link_monitor.hpp"
#include "common/log.hpp"
#include "common/net_utils.hpp"

namespace voxfleet::node {

namespace {

const log::Logger& logger() { return log::Logger::get("node.links"); }

} // anonymous namespace

LinkMonitor::LinkMonitor(net::any_io_executor executor, HttpClient& http, DeviceRegistry& devices, Options options)
    : executor_(executor)
    , http_(http)
    , devices_(devices)
    , options_(options)
    , task_(executor) {}

void LinkMonitor::start() {
    logger().info("Checking {} linked device(s) every {}ms", devices_.devices().size(), options_.interval.count());
    trigger();
    task_.schedule_repeating(options_.interval, [this] { trigger(); });
}

void LinkMonitor::stop() {
    task_.cancel();
}

void LinkMonitor::trigger() {
    if (checking_) {
        logger().debug("Previous health round still running, skipping");
        return;
    }
    async::spawn(executor_, check_all(), "link_monitor");
}

net::awaitable<void> LinkMonitor::check_all() {
    checking_ = true;

    // Copy: set_online may be called while later checks are in flight
    auto devices = devices_.devices();
    for (const auto& device : devices) {
        if (device.url.empty()) continue;

        auto result = co_await http_.get(join_url(device.url, "/api/health"), device.access_token, options_.timeout);
        bool online = result && result->ok();
        if (!result) {
            logger().trace("{} unreachable: {}", device.id, fleet_error_message(result.error()));
        }
        devices_.set_online(device.id, online);
    }

    ++rounds_;
    checking_ = false;
}

} // namespace voxfleet::node
