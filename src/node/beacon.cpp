#include "node/beacon.hpp"
#include "common/log.hpp"
#include <boost/json.hpp>

namespace voxfleet::node {

namespace {

const log::Logger& logger() { return log::Logger::get("node.beacon"); }

} // anonymous namespace

AdvertisementBeacon::AdvertisementBeacon(net::any_io_executor executor, Options options)
    : options_(std::move(options))
    , socket_(executor)
    , task_(executor) {}

AdvertisementBeacon::~AdvertisementBeacon() {
    stop();
}

std::string AdvertisementBeacon::payload() const {
    boost::json::object obj;
    obj["service"] = "voxfleet";
    obj["deviceId"] = options_.device_id;
    obj["deviceName"] = options_.device_name;
    obj["port"] = options_.api_port;
    return boost::json::serialize(obj);
}

bool AdvertisementBeacon::start() {
    boost::system::error_code ec;
    socket_.open(net::ip::udp::v4(), ec);
    if (!ec) socket_.set_option(net::socket_base::broadcast(true), ec);
    if (ec) {
        logger().warn("Cannot open broadcast socket: {}", ec.message());
        socket_.close(ec);
        return false;
    }

    logger().info("Advertising {} on UDP {} every {}ms", options_.device_id,
                  options_.advertise_port, options_.interval.count());
    announce();
    task_.schedule_repeating(options_.interval, [this] { announce(); });
    return true;
}

void AdvertisementBeacon::stop() {
    task_.cancel();
    if (socket_.is_open()) {
        boost::system::error_code ec;
        socket_.close(ec);
    }
}

void AdvertisementBeacon::announce() {
    auto data = payload();
    net::ip::udp::endpoint to(net::ip::address_v4::broadcast(), options_.advertise_port);

    boost::system::error_code ec;
    socket_.send_to(net::buffer(data), to, 0, ec);
    if (ec) {
        logger().debug("Announcement failed: {}", ec.message());
        return;
    }
    ++sent_;
}

} // namespace voxfleet::node
