#pragma once

#include "common/async_utils.hpp"
#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <string>

namespace voxfleet::node {

namespace net = boost::asio;

// Announces this node on the local network so remote controllers can
// resolve its address without a subnet scan.
class AdvertisementBeacon {
public:
    struct Options {
        std::string device_id;
        std::string device_name;
        uint16_t api_port = 3000;
        uint16_t advertise_port = 41234;
        std::chrono::milliseconds interval{5000};
    };

    AdvertisementBeacon(net::any_io_executor executor, Options options);
    ~AdvertisementBeacon();

    // Opens the broadcast socket and sends the first announcement immediately
    bool start();
    void stop();

    bool running() const { return task_.active(); }
    uint64_t sent() const { return sent_; }

    // {"service":"voxfleet","deviceId":...,"deviceName":...,"port":...}
    std::string payload() const;

private:
    void announce();

    Options options_;
    net::ip::udp::socket socket_;
    async::ScheduledTask task_;
    uint64_t sent_{0};
};

} // namespace voxfleet::node
