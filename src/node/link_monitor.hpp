#pragma once

#include "common/async_utils.hpp"
#include "common/http_client.hpp"
#include "node/services.hpp"
#include <boost/asio.hpp>
#include <chrono>

namespace voxfleet::node {

/**
 * LinkMonitor - keeps DeviceRegistry's online flags current.
 *
 * Every interval each linked device gets GET /api/health with its stored
 * token; a 2xx marks it online, anything else (including transport errors)
 * offline. A round that is still running when the next one is due is skipped.
 */
class LinkMonitor {
public:
    struct Options {
        std::chrono::milliseconds interval{30000};
        std::chrono::milliseconds timeout{5000};
    };

    LinkMonitor(net::any_io_executor executor, HttpClient& http, DeviceRegistry& devices, Options options);

    // First round runs immediately
    void start();
    void stop();

    // One pass over every linked device
    net::awaitable<void> check_all();

    uint64_t rounds() const { return rounds_; }

private:
    void trigger();

    net::any_io_executor executor_;
    HttpClient& http_;
    DeviceRegistry& devices_;
    Options options_;
    async::ScheduledTask task_;
    bool checking_{false};
    uint64_t rounds_{0};
};

} // namespace voxfleet::node
