#pragma once

#include "common/types.hpp"
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace voxfleet::remote {

namespace net = boost::asio;

/**
 * CorrelationTable - matches replies on a shared channel to their callers.
 *
 * add() registers a commandId before the command is written; wait()
 * suspends until resolve() delivers the reply, the timeout elapses, or
 * fail_all() tears the table down. The entry is removed in every case, so a
 * reply arriving after the timeout finds nothing and is dropped.
 */
class CorrelationTable {
public:
    enum class Outcome {
        REPLIED,
        TIMED_OUT,
        CLOSED,
    };

    struct Waiter {
        explicit Waiter(net::any_io_executor ex) : timer(ex) {}
        std::string id;
        net::steady_timer timer;
        std::optional<CommandReply> reply;
        bool closed{false};
    };

    explicit CorrelationTable(net::any_io_executor executor);

    // At most one waiter per id; a duplicate id replaces nothing and returns nullptr
    std::shared_ptr<Waiter> add(const std::string& id, std::chrono::milliseconds timeout);

    net::awaitable<Outcome> wait(std::shared_ptr<Waiter> waiter);

    // False for unknown or already expired ids
    bool resolve(const std::string& id, CommandReply reply);

    // Wake every waiter with CLOSED
    void fail_all();

    size_t size() const { return pending_.size(); }
    bool contains(const std::string& id) const { return pending_.count(id) != 0; }

private:
    net::any_io_executor executor_;
    std::unordered_map<std::string, std::shared_ptr<Waiter>> pending_;
};

} // namespace voxfleet::remote
