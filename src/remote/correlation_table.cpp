#include "remote/correlation_table.hpp"
#include "common/log.hpp"
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace voxfleet::remote {

namespace {

const log::Logger& logger() { return log::Logger::get("remote.correlation"); }

} // anonymous namespace

CorrelationTable::CorrelationTable(net::any_io_executor executor)
    : executor_(std::move(executor)) {}

std::shared_ptr<CorrelationTable::Waiter> CorrelationTable::add(
    const std::string& id, std::chrono::milliseconds timeout) {
    if (pending_.count(id)) {
        logger().warn("Duplicate commandId {}", id);
        return nullptr;
    }

    auto waiter = std::make_shared<Waiter>(executor_);
    waiter->id = id;
    waiter->timer.expires_after(timeout);
    pending_.emplace(id, waiter);
    return waiter;
}

net::awaitable<CorrelationTable::Outcome> CorrelationTable::wait(std::shared_ptr<Waiter> waiter) {
    if (!waiter) {
        co_return Outcome::CLOSED;
    }

    // resolve()/fail_all() cancel the timer; expiry means no reply came
    if (!waiter->reply && !waiter->closed) {
        boost::system::error_code ec;
        co_await waiter->timer.async_wait(net::redirect_error(net::use_awaitable, ec));
    }

    auto it = pending_.find(waiter->id);
    if (it != pending_.end() && it->second == waiter) {
        pending_.erase(it);
    }

    if (waiter->reply) {
        co_return Outcome::REPLIED;
    }
    if (waiter->closed) {
        co_return Outcome::CLOSED;
    }

    logger().debug("Command {} timed out, {} still pending", waiter->id, pending_.size());
    co_return Outcome::TIMED_OUT;
}

bool CorrelationTable::resolve(const std::string& id, CommandReply reply) {
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        logger().debug("Dropping reply for unknown or expired command {}", id);
        return false;
    }

    auto waiter = it->second;
    pending_.erase(it);
    waiter->reply = std::move(reply);
    waiter->timer.cancel();
    return true;
}

void CorrelationTable::fail_all() {
    auto pending = std::move(pending_);
    pending_.clear();
    for (auto& [id, waiter] : pending) {
        waiter->closed = true;
        waiter->timer.cancel();
    }
}

} // namespace voxfleet::remote
