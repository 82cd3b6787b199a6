#pragma once

#include "common/log.hpp"
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace voxfleet::async {

namespace net = boost::asio;

// ============================================================================
// spawn: co_spawn an awaitable, logging anything it throws
// ============================================================================
template<typename Executor>
void spawn(Executor ex, net::awaitable<void> task, std::string name) {
    net::co_spawn(
        ex,
        std::move(task),
        [name = std::move(name)](std::exception_ptr ep) {
            if (!ep) return;
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                log::get()->error("{}: Unhandled exception: {}", name, e.what());
            }
        });
}

// ============================================================================
// sleep_for: suspend the calling coroutine
// ============================================================================
inline net::awaitable<void> sleep_for(std::chrono::milliseconds duration) {
    net::steady_timer timer(co_await net::this_coro::executor, duration);
    boost::system::error_code ec;
    co_await timer.async_wait(net::redirect_error(net::use_awaitable, ec));
}

// ============================================================================
// with_timeout: race an operation against a timer, nullopt on timeout
// ============================================================================
template<typename T>
net::awaitable<std::optional<T>> with_timeout(net::awaitable<T> op, std::chrono::milliseconds timeout) {
    using namespace net::experimental::awaitable_operators;

    net::steady_timer timer(co_await net::this_coro::executor, timeout);
    auto result = co_await (std::move(op) || timer.async_wait(net::use_awaitable));

    if (result.index() == 0) {
        co_return std::get<0>(std::move(result));
    }
    co_return std::nullopt;
}

// timed_op: run an operation, false when the timer won
inline net::awaitable<bool> timed_op(net::awaitable<void> op, std::chrono::milliseconds timeout) {
    using namespace net::experimental::awaitable_operators;

    net::steady_timer timer(co_await net::this_coro::executor, timeout);
    auto result = co_await (std::move(op) || timer.async_wait(net::use_awaitable));
    co_return result.index() == 0;
}

// ============================================================================
// ScheduledTask - cancellable one-shot or repeating callback
// ============================================================================
//
// cancel() and every re-schedule bump a generation counter, so a completion
// that was already queued when the task was superseded is discarded instead
// of firing late. Callbacks run on the task's executor.
class ScheduledTask {
public:
    explicit ScheduledTask(net::any_io_executor executor);
    ~ScheduledTask();

    ScheduledTask(const ScheduledTask&) = delete;
    ScheduledTask& operator=(const ScheduledTask&) = delete;

    void schedule_once(std::chrono::milliseconds delay, std::function<void()> fn);
    void schedule_repeating(std::chrono::milliseconds interval, std::function<void()> fn);

    void cancel();

    bool active() const { return state_->active; }
    uint64_t fire_count() const { return state_->fires; }

private:
    struct State {
        explicit State(net::any_io_executor ex) : timer(ex) {}
        net::steady_timer timer;
        std::function<void()> fn;
        std::chrono::milliseconds interval{0};
        bool repeating{false};
        bool active{false};
        uint64_t generation{0};
        uint64_t fires{0};
    };

    static void arm(const std::shared_ptr<State>& state);

    std::shared_ptr<State> state_;
};

} // namespace voxfleet::async
