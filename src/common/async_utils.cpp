#include "common/async_utils.hpp"

namespace voxfleet::async {

ScheduledTask::ScheduledTask(net::any_io_executor executor)
    : state_(std::make_shared<State>(std::move(executor))) {}

ScheduledTask::~ScheduledTask() {
    cancel();
}

void ScheduledTask::schedule_once(std::chrono::milliseconds delay, std::function<void()> fn) {
    cancel();
    state_->fn = std::move(fn);
    state_->interval = delay;
    state_->repeating = false;
    state_->active = true;
    arm(state_);
}

void ScheduledTask::schedule_repeating(std::chrono::milliseconds interval, std::function<void()> fn) {
    cancel();
    state_->fn = std::move(fn);
    state_->interval = interval;
    state_->repeating = true;
    state_->active = true;
    arm(state_);
}

void ScheduledTask::cancel() {
    ++state_->generation;
    state_->active = false;
    state_->timer.cancel();
}

void ScheduledTask::arm(const std::shared_ptr<State>& state) {
    const uint64_t gen = state->generation;
    state->timer.expires_after(state->interval);
    state->timer.async_wait(
        [weak = std::weak_ptr<State>(state), gen](const boost::system::error_code& ec) {
            if (ec == net::error::operation_aborted) return;

            auto s = weak.lock();
            if (!s || s->generation != gen || !s->active) return;

            ++s->fires;
            auto fn = s->fn;
            if (s->repeating) {
                arm(s);
            } else {
                s->active = false;
            }

            // May cancel or re-schedule this task
            if (fn) fn();
        });
}

} // namespace voxfleet::async
