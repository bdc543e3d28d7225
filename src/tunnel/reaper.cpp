#include "reaper.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

Reaper::Reaper(Supervisor& supervisor, std::chrono::milliseconds interval,
               CancelToken token, OutcomeHandler done)
    : supervisor_(supervisor),
      interval_(interval),
      token_(std::move(token)),
      done_(std::move(done)),
      timer_(supervisor.io()) {}

TaskFn Reaper::task(Supervisor& supervisor, std::chrono::milliseconds interval) {
    return [&supervisor, interval](CancelToken token, OutcomeHandler done) {
        auto reaper = std::make_shared<Reaper>(supervisor, interval, std::move(token), std::move(done));
        reaper->start();
    };
}

void Reaper::start() {
    auto self = shared_from_this();
    cancel_subscription_ = token_.on_cancel([self]() { self->finish(); });
    if (!finished_) schedule();
}

void Reaper::schedule() {
    auto self = shared_from_this();
    timer_.expires_after(interval_);
    timer_.async_wait([self](const boost::system::error_code& ec) {
        if (ec || self->finished_) return;
        self->reap();
        self->schedule();
    });
}

void Reaper::reap() {
    for (const auto& task : supervisor_.drain_completed()) {
        ++reaped_;
        if (task.outcome.is_err()) {
            log_warn(fmt::format("{}: {}", task.name, task.outcome.describe()));
        }
    }
}

void Reaper::finish() {
    if (finished_) return;
    finished_ = true;
    token_.unsubscribe(cancel_subscription_);
    timer_.cancel();
    reap();
    log_debug(fmt::format("Reaper: stopped after reaping {} connection(s)", reaped_));

    auto done = std::move(done_);
    done_ = nullptr;
    if (done) done(TaskOutcome::Ok());
}
