#include "interrupt_watcher.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <csignal>
#include <cstring>

InterruptWatcher::InterruptWatcher(Supervisor& supervisor, CancelToken token, OutcomeHandler done)
    : supervisor_(supervisor),
      token_(std::move(token)),
      done_(std::move(done)),
      signals_(supervisor.io()) {}

TaskFn InterruptWatcher::task(Supervisor& supervisor) {
    return [&supervisor](CancelToken token, OutcomeHandler done) {
        auto watcher = std::make_shared<InterruptWatcher>(supervisor, std::move(token), std::move(done));
        watcher->start();
    };
}

void InterruptWatcher::start() {
    auto self = shared_from_this();
    boost::system::error_code ec;
    signals_.add(SIGINT, ec);
    if (!ec) signals_.add(SIGTERM, ec);
    if (ec) {
        log_warn(fmt::format("Cannot watch for interrupts: {}", ec.message()));
    }

    cancel_subscription_ = token_.on_cancel([self]() { self->finish(); });

    signals_.async_wait([self](const boost::system::error_code& ec, int signo) {
        if (ec || self->finished_) return;
        log_info(fmt::format("Received {}, shutting down gracefully", strsignal(signo)));
        self->supervisor_.shutdown();
        self->finish();
    });
}

void InterruptWatcher::finish() {
    if (finished_) return;
    finished_ = true;
    token_.unsubscribe(cancel_subscription_);
    boost::system::error_code ec;
    signals_.cancel(ec);
    signals_.clear(ec);

    auto done = std::move(done_);
    done_ = nullptr;
    if (done) done(TaskOutcome::Ok());
}
