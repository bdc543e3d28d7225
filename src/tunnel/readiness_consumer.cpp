#include "readiness_consumer.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

ReadinessConsumer::ReadinessConsumer(Supervisor& supervisor, std::shared_ptr<Readiness> ready,
                                     TaskHandle forwarder, std::shared_ptr<TunnelSession> session,
                                     CancelToken token, OutcomeHandler done)
    : supervisor_(supervisor),
      ready_(std::move(ready)),
      forwarder_(std::move(forwarder)),
      session_(std::move(session)),
      token_(std::move(token)),
      done_(std::move(done)) {}

TaskFn ReadinessConsumer::task(Supervisor& supervisor, std::shared_ptr<Readiness> ready,
                               TaskHandle forwarder, std::shared_ptr<TunnelSession> session) {
    return [&supervisor, ready, forwarder, session](CancelToken token, OutcomeHandler done) {
        auto consumer = std::make_shared<ReadinessConsumer>(supervisor, ready, forwarder, session,
                                                            std::move(token), std::move(done));
        consumer->start();
    };
}

void ReadinessConsumer::start() {
    auto self = shared_from_this();
    cancel_subscription_ = token_.on_cancel([self]() {
        if (self->finished_) return;
        if (self->session_started_) self->session_->cancel();
        else self->finish(TaskOutcome::Ok());
    });
    ready_->async_wait([self](Result<boost::asio::ip::tcp::endpoint> bound) {
        self->on_ready(std::move(bound));
    });
}

void ReadinessConsumer::on_ready(Result<boost::asio::ip::tcp::endpoint> bound) {
    if (finished_ || session_started_) return;
    if (bound.is_err()) {
        finish(TaskOutcome::Err(ErrorKind::ReadinessLost, bound.error));
        return;
    }

    log_debug(fmt::format("Tunnel ready on {}:{}", bound.value.address().to_string(), bound.value.port()));
    session_started_ = true;
    auto self = shared_from_this();
    session_->start(bound.value, [self](TaskOutcome outcome) { self->on_session_done(std::move(outcome)); });
}

void ReadinessConsumer::on_session_done(TaskOutcome outcome) {
    if (outcome.is_err() && token_.cancelled()) {
        log_debug(fmt::format("Session ended after cancellation: {}", outcome.describe()));
        finish(TaskOutcome::Ok());
        return;
    }
    finish(std::move(outcome));
}

void ReadinessConsumer::finish(TaskOutcome outcome) {
    if (finished_) return;
    finished_ = true;
    token_.unsubscribe(cancel_subscription_);

    forwarder_.cancel();
    supervisor_.shutdown();

    auto done = std::move(done_);
    done_ = nullptr;
    if (done) done(std::move(outcome));
}
