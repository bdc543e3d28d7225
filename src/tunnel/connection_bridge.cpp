#include "connection_bridge.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <boost/asio/error.hpp>
#include <fmt/format.h>

using boost::asio::ip::tcp;

ConnectionBridge::ConnectionBridge(std::shared_ptr<DuplexStream> local,
                                   tcp::endpoint peer,
                                   ForwardSpec spec,
                                   std::shared_ptr<RemoteStreamProvider> provider,
                                   CancelToken token,
                                   OutcomeHandler done)
    : local_(std::move(local)),
      peer_(std::move(peer)),
      spec_(std::move(spec)),
      provider_(std::move(provider)),
      token_(std::move(token)),
      done_(std::move(done)) {
    upstream_.label = "local->remote";
    downstream_.label = "remote->local";
}

TaskFn ConnectionBridge::task(std::shared_ptr<DuplexStream> local,
                              tcp::endpoint peer,
                              ForwardSpec spec,
                              std::shared_ptr<RemoteStreamProvider> provider) {
    return [local, peer, spec, provider](CancelToken token, OutcomeHandler done) {
        auto bridge = std::make_shared<ConnectionBridge>(local, peer, spec, provider,
                                                         std::move(token), std::move(done));
        bridge->start();
    };
}

void ConnectionBridge::start() {
    auto self = shared_from_this();
    if (token_.cancelled()) {
        finish(TaskOutcome::Ok());
        return;
    }
    cancel_subscription_ = token_.on_cancel([self]() {
        if (self->finished_) return;
        log_debug(fmt::format("Connection {} -> {}: cancelled", endpoint_string(self->peer_),
                              self->spec_.target()));
        self->finish(TaskOutcome::Ok());
    });

    log_debug(fmt::format("Connection {} -> {}: opening remote stream via {}",
                          endpoint_string(peer_), spec_.target(), provider_->name()));
    provider_->async_open(spec_.pod_name, spec_.pod_namespace, spec_.remote_port,
        [self](Result<std::shared_ptr<DuplexStream>> result) {
            self->on_remote_opened(std::move(result));
        });
}

void ConnectionBridge::on_remote_opened(Result<std::shared_ptr<DuplexStream>> result) {
    if (finished_) {
        // Cancelled while the open was in flight.
        if (result.is_ok() && result.value) result.value->close();
        return;
    }
    if (result.is_err() || !result.value) {
        finish(TaskOutcome::Err(ErrorKind::RemoteStreamUnavailable,
                                fmt::format("{}: {}", spec_.target(),
                                            result.is_err() ? result.error : "no stream")));
        return;
    }

    remote_ = result.value;
    log_debug(fmt::format("Connection {} -> {}: bridging to {}", endpoint_string(peer_),
                          spec_.target(), remote_->describe()));

    upstream_.from = local_;
    upstream_.to = remote_;
    upstream_.buffer.resize(BRIDGE_BUF_SIZE);
    downstream_.from = remote_;
    downstream_.to = local_;
    downstream_.buffer.resize(BRIDGE_BUF_SIZE);

    pump(upstream_);
    pump(downstream_);
}

void ConnectionBridge::pump(Direction& dir) {
    auto self = shared_from_this();
    dir.from->async_read_some(boost::asio::buffer(dir.buffer),
        [self, &dir](const boost::system::error_code& ec, std::size_t n) {
            if (self->finished_) return;
            if (n > 0) {
                // Deliver what was read before looking at the error.
                self->write_all(dir, 0, n);
                return;
            }
            if (ec == boost::asio::error::eof) {
                dir.done = true;
                dir.to->shutdown_send();
                if (self->upstream_.done && self->downstream_.done)
                    self->finish(TaskOutcome::Ok());
                return;
            }
            if (ec) {
                self->on_io_error(dir, ec);
                return;
            }
            self->pump(dir);
        });
}

void ConnectionBridge::write_all(Direction& dir, std::size_t offset, std::size_t length) {
    auto self = shared_from_this();
    dir.to->async_write_some(boost::asio::buffer(dir.buffer.data() + offset, length - offset),
        [self, &dir, offset, length](const boost::system::error_code& ec, std::size_t n) {
            if (self->finished_) return;
            if (ec) {
                self->on_io_error(dir, ec);
                return;
            }
            dir.total += n;
            if (offset + n < length) {
                self->write_all(dir, offset + n, length);
            } else {
                self->pump(dir);
            }
        });
}

void ConnectionBridge::on_io_error(Direction& dir, const boost::system::error_code& ec) {
    if (is_benign_disconnect(ec)) {
        log_debug(fmt::format("Connection {} -> {}: {} ended ({})", endpoint_string(peer_),
                              spec_.target(), dir.label, ec.message()));
        finish(TaskOutcome::Ok());
        return;
    }
    finish(TaskOutcome::Err(ErrorKind::StreamIo,
                            fmt::format("{} {}: {}", spec_.target(), dir.label, ec.message())));
}

void ConnectionBridge::finish(TaskOutcome outcome) {
    if (finished_) return;
    finished_ = true;

    token_.unsubscribe(cancel_subscription_);
    cancel_subscription_ = 0;
    local_->close();
    if (remote_) remote_->close();

    log_debug(fmt::format("Connection {} -> {}: closed ({} bytes up, {} bytes down, {})",
                          endpoint_string(peer_), spec_.target(), upstream_.total,
                          downstream_.total, outcome.describe()));

    auto done = std::move(done_);
    done_ = nullptr;
    if (done) done(std::move(outcome));
}
