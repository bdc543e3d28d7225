#include "listener.hpp"
#include "connection_bridge.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <boost/asio/error.hpp>
#include <fmt/format.h>

using boost::asio::ip::tcp;

Listener::Listener(Supervisor& supervisor,
                   ForwardSpec spec,
                   std::shared_ptr<RemoteStreamProvider> provider,
                   ReadyCallback on_ready,
                   CancelToken token,
                   OutcomeHandler done)
    : supervisor_(supervisor),
      spec_(std::move(spec)),
      provider_(std::move(provider)),
      on_ready_(std::move(on_ready)),
      token_(std::move(token)),
      done_(std::move(done)),
      acceptor_(supervisor.io()) {}

TaskFn Listener::task(Supervisor& supervisor,
                      ForwardSpec spec,
                      std::shared_ptr<RemoteStreamProvider> provider,
                      ReadyCallback on_ready) {
    return [&supervisor, spec, provider, on_ready](CancelToken token, OutcomeHandler done) {
        auto listener = std::make_shared<Listener>(supervisor, spec, provider, on_ready,
                                                   std::move(token), std::move(done));
        listener->start();
    };
}

void Listener::start() {
    if (token_.cancelled()) {
        on_ready_ = nullptr;
        finish(TaskOutcome::Ok());
        return;
    }

    const auto& requested = spec_.local_bind_address;
    boost::system::error_code ec;
    acceptor_.open(requested.protocol(), ec);
    if (!ec) acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    if (!ec) acceptor_.bind(requested, ec);
    if (!ec) acceptor_.listen(LISTEN_BACKLOG, ec);
    if (!ec) bound_ = acceptor_.local_endpoint(ec);
    if (ec) {
        on_ready_ = nullptr;
        finish(TaskOutcome::Err(ErrorKind::BindFailed,
                                fmt::format("cannot listen on {}: {}",
                                            endpoint_string(requested), ec.message())));
        return;
    }

    log_info(fmt::format("Forwarding from: {} -> {}", endpoint_string(bound_), spec_.target()));

    auto ready = std::move(on_ready_);
    on_ready_ = nullptr;
    if (ready) ready(bound_);

    auto self = shared_from_this();
    cancel_subscription_ = token_.on_cancel([self]() {
        if (self->finished_) return;
        log_debug(fmt::format("Listener {}: stopping after {} connection(s)",
                              endpoint_string(self->bound_), self->accepted_));
        self->finish(TaskOutcome::Ok());
    });

    accept_next();
}

void Listener::accept_next() {
    auto self = shared_from_this();
    acceptor_.async_accept([self](const boost::system::error_code& ec, tcp::socket socket) {
        self->on_accept(ec, std::move(socket));
    });
}

void Listener::on_accept(const boost::system::error_code& ec, tcp::socket socket) {
    if (finished_) return;

    if (ec == boost::asio::error::connection_aborted) {
        // Client gave up between SYN and accept.
        accept_next();
        return;
    }
    if (ec) {
        finish(TaskOutcome::Err(ErrorKind::AcceptFailed,
                                fmt::format("accept on {} failed: {}",
                                            endpoint_string(bound_), ec.message())));
        return;
    }

    boost::system::error_code peer_ec;
    tcp::endpoint peer = socket.remote_endpoint(peer_ec);
    if (peer_ec) {
        log_debug(fmt::format("Listener {}: dropped connection before bridging: {}",
                              endpoint_string(bound_), peer_ec.message()));
        accept_next();
        return;
    }

    ++accepted_;
    if (!token_.cancelled() && !supervisor_.shutting_down()) {
        boost::system::error_code opt_ec;
        socket.set_option(tcp::no_delay(true), opt_ec);
        auto local = std::make_shared<TcpDuplexStream>(std::move(socket));
        std::string name = fmt::format("stream-{}-{}", endpoint_string(bound_), peer.port());
        supervisor_.spawn_contained(name, ConnectionBridge::task(local, peer, spec_, provider_));
    }

    accept_next();
}

void Listener::finish(TaskOutcome outcome) {
    if (finished_) return;
    finished_ = true;

    token_.unsubscribe(cancel_subscription_);
    cancel_subscription_ = 0;
    boost::system::error_code ec;
    acceptor_.close(ec);

    auto done = std::move(done_);
    done_ = nullptr;
    if (done) done(std::move(outcome));
}
