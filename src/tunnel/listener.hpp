#pragma once

#include <memory>
#include <string>
#include <boost/asio/ip/tcp.hpp>
#include "cancel_signal.hpp"
#include "forward_spec.hpp"
#include "readiness.hpp"
#include "remote_stream_provider.hpp"
#include "supervisor.hpp"

// Binds one ForwardSpec's local address and spawns a contained
// ConnectionBridge per accepted connection.
//
// on_ready is called once with the bound address, after listen() and before
// the first accept; it is dropped uncalled if binding fails. Cancellation
// closes the acceptor and ends the task with Success; in-flight bridges are
// left to the supervisor.
class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(Supervisor& supervisor,
             ForwardSpec spec,
             std::shared_ptr<RemoteStreamProvider> provider,
             ReadyCallback on_ready,
             CancelToken token,
             OutcomeHandler done);

    static TaskFn task(Supervisor& supervisor,
                       ForwardSpec spec,
                       std::shared_ptr<RemoteStreamProvider> provider,
                       ReadyCallback on_ready = nullptr);

    void start();

private:
    void accept_next();
    void on_accept(const boost::system::error_code& ec, boost::asio::ip::tcp::socket socket);
    void finish(TaskOutcome outcome);

    Supervisor& supervisor_;
    ForwardSpec spec_;
    std::shared_ptr<RemoteStreamProvider> provider_;
    ReadyCallback on_ready_;
    CancelToken token_;
    OutcomeHandler done_;
    CancelSignal::SubscriptionId cancel_subscription_ = 0;

    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::ip::tcp::endpoint bound_;
    std::size_t accepted_ = 0;
    bool finished_ = false;
};
