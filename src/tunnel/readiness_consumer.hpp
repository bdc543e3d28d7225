#pragma once

#include <memory>
#include <boost/asio/ip/tcp.hpp>
#include "readiness.hpp"
#include "supervisor.hpp"

// Work that runs against a forwarder once its local address is known: a
// remote command, an interactive shell, a file transfer.
class TunnelSession {
public:
    virtual ~TunnelSession() = default;

    // Starts against the forwarder's bound address. `done` is called once.
    virtual void start(const boost::asio::ip::tcp::endpoint& bound, OutcomeHandler done) = 0;

    // Stops early. `done` still fires, with any outcome.
    virtual void cancel() = 0;
};

// Supervised task that waits for the forwarder's readiness, runs the session
// through the tunnel, then cancels the forwarder and shuts the group down.
// The teardown happens on every exit path: session success or error,
// readiness lost, and cancellation.
//
// A closed readiness channel ends the task with ReadinessLost. A session
// error that follows cancellation is reported as Success.
class ReadinessConsumer : public std::enable_shared_from_this<ReadinessConsumer> {
public:
    ReadinessConsumer(Supervisor& supervisor, std::shared_ptr<Readiness> ready, TaskHandle forwarder,
                      std::shared_ptr<TunnelSession> session, CancelToken token, OutcomeHandler done);

    static TaskFn task(Supervisor& supervisor, std::shared_ptr<Readiness> ready,
                       TaskHandle forwarder, std::shared_ptr<TunnelSession> session);

    void start();

private:
    void on_ready(Result<boost::asio::ip::tcp::endpoint> bound);
    void on_session_done(TaskOutcome outcome);
    void finish(TaskOutcome outcome);

    Supervisor& supervisor_;
    std::shared_ptr<Readiness> ready_;
    TaskHandle forwarder_;
    std::shared_ptr<TunnelSession> session_;
    CancelToken token_;
    OutcomeHandler done_;
    CancelSignal::SubscriptionId cancel_subscription_ = 0;
    bool session_started_ = false;
    bool finished_ = false;
};
