#pragma once

#include <memory>
#include <boost/asio/signal_set.hpp>
#include "supervisor.hpp"

// Turns SIGINT/SIGTERM into a supervisor shutdown. Ends with Success either
// way: an interrupt is a clean exit, not a failure.
class InterruptWatcher : public std::enable_shared_from_this<InterruptWatcher> {
public:
    InterruptWatcher(Supervisor& supervisor, CancelToken token, OutcomeHandler done);

    static TaskFn task(Supervisor& supervisor);

    void start();

private:
    void finish();

    Supervisor& supervisor_;
    CancelToken token_;
    OutcomeHandler done_;
    CancelSignal::SubscriptionId cancel_subscription_ = 0;
    boost::asio::signal_set signals_;
    bool finished_ = false;
};
