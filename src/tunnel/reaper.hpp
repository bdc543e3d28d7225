#pragma once

#include <chrono>
#include <memory>
#include <boost/asio/steady_timer.hpp>
#include "supervisor.hpp"

// Periodically drains finished contained tasks (connection bridges) from the
// supervisor, logging their errors at warn. Runs until cancelled; always
// ends with Success.
class Reaper : public std::enable_shared_from_this<Reaper> {
public:
    Reaper(Supervisor& supervisor, std::chrono::milliseconds interval,
           CancelToken token, OutcomeHandler done);

    static TaskFn task(Supervisor& supervisor, std::chrono::milliseconds interval);

    void start();

private:
    void schedule();
    void reap();
    void finish();

    Supervisor& supervisor_;
    std::chrono::milliseconds interval_;
    CancelToken token_;
    OutcomeHandler done_;
    CancelSignal::SubscriptionId cancel_subscription_ = 0;
    boost::asio::steady_timer timer_;
    std::size_t reaped_ = 0;
    bool finished_ = false;
};
