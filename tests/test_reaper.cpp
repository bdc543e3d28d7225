#include <gtest/gtest.h>
#include <tunnel/reaper.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>

using namespace std::chrono_literals;

static TaskFn finish_with(boost::asio::io_context& io, TaskOutcome outcome) {
    return [&io, outcome](CancelToken, OutcomeHandler done) {
        boost::asio::post(io, [done, outcome]() { done(outcome); });
    };
}

// Checks the supervisor after `delay`, then shuts it down.
static TaskFn check_after(Supervisor& supervisor, std::chrono::milliseconds delay,
                          std::size_t* completed_seen) {
    return [&supervisor, delay, completed_seen](CancelToken, OutcomeHandler done) {
        auto timer = std::make_shared<boost::asio::steady_timer>(supervisor.io(), delay);
        timer->async_wait([&supervisor, timer, completed_seen, done](const boost::system::error_code&) {
            *completed_seen = supervisor.completed_count();
            supervisor.shutdown();
            done(TaskOutcome::Ok());
        });
    };
}

TEST(Reaper, DrainsContainedTasksWhileRunning) {
    boost::asio::io_context io;
    Supervisor supervisor(io, 1s);
    supervisor.spawn_contained("stream-1", finish_with(io, TaskOutcome::Ok()));
    supervisor.spawn_contained("stream-2",
        finish_with(io, TaskOutcome::Err(ErrorKind::RemoteStreamUnavailable, "web:80: gone")));
    supervisor.spawn_contained("stream-3",
        finish_with(io, TaskOutcome::Err(ErrorKind::StreamIo, "web:80 local->remote: fault")));
    supervisor.spawn("reaper", Reaper::task(supervisor, 10ms));

    std::size_t completed_seen = 99;
    supervisor.spawn("check", check_after(supervisor, 100ms, &completed_seen));

    EXPECT_TRUE(supervisor.serve().is_ok());
    EXPECT_EQ(completed_seen, 0u);
    EXPECT_EQ(supervisor.completed_count(), 0u);
}

TEST(Reaper, FinalSweepOnCancel) {
    boost::asio::io_context io;
    Supervisor supervisor(io, 1s);
    supervisor.spawn_contained("stream-1",
        finish_with(io, TaskOutcome::Err(ErrorKind::StreamIo, "reset")));
    // Interval never elapses during the test.
    supervisor.spawn("reaper", Reaper::task(supervisor, std::chrono::hours(1)));

    std::size_t completed_seen = 0;
    supervisor.spawn("check", check_after(supervisor, 50ms, &completed_seen));

    EXPECT_TRUE(supervisor.serve().is_ok());
    EXPECT_EQ(completed_seen, 1u);
    EXPECT_EQ(supervisor.completed_count(), 0u);
}

TEST(Reaper, AlwaysEndsWithSuccess) {
    boost::asio::io_context io;
    Supervisor supervisor(io, 1s);
    TaskHandle handle = supervisor.spawn("reaper", Reaper::task(supervisor, 10ms));
    handle.cancel();

    TaskOutcome outcome = supervisor.serve();
    EXPECT_TRUE(outcome.is_ok());
    EXPECT_EQ(supervisor.running_count(), 0u);
}
