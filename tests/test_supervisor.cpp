#include <gtest/gtest.h>
#include <tunnel/supervisor.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace std::chrono_literals;

// Finishes with `outcome` on the next loop turn.
static TaskFn finish_with(boost::asio::io_context& io, TaskOutcome outcome) {
    return [&io, outcome](CancelToken, OutcomeHandler done) {
        boost::asio::post(io, [done, outcome]() { done(outcome); });
    };
}

// Runs until cancelled, then finishes with Success.
static TaskFn until_cancelled(bool* saw_cancel = nullptr) {
    return [saw_cancel](CancelToken token, OutcomeHandler done) {
        token.on_cancel([saw_cancel, done]() {
            if (saw_cancel) *saw_cancel = true;
            done(TaskOutcome::Ok());
        });
    };
}

TEST(Supervisor, ServeWithoutTasksReturnsSuccess) {
    boost::asio::io_context io;
    Supervisor supervisor(io, 1s);
    EXPECT_TRUE(supervisor.serve().is_ok());
}

TEST(Supervisor, ServeReturnsWhenAllTasksFinish) {
    boost::asio::io_context io;
    Supervisor supervisor(io, 1s);
    supervisor.spawn("a", finish_with(io, TaskOutcome::Ok()));
    supervisor.spawn("b", finish_with(io, TaskOutcome::Ok()));

    EXPECT_TRUE(supervisor.serve().is_ok());
    EXPECT_EQ(supervisor.running_count(), 0u);
    EXPECT_FALSE(supervisor.shutting_down());
}

TEST(Supervisor, FailFastErrorCancelsSiblings) {
    boost::asio::io_context io;
    Supervisor supervisor(io, 1s);
    bool sibling_cancelled = false;
    supervisor.spawn("sibling", until_cancelled(&sibling_cancelled));
    supervisor.spawn("listener", finish_with(io, TaskOutcome::Err(ErrorKind::BindFailed, "in use")));

    TaskOutcome outcome = supervisor.serve();

    ASSERT_TRUE(outcome.is_err());
    EXPECT_EQ(outcome.error.kind, ErrorKind::BindFailed);
    EXPECT_EQ(outcome.error.message, "in use");
    EXPECT_TRUE(sibling_cancelled);
    EXPECT_EQ(supervisor.abandoned_count(), 0u);
}

TEST(Supervisor, FirstErrorWins) {
    boost::asio::io_context io;
    Supervisor supervisor(io, 1s);
    // Fails only once the group is cancelled, i.e. after "first".
    supervisor.spawn("second", [](CancelToken token, OutcomeHandler done) {
        token.on_cancel([done]() { done(TaskOutcome::Err(ErrorKind::AcceptFailed, "late")); });
    });
    supervisor.spawn("first", finish_with(io, TaskOutcome::Err(ErrorKind::BindFailed, "early")));

    TaskOutcome outcome = supervisor.serve();
    ASSERT_TRUE(outcome.is_err());
    EXPECT_EQ(outcome.error.kind, ErrorKind::BindFailed);
}

TEST(Supervisor, ContainedErrorDoesNotEscalate) {
    boost::asio::io_context io;
    Supervisor supervisor(io, 1s);
    bool group_cancelled_early = false;

    supervisor.spawn_contained("stream-1", finish_with(io,
        TaskOutcome::Err(ErrorKind::RemoteStreamUnavailable, "p1:80: refused")));

    // Looks at the group a little later, then stops it.
    auto timer = std::make_shared<boost::asio::steady_timer>(io);
    supervisor.spawn("observer", [&, timer](CancelToken token, OutcomeHandler done) {
        timer->expires_after(50ms);
        timer->async_wait([&, token, done](const boost::system::error_code&) {
            group_cancelled_early = token.cancelled();
            supervisor.shutdown();
            done(TaskOutcome::Ok());
        });
    });

    TaskOutcome outcome = supervisor.serve();

    EXPECT_TRUE(outcome.is_ok());
    EXPECT_FALSE(group_cancelled_early);
    auto completed = supervisor.drain_completed();
    ASSERT_EQ(completed.size(), 1u);
    EXPECT_EQ(completed[0].name, "stream-1");
    EXPECT_EQ(completed[0].outcome.error.kind, ErrorKind::RemoteStreamUnavailable);
    EXPECT_EQ(supervisor.completed_count(), 0u);
}

TEST(Supervisor, ShutdownCancelsEveryTask) {
    boost::asio::io_context io;
    Supervisor supervisor(io, 1s);
    bool a = false, b = false;
    supervisor.spawn("a", until_cancelled(&a));
    supervisor.spawn_contained("b", until_cancelled(&b));
    supervisor.shutdown();

    EXPECT_TRUE(supervisor.serve().is_ok());
    EXPECT_TRUE(a);
    EXPECT_TRUE(b);
    EXPECT_TRUE(supervisor.shutting_down());
}

TEST(Supervisor, ShutdownFromAnotherThread) {
    boost::asio::io_context io;
    Supervisor supervisor(io, 1s);
    supervisor.spawn("a", until_cancelled());

    TaskOutcome outcome = TaskOutcome::Err(ErrorKind::Internal, "not run");
    std::thread server([&]() { outcome = supervisor.serve(); });
    std::this_thread::sleep_for(20ms);
    supervisor.shutdown();
    server.join();

    EXPECT_TRUE(outcome.is_ok());
}

TEST(Supervisor, DrainDeadlineAbandonsStragglers) {
    boost::asio::io_context io;
    Supervisor supervisor(io, 50ms);
    supervisor.spawn("stubborn", [](CancelToken, OutcomeHandler) {});
    supervisor.spawn("polite", until_cancelled());
    supervisor.shutdown();

    auto start = std::chrono::steady_clock::now();
    TaskOutcome outcome = supervisor.serve();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(outcome.is_ok());
    EXPECT_EQ(supervisor.abandoned_count(), 1u);
    EXPECT_EQ(supervisor.running_count(), 0u);
    EXPECT_LT(elapsed, 2s);
}

TEST(Supervisor, TaskHandleCancelsOnlyItsTask) {
    boost::asio::io_context io;
    Supervisor supervisor(io, 1s);
    bool helper_cancelled = false;
    bool main_saw_cancel = true;

    TaskHandle helper = supervisor.spawn("helper", until_cancelled(&helper_cancelled));
    auto timer = std::make_shared<boost::asio::steady_timer>(io);
    supervisor.spawn("main", [&, timer](CancelToken token, OutcomeHandler done) {
        timer->expires_after(30ms);
        timer->async_wait([&, token, done](const boost::system::error_code&) {
            main_saw_cancel = token.cancelled();
            done(TaskOutcome::Ok());
        });
    });
    EXPECT_TRUE(helper.valid());
    EXPECT_EQ(helper.name(), "helper");
    helper.cancel();

    EXPECT_TRUE(supervisor.serve().is_ok());
    EXPECT_TRUE(helper_cancelled);
    EXPECT_FALSE(main_saw_cancel);
    EXPECT_FALSE(supervisor.shutting_down());
}

TEST(Supervisor, SecondOutcomeIsIgnored) {
    boost::asio::io_context io;
    Supervisor supervisor(io, 1s);
    supervisor.spawn("twice", [&io](CancelToken, OutcomeHandler done) {
        boost::asio::post(io, [done]() {
            done(TaskOutcome::Ok());
            done(TaskOutcome::Err(ErrorKind::StreamIo, "too late"));
        });
    });

    EXPECT_TRUE(supervisor.serve().is_ok());
}

TEST(Supervisor, ThrowingTaskBecomesInternalError) {
    boost::asio::io_context io;
    Supervisor supervisor(io, 1s);
    supervisor.spawn("broken", [](CancelToken, OutcomeHandler) {
        throw std::runtime_error("boom");
    });

    TaskOutcome outcome = supervisor.serve();
    ASSERT_TRUE(outcome.is_err());
    EXPECT_EQ(outcome.error.kind, ErrorKind::Internal);
    EXPECT_EQ(outcome.error.message, "boom");
}

TEST(Supervisor, SpawnDuringShutdownIsRefused) {
    boost::asio::io_context io;
    Supervisor supervisor(io, 1s);
    bool late_task_ran = false;
    TaskHandle late;

    supervisor.spawn("spawner", [&](CancelToken token, OutcomeHandler done) {
        token.on_cancel([&, done]() {
            late = supervisor.spawn("late", [&late_task_ran](CancelToken, OutcomeHandler d) {
                late_task_ran = true;
                d(TaskOutcome::Ok());
            });
            done(TaskOutcome::Ok());
        });
    });
    supervisor.shutdown();

    EXPECT_TRUE(supervisor.serve().is_ok());
    EXPECT_FALSE(late.valid());
    EXPECT_FALSE(late_task_ran);
}

TEST(TaskOutcome, DescribeNamesTheKind) {
    EXPECT_EQ(TaskOutcome::Ok().describe(), "success");
    EXPECT_EQ(TaskOutcome::Err(ErrorKind::BindFailed, "x").describe(), "bind failed: x");
}
