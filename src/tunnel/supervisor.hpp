#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include "cancel_signal.hpp"
#include "task_outcome.hpp"

// Body of a supervised task: start work, watch the token, call the handler
// exactly once when finished.
using TaskFn = std::function<void(CancelToken, OutcomeHandler)>;

enum class TaskPolicy {
    FailFast,       // an Error outcome shuts the whole group down
    Contained,      // outcome is queued for the reaper, never escalated
};

// Cancels a single supervised task without touching the rest of the group.
class TaskHandle {
public:
    TaskHandle() = default;

    void cancel() const;
    bool valid() const { return !signal_.expired(); }
    const std::string& name() const { return name_; }

private:
    friend class Supervisor;
    TaskHandle(std::string name, std::weak_ptr<CancelSignal> signal)
        : name_(std::move(name)), signal_(std::move(signal)) {}

    std::string name_;
    std::weak_ptr<CancelSignal> signal_;
};

struct CompletedTask {
    std::string name;
    TaskOutcome outcome;
};

// Lifecycle manager for a group of cooperative tasks sharing one io_context.
//
// serve() runs the event loop until every task has finished, or until a
// fail-fast task errors / shutdown() is requested. In the latter case the
// group signal fires and serve() waits at most the drain deadline for the
// remaining tasks; stragglers are logged and abandoned.
//
// spawn() and drain_completed() must be called before serve() or from the
// io_context thread. shutdown() is safe from any thread.
class Supervisor {
public:
    Supervisor(boost::asio::io_context& io, std::chrono::milliseconds drain_deadline);
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    TaskHandle spawn(const std::string& name, TaskFn task,
                     TaskPolicy policy = TaskPolicy::FailFast);

    TaskHandle spawn_contained(const std::string& name, TaskFn task) {
        return spawn(name, std::move(task), TaskPolicy::Contained);
    }

    // Blocks. Returns the first fail-fast Error, else Success.
    TaskOutcome serve();

    void shutdown();
    bool shutting_down() const { return shutting_down_; }

    // Removes and returns finished contained tasks.
    std::vector<CompletedTask> drain_completed();

    std::size_t running_count() const { return running_.size(); }
    std::size_t completed_count() const { return completed_.size(); }
    std::size_t abandoned_count() const { return abandoned_; }

    CancelToken token() const { return CancelToken(group_); }
    boost::asio::io_context& io() { return io_; }

private:
    struct TaskRecord {
        std::string name;
        TaskPolicy policy;
        std::shared_ptr<CancelSignal> signal;
    };

    void start_task(std::uint64_t id, TaskFn task, CancelToken token, OutcomeHandler done);
    void on_task_finished(std::uint64_t id, TaskOutcome outcome);
    void begin_shutdown(const std::string& reason);
    void on_drain_deadline(const boost::system::error_code& ec);
    void check_done();
    void stop_loop();

    boost::asio::io_context& io_;
    std::chrono::milliseconds drain_deadline_;
    boost::asio::steady_timer drain_timer_;
    std::shared_ptr<CancelSignal> group_;

    std::uint64_t next_id_ = 1;
    std::map<std::uint64_t, TaskRecord> running_;
    std::deque<CompletedTask> completed_;
    std::optional<TaskOutcome> first_error_;
    std::size_t abandoned_ = 0;
    bool shutting_down_ = false;
    bool serving_ = false;

    // Handlers outliving the supervisor check this before touching it.
    std::shared_ptr<bool> alive_;
};
