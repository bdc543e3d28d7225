#include "supervisor.hpp"
#include <core/log.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>
#include <fmt/format.h>
#include <atomic>
#include <exception>

// ── TaskHandle ────────────────────────────────────────────

void TaskHandle::cancel() const {
    if (auto signal = signal_.lock()) signal->trigger();
}

// ── Supervisor ────────────────────────────────────────────

Supervisor::Supervisor(boost::asio::io_context& io, std::chrono::milliseconds drain_deadline)
    : io_(io),
      drain_deadline_(drain_deadline),
      drain_timer_(io),
      group_(CancelSignal::create(io)),
      alive_(std::make_shared<bool>(true)) {}

Supervisor::~Supervisor() {
    alive_.reset();
    for (auto& [id, record] : running_) record.signal->detach();
}

TaskHandle Supervisor::spawn(const std::string& name, TaskFn task, TaskPolicy policy) {
    if (shutting_down_) {
        log_debug(fmt::format("Supervisor: refusing to start {} during shutdown", name));
        return TaskHandle();
    }

    std::uint64_t id = next_id_++;
    auto signal = group_->make_child();
    running_.emplace(id, TaskRecord{name, policy, signal});

    std::weak_ptr<bool> alive = alive_;
    auto reported = std::make_shared<std::atomic<bool>>(false);
    OutcomeHandler done = [this, alive, id, name, reported](TaskOutcome outcome) {
        if (reported->exchange(true)) {
            log_warn(fmt::format("Supervisor: {} reported a second outcome ({}), ignored",
                                 name, outcome.describe()));
            return;
        }
        if (alive.expired()) return;
        boost::asio::post(io_, [this, alive, id, outcome]() {
            if (alive.expired()) return;
            on_task_finished(id, outcome);
        });
    };

    boost::asio::post(io_, [this, alive, id, task = std::move(task),
                            token = CancelToken(signal), done]() mutable {
        if (alive.expired()) return;
        start_task(id, std::move(task), token, done);
    });

    return TaskHandle(name, signal);
}

void Supervisor::start_task(std::uint64_t id, TaskFn task, CancelToken token,
                            OutcomeHandler done) {
    auto it = running_.find(id);
    if (it == running_.end()) return;
    log_debug(fmt::format("Supervisor: starting {}", it->second.name));

    try {
        task(token, done);
    } catch (const std::exception& e) {
        done(TaskOutcome::Err(ErrorKind::Internal, e.what()));
    }
}

void Supervisor::on_task_finished(std::uint64_t id, TaskOutcome outcome) {
    auto it = running_.find(id);
    if (it == running_.end()) return;  // abandoned after the drain deadline

    TaskRecord record = std::move(it->second);
    running_.erase(it);
    record.signal->detach();

    if (outcome.is_ok())
        log_debug(fmt::format("Supervisor: {} finished", record.name));
    else
        log_debug(fmt::format("Supervisor: {} failed: {}", record.name, outcome.describe()));

    if (record.policy == TaskPolicy::Contained) {
        completed_.push_back({record.name, outcome});
    } else if (outcome.is_err()) {
        if (!first_error_) first_error_ = outcome;
        begin_shutdown(fmt::format("{} failed", record.name));
    }

    check_done();
}

void Supervisor::shutdown() {
    std::weak_ptr<bool> alive = alive_;
    boost::asio::post(io_, [this, alive]() {
        if (alive.expired()) return;
        begin_shutdown("shutdown requested");
    });
}

void Supervisor::begin_shutdown(const std::string& reason) {
    if (shutting_down_) return;
    shutting_down_ = true;
    log_debug(fmt::format("Supervisor: {}, cancelling {} task(s)", reason, running_.size()));

    group_->trigger();

    if (running_.empty()) {
        check_done();
        return;
    }
    drain_timer_.expires_after(drain_deadline_);
    std::weak_ptr<bool> alive = alive_;
    drain_timer_.async_wait([this, alive](const boost::system::error_code& ec) {
        if (alive.expired()) return;
        on_drain_deadline(ec);
    });
}

void Supervisor::on_drain_deadline(const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted) return;
    if (running_.empty()) return;

    for (auto& [id, record] : running_) {
        log_warn(fmt::format("Supervisor: {} did not stop within {}ms, abandoning",
                             record.name, drain_deadline_.count()));
        record.signal->detach();
    }
    abandoned_ += running_.size();
    running_.clear();
    stop_loop();
}

void Supervisor::check_done() {
    if (!running_.empty()) return;
    drain_timer_.cancel();
    stop_loop();
}

void Supervisor::stop_loop() {
    if (serving_) io_.stop();
}

std::vector<CompletedTask> Supervisor::drain_completed() {
    std::vector<CompletedTask> out(std::make_move_iterator(completed_.begin()),
                                   std::make_move_iterator(completed_.end()));
    completed_.clear();
    return out;
}

TaskOutcome Supervisor::serve() {
    if (!running_.empty()) {
        // Tasks waiting only on the group signal hold no io work of their own.
        auto work = boost::asio::make_work_guard(io_);
        serving_ = true;
        io_.restart();
        io_.run();
        serving_ = false;
    }

    if (first_error_) return *first_error_;
    return TaskOutcome::Ok();
}
