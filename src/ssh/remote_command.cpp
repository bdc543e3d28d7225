#include "remote_command.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <fmt/format.h>
#include <libssh2.h>

RemoteCommand::RemoteCommand(boost::asio::io_context& io, SshTarget target, std::string command,
                             OutputCallback on_stdout, OutputCallback on_stderr)
    : io_(io),
      target_(std::move(target)),
      command_(std::move(command)),
      on_stdout_(std::move(on_stdout)),
      on_stderr_(std::move(on_stderr)),
      stdout_buf_(SSH_READ_BUF_SIZE),
      stderr_buf_(SSH_READ_BUF_SIZE) {}

void RemoteCommand::start(const boost::asio::ip::tcp::endpoint& bound, OutcomeHandler done) {
    done_ = std::move(done);
    target_.host = bound.address().to_string();
    target_.port = bound.port();
    session_ = SshSession::create(io_, target_);

    auto self = shared_from_this();
    session_->async_connect([self](Result<void> result) { self->on_connected(std::move(result)); });
}

void RemoteCommand::cancel() {
    finish(TaskOutcome::Err(ErrorKind::SshFailed, "cancelled"));
}

void RemoteCommand::on_connected(Result<void> result) {
    if (finished_) return;
    if (result.is_err()) {
        finish(TaskOutcome::Err(ErrorKind::SshFailed, result.error));
        return;
    }
    auto self = shared_from_this();
    session_->async_exec(command_, [self](Result<LIBSSH2_CHANNEL*> channel) {
        self->on_channel(std::move(channel));
    });
}

void RemoteCommand::on_channel(Result<LIBSSH2_CHANNEL*> channel) {
    if (finished_) return;
    if (channel.is_err()) {
        finish(TaskOutcome::Err(ErrorKind::SshFailed, channel.error));
        return;
    }

    stream_ = std::make_shared<SshChannelStream>(session_, channel.value,
                                                 fmt::format("exec:{}", session_->target().describe()));
    stream_->shutdown_send();
    read_stdout();
    read_stderr();
}

void RemoteCommand::read_stdout() {
    auto self = shared_from_this();
    stream_->async_read_some(boost::asio::buffer(stdout_buf_),
        [self](const boost::system::error_code& ec, std::size_t n) {
            if (self->finished_) return;
            if (ec == boost::asio::error::eof) {
                self->stdout_done_ = true;
                self->on_output_ended();
                return;
            }
            if (ec) {
                self->finish(TaskOutcome::Err(ErrorKind::SshFailed, "reading command output: " + ec.message()));
                return;
            }
            if (self->on_stdout_) self->on_stdout_(self->stdout_buf_.data(), n);
            self->read_stdout();
        });
}

void RemoteCommand::read_stderr() {
    auto self = shared_from_this();
    stream_->async_read_stderr(boost::asio::buffer(stderr_buf_),
        [self](const boost::system::error_code& ec, std::size_t n) {
            if (self->finished_) return;
            if (ec == boost::asio::error::eof) {
                self->stderr_done_ = true;
                self->on_output_ended();
                return;
            }
            if (ec) {
                self->finish(TaskOutcome::Err(ErrorKind::SshFailed, "reading command errors: " + ec.message()));
                return;
            }
            if (self->on_stderr_) self->on_stderr_(self->stderr_buf_.data(), n);
            self->read_stderr();
        });
}

void RemoteCommand::on_output_ended() {
    if (!stdout_done_ || !stderr_done_) return;

    // The exit status can arrive after EOF; wait for the remote close.
    auto self = shared_from_this();
    LIBSSH2_CHANNEL* channel = stream_->raw_channel();
    session_->async_call(stream_.get(),
        [channel]() { return libssh2_channel_wait_closed(channel); },
        [self](int rc) {
            if (self->finished_) return;
            if (rc != 0) {
                log_debug(fmt::format("RemoteCommand: wait for close: {}", ssh_error_name(rc)));
            }
            self->exit_status_ = self->stream_->exit_status();
            log_debug(fmt::format("RemoteCommand: '{}' exited with {}", self->command_, self->exit_status_));
            if (self->exit_status_ != 0) {
                self->finish(TaskOutcome::Err(ErrorKind::CommandFailed,
                    fmt::format("remote command exited with status {}", self->exit_status_)));
                return;
            }
            self->finish(TaskOutcome::Ok());
        });
}

void RemoteCommand::finish(TaskOutcome outcome) {
    if (finished_) return;
    finished_ = true;

    if (stream_) stream_->close();
    if (session_) session_->close(outcome.is_ok() ? "command finished" : outcome.error.message);

    auto done = std::move(done_);
    done_ = nullptr;
    if (done) boost::asio::post(io_, [done, outcome]() { done(outcome); });
}
