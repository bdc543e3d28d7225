#include "interactive_shell.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <cerrno>
#include <csignal>
#include <fmt/format.h>
#include <libssh2.h>
#include <unistd.h>

namespace {

// Blocking write of the whole buffer; the terminal is local and fast.
bool write_all(int fd, const char* data, std::size_t size) {
    while (size > 0) {
        ssize_t n = ::write(fd, data, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        size -= static_cast<std::size_t>(n);
    }
    return true;
}

} // namespace

InteractiveShell::InteractiveShell(boost::asio::io_context& io, SshTarget target, std::string command)
    : io_(io),
      target_(std::move(target)),
      command_(std::move(command)),
      stdin_(io),
      resize_(io),
      stdin_buf_(SSH_READ_BUF_SIZE),
      stdout_buf_(SSH_READ_BUF_SIZE),
      stderr_buf_(SSH_READ_BUF_SIZE) {}

void InteractiveShell::start(const boost::asio::ip::tcp::endpoint& bound, OutcomeHandler done) {
    done_ = std::move(done);
    target_.host = bound.address().to_string();
    target_.port = bound.port();
    session_ = SshSession::create(io_, target_);

    auto self = shared_from_this();
    session_->async_connect([self](Result<void> result) { self->on_connected(std::move(result)); });
}

void InteractiveShell::cancel() {
    finish(TaskOutcome::Err(ErrorKind::SshFailed, "cancelled"));
}

void InteractiveShell::on_connected(Result<void> result) {
    if (finished_) return;
    if (result.is_err()) {
        finish(TaskOutcome::Err(ErrorKind::SshFailed, result.error));
        return;
    }

    PtyRequest pty;
    pty.term = platform::term_name();
    pty.width = platform::term_width();
    pty.height = platform::term_height();

    auto self = shared_from_this();
    session_->async_exec(command_, [self](Result<LIBSSH2_CHANNEL*> channel) {
        self->on_channel(std::move(channel));
    }, pty);
}

void InteractiveShell::on_channel(Result<LIBSSH2_CHANNEL*> channel) {
    if (finished_) return;
    if (channel.is_err()) {
        finish(TaskOutcome::Err(ErrorKind::SshFailed, channel.error));
        return;
    }

    stream_ = std::make_shared<SshChannelStream>(session_, channel.value,
                                                 fmt::format("shell:{}", session_->target().describe()));
    raw_mode_ = std::make_unique<platform::RawModeGuard>();
    read_stdout();
    read_stderr();
    attach_stdin();

    boost::system::error_code ec;
    resize_.add(SIGWINCH, ec);
    if (ec) log_debug(fmt::format("InteractiveShell: no resize notifications: {}", ec.message()));
    else watch_resize();
}

void InteractiveShell::attach_stdin() {
    int fd = ::dup(STDIN_FILENO);
    boost::system::error_code ec;
    if (fd >= 0) stdin_.assign(fd, ec);
    if (fd < 0 || ec) {
        // Regular files cannot be watched; the remote sees end of input.
        log_debug(fmt::format("InteractiveShell: stdin not relayed: {}",
                              fd < 0 ? std::string("dup failed") : ec.message()));
        if (fd >= 0 && ec) ::close(fd);
        stream_->shutdown_send();
        return;
    }
    read_stdin();
}

void InteractiveShell::read_stdin() {
    auto self = shared_from_this();
    stdin_.async_read_some(boost::asio::buffer(stdin_buf_),
        [self](const boost::system::error_code& ec, std::size_t n) {
            if (self->finished_) return;
            if (ec) {
                if (ec != boost::asio::error::eof)
                    log_debug(fmt::format("InteractiveShell: stdin: {}", ec.message()));
                self->stream_->shutdown_send();
                return;
            }
            self->send_stdin(0, n);
        });
}

void InteractiveShell::send_stdin(std::size_t offset, std::size_t size) {
    auto self = shared_from_this();
    stream_->async_write_some(boost::asio::buffer(stdin_buf_.data() + offset, size - offset),
        [self, offset, size](const boost::system::error_code& ec, std::size_t n) {
            if (self->finished_) return;
            if (ec) {
                self->finish(TaskOutcome::Err(ErrorKind::SshFailed, "writing to remote shell: " + ec.message()));
                return;
            }
            if (offset + n < size) {
                self->send_stdin(offset + n, size);
                return;
            }
            self->read_stdin();
        });
}

void InteractiveShell::read_stdout() {
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
                self->finish(TaskOutcome::Err(ErrorKind::SshFailed, "reading remote shell: " + ec.message()));
                return;
            }
            if (!write_all(STDOUT_FILENO, self->stdout_buf_.data(), n)) {
                self->finish(TaskOutcome::Err(ErrorKind::SshFailed, "writing to stdout failed"));
                return;
            }
            self->read_stdout();
        });
}

void InteractiveShell::read_stderr() {
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
                self->finish(TaskOutcome::Err(ErrorKind::SshFailed, "reading remote shell: " + ec.message()));
                return;
            }
            write_all(STDERR_FILENO, self->stderr_buf_.data(), n);
            self->read_stderr();
        });
}

void InteractiveShell::watch_resize() {
    auto self = shared_from_this();
    resize_.async_wait([self](const boost::system::error_code& ec, int) {
        if (ec || self->finished_) return;
        int width = platform::term_width();
        int height = platform::term_height();
        LIBSSH2_CHANNEL* channel = self->stream_->raw_channel();
        self->session_->async_call(self->stream_.get(),
            [channel, width, height]() { return libssh2_channel_request_pty_size(channel, width, height); },
            [](int rc) {
                if (rc != 0) log_debug(fmt::format("InteractiveShell: resize: {}", ssh_error_name(rc)));
            });
        self->watch_resize();
    });
}

void InteractiveShell::on_output_ended() {
    if (!stdout_done_ || !stderr_done_) return;

    auto self = shared_from_this();
    LIBSSH2_CHANNEL* channel = stream_->raw_channel();
    session_->async_call(stream_.get(),
        [channel]() { return libssh2_channel_wait_closed(channel); },
        [self](int rc) {
            if (self->finished_) return;
            if (rc != 0) {
                log_debug(fmt::format("InteractiveShell: wait for close: {}", ssh_error_name(rc)));
            }
            self->exit_status_ = self->stream_->exit_status();
            log_debug(fmt::format("InteractiveShell: '{}' exited with {}", self->command_, self->exit_status_));
            if (self->exit_status_ != 0) {
                self->finish(TaskOutcome::Err(ErrorKind::CommandFailed,
                    fmt::format("remote shell exited with status {}", self->exit_status_)));
                return;
            }
            self->finish(TaskOutcome::Ok());
        });
}

void InteractiveShell::finish(TaskOutcome outcome) {
    if (finished_) return;
    finished_ = true;

    boost::system::error_code ec;
    resize_.cancel(ec);
    resize_.clear(ec);
    stdin_.close(ec);
    raw_mode_.reset();

    if (stream_) stream_->close();
    if (session_) session_->close(outcome.is_ok() ? "shell finished" : outcome.error.message);

    auto done = std::move(done_);
    done_ = nullptr;
    if (done) boost::asio::post(io_, [done, outcome]() { done(outcome); });
}
