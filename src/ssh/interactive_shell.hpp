#pragma once

#include <memory>
#include <string>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/signal_set.hpp>
#include <platform/terminal.hpp>
#include <tunnel/readiness_consumer.hpp>
#include "channel_stream.hpp"
#include "ssh_session.hpp"

// Interactive command on a remote pseudo-terminal, reached through the tunnel.
//
// Puts the local terminal in raw mode for the session, relays stdin to the
// channel and the channel to stdout/stderr, and forwards window size
// changes. End of local stdin half-closes the channel. Finishes when the
// remote side closes: Success on exit status 0, CommandFailed otherwise.
class InteractiveShell : public TunnelSession, public std::enable_shared_from_this<InteractiveShell> {
public:
    InteractiveShell(boost::asio::io_context& io, SshTarget target, std::string command);

    void start(const boost::asio::ip::tcp::endpoint& bound, OutcomeHandler done) override;
    void cancel() override;

    int exit_status() const { return exit_status_; }

private:
    void on_connected(Result<void> result);
    void on_channel(Result<LIBSSH2_CHANNEL*> channel);
    void attach_stdin();
    void read_stdin();
    void send_stdin(std::size_t offset, std::size_t size);
    void read_stdout();
    void read_stderr();
    void watch_resize();
    void on_output_ended();
    void finish(TaskOutcome outcome);

    boost::asio::io_context& io_;
    SshTarget target_;
    std::string command_;
    OutcomeHandler done_;

    std::shared_ptr<SshSession> session_;
    std::shared_ptr<SshChannelStream> stream_;
    boost::asio::posix::stream_descriptor stdin_;
    boost::asio::signal_set resize_;
    std::unique_ptr<platform::RawModeGuard> raw_mode_;
    std::vector<char> stdin_buf_;
    std::vector<char> stdout_buf_;
    std::vector<char> stderr_buf_;
    int exit_status_ = 0;
    bool stdout_done_ = false;
    bool stderr_done_ = false;
    bool finished_ = false;
};
