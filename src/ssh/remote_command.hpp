#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <tunnel/readiness_consumer.hpp>
#include "channel_stream.hpp"
#include "ssh_session.hpp"

// Runs one command over a fresh SSH session through the tunnel and streams
// its output.
//
// Finishes with Success once stdout and stderr have both ended and the
// remote exited 0; a non-zero exit is CommandFailed (see exit_status()).
// Session failures are SshFailed. Remote stdin is closed immediately.
class RemoteCommand : public TunnelSession, public std::enable_shared_from_this<RemoteCommand> {
public:
    using OutputCallback = std::function<void(const char* data, std::size_t size)>;

    // `target` carries the credentials; host and port come from the tunnel.
    RemoteCommand(boost::asio::io_context& io, SshTarget target, std::string command,
                  OutputCallback on_stdout, OutputCallback on_stderr);

    void start(const boost::asio::ip::tcp::endpoint& bound, OutcomeHandler done) override;
    void cancel() override;

    // Remote exit status; meaningful once the session finished.
    int exit_status() const { return exit_status_; }

private:
    void on_connected(Result<void> result);
    void on_channel(Result<LIBSSH2_CHANNEL*> channel);
    void read_stdout();
    void read_stderr();
    void on_output_ended();
    void finish(TaskOutcome outcome);

    boost::asio::io_context& io_;
    SshTarget target_;
    std::string command_;
    OutputCallback on_stdout_;
    OutputCallback on_stderr_;
    OutcomeHandler done_;

    std::shared_ptr<SshSession> session_;
    std::shared_ptr<SshChannelStream> stream_;
    std::vector<char> stdout_buf_;
    std::vector<char> stderr_buf_;
    int exit_status_ = 0;
    bool stdout_done_ = false;
    bool stderr_done_ = false;
    bool finished_ = false;
};
