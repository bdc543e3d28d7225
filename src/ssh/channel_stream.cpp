#include "channel_stream.hpp"
#include <core/log.hpp>
#include <boost/asio/error.hpp>
#include <fmt/format.h>
#include <libssh2.h>

boost::system::error_code ssh_channel_error(int rc) {
    switch (rc) {
        case 0:
        case LIBSSH2_ERROR_CHANNEL_EOF_SENT:
            return boost::asio::error::eof;
        case LIBSSH2_ERROR_CHANNEL_CLOSED:
            return boost::asio::error::operation_aborted;
        case LIBSSH2_ERROR_SOCKET_DISCONNECT:
        case LIBSSH2_ERROR_SOCKET_RECV:
            return boost::asio::error::connection_reset;
        case LIBSSH2_ERROR_SOCKET_SEND:
            return boost::asio::error::broken_pipe;
        case LIBSSH2_ERROR_TIMEOUT:
        case LIBSSH2_ERROR_SOCKET_TIMEOUT:
            return boost::asio::error::timed_out;
        default:
            return boost::asio::error::fault;
    }
}

SshChannelStream::SshChannelStream(std::shared_ptr<SshSession> session, LIBSSH2_CHANNEL* channel,
                                   std::string description)
    : session_(std::move(session)), channel_(channel), description_(std::move(description)) {}

SshChannelStream::~SshChannelStream() {
    close();
}

void SshChannelStream::async_read_some(boost::asio::mutable_buffer buffer, IoHandler handler) {
    LIBSSH2_CHANNEL* channel = channel_;
    session_->async_call(this,
        [channel, buffer]() {
            return static_cast<int>(libssh2_channel_read(channel, static_cast<char*>(buffer.data()),
                                                         buffer.size()));
        },
        [handler](int rc) {
            if (rc > 0) handler({}, static_cast<std::size_t>(rc));
            else handler(ssh_channel_error(rc), 0);
        });
}

void SshChannelStream::async_read_stderr(boost::asio::mutable_buffer buffer, IoHandler handler) {
    LIBSSH2_CHANNEL* channel = channel_;
    session_->async_call(this,
        [channel, buffer]() {
            return static_cast<int>(libssh2_channel_read_stderr(
                channel, static_cast<char*>(buffer.data()), buffer.size()));
        },
        [handler](int rc) {
            if (rc > 0) handler({}, static_cast<std::size_t>(rc));
            else handler(ssh_channel_error(rc), 0);
        });
}

void SshChannelStream::async_write_some(boost::asio::const_buffer buffer, IoHandler handler) {
    LIBSSH2_CHANNEL* channel = channel_;
    session_->async_call(write_owner(),
        [channel, buffer]() {
            return static_cast<int>(libssh2_channel_write(
                channel, static_cast<const char*>(buffer.data()), buffer.size()));
        },
        [handler](int rc) {
            if (rc >= 0) handler({}, static_cast<std::size_t>(rc));
            else handler(ssh_channel_error(rc), 0);
        });
}

void SshChannelStream::shutdown_send() {
    if (eof_sent_ || closed_) return;
    eof_sent_ = true;
    LIBSSH2_CHANNEL* channel = channel_;
    std::string description = description_;
    session_->async_call(write_owner(),
        [channel]() { return libssh2_channel_send_eof(channel); },
        [description](int rc) {
            if (rc != 0 && rc != LIBSSH2_ERROR_CHANNEL_CLOSED)
                log_debug(fmt::format("{}: send EOF: {}", description, ssh_error_name(rc)));
        });
}

void SshChannelStream::close() {
    if (closed_) return;
    closed_ = true;

    session_->cancel_ops(this);
    session_->cancel_ops(write_owner());
    if (session_->closed()) return;  // the session freed its channels

    // Close, then free, on the session's pump. The lambdas keep the session
    // alive until the channel is released.
    auto session = session_;
    LIBSSH2_CHANNEL* channel = channel_;
    std::string description = description_;
    session->async_call(nullptr,
        [channel]() { return libssh2_channel_close(channel); },
        [session, channel, description](int rc) {
            if (session->closed()) return;
            if (rc != 0)
                log_debug(fmt::format("{}: close: {}", description, ssh_error_name(rc)));
            session->async_call(nullptr,
                [channel]() { return libssh2_channel_free(channel); },
                [description](int rc) {
                    if (rc != 0)
                        log_debug(fmt::format("{}: free: {}", description, ssh_error_name(rc)));
                });
        });
}

int SshChannelStream::exit_status() const {
    return libssh2_channel_get_exit_status(channel_);
}
