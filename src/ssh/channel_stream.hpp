#pragma once

#include <memory>
#include <string>
#include <tunnel/duplex_stream.hpp>
#include "ssh_session.hpp"

// DuplexStream over one libssh2 channel (direct-tcpip or exec).
// Keeps the session alive for as long as the channel is open.
class SshChannelStream : public DuplexStream {
public:
    SshChannelStream(std::shared_ptr<SshSession> session, LIBSSH2_CHANNEL* channel,
                     std::string description);
    ~SshChannelStream() override;

    void async_read_some(boost::asio::mutable_buffer buffer, IoHandler handler) override;
    void async_write_some(boost::asio::const_buffer buffer, IoHandler handler) override;
    void shutdown_send() override;
    void close() override;
    std::string describe() const override { return description_; }

    // Reads the channel's stderr substream (exec channels).
    void async_read_stderr(boost::asio::mutable_buffer buffer, IoHandler handler);

    // Remote exit status; meaningful after end-of-stream.
    int exit_status() const;

    LIBSSH2_CHANNEL* raw_channel() { return channel_; }

private:
    const void* write_owner() const { return &channel_; }

    std::shared_ptr<SshSession> session_;
    LIBSSH2_CHANNEL* channel_;
    std::string description_;
    bool eof_sent_ = false;
    bool closed_ = false;
};

// Maps a libssh2 channel return code to the error codes sockets report, so
// callers can treat both stream kinds alike.
boost::system::error_code ssh_channel_error(int rc);
