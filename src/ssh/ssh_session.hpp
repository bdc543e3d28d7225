#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <optional>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <core/types.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;
typedef struct _LIBSSH2_SFTP LIBSSH2_SFTP;

struct SshTarget {
    std::string host;
    int port = 22;
    std::string user;
    std::optional<std::string> private_key_path;
    std::optional<std::string> password;
    int timeout_secs = 15;

    std::string describe() const;
};

// Pseudo-terminal requested before a command starts.
struct PtyRequest {
    std::string term = "xterm";
    int width = 80;
    int height = 24;
};

// Non-blocking libssh2 session driven by an asio io_context.
//
// Every libssh2 call goes through async_call(): the call is retried each time
// the session socket becomes ready in the direction libssh2 is blocked on,
// until it returns something other than EAGAIN. All calls on one session run
// on the io_context thread, so no locking is needed.
class SshSession : public std::enable_shared_from_this<SshSession> {
public:
    using ConnectHandler = std::function<void(Result<void>)>;
    using ChannelHandler = std::function<void(Result<LIBSSH2_CHANNEL*>)>;
    using SftpHandler = std::function<void(Result<LIBSSH2_SFTP*>)>;
    using Attempt = std::function<int()>;
    using Completion = std::function<void(int rc)>;

    static std::shared_ptr<SshSession> create(boost::asio::io_context& io, SshTarget target);
    ~SshSession();

    SshSession(const SshSession&) = delete;
    SshSession& operator=(const SshSession&) = delete;

    // TCP connect, handshake and authentication, bounded by timeout_secs.
    void async_connect(ConnectHandler handler);

    // direct-tcpip channel to host:port as seen from the SSH server.
    void async_direct_tcpip(const std::string& host, uint16_t port, ChannelHandler handler);

    // Session channel running `command` (the login shell when empty), on a
    // pseudo-terminal when `pty` is set.
    void async_exec(const std::string& command, ChannelHandler handler,
                    std::optional<PtyRequest> pty = std::nullopt);

    // SFTP subsystem on a new channel.
    void async_sftp(SftpHandler handler);

    // Retries `attempt` until it stops returning EAGAIN, then posts
    // `done(rc)`. Operations tagged with an owner can be dropped together.
    void async_call(const void* owner, Attempt attempt, Completion done);

    // Completes the owner's pending operations with LIBSSH2_ERROR_CHANNEL_CLOSED.
    void cancel_ops(const void* owner);

    // Disconnects and completes every pending operation with
    // LIBSSH2_ERROR_SOCKET_DISCONNECT. Idempotent.
    void close(const std::string& reason = "closed");

    bool connected() const { return connected_ && !closed_; }
    bool closed() const { return closed_; }
    const SshTarget& target() const { return target_; }
    boost::asio::io_context& io() { return io_; }

    // libssh2's description of the last session error.
    std::string last_error() const;

    // libssh2's code for the last session error; EAGAIN while a call that
    // returns a handle is still in progress.
    int last_errno() const;

private:
    SshSession(boost::asio::io_context& io, SshTarget target);

    struct PendingOp {
        const void* owner;
        Attempt attempt;
        Completion done;
    };

    void on_tcp_connected();
    void authenticate();
    void finish_connect(Result<void> result);
    void open_channel(std::function<LIBSSH2_CHANNEL*()> open, std::string what,
                      ChannelHandler handler);
    void start_command(LIBSSH2_CHANNEL* channel, const std::string& command, ChannelHandler handler);
    void release_channel(LIBSSH2_CHANNEL* channel);

    void drive();
    bool run_pass();
    void arm_wait();
    void schedule_keepalive();

    boost::asio::io_context& io_;
    SshTarget target_;
    boost::asio::ip::tcp::resolver resolver_;
    boost::asio::ip::tcp::socket socket_;
    boost::asio::steady_timer connect_timer_;
    boost::asio::steady_timer nudge_timer_;
    boost::asio::steady_timer keepalive_timer_;

    LIBSSH2_SESSION* session_ = nullptr;
    std::list<PendingOp> pending_;
    ConnectHandler connect_handler_;
    bool read_waiting_ = false;
    bool write_waiting_ = false;
    bool nudge_armed_ = false;
    bool connected_ = false;
    bool closed_ = false;
};

// Reads a libssh2 return code as text ("EAGAIN", "socket disconnected", ...).
std::string ssh_error_name(int rc);
