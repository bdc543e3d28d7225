#include "ssh_session.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/post.hpp>
#include <fmt/format.h>
#include <libssh2.h>
#include <libssh2_sftp.h>

using boost::asio::ip::tcp;

namespace {

int libssh2_init_rc() {
    static const int rc = libssh2_init(0);
    return rc;
}

constexpr int MAX_DRIVE_ROUNDS = 16;
constexpr std::chrono::milliseconds NUDGE_INTERVAL{250};

} // namespace

std::string SshTarget::describe() const {
    return fmt::format("{}@{}:{}", user, host, port);
}

std::string ssh_error_name(int rc) {
    switch (rc) {
        case 0:                                  return "ok";
        case LIBSSH2_ERROR_EAGAIN:               return "EAGAIN";
        case LIBSSH2_ERROR_SOCKET_DISCONNECT:    return "socket disconnected";
        case LIBSSH2_ERROR_SOCKET_SEND:          return "socket send failed";
        case LIBSSH2_ERROR_SOCKET_RECV:          return "socket receive failed";
        case LIBSSH2_ERROR_CHANNEL_CLOSED:       return "channel closed";
        case LIBSSH2_ERROR_CHANNEL_EOF_SENT:     return "channel EOF already sent";
        case LIBSSH2_ERROR_CHANNEL_FAILURE:      return "channel failure";
        case LIBSSH2_ERROR_AUTHENTICATION_FAILED: return "authentication failed";
        case LIBSSH2_ERROR_TIMEOUT:              return "timeout";
        default:                                 return fmt::format("libssh2 error {}", rc);
    }
}

// ── Lifecycle ─────────────────────────────────────────────

std::shared_ptr<SshSession> SshSession::create(boost::asio::io_context& io, SshTarget target) {
    return std::shared_ptr<SshSession>(new SshSession(io, std::move(target)));
}

SshSession::SshSession(boost::asio::io_context& io, SshTarget target)
    : io_(io),
      target_(std::move(target)),
      resolver_(io),
      socket_(io),
      connect_timer_(io),
      nudge_timer_(io),
      keepalive_timer_(io) {}

SshSession::~SshSession() {
    close("session released");
}

void SshSession::async_connect(ConnectHandler handler) {
    connect_handler_ = std::move(handler);
    if (libssh2_init_rc() != 0) {
        finish_connect(Result<void>::Err("Failed to initialize libssh2"));
        return;
    }

    auto self = shared_from_this();
    log_debug(fmt::format("SSH: connecting to {}", target_.describe()));

    connect_timer_.expires_after(std::chrono::seconds(target_.timeout_secs));
    connect_timer_.async_wait([self](const boost::system::error_code& ec) {
        if (ec || !self->connect_handler_) return;
        self->finish_connect(Result<void>::Err(
            fmt::format("Connection timed out: {}", self->target_.describe())));
    });

    resolver_.async_resolve(target_.host, std::to_string(target_.port),
        [self](const boost::system::error_code& ec, tcp::resolver::results_type results) {
            if (!self->connect_handler_) return;
            if (ec) {
                self->finish_connect(Result<void>::Err(fmt::format(
                    "Failed to resolve host {}: {}", self->target_.host, ec.message())));
                return;
            }
            boost::asio::async_connect(self->socket_, results,
                [self](const boost::system::error_code& ec, const tcp::endpoint&) {
                    if (!self->connect_handler_) return;
                    if (ec) {
                        self->finish_connect(Result<void>::Err(fmt::format(
                            "Failed to connect to {}: {}", self->target_.describe(), ec.message())));
                        return;
                    }
                    self->on_tcp_connected();
                });
        });
}

void SshSession::on_tcp_connected() {
    boost::system::error_code ec;
    socket_.set_option(tcp::socket::keep_alive(true), ec);
    socket_.set_option(tcp::no_delay(true), ec);
    socket_.native_non_blocking(true, ec);
    if (ec) {
        finish_connect(Result<void>::Err("Failed to make socket non-blocking: " + ec.message()));
        return;
    }

    session_ = libssh2_session_init();
    if (!session_) {
        finish_connect(Result<void>::Err("Failed to create SSH session"));
        return;
    }
    libssh2_session_set_blocking(session_, 0);

    auto self = shared_from_this();
    auto fd = socket_.native_handle();
    async_call(nullptr,
        [self, fd]() { return libssh2_session_handshake(self->session_, fd); },
        [self](int rc) {
            if (!self->connect_handler_) return;
            if (rc != 0) {
                self->finish_connect(Result<void>::Err("SSH handshake failed: " + self->last_error()));
                return;
            }
            self->authenticate();
        });
}

void SshSession::authenticate() {
    auto self = shared_from_this();
    const auto& user = target_.user;

    auto try_password = [self]() {
        const auto& password = *self->target_.password;
        self->async_call(nullptr,
            [self, password]() {
                return libssh2_userauth_password(self->session_, self->target_.user.c_str(),
                                                 password.c_str());
            },
            [self](int rc) {
                if (!self->connect_handler_) return;
                if (rc != 0) {
                    self->finish_connect(Result<void>::Err(fmt::format(
                        "Authentication failed for {}: {}", self->target_.describe(), self->last_error())));
                    return;
                }
                self->finish_connect(Result<void>::Ok());
            });
    };

    if (target_.private_key_path) {
        std::string key = *target_.private_key_path;
        async_call(nullptr,
            [self, user, key]() {
                return libssh2_userauth_publickey_fromfile(self->session_, user.c_str(),
                                                           nullptr, key.c_str(), nullptr);
            },
            [self, key, try_password](int rc) {
                if (!self->connect_handler_) return;
                if (rc == 0) {
                    self->finish_connect(Result<void>::Ok());
                    return;
                }
                log_debug(fmt::format("SSH: key {} rejected: {}", key, self->last_error()));
                if (self->target_.password) {
                    try_password();
                    return;
                }
                self->finish_connect(Result<void>::Err(fmt::format(
                    "Authentication failed for {} with key {}: {}",
                    self->target_.describe(), key, self->last_error())));
            });
        return;
    }

    if (target_.password) {
        try_password();
        return;
    }

    finish_connect(Result<void>::Err(
        "No SSH credentials: set a private key file or a password"));
}

void SshSession::finish_connect(Result<void> result) {
    if (!connect_handler_) return;
    auto handler = std::move(connect_handler_);
    connect_handler_ = nullptr;
    connect_timer_.cancel();

    if (result.is_err()) {
        log_debug(fmt::format("SSH: {} failed: {}", target_.describe(), result.error));
        close(result.error);
    } else {
        connected_ = true;
        libssh2_keepalive_config(session_, 1, SSH_KEEPALIVE_SECS);
        schedule_keepalive();
        log_debug(fmt::format("SSH: connected to {}", target_.describe()));
    }
    boost::asio::post(io_, [handler, result]() { handler(result); });
}

void SshSession::close(const std::string& reason) {
    if (closed_) return;
    closed_ = true;
    connected_ = false;

    connect_timer_.cancel();
    nudge_timer_.cancel();
    keepalive_timer_.cancel();
    resolver_.cancel();

    auto ops = std::move(pending_);
    pending_.clear();
    for (auto& op : ops) {
        auto done = std::move(op.done);
        boost::asio::post(io_, [done]() { done(LIBSSH2_ERROR_SOCKET_DISCONNECT); });
    }

    if (connect_handler_) {
        auto handler = std::move(connect_handler_);
        connect_handler_ = nullptr;
        boost::asio::post(io_, [handler, reason]() {
            handler(Result<void>::Err("SSH session closed: " + reason));
        });
    }

    if (session_) {
        int rc = libssh2_session_disconnect(session_, reason.c_str());
        if (rc != 0 && rc != LIBSSH2_ERROR_EAGAIN)
            log_debug(fmt::format("SSH: disconnect from {}: {}", target_.describe(), ssh_error_name(rc)));
        for (int i = 0; i < 100 && libssh2_session_free(session_) == LIBSSH2_ERROR_EAGAIN; i++) {
        }
        session_ = nullptr;
    }

    boost::system::error_code ec;
    socket_.close(ec);
    log_debug(fmt::format("SSH: session {} closed ({})", target_.describe(), reason));
}

std::string SshSession::last_error() const {
    if (!session_) return "no session";
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session_, &msg, &len, 0);
    if (!msg || len == 0) return "unknown error";
    return std::string(msg, static_cast<size_t>(len));
}

int SshSession::last_errno() const {
    if (!session_) return LIBSSH2_ERROR_SOCKET_DISCONNECT;
    return libssh2_session_last_errno(session_);
}

// ── Channels ──────────────────────────────────────────────

void SshSession::open_channel(std::function<LIBSSH2_CHANNEL*()> open, std::string what,
                              ChannelHandler handler) {
    if (!connected()) {
        boost::asio::post(io_, [handler, what]() {
            handler(Result<LIBSSH2_CHANNEL*>::Err(what + " failed: SSH session is not connected"));
        });
        return;
    }

    auto self = shared_from_this();
    auto channel = std::make_shared<LIBSSH2_CHANNEL*>(nullptr);
    async_call(nullptr,
        [self, open, channel]() {
            *channel = open();
            if (*channel) return 0;
            int rc = libssh2_session_last_errno(self->session_);
            return rc != 0 ? rc : LIBSSH2_ERROR_CHANNEL_FAILURE;
        },
        [self, channel, what, handler](int rc) {
            if (rc == 0 && *channel) {
                handler(Result<LIBSSH2_CHANNEL*>::Ok(*channel));
                return;
            }
            std::string reason = self->closed() ? ssh_error_name(rc) : self->last_error();
            handler(Result<LIBSSH2_CHANNEL*>::Err(fmt::format("{} failed: {}", what, reason)));
        });
}

void SshSession::async_direct_tcpip(const std::string& host, uint16_t port, ChannelHandler handler) {
    auto self = shared_from_this();
    open_channel(
        [self, host, port]() {
            return libssh2_channel_direct_tcpip(self->session_, host.c_str(), port);
        },
        fmt::format("direct-tcpip to {}:{}", host, port),
        std::move(handler));
}

void SshSession::async_exec(const std::string& command, ChannelHandler handler,
                            std::optional<PtyRequest> pty) {
    auto self = shared_from_this();
    open_channel(
        [self]() { return libssh2_channel_open_session(self->session_); },
        "exec channel",
        [self, command, handler, pty](Result<LIBSSH2_CHANNEL*> opened) {
            if (opened.is_err()) {
                handler(opened);
                return;
            }
            LIBSSH2_CHANNEL* channel = opened.value;
            if (!pty) {
                self->start_command(channel, command, handler);
                return;
            }
            auto request = *pty;
            self->async_call(nullptr,
                [channel, request]() {
                    return libssh2_channel_request_pty_ex(
                        channel, request.term.c_str(), static_cast<unsigned int>(request.term.size()),
                        nullptr, 0, request.width, request.height, 0, 0);
                },
                [self, channel, command, handler](int rc) {
                    if (rc != 0) {
                        std::string reason = self->closed() ? ssh_error_name(rc) : self->last_error();
                        self->release_channel(channel);
                        handler(Result<LIBSSH2_CHANNEL*>::Err("pty request failed: " + reason));
                        return;
                    }
                    self->start_command(channel, command, handler);
                });
        });
}

void SshSession::start_command(LIBSSH2_CHANNEL* channel, const std::string& command,
                               ChannelHandler handler) {
    auto self = shared_from_this();
    log_debug(fmt::format("SSH: exec on {}: {}", target_.describe(), command.empty() ? "login shell" : command));
    async_call(nullptr,
        [channel, command]() {
            if (command.empty()) return libssh2_channel_shell(channel);
            return libssh2_channel_exec(channel, command.c_str());
        },
        [self, channel, handler](int rc) {
            if (rc == 0) {
                handler(Result<LIBSSH2_CHANNEL*>::Ok(channel));
                return;
            }
            std::string reason = self->closed() ? ssh_error_name(rc) : self->last_error();
            self->release_channel(channel);
            handler(Result<LIBSSH2_CHANNEL*>::Err("exec failed: " + reason));
        });
}

void SshSession::release_channel(LIBSSH2_CHANNEL* channel) {
    if (closed()) return;
    async_call(nullptr, [channel]() { return libssh2_channel_free(channel); }, [](int) {});
}

void SshSession::async_sftp(SftpHandler handler) {
    if (!connected()) {
        boost::asio::post(io_, [handler]() {
            handler(Result<LIBSSH2_SFTP*>::Err("SFTP failed: SSH session is not connected"));
        });
        return;
    }

    auto self = shared_from_this();
    auto sftp = std::make_shared<LIBSSH2_SFTP*>(nullptr);
    async_call(nullptr,
        [self, sftp]() {
            *sftp = libssh2_sftp_init(self->session_);
            if (*sftp) return 0;
            int rc = libssh2_session_last_errno(self->session_);
            return rc != 0 ? rc : LIBSSH2_ERROR_CHANNEL_FAILURE;
        },
        [self, sftp, handler](int rc) {
            if (rc == 0 && *sftp) {
                log_debug(fmt::format("SSH: SFTP subsystem open on {}", self->target_.describe()));
                handler(Result<LIBSSH2_SFTP*>::Ok(*sftp));
                return;
            }
            std::string reason = self->closed() ? ssh_error_name(rc) : self->last_error();
            handler(Result<LIBSSH2_SFTP*>::Err("SFTP subsystem failed: " + reason));
        });
}

// ── Event pump ────────────────────────────────────────────

void SshSession::async_call(const void* owner, Attempt attempt, Completion done) {
    if (closed_) {
        boost::asio::post(io_, [done]() { done(LIBSSH2_ERROR_SOCKET_DISCONNECT); });
        return;
    }
    pending_.push_back({owner, std::move(attempt), std::move(done)});

    std::weak_ptr<SshSession> weak = shared_from_this();
    boost::asio::post(io_, [weak]() {
        if (auto self = weak.lock()) self->drive();
    });
}

void SshSession::cancel_ops(const void* owner) {
    for (auto it = pending_.begin(); it != pending_.end();) {
        if (it->owner != owner) {
            ++it;
            continue;
        }
        auto done = std::move(it->done);
        it = pending_.erase(it);
        boost::asio::post(io_, [done]() { done(LIBSSH2_ERROR_CHANNEL_CLOSED); });
    }
}

void SshSession::drive() {
    if (closed_ || !session_) return;

    // An attempt for one channel may pull another channel's packets off the
    // socket; keep passing while the socket had data or anything completed.
    for (int round = 0; round < MAX_DRIVE_ROUNDS && !pending_.empty(); ++round) {
        boost::system::error_code ec;
        std::size_t buffered = socket_.available(ec);
        bool progress = run_pass();
        if (closed_) return;
        if (!progress && buffered == 0) break;
    }

    if (!pending_.empty()) arm_wait();
}

bool SshSession::run_pass() {
    bool progress = false;
    for (auto it = pending_.begin(); it != pending_.end();) {
        int rc = it->attempt();
        if (rc == LIBSSH2_ERROR_EAGAIN) {
            ++it;
            continue;
        }
        auto done = std::move(it->done);
        it = pending_.erase(it);
        progress = true;
        boost::asio::post(io_, [done, rc]() { done(rc); });
    }
    return progress;
}

void SshSession::arm_wait() {
    if (closed_) return;
    std::weak_ptr<SshSession> weak = shared_from_this();

    auto on_ready = [weak](const boost::system::error_code& ec) {
        auto self = weak.lock();
        if (!self || ec == boost::asio::error::operation_aborted) return;
        if (ec) {
            self->close("socket error: " + ec.message());
            return;
        }
        self->drive();
    };

    int dirs = libssh2_session_block_directions(session_);
    if ((dirs & LIBSSH2_SESSION_BLOCK_OUTBOUND) && !write_waiting_) {
        write_waiting_ = true;
        socket_.async_wait(tcp::socket::wait_write, [weak, on_ready](const boost::system::error_code& ec) {
            if (auto self = weak.lock()) self->write_waiting_ = false;
            on_ready(ec);
        });
    }
    if (!read_waiting_) {
        read_waiting_ = true;
        socket_.async_wait(tcp::socket::wait_read, [weak, on_ready](const boost::system::error_code& ec) {
            if (auto self = weak.lock()) self->read_waiting_ = false;
            on_ready(ec);
        });
    }
    if (!nudge_armed_) {
        // Backstop for data libssh2 already buffered on behalf of a waiting op.
        nudge_armed_ = true;
        nudge_timer_.expires_after(NUDGE_INTERVAL);
        nudge_timer_.async_wait([weak](const boost::system::error_code& ec) {
            auto self = weak.lock();
            if (!self) return;
            self->nudge_armed_ = false;
            if (!ec) self->drive();
        });
    }
}

void SshSession::schedule_keepalive() {
    std::weak_ptr<SshSession> weak = shared_from_this();
    keepalive_timer_.expires_after(std::chrono::seconds(SSH_KEEPALIVE_SECS));
    keepalive_timer_.async_wait([weak](const boost::system::error_code& ec) {
        auto self = weak.lock();
        if (!self || ec || self->closed_) return;
        int next = 0;
        int rc = libssh2_keepalive_send(self->session_, &next);
        if (rc != 0 && rc != LIBSSH2_ERROR_EAGAIN) {
            self->close("keepalive failed: " + self->last_error());
            return;
        }
        self->drive();
        self->schedule_keepalive();
    });
}
