#include "sftp_transfer.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <boost/asio/post.hpp>
#include <fmt/format.h>
#include <libssh2.h>
#include <libssh2_sftp.h>

std::string sftp_status_name(unsigned long status) {
    switch (status) {
        case LIBSSH2_FX_OK:                return "ok";
        case LIBSSH2_FX_EOF:               return "end of file";
        case LIBSSH2_FX_NO_SUCH_FILE:      return "no such file";
        case LIBSSH2_FX_PERMISSION_DENIED: return "permission denied";
        case LIBSSH2_FX_FAILURE:           return "failure";
        case LIBSSH2_FX_NO_SUCH_PATH:      return "no such path";
        case LIBSSH2_FX_FILE_ALREADY_EXISTS: return "file already exists";
        case LIBSSH2_FX_WRITE_PROTECT:     return "write protected";
        case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM: return "no space on filesystem";
        case LIBSSH2_FX_QUOTA_EXCEEDED:    return "quota exceeded";
        case LIBSSH2_FX_NOT_A_DIRECTORY:   return "not a directory";
        case LIBSSH2_FX_INVALID_FILENAME:  return "invalid filename";
        default:                           return fmt::format("SFTP status {}", status);
    }
}

SftpTransfer::SftpTransfer(boost::asio::io_context& io, SshTarget target, TransferDirection direction,
                           std::string local_path, std::string remote_path)
    : io_(io),
      target_(std::move(target)),
      direction_(direction),
      local_path_(std::move(local_path)),
      remote_path_(std::move(remote_path)),
      buf_(SFTP_CHUNK_SIZE) {}

void SftpTransfer::start(const boost::asio::ip::tcp::endpoint& bound, OutcomeHandler done) {
    done_ = std::move(done);

    if (direction_ == TransferDirection::Upload) {
        in_.open(local_path_, std::ios::binary);
        if (!in_) {
            finish(TaskOutcome::Err(ErrorKind::TransferFailed,
                                    fmt::format("Cannot open local file {}", local_path_)));
            return;
        }
    }

    target_.host = bound.address().to_string();
    target_.port = bound.port();
    session_ = SshSession::create(io_, target_);

    auto self = shared_from_this();
    session_->async_connect([self](Result<void> result) { self->on_connected(std::move(result)); });
}

void SftpTransfer::cancel() {
    finish(TaskOutcome::Err(ErrorKind::TransferFailed, "cancelled"));
}

void SftpTransfer::on_connected(Result<void> result) {
    if (finished_) return;
    if (result.is_err()) {
        finish(TaskOutcome::Err(ErrorKind::SshFailed, result.error));
        return;
    }
    auto self = shared_from_this();
    session_->async_sftp([self](Result<LIBSSH2_SFTP*> sftp) { self->on_sftp(std::move(sftp)); });
}

void SftpTransfer::on_sftp(Result<LIBSSH2_SFTP*> sftp) {
    if (finished_) return;
    if (sftp.is_err()) {
        finish(TaskOutcome::Err(ErrorKind::TransferFailed, sftp.error));
        return;
    }
    sftp_ = sftp.value;

    bool upload = direction_ == TransferDirection::Upload;
    unsigned long flags = upload ? (LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC)
                                 : LIBSSH2_FXF_READ;
    long mode = upload ? (LIBSSH2_SFTP_S_IRUSR | LIBSSH2_SFTP_S_IWUSR |
                          LIBSSH2_SFTP_S_IRGRP | LIBSSH2_SFTP_S_IROTH)
                       : 0;

    auto self = shared_from_this();
    session_->async_call(this,
        [self, flags, mode]() {
            self->handle_ = libssh2_sftp_open(self->sftp_, self->remote_path_.c_str(), flags, mode);
            if (self->handle_) return 0;
            int rc = self->session_->last_errno();
            return rc != 0 ? rc : LIBSSH2_ERROR_SFTP_PROTOCOL;
        },
        [self](int rc) { self->on_remote_open(rc); });
}

void SftpTransfer::on_remote_open(int rc) {
    if (finished_) return;
    if (rc != 0 || !handle_) {
        finish(TaskOutcome::Err(ErrorKind::TransferFailed,
            fmt::format("Cannot open remote file {}: {}", remote_path_,
                        rc == LIBSSH2_ERROR_SFTP_PROTOCOL ? sftp_error() : ssh_error_name(rc))));
        return;
    }

    log_debug(fmt::format("SftpTransfer: {} {} ({})",
                          direction_ == TransferDirection::Upload ? "uploading to" : "downloading",
                          remote_path_, target_.describe()));

    if (direction_ == TransferDirection::Upload) {
        upload_next();
        return;
    }

    out_.open(local_path_, std::ios::binary | std::ios::trunc);
    if (!out_) {
        finish(TaskOutcome::Err(ErrorKind::TransferFailed,
                                fmt::format("Cannot create local file {}", local_path_)));
        return;
    }
    download_next();
}

void SftpTransfer::download_next() {
    auto self = shared_from_this();
    session_->async_call(this,
        [self]() {
            return static_cast<int>(libssh2_sftp_read(self->handle_, self->buf_.data(), self->buf_.size()));
        },
        [self](int rc) {
            if (self->finished_) return;
            if (rc < 0) {
                self->finish(TaskOutcome::Err(ErrorKind::TransferFailed,
                    fmt::format("Reading {} failed: {}", self->remote_path_,
                                rc == LIBSSH2_ERROR_SFTP_PROTOCOL ? self->sftp_error() : ssh_error_name(rc))));
                return;
            }
            if (rc == 0) {
                self->out_.close();
                if (self->out_.fail()) {
                    self->finish(TaskOutcome::Err(ErrorKind::TransferFailed,
                        fmt::format("Writing {} failed", self->local_path_)));
                    return;
                }
                self->close_remote();
                return;
            }
            self->out_.write(self->buf_.data(), rc);
            if (!self->out_) {
                self->finish(TaskOutcome::Err(ErrorKind::TransferFailed,
                    fmt::format("Writing {} failed", self->local_path_)));
                return;
            }
            self->transferred_ += static_cast<std::uint64_t>(rc);
            self->download_next();
        });
}

void SftpTransfer::upload_next() {
    in_.read(buf_.data(), static_cast<std::streamsize>(buf_.size()));
    std::size_t n = static_cast<std::size_t>(in_.gcount());
    if (n == 0) {
        if (in_.bad()) {
            finish(TaskOutcome::Err(ErrorKind::TransferFailed,
                                    fmt::format("Reading {} failed", local_path_)));
            return;
        }
        close_remote();
        return;
    }
    write_chunk(0, n);
}

void SftpTransfer::write_chunk(std::size_t offset, std::size_t size) {
    auto self = shared_from_this();
    session_->async_call(this,
        [self, offset, size]() {
            return static_cast<int>(libssh2_sftp_write(self->handle_, self->buf_.data() + offset, size - offset));
        },
        [self, offset, size](int rc) {
            if (self->finished_) return;
            if (rc < 0) {
                self->finish(TaskOutcome::Err(ErrorKind::TransferFailed,
                    fmt::format("Writing {} failed: {}", self->remote_path_,
                                rc == LIBSSH2_ERROR_SFTP_PROTOCOL ? self->sftp_error() : ssh_error_name(rc))));
                return;
            }
            self->transferred_ += static_cast<std::uint64_t>(rc);
            if (offset + static_cast<std::size_t>(rc) < size) {
                self->write_chunk(offset + static_cast<std::size_t>(rc), size);
                return;
            }
            self->upload_next();
        });
}

void SftpTransfer::close_remote() {
    auto self = shared_from_this();
    session_->async_call(this,
        [self]() { return libssh2_sftp_close_handle(self->handle_); },
        [self](int rc) {
            if (self->finished_) return;
            self->handle_ = nullptr;
            if (rc != 0) {
                self->finish(TaskOutcome::Err(ErrorKind::TransferFailed,
                    fmt::format("Closing {} failed: {}", self->remote_path_, ssh_error_name(rc))));
                return;
            }
            self->session_->async_call(self.get(),
                [self]() { return libssh2_sftp_shutdown(self->sftp_); },
                [self](int) {
                    if (self->finished_) return;
                    self->sftp_ = nullptr;
                    self->finish(TaskOutcome::Ok());
                });
        });
}

void SftpTransfer::finish(TaskOutcome outcome) {
    if (finished_) return;
    finished_ = true;
    completed_ = outcome.is_ok();

    if (session_) {
        session_->cancel_ops(this);
        session_->close(outcome.is_ok() ? "transfer finished" : outcome.error.message);
    }
    log_debug(fmt::format("SftpTransfer: {} after {} byte(s)", outcome.describe(), transferred_));

    auto done = std::move(done_);
    done_ = nullptr;
    if (done) boost::asio::post(io_, [done, outcome]() { done(outcome); });
}

std::string SftpTransfer::sftp_error() const {
    if (!sftp_) return "SFTP protocol error";
    return sftp_status_name(libssh2_sftp_last_error(sftp_));
}
