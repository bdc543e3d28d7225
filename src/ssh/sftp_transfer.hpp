#pragma once

#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <tunnel/readiness_consumer.hpp>
#include "ssh_session.hpp"

typedef struct _LIBSSH2_SFTP_HANDLE LIBSSH2_SFTP_HANDLE;

enum class TransferDirection {
    Upload,     // local file -> remote path
    Download,   // remote file -> local path
};

// Copies one file over SFTP on a fresh SSH session through the tunnel.
//
// Remote destinations are created or truncated; local destinations likewise.
// File and SFTP failures are TransferFailed, session failures SshFailed.
class SftpTransfer : public TunnelSession, public std::enable_shared_from_this<SftpTransfer> {
public:
    SftpTransfer(boost::asio::io_context& io, SshTarget target, TransferDirection direction,
                 std::string local_path, std::string remote_path);

    void start(const boost::asio::ip::tcp::endpoint& bound, OutcomeHandler done) override;
    void cancel() override;

    std::uint64_t bytes_transferred() const { return transferred_; }

    // True once the whole file was copied and the remote handle closed.
    bool completed() const { return completed_; }

private:
    void on_connected(Result<void> result);
    void on_sftp(Result<LIBSSH2_SFTP*> sftp);
    void on_remote_open(int rc);
    void download_next();
    void upload_next();
    void write_chunk(std::size_t offset, std::size_t size);
    void close_remote();
    void finish(TaskOutcome outcome);

    std::string sftp_error() const;

    boost::asio::io_context& io_;
    SshTarget target_;
    TransferDirection direction_;
    std::string local_path_;
    std::string remote_path_;
    OutcomeHandler done_;

    std::shared_ptr<SshSession> session_;
    LIBSSH2_SFTP* sftp_ = nullptr;
    LIBSSH2_SFTP_HANDLE* handle_ = nullptr;
    std::ifstream in_;
    std::ofstream out_;
    std::vector<char> buf_;
    std::uint64_t transferred_ = 0;
    bool completed_ = false;
    bool finished_ = false;
};

// Describes an SFTP status code ("no such file", "permission denied", ...).
std::string sftp_status_name(unsigned long status);
