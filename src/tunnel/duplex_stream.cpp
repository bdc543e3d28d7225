#include "duplex_stream.hpp"
#include <boost/asio/error.hpp>
#include <fmt/format.h>

using boost::asio::ip::tcp;

TcpDuplexStream::TcpDuplexStream(tcp::socket socket)
    : socket_(std::move(socket)) {
    boost::system::error_code ec;
    auto remote = socket_.remote_endpoint(ec);
    description_ = ec ? std::string("tcp") : fmt::format("tcp:{}", remote.address().to_string() +
                                                          ":" + std::to_string(remote.port()));
}

TcpDuplexStream::~TcpDuplexStream() {
    close();
}

void TcpDuplexStream::async_read_some(boost::asio::mutable_buffer buffer, IoHandler handler) {
    socket_.async_read_some(buffer, std::move(handler));
}

void TcpDuplexStream::async_write_some(boost::asio::const_buffer buffer, IoHandler handler) {
    socket_.async_write_some(buffer, std::move(handler));
}

void TcpDuplexStream::shutdown_send() {
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_send, ec);
}

void TcpDuplexStream::close() {
    if (!socket_.is_open()) return;
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

std::string TcpDuplexStream::describe() const {
    return description_;
}

bool is_benign_disconnect(const boost::system::error_code& ec) {
    return ec == boost::asio::error::eof ||
           ec == boost::asio::error::broken_pipe ||
           ec == boost::asio::error::connection_reset ||
           ec == boost::asio::error::connection_aborted ||
           ec == boost::asio::error::operation_aborted ||
           ec == boost::asio::error::shut_down;
}
