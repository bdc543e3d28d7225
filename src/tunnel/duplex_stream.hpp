#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/tcp.hpp>

using IoHandler = std::function<void(const boost::system::error_code&, std::size_t)>;

// A byte stream with independent read and write halves.
//
// Completion handlers are never invoked from inside the initiating call.
// At most one read and one write may be outstanding at a time.
class DuplexStream {
public:
    virtual ~DuplexStream() = default;

    virtual void async_read_some(boost::asio::mutable_buffer buffer, IoHandler handler) = 0;
    virtual void async_write_some(boost::asio::const_buffer buffer, IoHandler handler) = 0;

    // Half-close: the peer reads end-of-stream after the data already written.
    virtual void shutdown_send() = 0;

    // Aborts outstanding operations and releases the stream. Idempotent.
    virtual void close() = 0;

    virtual std::string describe() const = 0;
};

// DuplexStream over a connected TCP socket.
class TcpDuplexStream : public DuplexStream {
public:
    explicit TcpDuplexStream(boost::asio::ip::tcp::socket socket);
    ~TcpDuplexStream() override;

    void async_read_some(boost::asio::mutable_buffer buffer, IoHandler handler) override;
    void async_write_some(boost::asio::const_buffer buffer, IoHandler handler) override;
    void shutdown_send() override;
    void close() override;
    std::string describe() const override;

private:
    boost::asio::ip::tcp::socket socket_;
    std::string description_;
};

// End-of-stream, broken pipe, peer reset and cancellation: the normal ways a
// tunnelled connection ends.
bool is_benign_disconnect(const boost::system::error_code& ec);
