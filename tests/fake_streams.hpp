#pragma once

#include <algorithm>
#include <atomic>
#include <cstring>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <tunnel/duplex_stream.hpp>
#include <tunnel/remote_stream_provider.hpp>

// In-memory DuplexStream. Bytes written to one end are read from its peer;
// an echo stream is its own peer. All completions are posted to the io_context.
class MemoryStream : public DuplexStream, public std::enable_shared_from_this<MemoryStream> {
public:
    MemoryStream(boost::asio::io_context& io, std::string name) : io_(io), name_(std::move(name)) {}

    static std::pair<std::shared_ptr<MemoryStream>, std::shared_ptr<MemoryStream>>
    pipe(boost::asio::io_context& io) {
        auto a = std::make_shared<MemoryStream>(io, "pipe-a");
        auto b = std::make_shared<MemoryStream>(io, "pipe-b");
        a->peer_ = b;
        b->peer_ = a;
        return {a, b};
    }

    static std::shared_ptr<MemoryStream> echo(boost::asio::io_context& io) {
        auto s = std::make_shared<MemoryStream>(io, "echo");
        s->peer_ = s;
        return s;
    }

    void async_read_some(boost::asio::mutable_buffer buffer, IoHandler handler) override {
        read_buffer_ = buffer;
        read_handler_ = std::move(handler);
        complete_read();
    }

    void async_write_some(boost::asio::const_buffer buffer, IoHandler handler) override {
        auto peer = peer_.lock();
        if (closed_ || send_shutdown_ || !peer || peer->closed_) {
            boost::asio::post(io_, [handler]() { handler(boost::asio::error::broken_pipe, 0); });
            return;
        }
        std::size_t n = buffer.size();
        bytes_written_ += n;
        peer->inbox_.append(static_cast<const char*>(buffer.data()), n);
        boost::asio::post(io_, [handler, n]() { handler({}, n); });
        peer->complete_read();
    }

    void shutdown_send() override {
        if (send_shutdown_) return;
        send_shutdown_ = true;
        if (auto peer = peer_.lock()) {
            peer->inbox_eof_ = true;
            peer->complete_read();
        }
    }

    void close() override {
        if (closed_) return;
        closed_ = true;
        complete_read();
        auto peer = peer_.lock();
        if (peer && peer.get() != this) {
            peer->inbox_eof_ = true;
            peer->complete_read();
        }
    }

    std::string describe() const override { return name_; }

    // Next (and every later) read fails with `ec`.
    void fail_reads_with(boost::system::error_code ec) {
        forced_error_ = ec;
        complete_read();
    }

    bool closed() const { return closed_; }
    bool send_shutdown() const { return send_shutdown_; }
    std::size_t bytes_written() const { return bytes_written_; }

private:
    void complete_read() {
        if (!read_handler_) return;
        IoHandler handler = std::move(read_handler_);
        read_handler_ = nullptr;

        if (closed_) {
            boost::asio::post(io_, [handler]() { handler(boost::asio::error::operation_aborted, 0); });
        } else if (forced_error_) {
            auto ec = forced_error_;
            boost::asio::post(io_, [handler, ec]() { handler(ec, 0); });
        } else if (!inbox_.empty()) {
            std::size_t n = std::min(inbox_.size(), read_buffer_.size());
            std::memcpy(read_buffer_.data(), inbox_.data(), n);
            inbox_.erase(0, n);
            boost::asio::post(io_, [handler, n]() { handler({}, n); });
        } else if (inbox_eof_) {
            boost::asio::post(io_, [handler]() { handler(boost::asio::error::eof, 0); });
        } else {
            read_handler_ = std::move(handler);
        }
    }

    boost::asio::io_context& io_;
    std::string name_;
    std::weak_ptr<MemoryStream> peer_;
    std::string inbox_;
    bool inbox_eof_ = false;
    bool send_shutdown_ = false;
    bool closed_ = false;
    boost::system::error_code forced_error_;
    std::size_t bytes_written_ = 0;

    boost::asio::mutable_buffer read_buffer_;
    IoHandler read_handler_;
};

// Far end of a pipe acting as a remote service: sends `to_send`, half-closes,
// and collects everything the bridge delivers until end-of-stream.
class RemotePeer : public std::enable_shared_from_this<RemotePeer> {
public:
    RemotePeer(std::shared_ptr<MemoryStream> stream, std::string to_send)
        : stream_(std::move(stream)), to_send_(std::move(to_send)), buffer_(4096) {}

    void start() {
        auto self = shared_from_this();
        if (!to_send_.empty()) {
            stream_->async_write_some(boost::asio::buffer(to_send_),
                [self](const boost::system::error_code& ec, std::size_t) {
                    if (!ec) self->stream_->shutdown_send();
                });
        } else {
            stream_->shutdown_send();
        }
        read();
    }

    const std::string& received() const { return received_; }
    bool saw_eof() const { return saw_eof_; }

private:
    void read() {
        auto self = shared_from_this();
        stream_->async_read_some(boost::asio::buffer(buffer_),
            [self](const boost::system::error_code& ec, std::size_t n) {
                if (ec) {
                    self->saw_eof_ = (ec == boost::asio::error::eof);
                    return;
                }
                self->received_.append(self->buffer_.data(), n);
                self->read();
            });
    }

    std::shared_ptr<MemoryStream> stream_;
    std::string to_send_;
    std::vector<char> buffer_;
    std::string received_;
    bool saw_eof_ = false;
};

// RemoteStreamProvider double. Echoes by default; fails for pods listed in
// failing_pods and for the open numbered fail_open_number (1-based); with
// hold set, parks opens until release_held().
class FakeProvider : public RemoteStreamProvider {
public:
    explicit FakeProvider(boost::asio::io_context& io) : io_(io) {}

    void async_open(const std::string& pod_name, const std::string& pod_namespace,
                    uint16_t remote_port, OpenHandler handler) override {
        int number = ++opens;
        if (failing_pods.count(pod_name) || number == fail_open_number) {
            ++failures;
            std::string msg = "pod " + pod_name + " is not running";
            boost::asio::post(io_, [handler, msg]() {
                handler(Result<std::shared_ptr<DuplexStream>>::Err(msg));
            });
            return;
        }
        if (hold) {
            held.push_back(std::move(handler));
            return;
        }
        std::shared_ptr<DuplexStream> stream = make_stream();
        boost::asio::post(io_, [handler, stream]() {
            handler(Result<std::shared_ptr<DuplexStream>>::Ok(stream));
        });
    }

    std::string name() const override { return "fake"; }

    void release_held() {
        for (auto& handler : held) {
            std::shared_ptr<DuplexStream> stream = make_stream();
            boost::asio::post(io_, [handler, stream]() {
                handler(Result<std::shared_ptr<DuplexStream>>::Ok(stream));
            });
        }
        held.clear();
    }

    std::shared_ptr<MemoryStream> make_stream() {
        std::shared_ptr<MemoryStream> stream;
        if (stream_factory) {
            stream = stream_factory();
        } else {
            stream = MemoryStream::echo(io_);
            if (read_error) stream->fail_reads_with(read_error);
        }
        streams.push_back(stream);
        return stream;
    }

    std::set<std::string> failing_pods;
    int fail_open_number = 0;
    bool hold = false;
    boost::system::error_code read_error;
    std::function<std::shared_ptr<MemoryStream>()> stream_factory;

    std::atomic<int> opens{0};
    std::atomic<int> failures{0};
    std::vector<OpenHandler> held;
    std::vector<std::shared_ptr<MemoryStream>> streams;

private:
    boost::asio::io_context& io_;
};
