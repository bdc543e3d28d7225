#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <core/types.hpp>

using ReadyCallback = std::function<void(const boost::asio::ip::tcp::endpoint&)>;

// One-shot, single-consumer readiness channel carrying the bound address.
//
// The producer sets the value at most once. Closing (or destroying) the
// producer before a value is set resolves the consumer with an error, so a
// failed listener never leaves the consumer hanging. Setting a value nobody
// waits for is fine: it is simply kept.
class Readiness {
public:
    using Handler = std::function<void(Result<boost::asio::ip::tcp::endpoint>)>;

    class Sender {
    public:
        ~Sender();
        Sender(const Sender&) = delete;
        Sender& operator=(const Sender&) = delete;

        void send(const boost::asio::ip::tcp::endpoint& endpoint);
        void close();

    private:
        friend class Readiness;
        explicit Sender(std::shared_ptr<Readiness> channel) : channel_(std::move(channel)) {}
        std::shared_ptr<Readiness> channel_;
    };

    // Creates the channel together with its only producer.
    static std::pair<std::shared_ptr<Readiness>, std::shared_ptr<Sender>>
    channel(boost::asio::io_context& io);

    // Adapts the sender to the listener's ready callback. The callback keeps
    // the sender alive; dropping the callback unfulfilled closes the channel.
    static ReadyCallback as_callback(std::shared_ptr<Sender> sender);

    // Handler is posted to the io_context once the channel resolves.
    void async_wait(Handler handler);

    bool resolved() const;

private:
    explicit Readiness(boost::asio::io_context& io) : io_(io) {}

    void fulfil(const boost::asio::ip::tcp::endpoint& endpoint);
    void fail();
    void dispatch(std::unique_lock<std::mutex>& lock);

    boost::asio::io_context& io_;
    mutable std::mutex mutex_;
    std::optional<boost::asio::ip::tcp::endpoint> value_;
    bool closed_ = false;
    Handler handler_;
};
