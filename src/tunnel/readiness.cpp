#include "readiness.hpp"
#include <boost/asio/post.hpp>

using boost::asio::ip::tcp;

// ── Sender ────────────────────────────────────────────────

Readiness::Sender::~Sender() {
    close();
}

void Readiness::Sender::send(const tcp::endpoint& endpoint) {
    if (channel_) channel_->fulfil(endpoint);
}

void Readiness::Sender::close() {
    if (channel_) {
        channel_->fail();
        channel_.reset();
    }
}

// ── Readiness ─────────────────────────────────────────────

std::pair<std::shared_ptr<Readiness>, std::shared_ptr<Readiness::Sender>>
Readiness::channel(boost::asio::io_context& io) {
    std::shared_ptr<Readiness> ready(new Readiness(io));
    std::shared_ptr<Sender> sender(new Sender(ready));
    return {ready, sender};
}

ReadyCallback Readiness::as_callback(std::shared_ptr<Sender> sender) {
    return [sender](const tcp::endpoint& endpoint) { sender->send(endpoint); };
}

void Readiness::async_wait(Handler handler) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (handler_) {
        lock.unlock();
        boost::asio::post(io_, [handler]() {
            handler(Result<tcp::endpoint>::Err("readiness is already being awaited"));
        });
        return;
    }
    handler_ = std::move(handler);
    dispatch(lock);
}

bool Readiness::resolved() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return value_.has_value() || closed_;
}

void Readiness::fulfil(const tcp::endpoint& endpoint) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (value_ || closed_) return;
    value_ = endpoint;
    dispatch(lock);
}

void Readiness::fail() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (value_ || closed_) return;
    closed_ = true;
    dispatch(lock);
}

void Readiness::dispatch(std::unique_lock<std::mutex>& lock) {
    if (!handler_ || !(value_ || closed_)) return;

    Handler handler = std::move(handler_);
    handler_ = nullptr;
    auto result = value_ ? Result<tcp::endpoint>::Ok(*value_)
                         : Result<tcp::endpoint>::Err("listener closed before reporting its address");
    lock.unlock();
    boost::asio::post(io_, [handler, result]() { handler(result); });
}
