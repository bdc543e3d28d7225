#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <boost/asio/io_context.hpp>

// Broadcast "please stop" signal.
//
// Any number of subscribers; trigger() is idempotent and thread-safe.
// Subscriber callbacks are posted to the io_context, never run inline, so a
// subscriber may safely trigger, subscribe or unsubscribe from its callback.
// Subscribing after the signal fired posts the callback immediately.
class CancelSignal : public std::enable_shared_from_this<CancelSignal> {
public:
    using Callback = std::function<void()>;
    using SubscriptionId = std::uint64_t;

    static std::shared_ptr<CancelSignal> create(boost::asio::io_context& io);
    ~CancelSignal();

    CancelSignal(const CancelSignal&) = delete;
    CancelSignal& operator=(const CancelSignal&) = delete;

    void trigger();
    bool triggered() const { return triggered_.load(); }

    SubscriptionId subscribe(Callback callback);
    void unsubscribe(SubscriptionId id);
    std::size_t subscriber_count() const;

    // A signal that fires when this one does, and can also fire on its own.
    std::shared_ptr<CancelSignal> make_child();

    // Stop following the parent (no-op for a root signal).
    void detach();

    boost::asio::io_context& io() { return io_; }

private:
    explicit CancelSignal(boost::asio::io_context& io);

    boost::asio::io_context& io_;
    mutable std::mutex mutex_;
    std::atomic<bool> triggered_{false};
    SubscriptionId next_id_ = 1;
    std::map<SubscriptionId, Callback> subscribers_;

    std::weak_ptr<CancelSignal> parent_;
    SubscriptionId parent_subscription_ = 0;
};

// Read-only view of a CancelSignal handed to tasks.
class CancelToken {
public:
    CancelToken() = default;
    explicit CancelToken(std::shared_ptr<CancelSignal> signal) : signal_(std::move(signal)) {}

    bool cancelled() const { return signal_ && signal_->triggered(); }

    CancelSignal::SubscriptionId on_cancel(CancelSignal::Callback callback) const {
        return signal_ ? signal_->subscribe(std::move(callback)) : 0;
    }

    void unsubscribe(CancelSignal::SubscriptionId id) const {
        if (signal_ && id != 0) signal_->unsubscribe(id);
    }

    const std::shared_ptr<CancelSignal>& signal() const { return signal_; }

private:
    std::shared_ptr<CancelSignal> signal_;
};
