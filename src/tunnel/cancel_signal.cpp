#include "cancel_signal.hpp"
#include <boost/asio/post.hpp>
#include <vector>

std::shared_ptr<CancelSignal> CancelSignal::create(boost::asio::io_context& io) {
    return std::shared_ptr<CancelSignal>(new CancelSignal(io));
}

CancelSignal::CancelSignal(boost::asio::io_context& io)
    : io_(io) {}

CancelSignal::~CancelSignal() {
    detach();
}

void CancelSignal::trigger() {
    std::vector<Callback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (triggered_.exchange(true)) return;
        callbacks.reserve(subscribers_.size());
        for (auto& [id, cb] : subscribers_) callbacks.push_back(std::move(cb));
        subscribers_.clear();
    }
    for (auto& cb : callbacks) {
        boost::asio::post(io_, std::move(cb));
    }
}

CancelSignal::SubscriptionId CancelSignal::subscribe(Callback callback) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!triggered_.load()) {
            SubscriptionId id = next_id_++;
            subscribers_.emplace(id, std::move(callback));
            return id;
        }
    }
    boost::asio::post(io_, std::move(callback));
    return 0;
}

void CancelSignal::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.erase(id);
}

std::size_t CancelSignal::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

std::shared_ptr<CancelSignal> CancelSignal::make_child() {
    auto child = create(io_);
    std::weak_ptr<CancelSignal> weak_child = child;
    auto id = subscribe([weak_child]() {
        if (auto c = weak_child.lock()) c->trigger();
    });
    child->parent_ = shared_from_this();
    child->parent_subscription_ = id;
    return child;
}

void CancelSignal::detach() {
    auto parent = parent_.lock();
    if (parent && parent_subscription_ != 0) {
        parent->unsubscribe(parent_subscription_);
    }
    parent_.reset();
    parent_subscription_ = 0;
}
