#include <gtest/gtest.h>
#include <tunnel/cancel_signal.hpp>
#include <atomic>
#include <thread>
#include <vector>

TEST(CancelSignal, TriggerNotifiesEverySubscriber) {
    boost::asio::io_context io;
    auto signal = CancelSignal::create(io);
    int calls = 0;
    for (int i = 0; i < 3; i++) signal->subscribe([&calls]() { calls++; });

    signal->trigger();
    io.run();

    EXPECT_EQ(calls, 3);
    EXPECT_TRUE(signal->triggered());
}

TEST(CancelSignal, CallbacksAreNeverInline) {
    boost::asio::io_context io;
    auto signal = CancelSignal::create(io);
    int calls = 0;
    signal->subscribe([&calls]() { calls++; });

    signal->trigger();
    EXPECT_EQ(calls, 0);
    io.run();
    EXPECT_EQ(calls, 1);
}

TEST(CancelSignal, SecondTriggerIsNoOp) {
    boost::asio::io_context io;
    auto signal = CancelSignal::create(io);
    int calls = 0;
    signal->subscribe([&calls]() { calls++; });

    signal->trigger();
    signal->trigger();
    io.run();

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(signal->subscriber_count(), 0u);
}

TEST(CancelSignal, ConcurrentTriggersNotifyOnce) {
    boost::asio::io_context io;
    auto signal = CancelSignal::create(io);
    std::atomic<int> calls{0};
    signal->subscribe([&calls]() { calls++; });

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; i++) threads.emplace_back([signal]() { signal->trigger(); });
    for (auto& t : threads) t.join();
    io.run();

    EXPECT_EQ(calls.load(), 1);
}

TEST(CancelSignal, SubscribeAfterTriggerStillNotifies) {
    boost::asio::io_context io;
    auto signal = CancelSignal::create(io);
    signal->trigger();

    int calls = 0;
    auto id = signal->subscribe([&calls]() { calls++; });
    EXPECT_EQ(id, 0u);
    io.run();
    EXPECT_EQ(calls, 1);
}

TEST(CancelSignal, UnsubscribedCallbackIsSkipped) {
    boost::asio::io_context io;
    auto signal = CancelSignal::create(io);
    int kept = 0, dropped = 0;
    signal->subscribe([&kept]() { kept++; });
    auto id = signal->subscribe([&dropped]() { dropped++; });

    signal->unsubscribe(id);
    signal->trigger();
    io.run();

    EXPECT_EQ(kept, 1);
    EXPECT_EQ(dropped, 0);
}

TEST(CancelSignal, ChildFollowsParent) {
    boost::asio::io_context io;
    auto parent = CancelSignal::create(io);
    auto child = parent->make_child();
    bool child_notified = false;
    child->subscribe([&child_notified]() { child_notified = true; });

    parent->trigger();
    io.run();

    EXPECT_TRUE(child->triggered());
    EXPECT_TRUE(child_notified);
}

TEST(CancelSignal, ChildCancelsAlone) {
    boost::asio::io_context io;
    auto parent = CancelSignal::create(io);
    auto a = parent->make_child();
    auto b = parent->make_child();

    a->trigger();
    io.run();

    EXPECT_TRUE(a->triggered());
    EXPECT_FALSE(b->triggered());
    EXPECT_FALSE(parent->triggered());
}

TEST(CancelSignal, DetachedChildIgnoresParent) {
    boost::asio::io_context io;
    auto parent = CancelSignal::create(io);
    auto child = parent->make_child();
    EXPECT_EQ(parent->subscriber_count(), 1u);

    child->detach();
    EXPECT_EQ(parent->subscriber_count(), 0u);

    parent->trigger();
    io.run();
    EXPECT_FALSE(child->triggered());
}

TEST(CancelSignal, DestroyedChildUnsubscribes) {
    boost::asio::io_context io;
    auto parent = CancelSignal::create(io);
    {
        auto child = parent->make_child();
        EXPECT_EQ(parent->subscriber_count(), 1u);
    }
    EXPECT_EQ(parent->subscriber_count(), 0u);
}

TEST(CancelToken, DefaultTokenIsInert) {
    CancelToken token;
    EXPECT_FALSE(token.cancelled());
    EXPECT_EQ(token.on_cancel([]() {}), 0u);
    token.unsubscribe(0);
}

TEST(CancelToken, ReflectsSignal) {
    boost::asio::io_context io;
    auto signal = CancelSignal::create(io);
    CancelToken token(signal);
    EXPECT_FALSE(token.cancelled());
    signal->trigger();
    EXPECT_TRUE(token.cancelled());
}
