#include "concurrency/bounded_channel.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

namespace kvtree::concurrency {

using namespace std::chrono_literals;

// ── Basic delivery ────────────────────────────────────────────────────────────

TEST(BoundedChannelTest, DeliversItemsInOrder) {
    auto [tx, rx] = make_channel<int>(4);
    ASSERT_TRUE(tx.send(1));
    ASSERT_TRUE(tx.send(2));
    ASSERT_TRUE(tx.send(3));
    tx.close();

    EXPECT_EQ(rx.receive(), 1);
    EXPECT_EQ(rx.receive(), 2);
    EXPECT_EQ(rx.receive(), 3);
    EXPECT_FALSE(rx.receive().has_value());
}

TEST(BoundedChannelTest, EndOfStreamIsSticky) {
    auto [tx, rx] = make_channel<int>(1);
    tx.close();
    EXPECT_FALSE(rx.receive().has_value());
    EXPECT_FALSE(rx.receive().has_value());
}

TEST(BoundedChannelTest, DestroyingSenderEndsStream) {
    auto [tx, rx] = make_channel<std::string>(2);
    {
        auto local = std::move(tx);
        ASSERT_TRUE(local.send("only"));
    }
    EXPECT_EQ(rx.receive(), "only");
    EXPECT_FALSE(rx.receive().has_value());
}

TEST(BoundedChannelTest, ZeroCapacityBehavesAsOne) {
    auto [tx, rx] = make_channel<int>(0);
    EXPECT_EQ(rx.capacity(), 1u);
    ASSERT_TRUE(tx.send(7));
    EXPECT_EQ(rx.buffered(), 1u);
}

// ── Backpressure ──────────────────────────────────────────────────────────────

TEST(BoundedChannelTest, SendBlocksWhileFull) {
    auto [tx, rx] = make_channel<int>(2);
    std::atomic<int> sent{0};

    std::thread producer([&, tx = std::move(tx)]() mutable {
        for (int i = 0; i < 5; ++i) {
            if (!tx.send(i)) {
                return;
            }
            sent.fetch_add(1);
        }
    });

    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(sent.load(), 2);
    EXPECT_EQ(rx.buffered(), 2u);

    std::vector<int> received;
    while (auto item = rx.receive()) {
        received.push_back(*item);
    }
    producer.join();

    EXPECT_EQ(sent.load(), 5);
    EXPECT_EQ(received, (std::vector<int>{0, 1, 2, 3, 4}));
}

// ── Cancellation ──────────────────────────────────────────────────────────────

TEST(BoundedChannelTest, SendFailsAfterReceiverClosed) {
    auto [tx, rx] = make_channel<int>(4);
    rx.close();
    EXPECT_TRUE(tx.receiver_closed());
    EXPECT_FALSE(tx.send(1));
}

TEST(BoundedChannelTest, ClosingReceiverUnblocksFullSender) {
    auto [tx, rx] = make_channel<int>(1);
    ASSERT_TRUE(tx.send(0));

    std::atomic<bool> result{true};
    std::atomic<bool> done{false};
    std::thread producer([&, tx = std::move(tx)]() mutable {
        result = tx.send(1);  // blocks: buffer is full
        done = true;
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(done.load());

    {
        auto dropped = std::move(rx);
    }
    producer.join();
    EXPECT_TRUE(done.load());
    EXPECT_FALSE(result.load());
}

// ── Terminal error ────────────────────────────────────────────────────────────

TEST(BoundedChannelTest, ErrorIsRethrownAfterDrain) {
    auto [tx, rx] = make_channel<int>(4);
    ASSERT_TRUE(tx.send(1));
    tx.close(std::make_exception_ptr(std::runtime_error("scan failed")));

    EXPECT_EQ(rx.receive(), 1);
    EXPECT_THROW(rx.receive(), std::runtime_error);
    EXPECT_FALSE(rx.receive().has_value());
}

TEST(BoundedChannelTest, SecondCloseDoesNotReplaceError) {
    auto [tx, rx] = make_channel<int>(1);
    tx.close(std::make_exception_ptr(std::runtime_error("first")));
    tx.close();
    EXPECT_THROW(rx.receive(), std::runtime_error);
}

} // namespace kvtree::concurrency
