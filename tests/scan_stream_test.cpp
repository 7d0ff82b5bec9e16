#include "common/errors.hpp"
#include "engine/scan_stream.hpp"

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>
#include <spdlog/sinks/null_sink.h>

namespace kvtree {

// ── Delivery ──────────────────────────────────────────────────────────────────

TEST(ScanStreamTest, DeliversPairsThenEnds) {
    auto [tx, rx] = concurrency::make_channel<KeyValue>(4);
    ASSERT_TRUE(tx.send({"a", "1"}));
    ASSERT_TRUE(tx.send({"b", "2"}));
    tx.close();

    ScanStream stream{std::move(rx)};
    EXPECT_EQ(stream.collect(), (std::vector<KeyValue>{{"a", "1"}, {"b", "2"}}));
    EXPECT_TRUE(stream.finished());
    EXPECT_FALSE(stream.next().has_value());
}

TEST(ScanStreamTest, DefaultConstructedIsEmpty) {
    ScanStream stream;
    EXPECT_FALSE(stream.next().has_value());
    EXPECT_TRUE(stream.finished());
}

TEST(ScanStreamTest, PrefixTruncatesAndReleasesProducer) {
    auto [tx, rx] = concurrency::make_channel<KeyValue>(1);
    std::vector<bool> sent;
    std::thread producer([&sent, tx = std::move(tx)]() mutable {
        for (const char* k : {"pre1", "pre2", "q1", "q2", "q3"}) {
            sent.push_back(tx.send({k, "v"}));
        }
    });

    ScanStream stream{std::move(rx), std::string("pre")};
    auto entries = stream.collect();
    producer.join();

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[1].first, "pre2");
    // Once the stream saw "q1" the rest of the sends were refused.
    ASSERT_EQ(sent.size(), 5u);
    EXPECT_FALSE(sent.back());
}

// ── Failure ───────────────────────────────────────────────────────────────────

TEST(ScanStreamTest, FailureSurfacesAfterProducedEntries) {
    auto [tx, rx] = concurrency::make_channel<KeyValue>(4);
    ASSERT_TRUE(tx.send({"a", "1"}));
    tx.close(std::make_exception_ptr(StorageIOError("cursor read failed")));

    ScanStream stream{std::move(rx)};
    auto first = stream.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->first, "a");

    EXPECT_THROW((void)stream.next(), StorageIOError);
    EXPECT_TRUE(stream.finished());
    EXPECT_FALSE(stream.next().has_value());
}

TEST(ScanStreamTest, TransactionFailureBeforeFirstEntry) {
    auto [tx, rx] = concurrency::make_channel<KeyValue>(4);
    tx.close(std::make_exception_ptr(TransactionError("no reader slot")));

    ScanStream stream{std::move(rx)};
    EXPECT_THROW((void)stream.collect(), TransactionError);
}

// ── Range interface ───────────────────────────────────────────────────────────

TEST(ScanStreamTest, RangeForIteratesAll) {
    auto [tx, rx] = concurrency::make_channel<KeyValue>(8);
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(tx.send({std::to_string(i), "v"}));
    }
    tx.close();

    ScanStream stream{std::move(rx)};
    std::vector<std::string> keys;
    for (const auto& entry : stream) {
        keys.push_back(entry.first);
    }
    EXPECT_EQ(keys, (std::vector<std::string>{"0", "1", "2"}));
}

TEST(ScanStreamTest, CloseStopsSender) {
    auto [tx, rx] = concurrency::make_channel<KeyValue>(1);
    ScanStream stream{std::move(rx)};
    stream.close();
    EXPECT_TRUE(tx.receiver_closed());
    EXPECT_FALSE(tx.send({"late", "v"}));
}

// ── Producer side ─────────────────────────────────────────────────────────────

namespace {

spdlog::logger quiet_logger() {
    return spdlog::logger("scan_stream_test", std::make_shared<spdlog::sinks::null_sink_mt>());
}

} // namespace

TEST(ScanStreamTest, FeedClosesChannelOnCompletion) {
    auto logger = quiet_logger();
    auto [tx, rx] = concurrency::make_channel<KeyValue>(4);
    feed_scan(tx, logger, "t", [](concurrency::Sender<KeyValue>& out) {
        return out.send({"a", "1"});
    });

    ScanStream stream{std::move(rx)};
    EXPECT_EQ(stream.collect(), (std::vector<KeyValue>{{"a", "1"}}));
}

TEST(ScanStreamTest, FeedForwardsAnyExceptionAfterSentPairs) {
    auto logger = quiet_logger();
    auto [tx, rx] = concurrency::make_channel<KeyValue>(4);
    feed_scan(tx, logger, "t", [](concurrency::Sender<KeyValue>& out) -> bool {
        (void)out.send({"a", "1"});
        (void)out.send({"b", "2"});
        throw std::length_error("key too long");
    });

    ScanStream stream{std::move(rx)};
    ASSERT_TRUE(stream.next().has_value());
    ASSERT_TRUE(stream.next().has_value());
    EXPECT_THROW((void)stream.next(), std::length_error);
    EXPECT_TRUE(stream.finished());
}

TEST(ScanStreamTest, FeedStopsWhenConsumerLeaves) {
    auto logger = quiet_logger();
    auto [tx, rx] = concurrency::make_channel<KeyValue>(4);
    rx.close();

    int sends = 0;
    feed_scan(tx, logger, "t", [&sends](concurrency::Sender<KeyValue>& out) {
        ++sends;
        return out.send({"a", "1"});
    });
    EXPECT_EQ(sends, 1);
    EXPECT_TRUE(tx.receiver_closed());
}

} // namespace kvtree
