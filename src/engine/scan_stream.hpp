#pragma once

#include "concurrency/bounded_channel.hpp"

#include <cstddef>
#include <exception>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace kvtree {

using KeyValue = std::pair<std::string, std::string>;

// ── ScanStream ───────────────────────────────────────────────────────────────
//
// Consumer end of a background range scan: a finite, pull-based,
// non-restartable sequence of key/value pairs in scan order.
//
// The scan runs on a worker thread with its own read transaction and pauses
// whenever the channel between them is full.  Destroying (or close()-ing) the
// stream before the end stops the worker at its next send.
//
// If the scan fails, every pair produced before the failure is delivered and
// then next() rethrows the failure, usually a TransactionError or
// StorageIOError.
//
// Not thread-safe: one consumer per stream.  Movable, not copyable.

class ScanStream {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type        = KeyValue;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const KeyValue*;
        using reference         = const KeyValue&;

        iterator() = default;

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        iterator& operator++() {
            current_ = stream_->next();
            return *this;
        }

        void operator++(int) { ++*this; }

        friend bool operator==(const iterator& it, std::default_sentinel_t) {
            return !it.current_.has_value();
        }

    private:
        friend class ScanStream;
        explicit iterator(ScanStream* stream)
            : stream_(stream)
            , current_(stream->next())
        {}

        ScanStream* stream_ = nullptr;
        std::optional<KeyValue> current_;
    };

    ScanStream() = default;

    // `stop_after_prefix`: end the stream at the first key that does not
    // start with this prefix.
    explicit ScanStream(concurrency::Receiver<KeyValue> receiver,
                        std::optional<std::string> stop_after_prefix = std::nullopt);

    ScanStream(ScanStream&&) noexcept            = default;
    ScanStream& operator=(ScanStream&&) noexcept = default;
    ScanStream(const ScanStream&)                = delete;
    ScanStream& operator=(const ScanStream&)     = delete;

    // Blocks until the next pair is available.  Returns std::nullopt at the
    // end of the stream and on every call after that.
    std::optional<KeyValue> next();

    // Abandons the rest of the scan.
    void close();

    [[nodiscard]] bool finished() const noexcept { return finished_; }

    // Drains the remaining pairs into a vector.
    [[nodiscard]] std::vector<KeyValue> collect();

    // Range interface; begin() pulls the first pair.
    iterator begin() { return iterator{this}; }
    std::default_sentinel_t end() const noexcept { return std::default_sentinel; }

private:
    concurrency::Receiver<KeyValue> receiver_;
    std::optional<std::string> prefix_;
    bool finished_ = false;
};

// ── feed_scan ────────────────────────────────────────────────────────────────
//
// Producer side of a scan.  Runs `produce(sender)`, which returns false when
// the consumer went away.  A normal finish closes the channel; an exception
// is logged and handed to the consumer behind the pairs already sent.

template <typename Produce>
void feed_scan(concurrency::Sender<KeyValue>& sender, spdlog::logger& logger,
               std::string_view tree, Produce&& produce) {
    try {
        if (!produce(sender)) {
            logger.trace("Scan of '{}' abandoned by its consumer", tree);
            return;
        }
        sender.close();
    } catch (const std::exception& e) {
        logger.error("Scan of '{}' failed: {}", tree, e.what());
        sender.close(std::current_exception());
    }
}

} // namespace kvtree
