#include "engine/scan_stream.hpp"

namespace kvtree {

ScanStream::ScanStream(concurrency::Receiver<KeyValue> receiver,
                       std::optional<std::string> stop_after_prefix)
    : receiver_(std::move(receiver))
    , prefix_(std::move(stop_after_prefix))
{}

std::optional<KeyValue> ScanStream::next() {
    if (finished_) {
        return std::nullopt;
    }

    // Stays set when receive() rethrows the scan's error.
    finished_ = true;
    auto item = receiver_.receive();
    if (!item) {
        return std::nullopt;
    }
    finished_ = false;

    // Keys arrive in ascending order, so the first miss ends the prefix.
    if (prefix_ && !item->first.starts_with(*prefix_)) {
        close();
        return std::nullopt;
    }
    return item;
}

void ScanStream::close() {
    finished_ = true;
    receiver_.close();
}

std::vector<KeyValue> ScanStream::collect() {
    std::vector<KeyValue> out;
    while (auto item = next()) {
        out.push_back(std::move(*item));
    }
    return out;
}

} // namespace kvtree
