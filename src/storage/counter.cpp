#include "storage/counter.hpp"

#include <limits>
#include <stdexcept>

namespace kvtree::storage {

std::string encode_counter(uint64_t value) {
    std::string out(kCounterWidth, '\0');
    for (std::size_t i = 0; i < kCounterWidth; ++i) {
        out[kCounterWidth - 1 - i] = static_cast<char>(value & 0xFF);
        value >>= 8;
    }
    return out;
}

std::optional<uint64_t> decode_counter(std::string_view bytes) {
    if (bytes.size() != kCounterWidth) {
        return std::nullopt;
    }
    uint64_t value = 0;
    for (const char c : bytes) {
        value = (value << 8) | static_cast<uint8_t>(c);
    }
    return value;
}

std::string next_counter(const std::optional<std::string>& current) {
    uint64_t value = 0;
    if (current) {
        value = decode_counter(*current).value_or(0);
    }
    if (value == std::numeric_limits<uint64_t>::max()) {
        throw std::overflow_error("counter overflow");
    }
    return encode_counter(value + 1);
}

} // namespace kvtree::storage
