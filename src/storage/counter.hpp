#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace kvtree::storage {

// ── Counter encoding ─────────────────────────────────────────────────────────
//
// Counters are stored as 8-byte big-endian unsigned integers so that their
// byte order matches their numeric order.

inline constexpr std::size_t kCounterWidth = sizeof(uint64_t);

// Encode `value` as kCounterWidth big-endian bytes.
[[nodiscard]] std::string encode_counter(uint64_t value);

// Decode a stored counter. Returns std::nullopt unless `bytes` is exactly
// kCounterWidth long.
[[nodiscard]] std::optional<uint64_t> decode_counter(std::string_view bytes);

// Successor of a stored counter value.  An absent value, or one that is not a
// valid counter, counts as zero, so the first increment always yields 1.
// Throws std::overflow_error when the counter is already at its maximum.
[[nodiscard]] std::string next_counter(const std::optional<std::string>& current);

} // namespace kvtree::storage
