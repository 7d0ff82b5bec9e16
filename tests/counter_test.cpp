#include "storage/counter.hpp"

#include <cstdint>
#include <initializer_list>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

namespace kvtree::storage {

// ── encode / decode ───────────────────────────────────────────────────────────

TEST(CounterTest, EncodeIsBigEndianFixedWidth) {
    const auto bytes = encode_counter(0x0102030405060708ULL);
    ASSERT_EQ(bytes.size(), kCounterWidth);
    EXPECT_EQ(bytes, std::string("\x01\x02\x03\x04\x05\x06\x07\x08", 8));
}

TEST(CounterTest, EncodeOneHasSingleLowByte) {
    EXPECT_EQ(encode_counter(1), std::string("\0\0\0\0\0\0\0\x01", 8));
}

TEST(CounterTest, DecodeReversesEncode) {
    for (uint64_t v : std::initializer_list<uint64_t>{0ULL, 1ULL, 255ULL, 256ULL, 0xDEADBEEFULL,
                       std::numeric_limits<uint64_t>::max()}) {
        auto decoded = decode_counter(encode_counter(v));
        ASSERT_TRUE(decoded.has_value());
        EXPECT_EQ(*decoded, v);
    }
}

TEST(CounterTest, DecodeRejectsWrongWidth) {
    EXPECT_FALSE(decode_counter("").has_value());
    EXPECT_FALSE(decode_counter("1234567").has_value());
    EXPECT_FALSE(decode_counter("123456789").has_value());
}

TEST(CounterTest, EncodedOrderMatchesNumericOrder) {
    EXPECT_LT(encode_counter(255), encode_counter(256));
    EXPECT_LT(encode_counter(1), encode_counter(1ULL << 56));
}

// ── next_counter ──────────────────────────────────────────────────────────────

TEST(CounterTest, AbsentValueStartsAtOne) {
    EXPECT_EQ(decode_counter(next_counter(std::nullopt)), 1u);
}

TEST(CounterTest, InvalidValueCountsAsZero) {
    EXPECT_EQ(decode_counter(next_counter(std::string("garbage"))), 1u);
}

TEST(CounterTest, IncrementsStoredValue) {
    EXPECT_EQ(decode_counter(next_counter(encode_counter(41))), 42u);
}

TEST(CounterTest, IncrementCarriesAcrossBytes) {
    EXPECT_EQ(next_counter(encode_counter(0xFF)), encode_counter(0x100));
}

TEST(CounterTest, OverflowThrows) {
    EXPECT_THROW(
        (void)next_counter(encode_counter(std::numeric_limits<uint64_t>::max())),
        std::overflow_error);
}

} // namespace kvtree::storage
