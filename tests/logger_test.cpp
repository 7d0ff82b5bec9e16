#include "common/logger.hpp"

#include <gtest/gtest.h>

namespace kvtree {

// ── make_component_logger ─────────────────────────────────────────────────────

TEST(LoggerTest, ComponentLoggerIsReused) {
    auto first  = make_component_logger("logger_test_reuse", spdlog::level::info);
    auto second = make_component_logger("logger_test_reuse", spdlog::level::info);
    EXPECT_EQ(first.get(), second.get());
}

TEST(LoggerTest, ReusedLoggerTakesNewLevel) {
    auto logger = make_component_logger("logger_test_level", spdlog::level::warn);
    EXPECT_EQ(logger->level(), spdlog::level::warn);

    auto again = make_component_logger("logger_test_level", spdlog::level::debug);
    EXPECT_EQ(again->level(), spdlog::level::debug);
    EXPECT_EQ(logger->level(), spdlog::level::debug);
}

// ── parse_log_level ───────────────────────────────────────────────────────────

TEST(LoggerTest, ParsesKnownLevels) {
    EXPECT_EQ(parse_log_level("trace"), spdlog::level::trace);
    EXPECT_EQ(parse_log_level("error"), spdlog::level::err);
    EXPECT_EQ(parse_log_level("off"),   spdlog::level::off);
}

TEST(LoggerTest, UnknownLevelFallsBackToInfo) {
    EXPECT_EQ(parse_log_level("loud"), spdlog::level::info);
    EXPECT_FALSE(is_known_log_level("loud"));
    EXPECT_TRUE(is_known_log_level("warn"));
}

} // namespace kvtree
