#include "common/engine_config.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

// ── Helpers ───────────────────────────────────────────────────────────────────

// Build a fake argv array from a vector of strings.
// The returned pointers are valid as long as `args` is alive.
static std::vector<char*> make_argv(std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size());
    for (auto& s : args) {
        argv.push_back(s.data());
    }
    return argv;
}

// ── Fixture ───────────────────────────────────────────────────────────────────

class EngineConfigTest : public ::testing::Test {
protected:
    kvtree::EngineConfig parse() {
        auto argv = make_argv(args_);
        return kvtree::parse_config(static_cast<int>(argv.size()), argv.data());
    }

    std::vector<std::string> args_{
        "kvtree-cli",
        "--database-path", "./data/kvtree",
    };
};

// ── Valid configuration ────────────────────────────────────────────────────────

TEST_F(EngineConfigTest, ParsesMinimalValidConfig) {
    auto cfg = parse();

    EXPECT_EQ(cfg.database_path,         "./data/kvtree");
    EXPECT_EQ(cfg.size_cap_bytes,        1ULL << 40);  // default
    EXPECT_EQ(cfg.max_readers,           126u);        // default
    EXPECT_EQ(cfg.max_namespaces,        128u);        // default
    EXPECT_EQ(cfg.worker_count,          10u);         // default
    EXPECT_EQ(cfg.scan_channel_capacity, 100u);        // default
    EXPECT_FALSE(cfg.sync_writes);                     // default
    EXPECT_EQ(cfg.log_level,             "info");      // default
}

TEST_F(EngineConfigTest, ShortPathFlag) {
    args_ = {"kvtree-cli", "-d", "/tmp/x"};
    EXPECT_EQ(parse().database_path, "/tmp/x");
}

TEST_F(EngineConfigTest, ParsesEveryOption) {
    args_.insert(args_.end(), {
        "--size-cap",       "1048576",
        "--max-readers",    "8",
        "--max-namespaces", "4",
        "--workers",        "2",
        "--scan-buffer",    "16",
        "--sync-writes",
        "--log-level",      "debug",
    });
    auto cfg = parse();

    EXPECT_EQ(cfg.size_cap_bytes,        1048576u);
    EXPECT_EQ(cfg.max_readers,           8u);
    EXPECT_EQ(cfg.max_namespaces,        4u);
    EXPECT_EQ(cfg.worker_count,          2u);
    EXPECT_EQ(cfg.scan_channel_capacity, 16u);
    EXPECT_TRUE(cfg.sync_writes);
    EXPECT_EQ(cfg.log_level,             "debug");
}

// ── Config file ───────────────────────────────────────────────────────────────

TEST_F(EngineConfigTest, ReadsConfigFileWithCommandLinePrecedence) {
    const auto path = std::filesystem::temp_directory_path() / "kvtree_config_test.ini";
    {
        std::ofstream out{path};
        out << "workers = 3\n"
            << "scan-buffer = 7\n"
            << "log-level = warn\n";
    }
    args_.insert(args_.end(), {"--config", path.string(), "--workers", "5"});
    auto cfg = parse();

    EXPECT_EQ(cfg.worker_count,          5u);   // command line wins
    EXPECT_EQ(cfg.scan_channel_capacity, 7u);   // from file
    EXPECT_EQ(cfg.log_level,             "warn");

    std::filesystem::remove(path);
}

TEST_F(EngineConfigTest, ConfigFileCanSupplyDatabasePath) {
    const auto path = std::filesystem::temp_directory_path() / "kvtree_config_path.ini";
    {
        std::ofstream out{path};
        out << "database-path = /srv/kvtree\n";
    }
    args_ = {"kvtree-cli", "--config", path.string()};
    EXPECT_EQ(parse().database_path, "/srv/kvtree");

    std::filesystem::remove(path);
}

TEST_F(EngineConfigTest, MissingConfigFileThrows) {
    args_.insert(args_.end(), {"--config", "/nonexistent/kvtree.ini"});
    EXPECT_THROW(parse(), std::runtime_error);
}

// ── Invalid configuration ─────────────────────────────────────────────────────

TEST_F(EngineConfigTest, MissingDatabasePathThrows) {
    args_ = {"kvtree-cli"};
    EXPECT_THROW(parse(), std::runtime_error);
}

TEST_F(EngineConfigTest, ZeroWorkersThrows) {
    args_.insert(args_.end(), {"--workers", "0"});
    try {
        (void)parse();
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("--workers"), std::string::npos);
    }
}

TEST_F(EngineConfigTest, ZeroScanBufferThrows) {
    args_.insert(args_.end(), {"--scan-buffer", "0"});
    EXPECT_THROW(parse(), std::runtime_error);
}

TEST_F(EngineConfigTest, ZeroReadersThrows) {
    args_.insert(args_.end(), {"--max-readers", "0"});
    EXPECT_THROW(parse(), std::runtime_error);
}

TEST_F(EngineConfigTest, UnknownLogLevelThrows) {
    args_.insert(args_.end(), {"--log-level", "verbose"});
    EXPECT_THROW(parse(), std::runtime_error);
}

TEST_F(EngineConfigTest, NonNumericValueThrows) {
    args_.insert(args_.end(), {"--workers", "many"});
    EXPECT_THROW(parse(), std::runtime_error);
}

TEST_F(EngineConfigTest, UnknownOptionThrows) {
    args_.insert(args_.end(), {"--frobnicate", "1"});
    EXPECT_THROW(parse(), std::runtime_error);
}

TEST_F(EngineConfigTest, HelpThrowsWithUsage) {
    args_ = {"kvtree-cli", "--help"};
    try {
        (void)parse();
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("database-path"), std::string::npos);
    }
}

// ── validate ──────────────────────────────────────────────────────────────────

TEST(EngineConfigValidateTest, DefaultsNeedOnlyAPath) {
    kvtree::EngineConfig cfg;
    EXPECT_THROW(kvtree::validate(cfg), std::runtime_error);
    cfg.database_path = "/tmp/db";
    EXPECT_NO_THROW(kvtree::validate(cfg));
}

TEST(EngineConfigValidateTest, OffIsAValidLogLevel) {
    kvtree::EngineConfig cfg;
    cfg.database_path = "/tmp/db";
    cfg.log_level = "off";
    EXPECT_NO_THROW(kvtree::validate(cfg));
}
