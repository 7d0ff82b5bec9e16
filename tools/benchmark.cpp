// Throughput benchmark for the tree operations.
//
// Opens an Engine in a temporary directory and runs N operations of each kind
// against one tree: insert, get, increment, and a full ascending scan (one op
// per entry pulled from the stream).
//
// Prints: total ops, elapsed time, ops/sec, and latency percentiles (p50,
// p90, p99, p999) for each operation.

#include "common/engine_config.hpp"
#include "common/errors.hpp"
#include "engine/engine.hpp"
#include "engine/tree.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <numeric>
#include <string>
#include <vector>

namespace {

using clock = std::chrono::high_resolution_clock;
using ns    = std::chrono::nanoseconds;

// ── Stats helpers ────────────────────────────────────────────────────────────

struct BenchResult {
    std::size_t total_ops{};
    double elapsed_sec{};
    double ops_per_sec{};
    double p50_us{};
    double p90_us{};
    double p99_us{};
    double p999_us{};
    double avg_us{};
};

BenchResult compute_stats(std::vector<int64_t>& latencies_ns) {
    BenchResult r;
    r.total_ops = latencies_ns.size();

    if (latencies_ns.empty()) return r;

    std::sort(latencies_ns.begin(), latencies_ns.end());

    auto total_ns = std::accumulate(latencies_ns.begin(), latencies_ns.end(), int64_t{0});
    r.elapsed_sec = static_cast<double>(total_ns) / 1e9;
    r.ops_per_sec = r.elapsed_sec > 0 ? static_cast<double>(r.total_ops) / r.elapsed_sec : 0.0;
    r.avg_us      = static_cast<double>(total_ns) / static_cast<double>(r.total_ops) / 1000.0;

    auto percentile = [&](double p) -> double {
        auto idx = static_cast<std::size_t>(p * static_cast<double>(latencies_ns.size() - 1));
        return static_cast<double>(latencies_ns[idx]) / 1000.0; // ns → µs
    };

    r.p50_us  = percentile(0.50);
    r.p90_us  = percentile(0.90);
    r.p99_us  = percentile(0.99);
    r.p999_us = percentile(0.999);

    return r;
}

void print_result(const char* label, const BenchResult& r) {
    fprintf(stdout,
        "\n── %s ──\n"
        "  Total ops:    %zu\n"
        "  Elapsed:      %.3f s\n"
        "  Throughput:   %.0f ops/sec\n"
        "  Avg latency:  %.1f µs\n"
        "  p50:          %.1f µs\n"
        "  p90:          %.1f µs\n"
        "  p99:          %.1f µs\n"
        "  p99.9:        %.1f µs\n",
        label, r.total_ops, r.elapsed_sec, r.ops_per_sec,
        r.avg_us, r.p50_us, r.p90_us, r.p99_us, r.p999_us);
}

std::string bench_key(std::size_t i) {
    return std::format("key{:010}", i);
}

// Times `op(i)` for i in [0, n).
template <typename Op>
BenchResult time_each(std::size_t n, Op op) {
    std::vector<int64_t> latencies;
    latencies.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        auto t0 = clock::now();
        op(i);
        auto t1 = clock::now();
        latencies.push_back(std::chrono::duration_cast<ns>(t1 - t0).count());
    }
    return compute_stats(latencies);
}

// ── Benchmark runners ────────────────────────────────────────────────────────

BenchResult bench_insert(kvtree::Tree& tree, std::size_t n) {
    return time_each(n, [&](std::size_t i) {
        tree.insert(bench_key(i), "value" + std::to_string(i));
    });
}

BenchResult bench_get(kvtree::Tree& tree, std::size_t n) {
    return time_each(n, [&](std::size_t i) {
        auto v = tree.get(bench_key(i));
        if (!v) {
            spdlog::warn("kvtree-bench: missing {}", bench_key(i));
        }
    });
}

BenchResult bench_increment(kvtree::Tree& tree, std::size_t n) {
    return time_each(n, [&](std::size_t i) {
        (void)tree.increment("ctr" + std::to_string(i % 16));
    });
}

// One op per entry pulled; includes the worker hand-off through the channel.
BenchResult bench_scan(kvtree::Tree& tree) {
    std::vector<int64_t> latencies;
    auto stream = tree.scan_prefix("key");
    while (true) {
        auto t0 = clock::now();
        auto entry = stream.next();
        auto t1 = clock::now();
        if (!entry) break;
        latencies.push_back(std::chrono::duration_cast<ns>(t1 - t0).count());
    }
    return compute_stats(latencies);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::warn);

    std::size_t num_ops = 10'000;
    if (argc > 1) {
        num_ops = static_cast<std::size_t>(std::atol(argv[1]));
        if (num_ops == 0) num_ops = 10'000;
    }

    namespace fs = std::filesystem;
    const auto dir = fs::temp_directory_path() /
        std::format("kvtree-bench-{}", clock::now().time_since_epoch().count());

    kvtree::EngineConfig cfg;
    cfg.database_path = dir.string();
    cfg.log_level     = "warn";

    fprintf(stdout,
        "kvtree Benchmark\n"
        "================\n"
        "Ops per phase: %zu\n"
        "Database:      %s\n",
        num_ops, cfg.database_path.c_str());

    int rc = 0;
    try {
        auto engine = kvtree::Engine::open(cfg);
        auto tree   = engine->open_tree("bench");

        auto insert_result    = bench_insert(*tree, num_ops);
        auto get_result       = bench_get(*tree, num_ops);
        auto increment_result = bench_increment(*tree, num_ops);
        auto scan_result      = bench_scan(*tree);

        print_result("Insert", insert_result);
        print_result("Get", get_result);
        print_result("Increment", increment_result);
        print_result("Full scan (per entry)", scan_result);
        fprintf(stdout, "\n%s\n", engine->memory_usage().c_str());
    } catch (const kvtree::StorageError& e) {
        spdlog::error("kvtree-bench: {}", e.what());
        rc = 1;
    }

    std::error_code ec;
    fs::remove_all(dir, ec);
    return rc;
}
