#pragma once

#include <cstdint>
#include <string>

#include <boost/program_options.hpp>

namespace kvtree {

// ── EngineConfig ──────────────────────────────────────────────────────────────
// Everything needed to open an Engine.
// Populated by parse_config() from CLI arguments, or filled in directly by
// embedding code and tests.

struct EngineConfig {
    std::string database_path;                         // Directory holding the store
    uint64_t    size_cap_bytes        = 1ULL << 40;     // Disk space cap (1 TiB)
    uint32_t    max_readers           = 126;            // Concurrent read transactions
    uint32_t    max_namespaces        = 128;            // Trees per environment
    uint32_t    worker_count          = 10;             // Pooled scan workers
    uint32_t    scan_channel_capacity = 100;            // Entries buffered per scan
    bool        sync_writes           = false;          // fsync on every commit
    std::string log_level             = "info";         // spdlog level string
};

// ── parse_config ──────────────────────────────────────────────────────────────
// Parse CLI arguments (and the optional --config INI file) into an
// EngineConfig.  Values given on the command line take precedence over the
// file.
//
// On success: returns a fully validated EngineConfig.
// On error  : throws std::runtime_error with a human-readable message
//             (--help also throws, carrying the usage text).
//
// Validates:
//   - database_path is not empty
//   - size cap, reader, namespace, worker and buffer bounds are all > 0
//   - log level is one of trace|debug|info|warn|error|critical|off

[[nodiscard]] EngineConfig parse_config(int argc, char* argv[]);

// Throws std::runtime_error if `cfg` violates one of the rules above.
void validate(const EngineConfig& cfg);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with engine options.
// Exposed for testing and for tools that add options of their own.

void add_options(boost::program_options::options_description& desc);

// Build an EngineConfig from a variables_map filled using add_options().
[[nodiscard]] EngineConfig config_from_variables(
    const boost::program_options::variables_map& vm);

} // namespace kvtree
