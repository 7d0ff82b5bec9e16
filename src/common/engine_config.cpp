#include "common/engine_config.hpp"

#include "common/logger.hpp"

#include <format>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace kvtree {

// ── validate ──────────────────────────────────────────────────────────────────

void validate(const EngineConfig& cfg) {
    if (cfg.database_path.empty()) {
        throw std::runtime_error("--database-path must not be empty");
    }
    if (cfg.size_cap_bytes == 0) {
        throw std::runtime_error("--size-cap must be > 0");
    }
    if (cfg.max_readers == 0) {
        throw std::runtime_error("--max-readers must be > 0");
    }
    if (cfg.max_namespaces == 0) {
        throw std::runtime_error("--max-namespaces must be > 0");
    }
    if (cfg.worker_count == 0) {
        throw std::runtime_error("--workers must be > 0");
    }
    if (cfg.scan_channel_capacity == 0) {
        throw std::runtime_error("--scan-buffer must be > 0");
    }
    if (!is_known_log_level(cfg.log_level)) {
        throw std::runtime_error(
            std::format("--log-level must be one of trace|debug|info|warn|error|critical|off, got '{}'",
                        cfg.log_level));
    }
}

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    const EngineConfig defaults;
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("config",
            po::value<std::string>(),
            "Optional INI file with the same option names (command line wins)")
        ("database-path,d",
            po::value<std::string>()->required(),
            "Directory holding the database")
        ("size-cap",
            po::value<uint64_t>()->default_value(defaults.size_cap_bytes),
            "Maximum disk space used by the store, in bytes")
        ("max-readers",
            po::value<uint32_t>()->default_value(defaults.max_readers),
            "Maximum number of concurrent read transactions")
        ("max-namespaces",
            po::value<uint32_t>()->default_value(defaults.max_namespaces),
            "Maximum number of trees in the environment")
        ("workers",
            po::value<uint32_t>()->default_value(defaults.worker_count),
            "Number of pooled range-scan workers")
        ("scan-buffer",
            po::value<uint32_t>()->default_value(defaults.scan_channel_capacity),
            "Entries buffered between a scan worker and its consumer")
        ("sync-writes",
            po::bool_switch()->default_value(defaults.sync_writes),
            "fsync the write-ahead log on every commit")
        ("log-level",
            po::value<std::string>()->default_value(defaults.log_level),
            "Log level: trace|debug|info|warn|error|critical|off");
}

// ── config_from_variables ─────────────────────────────────────────────────────

EngineConfig config_from_variables(const po::variables_map& vm) {
    EngineConfig cfg;
    cfg.database_path         = vm["database-path"].as<std::string>();
    cfg.size_cap_bytes        = vm["size-cap"].as<uint64_t>();
    cfg.max_readers           = vm["max-readers"].as<uint32_t>();
    cfg.max_namespaces        = vm["max-namespaces"].as<uint32_t>();
    cfg.worker_count          = vm["workers"].as<uint32_t>();
    cfg.scan_channel_capacity = vm["scan-buffer"].as<uint32_t>();
    cfg.sync_writes           = vm["sync-writes"].as<bool>();
    cfg.log_level             = vm["log-level"].as<std::string>();
    return cfg;
}

// ── parse_config ──────────────────────────────────────────────────────────────

EngineConfig parse_config(int argc, char* argv[]) {
    po::options_description desc("kvtree options");
    add_options(desc);

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);

        // Handle --help before notify() so missing required options don't error.
        if (vm.count("help")) {
            std::ostringstream oss;
            oss << desc;
            throw std::runtime_error(oss.str());
        }

        // Options already stored from the command line are not overwritten.
        if (vm.count("config")) {
            const auto path = vm["config"].as<std::string>();
            std::ifstream file{path};
            if (!file) {
                throw std::runtime_error(
                    std::format("Cannot read config file '{}'", path));
            }
            po::store(po::parse_config_file(file, desc), vm);
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(std::format("Argument error: {}", e.what()));
    }

    auto cfg = config_from_variables(vm);
    validate(cfg);
    return cfg;
}

} // namespace kvtree
