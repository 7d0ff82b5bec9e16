#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace kvtree {

// ── Logger façade ─────────────────────────────────────────────────────────────

// Initialize the global default logger (for code that doesn't belong to a
// specific component: CLI, early startup messages, tests).
// Call once at program start before any logging.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::info);

// Create (or retrieve if already exists) a named component logger.
//   name   – component name embedded in every log line as [<name>]
//   level  – log level; applied to an existing logger as well
// Returns a shared_ptr to the logger.
std::shared_ptr<spdlog::logger> make_component_logger(
    const std::string& name,
    spdlog::level::level_enum level = spdlog::level::info);

// Parse a log-level string from CLI args ("trace", "debug", "info", …).
// Returns spdlog::level::info on unrecognised input.
spdlog::level::level_enum parse_log_level(const std::string& s);

// True if `s` names one of the levels accepted by parse_log_level().
[[nodiscard]] bool is_known_log_level(const std::string& s);

} // namespace kvtree
