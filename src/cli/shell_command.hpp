#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace kvtree::cli {

// ── Commands ──────────────────────────────────────────────────────────────────
//
// Parsed representation of one admin-shell line.  Each command type is a
// plain struct; the whole thing is wrapped in a std::variant so callers can
// std::visit over it without inheritance.

struct OpenCmd {
    std::string tree;
};

struct GetCmd {
    std::string key;
};

struct SetCmd {
    std::string key;
    std::string value;
};

struct DelCmd {
    std::string key;
};

struct IncrCmd {
    std::string key;
};

// Empty prefix scans the whole tree.
struct ScanCmd {
    std::string prefix;
};

struct RangeCmd {
    std::string from;
    bool backwards = false;
};

struct WatchCmd {
    std::string prefix;
    std::optional<uint32_t> timeout_ms; // wait forever when unset
};

struct ClearCmd {};
struct FlushCmd {};
struct StatsCmd {};
struct TreesCmd {};
struct HelpCmd {};

using ShellCommand = std::variant<OpenCmd, GetCmd, SetCmd, DelCmd, IncrCmd, ScanCmd,
                                  RangeCmd, WatchCmd, ClearCmd, FlushCmd, StatsCmd,
                                  TreesCmd, HelpCmd>;

struct ShellError {
    std::string message;
};

// Parse one line (without the trailing '\n') into a ShellCommand.
// Verbs are case-insensitive; arguments are taken verbatim.
//
// Thread-safe: pure function, no shared state.
[[nodiscard]] std::variant<ShellCommand, ShellError> parse_shell_command(std::string_view line);

// One-line-per-command usage summary.
[[nodiscard]] std::string_view shell_help();

} // namespace kvtree::cli
