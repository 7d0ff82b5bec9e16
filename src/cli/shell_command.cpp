#include "cli/shell_command.hpp"

#include <cctype>
#include <charconv>
#include <string>
#include <utility>

namespace kvtree::cli {

namespace {

// Split on the first space: returns (first_token, rest).
// If there is no space, rest is empty.
std::pair<std::string_view, std::string_view> split_once(std::string_view line) {
    const auto pos = line.find(' ');
    if (pos == std::string_view::npos) {
        return {line, {}};
    }
    return {line.substr(0, pos), line.substr(pos + 1)};
}

std::string to_upper(std::string_view s) {
    std::string out(s);
    for (auto& c : out) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return out;
}

// Parses a verb that takes exactly one single-token argument.
std::variant<std::string, ShellError> single_arg(std::string_view verb, std::string_view rest) {
    if (rest.empty()) {
        return ShellError{std::string(verb) + " requires an argument"};
    }
    auto [arg, extra] = split_once(rest);
    if (arg.empty() || !extra.empty()) {
        return ShellError{std::string(verb) + " takes exactly one argument"};
    }
    return std::string(arg);
}

constexpr std::string_view kHelp =
    "OPEN tree                  select the tree to work on\n"
    "GET key                    print the value of key\n"
    "SET key value              store value (may contain spaces)\n"
    "DEL key                    remove key\n"
    "INCR key                   increment the counter at key\n"
    "SCAN [prefix]              list keys with prefix (all keys when omitted)\n"
    "RANGE from [REV]           list keys from `from`, descending with REV\n"
    "WATCH prefix [timeout_ms]  wait for the next insert under prefix\n"
    "CLEAR                      remove every key of the current tree\n"
    "FLUSH                      force committed writes to disk\n"
    "STATS                      print memory usage and pool counters\n"
    "TREES                      list every tree\n"
    "HELP                       show this text";

} // namespace

// ── parse_shell_command ───────────────────────────────────────────────────────

std::variant<ShellCommand, ShellError> parse_shell_command(std::string_view line) {
    // Strip trailing '\r' so the parser is CRLF-tolerant.
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }

    if (line.empty()) {
        return ShellError{"empty command"};
    }

    auto [verb_tok, rest] = split_once(line);
    const auto verb = to_upper(verb_tok);

    // ── Verbs without arguments ───────────────────────────────────────────────
    if (verb == "CLEAR" || verb == "FLUSH" || verb == "STATS" || verb == "TREES" ||
        verb == "HELP") {
        if (!rest.empty()) {
            return ShellError{verb + " takes no arguments"};
        }
        if (verb == "CLEAR") return ShellCommand{ClearCmd{}};
        if (verb == "FLUSH") return ShellCommand{FlushCmd{}};
        if (verb == "STATS") return ShellCommand{StatsCmd{}};
        if (verb == "TREES") return ShellCommand{TreesCmd{}};
        return ShellCommand{HelpCmd{}};
    }

    // ── OPEN / GET / DEL / INCR ───────────────────────────────────────────────
    if (verb == "OPEN" || verb == "GET" || verb == "DEL" || verb == "INCR") {
        auto arg = single_arg(verb, rest);
        if (auto* err = std::get_if<ShellError>(&arg)) {
            return std::move(*err);
        }
        auto value = std::get<std::string>(std::move(arg));
        if (verb == "OPEN") return ShellCommand{OpenCmd{std::move(value)}};
        if (verb == "GET")  return ShellCommand{GetCmd{std::move(value)}};
        if (verb == "DEL")  return ShellCommand{DelCmd{std::move(value)}};
        return ShellCommand{IncrCmd{std::move(value)}};
    }

    // ── SET key value ─────────────────────────────────────────────────────────
    //
    // The value is everything after "SET <key> "; it may contain spaces.
    if (verb == "SET") {
        if (rest.empty()) {
            return ShellError{"SET requires a key and a value"};
        }
        auto [key, value] = split_once(rest);
        if (key.empty()) {
            return ShellError{"SET: key must not be empty"};
        }
        if (value.empty()) {
            return ShellError{"SET requires a value"};
        }
        return ShellCommand{SetCmd{std::string(key), std::string(value)}};
    }

    // ── SCAN [prefix] ─────────────────────────────────────────────────────────
    if (verb == "SCAN") {
        auto [prefix, extra] = split_once(rest);
        if (!extra.empty()) {
            return ShellError{"SCAN takes at most one argument"};
        }
        return ShellCommand{ScanCmd{std::string(prefix)}};
    }

    // ── RANGE from [REV] ──────────────────────────────────────────────────────
    if (verb == "RANGE") {
        if (rest.empty()) {
            return ShellError{"RANGE requires a start key"};
        }
        auto [from, after] = split_once(rest);
        if (from.empty()) {
            return ShellError{"RANGE: start key must not be empty"};
        }
        if (after.empty()) {
            return ShellCommand{RangeCmd{std::string(from), false}};
        }
        auto [direction, extra] = split_once(after);
        if (to_upper(direction) != "REV" || !extra.empty()) {
            return ShellError{"RANGE: expected REV after the start key"};
        }
        return ShellCommand{RangeCmd{std::string(from), true}};
    }

    // ── WATCH prefix [timeout_ms] ─────────────────────────────────────────────
    if (verb == "WATCH") {
        if (rest.empty()) {
            return ShellError{"WATCH requires a prefix"};
        }
        auto [prefix, after] = split_once(rest);
        if (prefix.empty()) {
            return ShellError{"WATCH: prefix must not be empty"};
        }
        if (after.empty()) {
            return ShellCommand{WatchCmd{std::string(prefix), std::nullopt}};
        }
        auto [timeout_tok, extra] = split_once(after);
        if (!extra.empty()) {
            return ShellError{"WATCH takes at most two arguments"};
        }
        uint32_t timeout_ms = 0;
        auto [p, ec] = std::from_chars(timeout_tok.data(),
                                       timeout_tok.data() + timeout_tok.size(), timeout_ms);
        if (ec != std::errc{} || p != timeout_tok.data() + timeout_tok.size()) {
            return ShellError{"WATCH: invalid timeout"};
        }
        return ShellCommand{WatchCmd{std::string(prefix), timeout_ms}};
    }

    return ShellError{"unknown command '" + std::string(verb_tok) + "'"};
}

std::string_view shell_help() {
    return kHelp;
}

} // namespace kvtree::cli
