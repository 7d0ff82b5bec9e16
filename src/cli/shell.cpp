#include "cli/shell.hpp"

#include "storage/counter.hpp"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>

#include <chrono>
#include <format>
#include <stdexcept>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace kvtree::cli {

namespace asio = boost::asio;

namespace {

// Printable form of an arbitrary byte string: non-printable bytes as \xNN.
std::string format_bytes(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());
    for (unsigned char c : bytes) {
        if (c >= 0x20 && c < 0x7f && c != '\\') {
            out += static_cast<char>(c);
        } else if (c == '\\') {
            out += "\\\\";
        } else {
            out += std::format("\\x{:02x}", c);
        }
    }
    return out;
}

// Drains a scan, one "key = value" line per entry.
std::string format_scan(ScanStream stream) {
    std::string out;
    std::size_t count = 0;
    for (const auto& [key, value] : stream) {
        out += std::format("{} = {}\n", format_bytes(key), format_bytes(value));
        ++count;
    }
    out += std::format("({} entries)", count);
    return out;
}

} // namespace

// One WATCH between registration and its report.  The timer is only touched
// on the watcher thread.
struct Shell::PendingWatch {
    PendingWatch(WatchSignal s, asio::io_context& ioc, std::string p)
        : signal(std::move(s)), timer(ioc), prefix(std::move(p)) {}

    WatchSignal signal;
    asio::steady_timer timer;
    std::string prefix;
};

Shell::Shell(std::shared_ptr<Engine> engine, Notify notify)
    : engine_(std::move(engine))
    , notify_(std::move(notify))
    , work_(asio::make_work_guard(ioc_))
    , watcher_([this] { ioc_.run(); })
{}

Shell::~Shell() {
    stopping_ = true;

    std::set<std::shared_ptr<PendingWatch>> live;
    {
        std::lock_guard lock(watches_mutex_);
        live.swap(watches_);
    }
    // Cancelling completes each wait on the watcher thread, which also stops
    // its timer; the io_context then runs out of work.
    for (const auto& watch : live) {
        watch->signal.cancel();
    }
    work_.reset();
    watcher_.join();
}

std::string Shell::execute(const ShellCommand& cmd) {
    return std::visit(
        [this](const auto& c) -> std::string {
            using T = std::decay_t<decltype(c)>;

            if constexpr (std::is_same_v<T, OpenCmd>) {
                tree_ = engine_->open_tree(c.tree);
                return "OK";
            } else if constexpr (std::is_same_v<T, TreesCmd>) {
                const auto names = engine_->tree_names();
                std::string out;
                for (const auto& name : names) {
                    out += name;
                    out += '\n';
                }
                return out + std::format("({} trees)", names.size());
            } else if constexpr (std::is_same_v<T, FlushCmd>) {
                engine_->flush();
                return "OK";
            } else if constexpr (std::is_same_v<T, StatsCmd>) {
                const auto& pool = engine_->worker_pool();
                return engine_->memory_usage() +
                    std::format("Scan workers: {}/{} busy, {} overflow\nPending watches: {}",
                                pool.active_count(), pool.max_count(),
                                pool.overflow_count(), pending_watches());
            } else if constexpr (std::is_same_v<T, HelpCmd>) {
                return std::string(shell_help());
            } else {
                return execute_on_tree(require_tree(), c);
            }
        },
        cmd);
}

std::size_t Shell::pending_watches() const {
    std::lock_guard lock(watches_mutex_);
    return watches_.size();
}

Tree& Shell::require_tree() {
    if (!tree_) {
        throw std::runtime_error("no tree selected; use OPEN <tree>");
    }
    return *tree_;
}

std::string Shell::execute_on_tree(Tree& tree, const GetCmd& c) {
    auto value = tree.get(c.key);
    return value ? "VALUE " + format_bytes(*value) : "NOT_FOUND";
}

std::string Shell::execute_on_tree(Tree& tree, const SetCmd& c) {
    tree.insert(c.key, c.value);
    return "OK";
}

std::string Shell::execute_on_tree(Tree& tree, const DelCmd& c) {
    tree.remove(c.key);
    return "DELETED";
}

std::string Shell::execute_on_tree(Tree& tree, const IncrCmd& c) {
    return std::to_string(storage::decode_counter(tree.increment(c.key)).value());
}

std::string Shell::execute_on_tree(Tree& tree, const ScanCmd& c) {
    return format_scan(c.prefix.empty() ? tree.iter() : tree.scan_prefix(c.prefix));
}

std::string Shell::execute_on_tree(Tree& tree, const RangeCmd& c) {
    return format_scan(tree.iter_from(c.from, c.backwards));
}

std::string Shell::execute_on_tree(Tree& tree, const WatchCmd& c) {
    // Registered here so that the very next command can already fire it.
    auto watch = std::make_shared<PendingWatch>(tree.watch_prefix(c.prefix), ioc_, c.prefix);
    {
        std::lock_guard lock(watches_mutex_);
        watches_.insert(watch);
    }

    asio::post(ioc_, [this, watch, timeout_ms = c.timeout_ms] {
        if (timeout_ms) {
            watch->timer.expires_after(std::chrono::milliseconds{*timeout_ms});
            watch->timer.async_wait([watch](const boost::system::error_code& ec) {
                if (!ec) {
                    watch->signal.cancel();
                }
            });
        }
        watch->signal.async_wait(asio::bind_executor(ioc_, [this, watch](bool fired) {
            watch->timer.cancel();
            finish_watch(watch, fired);
        }));
    });

    return "WATCHING " + format_bytes(c.prefix);
}

std::string Shell::execute_on_tree(Tree& tree, const ClearCmd&) {
    return std::format("CLEARED {}", tree.clear());
}

void Shell::finish_watch(const std::shared_ptr<PendingWatch>& watch, bool fired) {
    {
        std::lock_guard lock(watches_mutex_);
        watches_.erase(watch);
    }
    if (stopping_) {
        return;
    }
    notify_(std::format("{} {}", fired ? "FIRED" : "TIMEOUT", format_bytes(watch->prefix)));
}

} // namespace kvtree::cli
