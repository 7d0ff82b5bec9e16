#pragma once

#include "cli/shell_command.hpp"
#include "engine/engine.hpp"
#include "engine/tree.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

namespace kvtree::cli {

// ── Shell ─────────────────────────────────────────────────────────────────────
//
// Executes parsed commands against one Engine.  Holds the currently selected
// tree between commands.
//
// WATCH does not block: it registers the watch, returns "WATCHING <prefix>"
// and later reports "FIRED <prefix>" or "TIMEOUT <prefix>" through `notify`,
// called from the shell's watcher thread.  Commands keep running in the
// meantime, so a SET from the same shell can fire the watch.

class Shell {
public:
    using Notify = std::function<void(const std::string& line)>;

    // `notify` must not throw.
    Shell(std::shared_ptr<Engine> engine, Notify notify);

    // Drops pending watches without reporting them and joins the watcher.
    ~Shell();

    Shell(const Shell&)            = delete;
    Shell& operator=(const Shell&) = delete;

    // Returns the text to print for `cmd`.  Throws std::runtime_error when a
    // tree command runs before OPEN, plus whatever the engine throws.
    std::string execute(const ShellCommand& cmd);

    // Watches registered and not yet reported.
    [[nodiscard]] std::size_t pending_watches() const;

private:
    struct PendingWatch;

    Tree& require_tree();

    std::string execute_on_tree(Tree& tree, const GetCmd& c);
    std::string execute_on_tree(Tree& tree, const SetCmd& c);
    std::string execute_on_tree(Tree& tree, const DelCmd& c);
    std::string execute_on_tree(Tree& tree, const IncrCmd& c);
    std::string execute_on_tree(Tree& tree, const ScanCmd& c);
    std::string execute_on_tree(Tree& tree, const RangeCmd& c);
    std::string execute_on_tree(Tree& tree, const WatchCmd& c);
    std::string execute_on_tree(Tree& tree, const ClearCmd& c);

    void finish_watch(const std::shared_ptr<PendingWatch>& watch, bool fired);

    std::shared_ptr<Engine> engine_;
    std::shared_ptr<Tree> tree_;
    Notify notify_;

    // Watch timers belong to ioc_, so the watches are declared after it.
    boost::asio::io_context ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;

    std::atomic<bool> stopping_{false};
    mutable std::mutex watches_mutex_;
    std::set<std::shared_ptr<PendingWatch>> watches_;

    std::thread watcher_;
};

} // namespace kvtree::cli
