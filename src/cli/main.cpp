#include "cli/shell.hpp"
#include "cli/shell_command.hpp"
#include "common/engine_config.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "engine/engine.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <variant>

using namespace kvtree;

// ── main ──────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    // ── Parse CLI arguments ──────────────────────────────────────────────────
    EngineConfig cfg;
    try {
        cfg = parse_config(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    init_default_logger(parse_log_level(cfg.log_level));

    std::shared_ptr<Engine> engine;
    try {
        engine = Engine::open(cfg);
    } catch (const StorageError& e) {
        spdlog::error("kvtree-cli: failed to open {}: {}", cfg.database_path, e.what());
        return 1;
    }

    fprintf(stdout, "Opened %s. Type HELP for commands, Ctrl+D to quit.\n",
            cfg.database_path.c_str());

    // Watch reports arrive on the shell's watcher thread.
    std::mutex out_mutex;
    cli::Shell shell{engine, [&out_mutex](const std::string& note) {
        std::lock_guard lock(out_mutex);
        fprintf(stdout, "\n%s\n", note.c_str());
        fflush(stdout);
    }};

    std::string line;
    while (true) {
        {
            std::lock_guard lock(out_mutex);
            fprintf(stdout, "> ");
            fflush(stdout);
        }

        if (!std::getline(std::cin, line)) {
            fprintf(stdout, "\n");
            break;
        }

        if (line.empty()) {
            continue;
        }

        auto parse_result = cli::parse_shell_command(line);
        std::string output;
        if (auto* err = std::get_if<cli::ShellError>(&parse_result)) {
            output = "ERROR " + err->message;
        } else {
            try {
                output = shell.execute(std::get<cli::ShellCommand>(parse_result));
            } catch (const StorageError& e) {
                spdlog::error("kvtree-cli: storage error: {}", e.what());
                output = std::string("ERROR ") + e.what();
            } catch (const std::exception& e) {
                output = std::string("ERROR ") + e.what();
            }
        }

        std::lock_guard lock(out_mutex);
        fprintf(stdout, "%s\n", output.c_str());
    }

    return 0;
}
