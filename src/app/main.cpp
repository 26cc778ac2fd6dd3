/**
 * @file main.cpp
 * @brief sandbox_runner entry point.
 *
 * Wires the modules together:
 *   CLI → Config → Logger → TokenCache → Provider → Dispatcher
 * and is the only place that turns an outcome into a process exit status.
 */

#include "app/cli_args.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "output/console.hpp"
#include "runner/dispatcher.hpp"
#include "sandbox/local_provider.hpp"
#include "sandbox/mock_provider.hpp"
#include "sandbox/token_cache.hpp"
#include "tasks/task_builder.hpp"
#include "telemetry/json_sink.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>

using namespace sandbox_runner;

namespace {

constexpr const char* kVersion = "1.0.0";

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int signal) {
    g_shutdown_requested = 1;
    // A second signal terminates immediately.
    std::signal(signal, SIG_DFL);
}

std::unique_ptr<ILogSink> make_log_sink(const Config& config, bool verbose) {
    if (verbose) {
        return std::make_unique<StderrSink>();
    }
    if (!config.log.dir.empty()) {
        return std::make_unique<JsonFileSink>(config.log.dir, "sandbox_runner",
                                              config.log.max_file_size_mb, config.log.rotate_count);
    }
    return std::make_unique<NullSink>();
}

std::unique_ptr<ISandboxProvider> make_provider(const Config& config, TokenCache& tokens,
                                                Logger& logger) {
    if (config.sandbox.backend == "mock") {
        return std::make_unique<MockProvider>();
    }
    return std::make_unique<LocalProvider>(config.sandbox.root_dir, tokens, logger);
}

Result<int> dispatch(const cli::CliArgs& args, const Config& config, Dispatcher& dispatcher,
                     std::stop_token stop) {
    switch (args.command) {
        case cli::Command::Run:
            return dispatcher.run(cli::make_run_request(args, config), stop);
        case cli::Command::Exec:
            return dispatcher.exec(cli::make_exec_request(args, config), stop);
        case cli::Command::InstanceCreate:
            return dispatcher.create_instance(
                args.instance.tool.value_or(config.sandbox.tool),
                std::chrono::seconds{args.instance.timeout_seconds.value_or(config.sandbox.timeout_seconds)});
        case cli::Command::InstanceList:
            return dispatcher.list_instances();
        case cli::Command::InstanceDelete:
            return dispatcher.delete_instances(args.instance.ids);
        case cli::Command::Help:
        case cli::Command::Version:
            break;
    }
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = cli::parse_args(argc, argv);
    if (!args) {
        std::cerr << "Error: " << args.error().message << "\n"
                  << "Run 'sandbox_runner --help' for usage.\n";
        return 1;
    }
    if (args->command == cli::Command::Help) {
        std::cout << cli::usage_text();
        return 0;
    }
    if (args->command == cli::Command::Version) {
        std::cout << "sandbox_runner " << kVersion << "\n";
        return 0;
    }

    // ── Configuration ────────────────────────
    auto config_result = resolve_config(args->global.config_path);
    if (!config_result) {
        std::cerr << "Error: " << config_result.error().message << "\n";
        return 1;
    }
    Config config = *config_result;
    if (auto overridden = cli::apply_global_overrides(args->global, config); !overridden) {
        std::cerr << "Error: " << overridden.error().message << "\n";
        return 1;
    }
    apply_path_defaults(config);

    // ── Logger ───────────────────────────────
    auto level = parse_log_level(config.log.level);
    if (!level) {
        std::cerr << "Error: " << level.error().message << "\n";
        return 1;
    }
    LogLevel min_level = *level;
    if (args->global.verbose && !args->global.log_level) {
        min_level = LogLevel::Debug;
    }
    Logger logger(make_log_sink(config, args->global.verbose), min_level);
    logger.debug("backend: " + config.sandbox.backend + ", instances: " + config.sandbox.root_dir.string());

    // ── Sandbox backend ──────────────────────
    TokenCache tokens(config.cache.token_file);
    auto provider = make_provider(config, tokens, logger);

    ConsolePrinter printer(std::cout, std::cerr, config.output.format);
    TerminalSources sources;
    Dispatcher dispatcher(*provider, logger, printer, sources);

    // ── Cancellation ─────────────────────────
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::stop_source cancel;
    std::jthread watcher([&cancel, &logger](std::stop_token stop) {
        while (!stop.stop_requested()) {
            if (g_shutdown_requested) {
                logger.info("interrupt received, cancelling tasks that have not started");
                cancel.request_stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    auto outcome = dispatch(*args, config, dispatcher, cancel.get_token());

    watcher.request_stop();
    watcher.join();
    logger.flush();

    if (!outcome) {
        logger.error(outcome.error().message);
        std::cerr << "Error: " << outcome.error().message << "\n";
        return 1;
    }
    return *outcome;
}
