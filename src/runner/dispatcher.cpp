/**
 * @file dispatcher.cpp
 * @brief Dispatcher implementation.
 */

#include "runner/dispatcher.hpp"
#include "core/json.hpp"
#include "output/formatter.hpp"
#include "runner/parallel_runner.hpp"
#include "runner/result_aggregator.hpp"
#include "runner/sandbox_session.hpp"
#include "runner/sequential_runner.hpp"

#include <sstream>

namespace sandbox_runner {

namespace {

/// Destroys an owned sandbox when the command finishes.
class ScopedRelease {
public:
    ScopedRelease(ISandboxProvider& provider, Logger& logger, InstanceId id, bool armed)
        : provider_(provider), logger_(logger), id_(std::move(id)), armed_(armed) {}
    ~ScopedRelease() {
        if (armed_) release_sandbox(provider_, id_, logger_);
    }
    ScopedRelease(const ScopedRelease&) = delete;
    ScopedRelease& operator=(const ScopedRelease&) = delete;

private:
    ISandboxProvider& provider_;
    Logger& logger_;
    InstanceId id_;
    bool armed_;
};

/// Remote exit status for a finished single execution.
int single_exit_code(const ExecutionResult& execution) {
    if (execution.exit_code != 0) return execution.exit_code;
    return execution.error ? 1 : 0;
}

std::optional<Timing> timing_for(bool enabled, const AcquiredSandbox& acquired,
                                 Duration total, Duration exec) {
    if (!enabled) return std::nullopt;
    if (acquired.connected) return Timing::of(total);
    return Timing::with_phases(total, acquired.creation_duration, exec);
}

std::string join_words(const std::vector<std::string>& words) {
    std::string joined;
    for (const auto& word : words) {
        if (!joined.empty()) joined += ' ';
        joined += word;
    }
    return joined;
}

}  // namespace

// ─────────────────────────────────────────────
// Validation
// ─────────────────────────────────────────────

Result<void> validate_run(const RunRequest& request) {
    const auto& input = request.input;
    const auto& options = request.options;
    const bool has_code = input.code && !input.code->empty();

    if (options.instance_id && options.tool != kDefaultTool) {
        return Error{ErrorKind::Usage, "cannot specify both --instance and --tool"};
    }
    if (has_code && !input.files.empty()) {
        return Error{ErrorKind::Usage, "cannot use both -c and -f flags"};
    }
    if (input.repeat < 1) {
        return Error{ErrorKind::Usage, "--repeat must be at least 1"};
    }
    if (input.repeat > kMaxRepeat) {
        return Error{ErrorKind::Usage, "--repeat must be at most " + std::to_string(kMaxRepeat)};
    }
    if (input.repeat > 1 && options.instance_id) {
        return Error{ErrorKind::Usage,
                     "cannot use --repeat with --instance (existing instance doesn't support multiple executions)"};
    }
    if (options.parallel && options.instance_id) {
        return Error{ErrorKind::Usage,
                     "cannot use --parallel with --instance (each parallel task needs its own sandbox)"};
    }
    if (options.max_parallel < 0) {
        return Error{ErrorKind::Usage, "--max-parallel must not be negative"};
    }
    return {};
}

Result<std::map<std::string, std::string>> parse_env_assignments(const std::vector<std::string>& assignments) {
    std::map<std::string, std::string> env;
    for (const auto& assignment : assignments) {
        auto eq = assignment.find('=');
        if (eq == std::string::npos || eq == 0) {
            return Error{ErrorKind::Usage,
                         "invalid environment variable format: " + assignment + " (expected KEY=VALUE)"};
        }
        env[assignment.substr(0, eq)] = assignment.substr(eq + 1);
    }
    return env;
}

// ─────────────────────────────────────────────
// Dispatcher
// ─────────────────────────────────────────────

Dispatcher::Dispatcher(ISandboxProvider& provider, Logger& logger, ConsolePrinter& printer,
                       TaskSources& sources)
    : provider_(provider), logger_(logger), printer_(printer), sources_(sources) {}

Result<int> Dispatcher::run(const RunRequest& request, std::stop_token stop) {
    if (auto valid = validate_run(request); !valid) {
        return valid.error();
    }

    auto tasks = build_tasks(request.input, sources_);
    if (!tasks) return tasks.error();
    if (tasks->empty()) {
        return Error{ErrorKind::Build, "no code provided"};
    }
    logger_.debug("built " + std::to_string(tasks->size()) + " tasks");

    if (tasks->size() == 1 && request.input.repeat == 1) {
        return run_single(tasks->front(), request.options, stop);
    }
    return run_batch(*tasks, request.options, stop);
}

Result<int> Dispatcher::run_single(const ExecutionTask& task, const RunOptions& options,
                                   std::stop_token stop) {
    auto start = std::chrono::steady_clock::now();

    auto acquired = acquire_sandbox(provider_, options, logger_);
    if (!acquired) return acquired.error();

    const InstanceId id = acquired->sandbox->id();
    if (!acquired->connected && options.keep_alive) {
        printer_.on_info("Created instance: " + id + " (kept alive)");
    }
    ScopedRelease release(provider_, logger_, id, !acquired->connected && !options.keep_alive);

    OutputCallbacks passthrough{
        .on_stdout = [this](std::string_view chunk) { printer_.write_stdout(chunk); },
        .on_stderr = [this](std::string_view chunk) { printer_.write_stderr(chunk); },
    };

    auto exec_start = std::chrono::steady_clock::now();
    auto outcome = acquired->sandbox->run_code(task.code, RunCodeOptions{.language = options.language},
                                               options.stream ? &passthrough : nullptr, stop);
    auto exec_duration = elapsed_since(exec_start);
    auto total_duration = elapsed_since(start);

    if (!outcome) {
        if (outcome.error().kind == ErrorKind::Cancelled) return outcome.error();
        return outcome.error().wrap("failed to execute code");
    }
    const ExecutionResult& execution = *outcome;
    auto timing = timing_for(options.time, *acquired, total_duration, exec_duration);

    if (options.stream) {
        if (execution.error) {
            printer_.write_stderr("\n" + format_execution_error(*execution.error));
        }
        if (timing) printer_.line_stderr(format_timing(*timing));
    } else if (printer_.json()) {
        std::optional<InstanceId> kept;
        if (!acquired->connected && options.keep_alive) kept = id;
        printer_.line_stdout(execution_json(execution, kept, timing));
    } else {
        print_execution(execution);
        if (timing) printer_.line_stderr(format_timing(*timing));
    }

    logger_.info("task " + std::to_string(task.id) + " finished with exit code "
                 + std::to_string(execution.exit_code));
    return single_exit_code(execution);
}

int Dispatcher::run_batch(const std::vector<ExecutionTask>& tasks, const RunOptions& options,
                          std::stop_token stop) {
    printer_.set_task_timing(options.time);

    auto start = std::chrono::steady_clock::now();
    auto results = options.parallel
        ? run_parallel(tasks, options, provider_, logger_, &printer_, stop)
        : run_sequential(tasks, options, provider_, logger_, &printer_, stop);
    auto summary = summarize(results, elapsed_since(start));

    if (options.stream) {
        printer_.line_stderr(format_summary(summary, options.time));
    } else if (printer_.json()) {
        printer_.line_stdout(multi_task_json(results, summary, options.time));
    } else {
        // Parallel text output was already printed in completion order.
        if (!options.parallel) {
            for (const auto& result : results) {
                printer_.write_stdout(format_task_block(result, options.time));
            }
        }
        printer_.line_stdout(format_summary(summary, options.time));
    }

    logger_.info("batch finished: " + std::to_string(summary.succeeded) + "/"
                 + std::to_string(summary.total) + " succeeded");
    return exit_code(summary);
}

void Dispatcher::print_execution(const ExecutionResult& execution) {
    for (const auto& chunk : execution.stdout_chunks) {
        printer_.write_stdout(chunk);
    }
    for (const auto& result : execution.results) {
        if (result.text) printer_.line_stdout(*result.text);
    }
    for (const auto& chunk : execution.stderr_chunks) {
        printer_.write_stderr(chunk);
    }
    if (execution.error) {
        printer_.write_stderr(format_execution_error(*execution.error));
    }
}

// ─────────────────────────────────────────────
// exec
// ─────────────────────────────────────────────

Result<int> Dispatcher::exec(const ExecRequest& request, std::stop_token stop) {
    if (request.command.empty()) {
        return Error{ErrorKind::Usage, "no command provided"};
    }
    if (request.instance_id && request.tool != kDefaultTool) {
        return Error{ErrorKind::Usage, "cannot specify both --instance and --tool"};
    }
    auto env = parse_env_assignments(request.env);
    if (!env) return env.error();

    RunOptions options;
    options.instance_id = request.instance_id;
    options.tool = request.tool;
    options.keep_alive = request.keep_alive;
    options.timeout = request.timeout;

    auto start = std::chrono::steady_clock::now();
    auto acquired = acquire_sandbox(provider_, options, logger_);
    if (!acquired) return acquired.error();

    const InstanceId id = acquired->sandbox->id();
    if (!acquired->connected && request.keep_alive) {
        printer_.on_info("Created instance: " + id + " (kept alive)");
    }
    ScopedRelease release(provider_, logger_, id, !acquired->connected && !request.keep_alive);

    CommandOptions command_options{.cwd = request.cwd, .env = std::move(*env)};
    OutputCallbacks passthrough{
        .on_stdout = [this](std::string_view chunk) { printer_.write_stdout(chunk); },
        .on_stderr = [this](std::string_view chunk) { printer_.write_stderr(chunk); },
    };

    const std::string command = join_words(request.command);
    logger_.debug("exec in " + id + ": " + command);

    auto exec_start = std::chrono::steady_clock::now();
    auto outcome = acquired->sandbox->run_command(command, command_options,
                                                  request.stream ? &passthrough : nullptr, stop);
    auto exec_duration = elapsed_since(exec_start);
    auto total_duration = elapsed_since(start);

    if (!outcome) {
        if (outcome.error().kind == ErrorKind::Cancelled) return outcome.error();
        return outcome.error().wrap("failed to execute command");
    }
    const CommandResult& result = *outcome;
    auto timing = timing_for(request.time, *acquired, total_duration, exec_duration);

    if (request.stream) {
        if (timing) printer_.line_stderr(format_timing(*timing));
        if (result.exit_code != 0 && result.error) {
            return Error{ErrorKind::Execution, "command failed with exit code "
                         + std::to_string(result.exit_code) + ": " + *result.error};
        }
    } else if (printer_.json()) {
        std::optional<InstanceId> kept;
        if (!acquired->connected && request.keep_alive) kept = id;
        printer_.line_stdout(command_json(result, kept, timing));
    } else {
        printer_.write_stdout(result.stdout_text);
        printer_.write_stderr(result.stderr_text);
        if (result.error) printer_.line_stderr("--- error ---\n" + *result.error);
        if (timing) printer_.line_stderr(format_timing(*timing));
    }

    if (result.exit_code != 0) return result.exit_code;
    return result.error ? 1 : 0;
}

// ─────────────────────────────────────────────
// instance management
// ─────────────────────────────────────────────

Result<int> Dispatcher::create_instance(const std::string& tool, std::chrono::seconds timeout) {
    auto created = provider_.create(tool, CreateOptions{.timeout = timeout});
    if (!created) return created.error().wrap("failed to create instance");

    const auto& id = (*created)->id();
    logger_.info("created instance " + id);
    if (printer_.json()) {
        printer_.line_stdout(R"({"instance_id":)" + json_quote(id) + R"(,"tool":)" + json_quote(tool) + "}");
    } else {
        printer_.line_stdout("Created instance: " + id);
    }
    return 0;
}

Result<int> Dispatcher::list_instances() {
    auto instances = provider_.list();
    if (!instances) return instances.error().wrap("failed to list instances");

    if (printer_.json()) {
        printer_.line_stdout(instances_json(*instances));
    } else {
        printer_.write_stdout(instances_table(*instances));
    }
    return 0;
}

Result<int> Dispatcher::delete_instances(const std::vector<InstanceId>& instance_ids) {
    if (instance_ids.empty()) {
        return Error{ErrorKind::Usage, "no instance id provided"};
    }

    std::vector<InstanceId> deleted;
    std::vector<std::pair<InstanceId, std::string>> failures;
    for (const auto& id : instance_ids) {
        auto destroyed = provider_.destroy(id);
        if (destroyed) {
            logger_.info("deleted instance " + id);
            deleted.push_back(id);
        } else {
            logger_.warn("failed to delete instance " + id + ": " + destroyed.error().message);
            failures.emplace_back(id, destroyed.error().message);
        }
    }

    if (printer_.json()) {
        std::ostringstream oss;
        oss << R"({"deleted":[)";
        for (size_t i = 0; i < deleted.size(); ++i) {
            oss << (i > 0 ? "," : "") << json_quote(deleted[i]);
        }
        oss << R"(],"failed":[)";
        for (size_t i = 0; i < failures.size(); ++i) {
            oss << (i > 0 ? "," : "") << R"({"id":)" << json_quote(failures[i].first)
                << R"(,"error":)" << json_quote(failures[i].second) << "}";
        }
        oss << "]}";
        printer_.line_stdout(oss.str());
    } else {
        for (const auto& id : deleted) {
            printer_.line_stdout("Deleted instance: " + id);
        }
        for (const auto& [id, message] : failures) {
            printer_.line_stderr("Failed to delete instance " + id + ": " + message);
        }
    }
    return failures.empty() ? 0 : 1;
}

}  // namespace sandbox_runner
