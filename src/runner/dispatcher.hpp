/**
 * @file dispatcher.hpp
 * @brief Command entry points: validate, build tasks, pick a runner, print,
 *        and turn the outcome into an exit code.
 *
 * Usage and build errors come back as errors before anything touches a
 * sandbox; everything else ends as an exit code. Nothing here terminates the
 * process.
 */

#pragma once

#include "core/logger.hpp"
#include "output/console.hpp"
#include "runner/run_options.hpp"
#include "sandbox/sandbox.hpp"
#include "tasks/task_builder.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace sandbox_runner {

struct RunRequest {
    TaskInput input;
    RunOptions options;
};

struct ExecRequest {
    std::vector<std::string> command;            ///< joined with spaces
    std::optional<InstanceId> instance_id;
    std::string tool{kDefaultTool};
    bool keep_alive{false};
    bool stream{false};
    bool time{false};
    std::optional<std::string> cwd;
    std::vector<std::string> env;                ///< KEY=VALUE
    std::chrono::seconds timeout{300};
};

/**
 * @brief Reject conflicting run flags. No side effects.
 */
Result<void> validate_run(const RunRequest& request);

/**
 * @brief Split KEY=VALUE assignments; a missing '=' or empty key is a usage error.
 */
Result<std::map<std::string, std::string>> parse_env_assignments(const std::vector<std::string>& assignments);

class Dispatcher {
public:
    Dispatcher(ISandboxProvider& provider, Logger& logger, ConsolePrinter& printer,
               TaskSources& sources);

    Result<int> run(const RunRequest& request, std::stop_token stop);
    Result<int> exec(const ExecRequest& request, std::stop_token stop);

    Result<int> create_instance(const std::string& tool, std::chrono::seconds timeout);
    Result<int> list_instances();
    Result<int> delete_instances(const std::vector<InstanceId>& instance_ids);

private:
    Result<int> run_single(const ExecutionTask& task, const RunOptions& options, std::stop_token stop);
    int run_batch(const std::vector<ExecutionTask>& tasks, const RunOptions& options, std::stop_token stop);
    void print_execution(const ExecutionResult& execution);

    ISandboxProvider& provider_;
    Logger& logger_;
    ConsolePrinter& printer_;
    TaskSources& sources_;
};

}  // namespace sandbox_runner
