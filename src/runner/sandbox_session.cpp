/**
 * @file sandbox_session.cpp
 * @brief Sandbox acquisition and per-task execution shared by both runners.
 */

#include "runner/sandbox_session.hpp"

namespace sandbox_runner {

Result<AcquiredSandbox> acquire_sandbox(ISandboxProvider& provider, const RunOptions& options,
                                        Logger& logger) {
    if (options.instance_id) {
        auto connected = provider.connect(*options.instance_id);
        if (!connected) {
            return connected.error().wrap("failed to connect to instance " + *options.instance_id);
        }
        logger.debug("connected to instance " + *options.instance_id);
        return AcquiredSandbox{.sandbox = std::move(*connected), .connected = true};
    }

    auto start = std::chrono::steady_clock::now();
    auto created = provider.create(options.tool, CreateOptions{.timeout = options.timeout});
    auto creation = elapsed_since(start);
    if (!created) {
        return created.error().wrap("failed to create sandbox");
    }
    logger.debug("created sandbox " + (*created)->id() + " in "
                 + std::to_string(creation.count()) + "us");
    return AcquiredSandbox{.sandbox = std::move(*created), .creation_duration = creation};
}

void release_sandbox(ISandboxProvider& provider, const InstanceId& instance_id, Logger& logger) {
    auto destroyed = provider.destroy(instance_id);
    if (!destroyed) {
        logger.warn("failed to destroy sandbox " + instance_id + ": " + destroyed.error().message);
        return;
    }
    logger.debug("destroyed sandbox " + instance_id);
}

OutputCallbacks observer_callbacks(TaskObserver& observer, const ExecutionTask& task) {
    return OutputCallbacks{
        .on_stdout = [&observer, &task](std::string_view chunk) { observer.on_stdout(task, chunk); },
        .on_stderr = [&observer, &task](std::string_view chunk) { observer.on_stderr(task, chunk); },
    };
}

void execute_task(ISandbox& sandbox, const RunOptions& options, TaskObserver* observer,
                  std::stop_token stop, TaskResult& result) {
    OutputCallbacks callbacks;
    const OutputCallbacks* live = nullptr;
    if (options.stream && observer) {
        callbacks = observer_callbacks(*observer, result.task);
        live = &callbacks;
    }

    auto start = std::chrono::steady_clock::now();
    result.outcome = sandbox.run_code(result.task.code, RunCodeOptions{.language = options.language},
                                      live, std::move(stop));
    result.execution_duration = elapsed_since(start);
    result.total_duration = result.creation_duration + result.execution_duration;
}

}  // namespace sandbox_runner
