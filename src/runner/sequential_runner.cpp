/**
 * @file sequential_runner.cpp
 * @brief Sequential execution over a single sandbox.
 */

#include "runner/sequential_runner.hpp"
#include "runner/sandbox_session.hpp"

namespace sandbox_runner {

std::vector<TaskResult> run_sequential(const std::vector<ExecutionTask>& tasks,
                                       const RunOptions& options,
                                       ISandboxProvider& provider,
                                       Logger& logger,
                                       TaskObserver* observer,
                                       std::stop_token stop) {
    std::vector<TaskResult> results;
    results.reserve(tasks.size());
    for (const auto& task : tasks) {
        results.push_back(TaskResult{.task = task});
    }
    if (tasks.empty()) return results;

    if (stop.stop_requested()) {
        logger.info("stop requested, " + std::to_string(tasks.size()) + " tasks not started");
        return results;
    }

    auto acquired = acquire_sandbox(provider, options, logger);
    if (!acquired) {
        logger.error(acquired.error().message);
        for (auto& result : results) {
            result.outcome = acquired.error();
        }
        return results;
    }
    const SandboxPtr& sandbox = acquired->sandbox;

    if (!acquired->connected && options.keep_alive && observer) {
        observer->on_info("Created instance: " + sandbox->id() + " (kept alive)");
    }

    for (size_t i = 0; i < results.size(); ++i) {
        if (stop.stop_requested()) {
            logger.info("stop requested, " + std::to_string(results.size() - i) + " tasks not started");
            break;
        }
        auto& result = results[i];
        if (i == 0) {
            result.creation_duration = acquired->creation_duration;
        }
        execute_task(*sandbox, options, observer, stop, result);
        logger.debug("task " + std::to_string(result.task.id)
                     + (result.failed() ? " failed" : " succeeded"));
    }

    if (!acquired->connected && !options.keep_alive) {
        release_sandbox(provider, sandbox->id(), logger);
    }
    return results;
}

}  // namespace sandbox_runner
