/**
 * @file sandbox_session.hpp
 * @brief Shared pieces of the runners: sandbox acquisition, release and the
 *        streaming callbacks for one task.
 */

#pragma once

#include "core/logger.hpp"
#include "runner/run_options.hpp"
#include "runner/task_result.hpp"
#include "sandbox/sandbox.hpp"

namespace sandbox_runner {

/**
 * @brief A sandbox obtained for a run, with how it was obtained.
 */
struct AcquiredSandbox {
    SandboxPtr sandbox;
    Duration creation_duration{0};
    bool connected{false};      ///< attached to an existing instance, never destroyed
};

/**
 * @brief Connect to options.instance_id when set, otherwise create.
 *
 * Errors are prefixed with "failed to connect to instance <id>" or
 * "failed to create sandbox".
 */
Result<AcquiredSandbox> acquire_sandbox(ISandboxProvider& provider, const RunOptions& options,
                                        Logger& logger);

/**
 * @brief Destroy a sandbox; failure is logged as a warning and swallowed.
 */
void release_sandbox(ISandboxProvider& provider, const InstanceId& instance_id, Logger& logger);

/**
 * @brief Callbacks forwarding a task's output to the observer.
 */
OutputCallbacks observer_callbacks(TaskObserver& observer, const ExecutionTask& task);

/**
 * @brief Run one task's code and store outcome and execution time.
 */
void execute_task(ISandbox& sandbox, const RunOptions& options, TaskObserver* observer,
                  std::stop_token stop, TaskResult& result);

}  // namespace sandbox_runner
