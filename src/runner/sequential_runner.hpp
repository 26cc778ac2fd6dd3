/**
 * @file sequential_runner.hpp
 * @brief Runs every task, in order, against one shared sandbox.
 */

#pragma once

#include "core/logger.hpp"
#include "runner/run_options.hpp"
#include "runner/task_result.hpp"
#include "sandbox/sandbox.hpp"

#include <stop_token>
#include <vector>

namespace sandbox_runner {

/**
 * @brief Acquire one sandbox and run the tasks one after another.
 *
 * Sandbox state carries over from task to task. Creation time is charged to
 * results[0] only. If the sandbox cannot be obtained every task gets the same
 * error and nothing runs. Tasks not started when stop is requested keep the
 * "cancelled before start" outcome.
 *
 * @return one result per task, results[i] for tasks[i].
 */
std::vector<TaskResult> run_sequential(const std::vector<ExecutionTask>& tasks,
                                       const RunOptions& options,
                                       ISandboxProvider& provider,
                                       Logger& logger,
                                       TaskObserver* observer,
                                       std::stop_token stop);

}  // namespace sandbox_runner
