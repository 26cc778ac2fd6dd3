/**
 * @file parallel_runner.hpp
 * @brief Runs tasks concurrently, one fresh sandbox per task.
 */

#pragma once

#include "core/logger.hpp"
#include "runner/run_options.hpp"
#include "runner/task_result.hpp"
#include "sandbox/sandbox.hpp"

#include <cstddef>
#include <stop_token>
#include <vector>

namespace sandbox_runner {

/**
 * @brief min(max_parallel, task_count), or task_count when max_parallel <= 0.
 */
[[nodiscard]] size_t effective_parallelism(int max_parallel, size_t task_count) noexcept;

/**
 * @brief Fan tasks out over a worker pool sized to the effective limit.
 *
 * A task holds its worker while it creates a sandbox and runs, so no more
 * than the limit are ever acquiring or running. When not streaming and the
 * output is text, each finished result is handed to
 * observer->on_task_finished from a single consumer thread in completion
 * order. Sandboxes are destroyed after every task is done unless keep_alive
 * is set, in which case their ids are reported through observer->on_info.
 *
 * @return one result per task, results[i] for tasks[i].
 */
std::vector<TaskResult> run_parallel(const std::vector<ExecutionTask>& tasks,
                                     const RunOptions& options,
                                     ISandboxProvider& provider,
                                     Logger& logger,
                                     TaskObserver* observer,
                                     std::stop_token stop);

}  // namespace sandbox_runner
