/**
 * @file task_result.hpp
 * @brief Outcome of one task, observer hooks, and timing helpers.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace sandbox_runner {

inline constexpr std::string_view kCancelledBeforeStart = "cancelled before start";

/**
 * @brief One task's outcome.
 *
 * A default-constructed result reads as cancelled; runners pre-fill their
 * result vector this way and overwrite each slot when its task runs.
 */
struct TaskResult {
    ExecutionTask task;
    Result<ExecutionResult> outcome{Error{ErrorKind::Cancelled, std::string{kCancelledBeforeStart}}};
    Duration creation_duration{0};       ///< zero when the sandbox was reused or connected
    Duration execution_duration{0};
    Duration total_duration{0};

    /// Creation/transport error, or an error raised by the executed code.
    [[nodiscard]] bool failed() const {
        return !outcome.has_value() || outcome.value().error.has_value();
    }

    [[nodiscard]] bool cancelled() const {
        return !outcome.has_value() && outcome.error().kind == ErrorKind::Cancelled;
    }
};

/**
 * @brief Receives live output and finished results from the runners.
 *
 * on_stdout/on_stderr run on whichever thread executes the task, so
 * implementations must be thread-safe. on_task_finished is only called from
 * the parallel runner's single consumer thread.
 */
class TaskObserver {
public:
    virtual ~TaskObserver() = default;

    virtual void on_stdout(const ExecutionTask& task, std::string_view chunk) = 0;
    virtual void on_stderr(const ExecutionTask& task, std::string_view chunk) = 0;
    virtual void on_task_finished(const TaskResult& result) = 0;
    virtual void on_info(std::string_view message) = 0;
};

inline Duration elapsed_since(SteadyTime start) {
    return std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start);
}

}  // namespace sandbox_runner
