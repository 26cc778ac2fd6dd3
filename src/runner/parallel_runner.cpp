/**
 * @file parallel_runner.cpp
 * @brief Bounded parallel execution with completion-order reporting.
 */

#include "runner/parallel_runner.hpp"
#include "executor/thread_pool.hpp"
#include "runner/result_channel.hpp"
#include "runner/sandbox_session.hpp"

#include <future>
#include <mutex>
#include <optional>

namespace sandbox_runner {

namespace {

std::string join_ids(const std::vector<InstanceId>& ids) {
    std::string joined;
    for (const auto& id : ids) {
        if (!joined.empty()) joined += ", ";
        joined += id;
    }
    return joined;
}

}  // namespace

size_t effective_parallelism(int max_parallel, size_t task_count) noexcept {
    if (max_parallel <= 0 || static_cast<size_t>(max_parallel) > task_count) {
        return task_count;
    }
    return static_cast<size_t>(max_parallel);
}

std::vector<TaskResult> run_parallel(const std::vector<ExecutionTask>& tasks,
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

    const size_t limit = effective_parallelism(options.max_parallel, tasks.size());
    logger.debug("parallel run: " + std::to_string(tasks.size()) + " tasks, limit "
                 + std::to_string(limit));

    std::optional<ResultChannel<TaskResult>> channel;
    if (observer && !options.stream && options.format == OutputFormat::Text) {
        channel.emplace([observer](const TaskResult& result) { observer->on_task_finished(result); });
    }

    // Guards the sandbox list and the counters; results[i] has a single writer.
    std::mutex mutex;
    std::vector<InstanceId> sandboxes;
    size_t succeeded = 0;
    size_t failed = 0;

    auto run_one = [&](size_t index) {
        TaskResult& result = results[index];

        if (!stop.stop_requested()) {
            auto task_start = std::chrono::steady_clock::now();
            auto acquired = acquire_sandbox(provider, options, logger);
            if (!acquired) {
                logger.warn("task " + std::to_string(result.task.id) + ": "
                            + acquired.error().message);
                result.outcome = acquired.error();
                result.total_duration = elapsed_since(task_start);
            } else {
                if (!acquired->connected) {
                    std::lock_guard lock(mutex);
                    sandboxes.push_back(acquired->sandbox->id());
                }
                result.creation_duration = acquired->creation_duration;
                execute_task(*acquired->sandbox, options, observer, stop, result);
                result.total_duration = elapsed_since(task_start);
            }
        } else {
            logger.debug("task " + std::to_string(result.task.id) + " cancelled before start");
        }

        {
            std::lock_guard lock(mutex);
            if (result.failed()) {
                ++failed;
            } else {
                ++succeeded;
            }
        }
        if (channel) {
            channel->push(result);
        }
    };

    {
        ThreadPool pool(limit);
        std::vector<std::future<void>> pending;
        pending.reserve(tasks.size());
        for (size_t i = 0; i < tasks.size(); ++i) {
            pending.push_back(pool.submit([&run_one, i] { run_one(i); }));
        }
        for (auto& future : pending) {
            future.get();
        }
    }

    if (channel) {
        channel->close();
    }

    logger.info("parallel run finished: " + std::to_string(succeeded) + " succeeded, "
                + std::to_string(failed) + " failed, " + std::to_string(sandboxes.size())
                + " sandboxes");

    if (options.keep_alive) {
        if (!sandboxes.empty() && observer) {
            observer->on_info("Created " + std::to_string(sandboxes.size())
                              + " instances (kept alive): " + join_ids(sandboxes));
        }
    } else {
        for (const auto& id : sandboxes) {
            release_sandbox(provider, id, logger);
        }
    }
    return results;
}

}  // namespace sandbox_runner
