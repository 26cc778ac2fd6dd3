/**
 * @file recording_observer.hpp
 * @brief TaskObserver that records every callback, for runner tests.
 */

#pragma once

#include "runner/task_result.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace sandbox_runner::test_support {

class RecordingObserver : public TaskObserver {
public:
    void on_stdout(const ExecutionTask& task, std::string_view chunk) override {
        std::lock_guard lock(mutex_);
        stdout_lines.push_back(std::to_string(task.id) + ":" + std::string{chunk});
    }

    void on_stderr(const ExecutionTask& task, std::string_view chunk) override {
        std::lock_guard lock(mutex_);
        stderr_lines.push_back(std::to_string(task.id) + ":" + std::string{chunk});
    }

    void on_task_finished(const TaskResult& result) override {
        std::lock_guard lock(mutex_);
        finished.push_back(result.task.id);
    }

    void on_info(std::string_view message) override {
        std::lock_guard lock(mutex_);
        info.emplace_back(message);
    }

    std::vector<std::string> stdout_lines;
    std::vector<std::string> stderr_lines;
    std::vector<TaskId> finished;
    std::vector<std::string> info;

private:
    std::mutex mutex_;
};

/// n tasks with the same code, numbered like a repeated literal.
inline std::vector<ExecutionTask> make_tasks(uint32_t n, const std::string& code = "print(1)") {
    std::vector<ExecutionTask> tasks;
    for (uint32_t i = 1; i <= n; ++i) {
        tasks.push_back(ExecutionTask{
            .id = i, .code = code, .source = "<code>", .instance_number = i, .total_instances = n});
    }
    return tasks;
}

}  // namespace sandbox_runner::test_support
