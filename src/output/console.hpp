/**
 * @file console.hpp
 * @brief Thread-safe writer for command output.
 *
 * Every write takes one lock, so prefixed stream lines from concurrent
 * tasks never interleave mid-line. Streams are injected so tests can capture
 * them.
 */

#pragma once

#include "output/formatter.hpp"
#include "runner/task_result.hpp"

#include <mutex>
#include <ostream>
#include <string_view>

namespace sandbox_runner {

class ConsolePrinter : public TaskObserver {
public:
    ConsolePrinter(std::ostream& out, std::ostream& err, OutputFormat format);

    // TaskObserver interface
    void on_stdout(const ExecutionTask& task, std::string_view chunk) override;
    void on_stderr(const ExecutionTask& task, std::string_view chunk) override;
    void on_task_finished(const TaskResult& result) override;
    void on_info(std::string_view message) override;

    /// Unprefixed passthrough for single-task streaming.
    void write_stdout(std::string_view text);
    void write_stderr(std::string_view text);

    /// Text appended with a newline when it lacks one.
    void line_stdout(std::string_view text);
    void line_stderr(std::string_view text);

    /// Append a per-task "Time:" line to finished-task blocks.
    void set_task_timing(bool enabled) noexcept { task_timing_ = enabled; }

    [[nodiscard]] OutputFormat format() const noexcept { return format_; }
    [[nodiscard]] bool json() const noexcept { return format_ == OutputFormat::Json; }

private:
    void write(std::ostream& stream, std::string_view text, bool newline);

    std::ostream& out_;
    std::ostream& err_;
    OutputFormat format_;
    bool task_timing_{false};
    std::mutex mutex_;
};

}  // namespace sandbox_runner
