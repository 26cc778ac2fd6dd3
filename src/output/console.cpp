/**
 * @file console.cpp
 * @brief ConsolePrinter implementation.
 */

#include "output/console.hpp"

namespace sandbox_runner {

ConsolePrinter::ConsolePrinter(std::ostream& out, std::ostream& err, OutputFormat format)
    : out_(out), err_(err), format_(format) {}

void ConsolePrinter::on_stdout(const ExecutionTask& task, std::string_view chunk) {
    write(out_, stream_prefix(task) + " " + std::string{chunk}, true);
}

void ConsolePrinter::on_stderr(const ExecutionTask& task, std::string_view chunk) {
    write(err_, stream_prefix(task) + " " + std::string{chunk}, true);
}

void ConsolePrinter::on_task_finished(const TaskResult& result) {
    write(out_, format_task_block(result, task_timing_), false);
}

void ConsolePrinter::on_info(std::string_view message) {
    write(err_, message, true);
}

void ConsolePrinter::write_stdout(std::string_view text) { write(out_, text, false); }
void ConsolePrinter::write_stderr(std::string_view text) { write(err_, text, false); }
void ConsolePrinter::line_stdout(std::string_view text) { write(out_, text, true); }
void ConsolePrinter::line_stderr(std::string_view text) { write(err_, text, true); }

void ConsolePrinter::write(std::ostream& stream, std::string_view text, bool newline) {
    std::lock_guard lock(mutex_);
    stream << text;
    if (newline && (text.empty() || text.back() != '\n')) stream << '\n';
    stream.flush();
}

}  // namespace sandbox_runner
