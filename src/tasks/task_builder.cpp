/**
 * @file task_builder.cpp
 * @brief Task construction from code, files, stdin or the editor.
 */

#include "tasks/task_builder.hpp"
#include "tasks/editor.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <unistd.h>

namespace sandbox_runner {

namespace {

Result<std::string> read_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        return Error{ErrorKind::Build, "failed to read file " + path.string() + ": is a directory"};
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorKind::Build,
                     "failed to read file " + path.string() + ": " + std::strerror(errno)};
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    if (in.bad()) {
        return Error{ErrorKind::Build, "failed to read file " + path.string() + ": read error"};
    }
    return contents.str();
}

/// Appends `repeat` copies of one source to the task list.
void append_repeated(std::vector<ExecutionTask>& tasks, const std::string& code,
                     const std::string& source, uint32_t repeat) {
    for (uint32_t i = 1; i <= repeat; ++i) {
        tasks.push_back(ExecutionTask{
            .id = static_cast<TaskId>(tasks.size() + 1),
            .code = code,
            .source = source,
            .instance_number = i,
            .total_instances = repeat,
        });
    }
}

}  // namespace

// ─────────────────────────────────────────────
// TerminalSources
// ─────────────────────────────────────────────

bool TerminalSources::stdin_is_piped() {
    return isatty(STDIN_FILENO) == 0;
}

Result<std::string> TerminalSources::read_stdin() {
    std::string data{std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()};
    if (std::cin.bad()) {
        return Error{ErrorKind::Build, "failed to read stdin"};
    }
    return data;
}

Result<std::string> TerminalSources::edit(const std::string& language) {
    return open_editor(language);
}

// ─────────────────────────────────────────────
// build_tasks
// ─────────────────────────────────────────────

Result<std::vector<ExecutionTask>> build_tasks(const TaskInput& input, TaskSources& sources) {
    const bool has_code = input.code && !input.code->empty();

    if (has_code && !input.files.empty()) {
        return Error{ErrorKind::Usage, "cannot use both -c and -f flags"};
    }
    if (input.repeat < 1) {
        return Error{ErrorKind::Usage, "--repeat must be at least 1"};
    }
    if (input.repeat > kMaxRepeat) {
        return Error{ErrorKind::Usage, "--repeat must be at most " + std::to_string(kMaxRepeat)};
    }
    const auto repeat = static_cast<uint32_t>(input.repeat);

    std::vector<ExecutionTask> tasks;

    if (has_code) {
        append_repeated(tasks, *input.code, std::string{kSourceCode}, repeat);
        return tasks;
    }

    if (!input.files.empty()) {
        tasks.reserve(input.files.size() * repeat);
        for (const auto& path : input.files) {
            auto code = read_file(path);
            if (!code) return code.error();
            append_repeated(tasks, *code, path.string(), repeat);
        }
        return tasks;
    }

    if (sources.stdin_is_piped()) {
        auto code = sources.read_stdin();
        if (!code) return code.error();
        if (!code->empty()) {
            append_repeated(tasks, *code, std::string{kSourceStdin}, repeat);
        }
        return tasks;
    }

    auto code = sources.edit(input.language);
    if (!code) return code.error();
    if (!code->empty()) {
        append_repeated(tasks, *code, std::string{kSourceEditor}, repeat);
    }
    return tasks;
}

}  // namespace sandbox_runner
