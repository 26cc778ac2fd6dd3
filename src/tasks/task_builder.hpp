/**
 * @file task_builder.hpp
 * @brief Turns raw input into an ordered list of ExecutionTasks.
 *
 * Precedence is literal code, then files, then piped stdin, then an editor
 * session. Stdin and the editor sit behind TaskSources so tests can script
 * them.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sandbox_runner {

/// Upper bound for --repeat; every repeat becomes a task held in memory.
inline constexpr int64_t kMaxRepeat = 10000;

struct TaskInput {
    std::optional<std::string> code;               ///< empty string counts as absent
    std::vector<std::filesystem::path> files;
    int64_t repeat{1};
    std::string language{kDefaultLanguage};
};

/**
 * @brief Interactive input sources consulted when no code or file is given.
 */
class TaskSources {
public:
    virtual ~TaskSources() = default;

    /// True when stdin is a pipe or file rather than a terminal.
    [[nodiscard]] virtual bool stdin_is_piped() = 0;
    virtual Result<std::string> read_stdin() = 0;

    /// Empty string when the user left the buffer untouched.
    virtual Result<std::string> edit(const std::string& language) = 0;
};

/**
 * @brief Process stdin and the user's $EDITOR.
 */
class TerminalSources : public TaskSources {
public:
    [[nodiscard]] bool stdin_is_piped() override;
    Result<std::string> read_stdin() override;
    Result<std::string> edit(const std::string& language) override;
};

/**
 * @brief Build tasks, numbering them from 1 in build order.
 *
 * Each file expands into `repeat` consecutive tasks. An empty result means
 * there was nothing to run; the caller reports it.
 */
Result<std::vector<ExecutionTask>> build_tasks(const TaskInput& input, TaskSources& sources);

}  // namespace sandbox_runner
