/**
 * @file types.hpp
 * @brief Fundamental vocabulary types used throughout SandboxRunner.
 *
 * Defines task, sandbox and execution-result types shared by the task
 * builder, the sandbox providers and both runners. All types are plain
 * values; nothing here owns a sandbox.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sandbox_runner {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using TaskId = uint32_t;
using InstanceId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

inline constexpr std::string_view kDefaultTool = "code-interpreter-v1";
inline constexpr std::string_view kDefaultLanguage = "python";

// Source markers for tasks that do not come from a file.
inline constexpr std::string_view kSourceCode = "<code>";
inline constexpr std::string_view kSourceStdin = "<stdin>";
inline constexpr std::string_view kSourceEditor = "<editor>";

// ─────────────────────────────────────────────
// Execution Task
// ─────────────────────────────────────────────

/**
 * @brief One unit of code to run.
 *
 * Built once by the TaskBuilder and never mutated afterwards. Runners take
 * tasks by const reference and copy them into the matching TaskResult.
 */
struct ExecutionTask {
    TaskId id{0};
    std::string code;
    std::string source;                 ///< File path or one of the kSource* markers
    uint32_t instance_number{1};        ///< 1-based repetition index
    uint32_t total_instances{1};        ///< Repetition count for this source

    /// Instance number for display, 0 when the source is not repeated.
    [[nodiscard]] constexpr uint32_t display_instance() const noexcept {
        return total_instances > 1 ? instance_number : 0;
    }
};

// ─────────────────────────────────────────────
// Execution Result (returned by a sandbox)
// ─────────────────────────────────────────────

/**
 * @brief Structured error raised by the executed code itself.
 */
struct ExecutionError {
    std::string name;
    std::string value;
    std::string traceback;
};

/**
 * @brief One rich output payload. Only the populated formats are set.
 */
struct RichResult {
    std::optional<std::string> text;
    std::optional<std::string> html;
    std::optional<std::string> markdown;
    std::optional<std::string> svg;
    std::optional<std::string> png;
    std::optional<std::string> jpeg;
    std::optional<std::string> pdf;
    std::optional<std::string> latex;
    std::optional<std::string> json;
    std::optional<std::string> javascript;
    bool is_main_result{false};

    [[nodiscard]] bool empty() const noexcept {
        return !text && !html && !markdown && !svg && !png && !jpeg
            && !pdf && !latex && !json && !javascript;
    }
};

struct ExecutionResult {
    std::vector<std::string> stdout_chunks;
    std::vector<std::string> stderr_chunks;
    std::optional<ExecutionError> error;
    std::vector<RichResult> results;
    int exit_code{0};
};

/**
 * @brief Result of a plain shell command run inside a sandbox.
 */
struct CommandResult {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code{0};
    std::optional<std::string> error;   ///< Set when the command could not finish normally
};

// ─────────────────────────────────────────────
// Output Format
// ─────────────────────────────────────────────

enum class OutputFormat : uint8_t {
    Text,
    Json
};

[[nodiscard]] constexpr std::string_view to_string(OutputFormat format) noexcept {
    switch (format) {
        case OutputFormat::Text: return "text";
        case OutputFormat::Json: return "json";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Task State
// ─────────────────────────────────────────────

enum class TaskState : uint8_t {
    Pending,       ///< Waiting for an admission slot
    Acquiring,     ///< Creating or connecting its sandbox
    Running,       ///< Code is executing
    Succeeded,     ///< Finished without an execution error
    Failed         ///< Creation, transport or execution failure
};

[[nodiscard]] constexpr std::string_view to_string(TaskState state) noexcept {
    switch (state) {
        case TaskState::Pending:   return "pending";
        case TaskState::Acquiring: return "acquiring";
        case TaskState::Running:   return "running";
        case TaskState::Succeeded: return "succeeded";
        case TaskState::Failed:    return "failed";
    }
    return "unknown";
}

}  // namespace sandbox_runner
