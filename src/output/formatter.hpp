/**
 * @file formatter.hpp
 * @brief Text and JSON rendering of task results, summaries and timing.
 *
 * Pure string builders; ConsolePrinter decides where the text goes.
 */

#pragma once

#include "core/types.hpp"
#include "runner/result_aggregator.hpp"
#include "runner/task_result.hpp"
#include "sandbox/sandbox.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sandbox_runner {

/**
 * @brief Wall-clock breakdown. create/exec are set only when a sandbox was
 *        created for the measured work.
 */
struct Timing {
    Duration total{0};
    std::optional<Duration> create;
    std::optional<Duration> exec;

    static Timing of(Duration total) { return Timing{.total = total}; }
    static Timing with_phases(Duration total, Duration create, Duration exec) {
        return Timing{.total = total, .create = create, .exec = exec};
    }
};

/// Per-task timing: phases when the task paid for sandbox creation.
Timing task_timing(const TaskResult& result);

/// "850µs", "12.345ms", "1.234s".
std::string format_duration(Duration duration);

/// "Time: <total>" or "Time: <total> (create <c>, exec <e>)".
std::string format_timing(const Timing& timing);

/// "[<id>:<source>]" or "[<id>:<source>#<i>]" for repeated sources.
std::string stream_prefix(const ExecutionTask& task);

/// "━━━ Task <id>: <source> (<i>/<n>) [FAILED] ━━━"
std::string task_header(const TaskResult& result);

/// Header, stdout, stderr and error sections, then a blank line.
std::string format_task_block(const TaskResult& result, bool with_time = false);

/// "Summary: N tasks, S succeeded, F failed[, time D]"
std::string format_summary(const Summary& summary, bool with_time);

/// "--- error ---" section for an error raised by executed code.
std::string format_execution_error(const ExecutionError& error);

// ── JSON ──────────────────────────────────────

std::string timing_json(const Timing& timing);
std::string rich_results_json(const std::vector<RichResult>& results);

/// {"tasks":[...],"summary":{...}}
std::string multi_task_json(const std::vector<TaskResult>& results, const Summary& summary,
                            bool with_time);

/// {"stdout","stderr","results","error","exit_code","instance_id","timing"}
std::string execution_json(const ExecutionResult& result,
                           const std::optional<InstanceId>& instance_id,
                           const std::optional<Timing>& timing);

/// Same shape as execution_json; "error" is a string and "results" is empty.
std::string command_json(const CommandResult& result,
                         const std::optional<InstanceId>& instance_id,
                         const std::optional<Timing>& timing);

std::string instances_json(const std::vector<InstanceInfo>& instances);

/// Column-aligned table with a header row, or "No instances found".
std::string instances_table(const std::vector<InstanceInfo>& instances);

}  // namespace sandbox_runner
