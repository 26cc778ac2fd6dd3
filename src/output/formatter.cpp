/**
 * @file formatter.cpp
 * @brief Formatter implementation.
 */

#include "output/formatter.hpp"
#include "core/json.hpp"

#include <algorithm>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace sandbox_runner {

namespace {

std::string join_chunks(const std::vector<std::string>& chunks) {
    std::string joined;
    for (const auto& chunk : chunks) joined += chunk;
    return joined;
}

std::string json_string_array(const std::vector<std::string>& items) {
    std::string out = "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ",";
        out += json_quote(items[i]);
    }
    return out + "]";
}

std::string millis(Duration duration) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.3f", static_cast<double>(duration.count()) / 1000.0);
    return buffer;
}

std::string execution_error_json(const ExecutionError& error) {
    std::ostringstream oss;
    oss << R"({"name":)" << json_quote(error.name)
        << R"(,"value":)" << json_quote(error.value)
        << R"(,"traceback":)" << json_quote(error.traceback)
        << "}";
    return oss.str();
}

void append_field(std::ostringstream& oss, bool& first, std::string_view key,
                  const std::optional<std::string>& value) {
    if (!value) return;
    if (!first) oss << ",";
    first = false;
    oss << json_quote(key) << ":" << json_quote(*value);
}

void ensure_newline(std::string& text) {
    if (!text.empty() && text.back() != '\n') text += '\n';
}

}  // namespace

Timing task_timing(const TaskResult& result) {
    if (result.creation_duration.count() > 0) {
        return Timing::with_phases(result.total_duration, result.creation_duration,
                                   result.execution_duration);
    }
    return Timing::of(result.total_duration);
}

std::string format_duration(Duration duration) {
    const auto us = duration.count();
    char buffer[32];
    if (us < 1000) {
        std::snprintf(buffer, sizeof(buffer), "%lldµs", static_cast<long long>(us));
    } else if (us < 1'000'000) {
        std::snprintf(buffer, sizeof(buffer), "%.3fms", static_cast<double>(us) / 1e3);
    } else {
        std::snprintf(buffer, sizeof(buffer), "%.3fs", static_cast<double>(us) / 1e6);
    }
    return buffer;
}

std::string format_timing(const Timing& timing) {
    std::string line = "Time: " + format_duration(timing.total);
    if (timing.create && timing.exec) {
        line += " (create " + format_duration(*timing.create)
              + ", exec " + format_duration(*timing.exec) + ")";
    }
    return line;
}

std::string stream_prefix(const ExecutionTask& task) {
    std::string prefix = "[" + std::to_string(task.id) + ":" + task.source;
    if (auto instance = task.display_instance(); instance > 0) {
        prefix += "#" + std::to_string(instance);
    }
    return prefix + "]";
}

std::string task_header(const TaskResult& result) {
    const auto& task = result.task;
    std::string header = "━━━ Task " + std::to_string(task.id) + ": " + task.source;
    if (task.total_instances > 1) {
        header += " (" + std::to_string(task.instance_number) + "/"
                + std::to_string(task.total_instances) + ")";
    }
    if (result.failed()) header += " [FAILED]";
    return header + " ━━━";
}

std::string format_execution_error(const ExecutionError& error) {
    std::string text = "--- error ---\n" + error.name + ": " + error.value + "\n";
    if (!error.traceback.empty()) {
        text += error.traceback;
        ensure_newline(text);
    }
    return text;
}

std::string format_task_block(const TaskResult& result, bool with_time) {
    std::string text = task_header(result) + "\n";

    if (!result.outcome) {
        text += "--- error ---\n" + result.outcome.error().message + "\n";
    } else {
        const auto& execution = result.outcome.value();
        text += join_chunks(execution.stdout_chunks);
        ensure_newline(text);
        if (!execution.stderr_chunks.empty()) {
            text += "--- stderr ---\n" + join_chunks(execution.stderr_chunks);
            ensure_newline(text);
        }
        if (execution.error) {
            text += format_execution_error(*execution.error);
        }
    }

    if (with_time) {
        text += format_timing(task_timing(result)) + "\n";
    }
    return text + "\n";
}

std::string format_summary(const Summary& summary, bool with_time) {
    std::string line = "Summary: " + std::to_string(summary.total) + " tasks, "
                     + std::to_string(summary.succeeded) + " succeeded, "
                     + std::to_string(summary.failed) + " failed";
    if (with_time) {
        line += ", time " + format_duration(summary.duration);
    }
    return line;
}

// ─────────────────────────────────────────────
// JSON
// ─────────────────────────────────────────────

std::string timing_json(const Timing& timing) {
    std::ostringstream oss;
    oss << R"({"total_ms":)" << millis(timing.total);
    if (timing.create) oss << R"(,"create_ms":)" << millis(*timing.create);
    if (timing.exec)   oss << R"(,"exec_ms":)" << millis(*timing.exec);
    oss << "}";
    return oss.str();
}

std::string rich_results_json(const std::vector<RichResult>& results) {
    std::ostringstream oss;
    oss << "[";
    bool first_entry = true;
    for (const auto& result : results) {
        if (result.empty()) continue;
        if (!first_entry) oss << ",";
        first_entry = false;

        oss << "{";
        bool first = true;
        append_field(oss, first, "text", result.text);
        append_field(oss, first, "html", result.html);
        append_field(oss, first, "markdown", result.markdown);
        append_field(oss, first, "svg", result.svg);
        append_field(oss, first, "png", result.png);
        append_field(oss, first, "jpeg", result.jpeg);
        append_field(oss, first, "pdf", result.pdf);
        append_field(oss, first, "latex", result.latex);
        append_field(oss, first, "json", result.json);
        append_field(oss, first, "javascript", result.javascript);
        oss << R"(,"is_main_result":)" << (result.is_main_result ? "true" : "false") << "}";
    }
    oss << "]";
    return oss.str();
}

std::string multi_task_json(const std::vector<TaskResult>& results, const Summary& summary,
                            bool with_time) {
    std::ostringstream oss;
    oss << R"({"tasks":[)";
    for (size_t i = 0; i < results.size(); ++i) {
        const auto& result = results[i];
        const auto& task = result.task;
        if (i > 0) oss << ",";

        oss << R"({"id":)" << task.id
            << R"(,"source":)" << json_quote(task.source)
            << R"(,"instance":)" << task.instance_number
            << R"(,"total_instances":)" << task.total_instances
            << R"(,"success":)" << (result.failed() ? "false" : "true");

        if (result.outcome) {
            const auto& execution = result.outcome.value();
            oss << R"(,"stdout":)" << json_string_array(execution.stdout_chunks)
                << R"(,"stderr":)" << json_string_array(execution.stderr_chunks)
                << R"(,"results":)" << rich_results_json(execution.results)
                << R"(,"error":)"
                << (execution.error ? execution_error_json(*execution.error) : "null")
                << R"(,"error_message":null)";
        } else {
            oss << R"(,"stdout":[],"stderr":[],"results":[],"error":null)"
                << R"(,"error_message":)" << json_quote(result.outcome.error().message);
        }

        oss << R"(,"timing":)" << (with_time ? timing_json(task_timing(result)) : "null") << "}";
    }

    oss << R"(],"summary":{"total":)" << summary.total
        << R"(,"success":)" << summary.succeeded
        << R"(,"failed":)" << summary.failed
        << R"(,"timing":)" << (with_time ? timing_json(Timing::of(summary.duration)) : "null")
        << "}}";
    return oss.str();
}

std::string execution_json(const ExecutionResult& result,
                           const std::optional<InstanceId>& instance_id,
                           const std::optional<Timing>& timing) {
    std::ostringstream oss;
    oss << R"({"stdout":)" << json_string_array(result.stdout_chunks)
        << R"(,"stderr":)" << json_string_array(result.stderr_chunks)
        << R"(,"results":)" << rich_results_json(result.results)
        << R"(,"error":)" << (result.error ? execution_error_json(*result.error) : "null")
        << R"(,"exit_code":)" << result.exit_code
        << R"(,"instance_id":)" << (instance_id ? json_quote(*instance_id) : "null")
        << R"(,"timing":)" << (timing ? timing_json(*timing) : "null")
        << "}";
    return oss.str();
}

std::string command_json(const CommandResult& result,
                         const std::optional<InstanceId>& instance_id,
                         const std::optional<Timing>& timing) {
    std::ostringstream oss;
    oss << R"({"stdout":)" << json_quote(result.stdout_text)
        << R"(,"stderr":)" << json_quote(result.stderr_text)
        << R"(,"results":[])"
        << R"(,"error":)" << (result.error ? json_quote(*result.error) : "null")
        << R"(,"exit_code":)" << result.exit_code
        << R"(,"instance_id":)" << (instance_id ? json_quote(*instance_id) : "null")
        << R"(,"timing":)" << (timing ? timing_json(*timing) : "null")
        << "}";
    return oss.str();
}

std::string instances_json(const std::vector<InstanceInfo>& instances) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < instances.size(); ++i) {
        const auto& info = instances[i];
        if (i > 0) oss << ",";
        oss << R"({"id":)" << json_quote(info.id)
            << R"(,"tool":)" << json_quote(info.tool)
            << R"(,"created_at":)" << json_quote(info.created_at)
            << R"(,"has_token":)" << (info.has_token ? "true" : "false")
            << "}";
    }
    oss << "]";
    return oss.str();
}

std::string instances_table(const std::vector<InstanceInfo>& instances) {
    if (instances.empty()) return "No instances found\n";

    size_t id_width = 2;
    size_t tool_width = 4;
    for (const auto& info : instances) {
        id_width = std::max(id_width, info.id.size());
        tool_width = std::max(tool_width, info.tool.size());
    }

    std::ostringstream oss;
    oss << std::left << std::setw(static_cast<int>(id_width + 2)) << "ID"
        << std::setw(static_cast<int>(tool_width + 2)) << "TOOL"
        << std::setw(22) << "CREATED" << "TOKEN\n";
    for (const auto& info : instances) {
        oss << std::setw(static_cast<int>(id_width + 2)) << info.id
            << std::setw(static_cast<int>(tool_width + 2)) << info.tool
            << std::setw(22) << (info.created_at.empty() ? "-" : info.created_at)
            << (info.has_token ? "yes" : "no") << "\n";
    }
    return oss.str();
}

}  // namespace sandbox_runner
