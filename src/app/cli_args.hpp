/**
 * @file cli_args.hpp
 * @brief Command-line parsing and folding of flags over configuration.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "runner/dispatcher.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sandbox_runner::cli {

enum class Command {
    Run,
    Exec,
    InstanceCreate,
    InstanceList,
    InstanceDelete,
    Help,
    Version
};

struct GlobalFlags {
    std::optional<std::filesystem::path> config_path;
    std::optional<std::string> backend;
    std::optional<OutputFormat> format;
    std::optional<std::string> log_level;
    bool verbose = false;
};

struct RunFlags {
    std::optional<std::string> code;
    std::vector<std::filesystem::path> files;
    std::optional<std::string> instance;
    std::optional<std::string> tool;
    std::optional<std::string> language;
    bool keep_alive = false;
    bool stream = false;
    bool time = false;
    int64_t repeat = 1;
    bool parallel = false;
    std::optional<int> max_parallel;
};

struct ExecFlags {
    std::optional<std::string> instance;
    std::optional<std::string> tool;
    bool keep_alive = false;
    bool stream = false;
    bool time = false;
    std::optional<std::string> cwd;
    std::vector<std::string> env;
    std::vector<std::string> command;
};

struct InstanceFlags {
    std::optional<std::string> tool;
    std::optional<uint32_t> timeout_seconds;
    std::vector<std::string> ids;
};

struct CliArgs {
    Command command = Command::Help;
    GlobalFlags global;
    RunFlags run;
    ExecFlags exec;
    InstanceFlags instance;
};

/**
 * @brief Parse argv. Unknown flags, missing values and bad numbers are usage errors.
 */
Result<CliArgs> parse_args(int argc, const char* const argv[]);

std::string usage_text();

/**
 * @brief Apply the global flags that override configuration.
 */
Result<void> apply_global_overrides(const GlobalFlags& flags, Config& config);

RunRequest make_run_request(const CliArgs& args, const Config& config);
ExecRequest make_exec_request(const CliArgs& args, const Config& config);

}  // namespace sandbox_runner::cli
