/**
 * @file process.hpp
 * @brief Child process execution with live, line-oriented output capture.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace sandbox_runner {

struct ProcessSpec {
    std::vector<std::string> argv;                  ///< argv[0] is looked up on PATH
    std::filesystem::path cwd;                      ///< empty = inherit
    std::map<std::string, std::string> env;         ///< added to the parent environment
    std::chrono::milliseconds timeout{0};           ///< 0 = no timeout
};

struct ProcessOutput {
    std::vector<std::string> stdout_chunks;
    std::vector<std::string> stderr_chunks;
    int exit_code{-1};
    int term_signal{0};                             ///< non-zero when killed by a signal
    bool timed_out{false};
    bool cancelled{false};                          ///< killed because stop was requested
    Duration duration{0};
};

using ChunkCallback = std::function<void(std::string_view)>;

/**
 * @brief Run a child with stdin from /dev/null and both output pipes captured.
 *
 * Output is split into lines (each keeps its '\n'); every line is appended to
 * the result and handed to the matching callback as soon as it is complete.
 * A trailing partial line is flushed when the pipe closes.
 *
 * The child leads its own process group. On timeout or stop request the whole
 * group is killed, and the call returns shortly after even if something that
 * left the group still holds an output pipe.
 */
Result<ProcessOutput> run_process(const ProcessSpec& spec,
                                  const ChunkCallback& on_stdout = {},
                                  const ChunkCallback& on_stderr = {},
                                  std::stop_token stop = {});

/**
 * @brief Run a child attached to the caller's terminal and wait for it.
 *
 * @return the child's exit status.
 */
Result<int> run_interactive(const std::vector<std::string>& argv);

/**
 * @brief Look up an executable on PATH.
 */
bool find_on_path(std::string_view program);

}  // namespace sandbox_runner
