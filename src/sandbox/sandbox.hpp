/**
 * @file sandbox.hpp
 * @brief Sandbox provider and sandbox handle interfaces.
 *
 * Both runners talk to sandboxes only through these interfaces. A provider
 * creates, connects to and destroys sandboxes; a sandbox runs code or shell
 * commands. Providers are selected at startup, so virtual dispatch is fine
 * here: every call behind it is blocking I/O.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace sandbox_runner {

/**
 * @brief Live output callbacks. Invoked on the thread that called run_*.
 *
 * Each call carries one chunk, normally a line with its trailing newline.
 */
struct OutputCallbacks {
    std::function<void(std::string_view)> on_stdout;
    std::function<void(std::string_view)> on_stderr;
};

struct CreateOptions {
    std::chrono::seconds timeout{300};
};

struct RunCodeOptions {
    std::string language{kDefaultLanguage};
};

struct CommandOptions {
    std::optional<std::string> cwd;
    std::map<std::string, std::string> env;
};

/**
 * @brief Metadata about a known instance.
 */
struct InstanceInfo {
    InstanceId id;
    std::string tool;
    std::string created_at;              ///< ISO 8601, empty when unknown
    bool has_token{false};
};

/**
 * @brief A running sandbox. Owned through shared_ptr by whoever created it.
 */
class ISandbox {
public:
    virtual ~ISandbox() = default;

    [[nodiscard]] virtual const InstanceId& id() const noexcept = 0;

    /// Run code in the sandbox's interpreter for options.language.
    virtual Result<ExecutionResult> run_code(const std::string& code,
                                             const RunCodeOptions& options,
                                             const OutputCallbacks* callbacks,
                                             std::stop_token stop) = 0;

    /// Run a shell command.
    virtual Result<CommandResult> run_command(const std::string& command,
                                              const CommandOptions& options,
                                              const OutputCallbacks* callbacks,
                                              std::stop_token stop) = 0;
};

using SandboxPtr = std::shared_ptr<ISandbox>;

/**
 * @brief Creates, connects to and destroys sandboxes.
 *
 * create() must be safe to call concurrently from several threads.
 */
class ISandboxProvider {
public:
    virtual ~ISandboxProvider() = default;

    virtual Result<SandboxPtr> create(const std::string& tool, const CreateOptions& options) = 0;
    virtual Result<SandboxPtr> connect(const InstanceId& instance_id) = 0;
    virtual Result<void> destroy(const InstanceId& instance_id) = 0;
    virtual Result<std::vector<InstanceInfo>> list() = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

}  // namespace sandbox_runner
