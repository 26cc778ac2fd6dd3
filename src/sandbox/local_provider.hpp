/**
 * @file local_provider.hpp
 * @brief Sandbox provider backed by local working directories.
 *
 * Each sandbox is a directory <root>/<id> holding an instance.toml metadata
 * file. Code and commands run as child processes with the directory as their
 * working directory. Access tokens live in the TokenCache exactly as they
 * would for a remote instance, so `--instance` behaves the same way.
 */

#pragma once

#include "core/logger.hpp"
#include "sandbox/sandbox.hpp"
#include "sandbox/token_cache.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <random>
#include <string_view>

namespace sandbox_runner {

/**
 * @brief Interpreter command line and scratch-file extension for a language.
 */
struct LanguageRuntime {
    std::vector<std::string> command;     ///< script path is appended
    std::string extension;
};

Result<LanguageRuntime> runtime_for_language(std::string_view language);

/**
 * @brief Extract "Name: value" from the last line of a Python traceback.
 */
std::optional<ExecutionError> parse_python_traceback(const std::vector<std::string>& stderr_chunks);

/**
 * @brief True for ids shaped like the ones create() hands out: "sbx-" and 12 lowercase hex digits.
 */
bool is_instance_id(std::string_view id);

class LocalSandbox : public ISandbox {
public:
    LocalSandbox(InstanceId id, std::filesystem::path dir, std::chrono::seconds timeout);

    [[nodiscard]] const InstanceId& id() const noexcept override { return id_; }
    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return dir_; }

    Result<ExecutionResult> run_code(const std::string& code,
                                     const RunCodeOptions& options,
                                     const OutputCallbacks* callbacks,
                                     std::stop_token stop) override;

    Result<CommandResult> run_command(const std::string& command,
                                      const CommandOptions& options,
                                      const OutputCallbacks* callbacks,
                                      std::stop_token stop) override;

private:
    InstanceId id_;
    std::filesystem::path dir_;
    std::chrono::seconds timeout_;
    std::atomic<uint32_t> cell_counter_{0};
};

class LocalProvider : public ISandboxProvider {
public:
    static constexpr const char* kMetadataFile = "instance.toml";

    LocalProvider(std::filesystem::path root, TokenCache& tokens, Logger& logger);

    Result<SandboxPtr> create(const std::string& tool, const CreateOptions& options) override;
    Result<SandboxPtr> connect(const InstanceId& instance_id) override;
    Result<void> destroy(const InstanceId& instance_id) override;
    Result<std::vector<InstanceInfo>> list() override;

    [[nodiscard]] std::string_view name() const noexcept override { return "local"; }

private:
    std::string random_hex(size_t length);
    Result<std::filesystem::path> instance_dir(const InstanceId& instance_id) const;

    std::filesystem::path root_;
    TokenCache& tokens_;
    Logger& logger_;
    std::mutex rng_mutex_;
    std::mt19937_64 rng_;
};

}  // namespace sandbox_runner
