/**
 * @file config.hpp
 * @brief CLI configuration with TOML deserialization.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace sandbox_runner {

struct SandboxConfig {
    std::string backend = "local";                  ///< "local" or "mock"
    std::string tool{kDefaultTool};
    std::string language{kDefaultLanguage};
    uint32_t timeout_seconds = 300;
    std::filesystem::path root_dir;                 ///< empty = <state dir>/instances
};

struct RunConfig {
    uint32_t max_parallel = 0;                      ///< 0 = one slot per task
    bool stream = false;
    bool time = false;
};

struct OutputConfig {
    OutputFormat format = OutputFormat::Text;
};

struct LogConfig {
    std::filesystem::path dir;                      ///< empty = no log file
    std::string level = "warn";
    uint32_t max_file_size_mb = 10;
    uint32_t rotate_count = 3;
};

struct CacheConfig {
    std::filesystem::path token_file;               ///< empty = <state dir>/tokens.toml
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    SandboxConfig sandbox;
    RunConfig run;
    OutputConfig output;
    LogConfig log;
    CacheConfig cache;
};

/**
 * @brief Per-user state directory ($HOME/.sandbox_runner).
 */
std::filesystem::path default_state_dir();

/**
 * @brief Default configuration file location.
 */
std::filesystem::path default_config_path();

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Load an explicit file, or the default file when it exists.
 *
 * A missing explicit file is an error; a missing default file yields defaults.
 */
Result<Config> resolve_config(const std::optional<std::filesystem::path>& explicit_path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Fill empty paths (instance root, token file) from the state directory.
 */
void apply_path_defaults(Config& config);

Result<OutputFormat> parse_output_format(std::string_view name);

}  // namespace sandbox_runner
