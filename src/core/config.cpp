/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"
#include "core/logger.hpp"

#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

#include <toml++/toml.hpp>

namespace sandbox_runner {

std::filesystem::path default_state_dir() {
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path{home} / ".sandbox_runner";
    }
    if (const passwd* pw = getpwuid(getuid()); pw && pw->pw_dir) {
        return std::filesystem::path{pw->pw_dir} / ".sandbox_runner";
    }
    return std::filesystem::temp_directory_path() / ".sandbox_runner";
}

std::filesystem::path default_config_path() {
    return default_state_dir() / "config.toml";
}

Result<OutputFormat> parse_output_format(std::string_view name) {
    if (name == "text") return OutputFormat::Text;
    if (name == "json") return OutputFormat::Json;
    return Error{ErrorKind::Config, "unknown output format: " + std::string{name}
                                        + " (expected text or json)"};
}

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorKind::Config, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [sandbox]
        if (auto sandbox = tbl["sandbox"]; sandbox.is_table()) {
            config.sandbox.backend = sandbox["backend"].value_or(std::string{"local"});
            config.sandbox.tool = sandbox["tool"].value_or(std::string{kDefaultTool});
            config.sandbox.language = sandbox["language"].value_or(std::string{kDefaultLanguage});
            config.sandbox.timeout_seconds = static_cast<uint32_t>(
                sandbox["timeout_seconds"].value_or(int64_t{300}));
            config.sandbox.root_dir = sandbox["root_dir"].value_or(std::string{});
        }

        // [run]
        if (auto run = tbl["run"]; run.is_table()) {
            auto max_parallel = run["max_parallel"].value_or(int64_t{0});
            if (max_parallel < 0) {
                return Error{ErrorKind::Config, "run.max_parallel must not be negative"};
            }
            config.run.max_parallel = static_cast<uint32_t>(max_parallel);
            config.run.stream = run["stream"].value_or(false);
            config.run.time = run["time"].value_or(false);
        }

        // [output]
        if (auto output = tbl["output"]; output.is_table()) {
            auto format = parse_output_format(output["format"].value_or(std::string{"text"}));
            if (!format) return format.error();
            config.output.format = *format;
        }

        // [log]
        if (auto log = tbl["log"]; log.is_table()) {
            config.log.dir = log["dir"].value_or(std::string{});
            config.log.level = log["level"].value_or(std::string{"warn"});
            config.log.max_file_size_mb = static_cast<uint32_t>(
                log["max_file_size_mb"].value_or(int64_t{10}));
            config.log.rotate_count = static_cast<uint32_t>(
                log["rotate_count"].value_or(int64_t{3}));
            if (auto level = parse_log_level(config.log.level); !level) {
                return level.error();
            }
        }

        // [cache]
        if (auto cache = tbl["cache"]; cache.is_table()) {
            config.cache.token_file = cache["token_file"].value_or(std::string{});
        }

        if (config.sandbox.backend != "local" && config.sandbox.backend != "mock") {
            return Error{ErrorKind::Config, "unknown sandbox backend: " + config.sandbox.backend};
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorKind::Config,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<Config> resolve_config(const std::optional<std::filesystem::path>& explicit_path) {
    if (explicit_path) {
        return load_config(*explicit_path);
    }
    auto path = default_config_path();
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return default_config();
    }
    return load_config(path);
}

Config default_config() {
    return Config{};
}

void apply_path_defaults(Config& config) {
    if (config.sandbox.root_dir.empty()) {
        config.sandbox.root_dir = default_state_dir() / "instances";
    }
    if (config.cache.token_file.empty()) {
        config.cache.token_file = default_state_dir() / "tokens.toml";
    }
}

}  // namespace sandbox_runner
