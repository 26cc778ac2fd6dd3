/**
 * @file local_provider.cpp
 * @brief LocalProvider and LocalSandbox implementation.
 */

#include "sandbox/local_provider.hpp"
#include "sandbox/process.hpp"

#include <algorithm>
#include <cstddef>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <regex>
#include <sstream>
#include <system_error>

#include <toml++/toml.hpp>

namespace sandbox_runner {

namespace {

constexpr const char* kScratchDir = ".cells";
constexpr std::string_view kIdPrefix = "sbx-";
constexpr size_t kIdHexLength = 12;

std::string utc_now_iso8601() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%FT%TZ");
    return oss.str();
}

std::string join(const std::vector<std::string>& chunks) {
    std::string out;
    for (const auto& c : chunks) out += c;
    return out;
}

ChunkCallback stdout_callback(const OutputCallbacks* callbacks) {
    if (!callbacks || !callbacks->on_stdout) return {};
    return callbacks->on_stdout;
}

ChunkCallback stderr_callback(const OutputCallbacks* callbacks) {
    if (!callbacks || !callbacks->on_stderr) return {};
    return callbacks->on_stderr;
}

}  // namespace

bool is_instance_id(std::string_view id) {
    if (id.size() != kIdPrefix.size() + kIdHexLength || id.substr(0, kIdPrefix.size()) != kIdPrefix) {
        return false;
    }
    return std::all_of(id.begin() + static_cast<std::ptrdiff_t>(kIdPrefix.size()), id.end(),
                       [](char c) { return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'); });
}

// ─────────────────────────────────────────────
// Language runtimes
// ─────────────────────────────────────────────

Result<LanguageRuntime> runtime_for_language(std::string_view language) {
    if (language == "python")     return LanguageRuntime{{"python3", "-u"}, ".py"};
    if (language == "javascript") return LanguageRuntime{{"node"}, ".js"};
    if (language == "typescript") return LanguageRuntime{{"npx", "--yes", "tsx"}, ".ts"};
    if (language == "bash")       return LanguageRuntime{{"bash"}, ".sh"};
    if (language == "r")          return LanguageRuntime{{"Rscript"}, ".r"};
    if (language == "java")       return LanguageRuntime{{"java"}, ".java"};
    return Error{ErrorKind::Execution, "unsupported language: " + std::string{language}};
}

std::optional<ExecutionError> parse_python_traceback(const std::vector<std::string>& stderr_chunks) {
    std::string text = join(stderr_chunks);
    if (text.find("Traceback (most recent call last):") == std::string::npos) {
        return std::nullopt;
    }

    std::istringstream lines(text);
    std::string line;
    std::string last;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.find_first_not_of(" \t\r") != std::string::npos) {
            last = line;
        }
    }

    static const std::regex kExceptionLine(R"(^([A-Za-z_][A-Za-z0-9_.]*)(?::\s?(.*))?$)");
    std::smatch match;
    if (!std::regex_match(last, match, kExceptionLine)) {
        return std::nullopt;
    }
    return ExecutionError{match[1].str(), match[2].matched ? match[2].str() : std::string{}, text};
}

// ─────────────────────────────────────────────
// LocalSandbox
// ─────────────────────────────────────────────

LocalSandbox::LocalSandbox(InstanceId id, std::filesystem::path dir, std::chrono::seconds timeout)
    : id_(std::move(id)), dir_(std::move(dir)), timeout_(timeout) {}

Result<ExecutionResult> LocalSandbox::run_code(const std::string& code,
                                               const RunCodeOptions& options,
                                               const OutputCallbacks* callbacks,
                                               std::stop_token stop) {
    if (stop.stop_requested()) {
        return Error{ErrorKind::Cancelled, "cancelled before start"};
    }

    auto runtime = runtime_for_language(options.language);
    if (!runtime) return runtime.error();

    std::error_code ec;
    auto scratch = dir_ / kScratchDir;
    std::filesystem::create_directories(scratch, ec);
    if (ec) {
        return Error{ErrorKind::Execution, "failed to prepare sandbox " + id_ + ": " + ec.message()};
    }

    auto script = scratch / ("cell-" + std::to_string(++cell_counter_) + runtime->extension);
    {
        std::ofstream out(script, std::ios::trunc);
        out << code;
        if (!out) {
            return Error{ErrorKind::Execution, "failed to write code into sandbox " + id_};
        }
    }

    ProcessSpec spec;
    spec.argv = runtime->command;
    spec.argv.push_back(script.string());
    spec.cwd = dir_;
    spec.timeout = timeout_;

    auto proc = run_process(spec, stdout_callback(callbacks), stderr_callback(callbacks), stop);
    std::filesystem::remove(script, ec);
    if (!proc) {
        return Error{ErrorKind::Execution, proc.error().message};
    }
    if (proc->cancelled) {
        return Error{ErrorKind::Cancelled, "execution cancelled"};
    }

    ExecutionResult result;
    result.stdout_chunks = std::move(proc->stdout_chunks);
    result.stderr_chunks = std::move(proc->stderr_chunks);
    result.exit_code = proc->exit_code;

    if (proc->timed_out) {
        result.error = ExecutionError{
            "TimeoutError",
            "execution exceeded " + std::to_string(timeout_.count()) + " seconds",
            ""};
    } else if (proc->exit_code != 0) {
        std::optional<ExecutionError> parsed;
        if (options.language == "python") {
            parsed = parse_python_traceback(result.stderr_chunks);
        }
        result.error = parsed ? *parsed
                              : ExecutionError{"ExitError",
                                               "exit status " + std::to_string(proc->exit_code),
                                               ""};
    }
    return result;
}

Result<CommandResult> LocalSandbox::run_command(const std::string& command,
                                                const CommandOptions& options,
                                                const OutputCallbacks* callbacks,
                                                std::stop_token stop) {
    if (stop.stop_requested()) {
        return Error{ErrorKind::Cancelled, "cancelled before start"};
    }

    ProcessSpec spec;
    spec.argv = {"/bin/sh", "-c", command};
    spec.cwd = dir_;
    if (options.cwd) {
        std::filesystem::path cwd{*options.cwd};
        spec.cwd = cwd.is_absolute() ? cwd : dir_ / cwd;
    }
    spec.env = options.env;
    spec.timeout = timeout_;

    auto proc = run_process(spec, stdout_callback(callbacks), stderr_callback(callbacks), stop);
    if (!proc) {
        return Error{ErrorKind::Execution, proc.error().message};
    }
    if (proc->cancelled) {
        return Error{ErrorKind::Cancelled, "command cancelled"};
    }

    CommandResult result;
    result.stdout_text = join(proc->stdout_chunks);
    result.stderr_text = join(proc->stderr_chunks);
    result.exit_code = proc->exit_code;
    if (proc->timed_out) {
        result.error = "command timed out after " + std::to_string(timeout_.count()) + " seconds";
    } else if (proc->term_signal != 0) {
        result.error = "terminated by signal " + std::to_string(proc->term_signal);
    }
    return result;
}

// ─────────────────────────────────────────────
// LocalProvider
// ─────────────────────────────────────────────

LocalProvider::LocalProvider(std::filesystem::path root, TokenCache& tokens, Logger& logger)
    : root_(std::move(root)), tokens_(tokens), logger_(logger), rng_(std::random_device{}()) {}

std::string LocalProvider::random_hex(size_t length) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::lock_guard lock(rng_mutex_);
    std::string out;
    out.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        out.push_back(kDigits[rng_() & 0xF]);
    }
    return out;
}

Result<SandboxPtr> LocalProvider::create(const std::string& tool, const CreateOptions& options) {
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        return Error{ErrorKind::Sandbox, "cannot create sandbox root " + root_.string()
                                             + ": " + ec.message()};
    }

    InstanceId id;
    std::filesystem::path dir;
    for (int attempt = 0; attempt < 8; ++attempt) {
        id = std::string{kIdPrefix} + random_hex(kIdHexLength);
        dir = root_ / id;
        if (std::filesystem::create_directory(dir, ec)) break;
        if (ec) {
            return Error{ErrorKind::Sandbox, "cannot create sandbox directory: " + ec.message()};
        }
        id.clear();
    }
    if (id.empty()) {
        return Error{ErrorKind::Sandbox, "cannot allocate a unique sandbox id"};
    }

    toml::table meta{
        {"id", id},
        {"tool", tool},
        {"created_at", utc_now_iso8601()},
        {"timeout_seconds", static_cast<int64_t>(options.timeout.count())},
    };
    {
        std::ofstream out(dir / kMetadataFile, std::ios::trunc);
        out << meta << '\n';
        if (!out) {
            std::filesystem::remove_all(dir, ec);
            return Error{ErrorKind::Sandbox, "cannot write metadata for " + id};
        }
    }

    if (auto stored = tokens_.set(id, random_hex(32)); !stored) {
        std::filesystem::remove_all(dir, ec);
        return stored.error().wrap("cannot store access token for " + id);
    }

    logger_.debug("Created local sandbox " + id + " (tool " + tool + ")");
    return SandboxPtr{std::make_shared<LocalSandbox>(id, dir, options.timeout)};
}

Result<std::filesystem::path> LocalProvider::instance_dir(const InstanceId& instance_id) const {
    // The id names exactly one directory under root_; anything else never touches the filesystem.
    if (!is_instance_id(instance_id)) {
        return Error{ErrorKind::Sandbox, "invalid instance id: " + instance_id};
    }
    auto dir = root_ / instance_id;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(dir / kMetadataFile, ec)) {
        return Error{ErrorKind::Sandbox, "instance " + instance_id + " not found"};
    }
    return dir;
}

Result<SandboxPtr> LocalProvider::connect(const InstanceId& instance_id) {
    if (!is_instance_id(instance_id)) {
        return Error{ErrorKind::Sandbox, "invalid instance id: " + instance_id};
    }
    if (!tokens_.get(instance_id)) {
        return Error{ErrorKind::Sandbox,
                     "access token not found in cache for instance " + instance_id
                         + "; the token is only available to the process that created it"};
    }

    auto found = instance_dir(instance_id);
    if (!found) return found.error();
    const auto& dir = *found;

    std::chrono::seconds timeout{300};
    try {
        auto meta = toml::parse_file((dir / kMetadataFile).string());
        timeout = std::chrono::seconds{meta["timeout_seconds"].value_or(int64_t{300})};
    } catch (const toml::parse_error& err) {
        logger_.warn("Unreadable metadata for " + instance_id + ": "
                     + std::string{err.description()});
    }

    logger_.debug("Connected to local sandbox " + instance_id);
    return SandboxPtr{std::make_shared<LocalSandbox>(instance_id, dir, timeout)};
}

Result<void> LocalProvider::destroy(const InstanceId& instance_id) {
    auto found = instance_dir(instance_id);
    if (!found) return found.error();

    std::error_code ec;
    std::filesystem::remove_all(*found, ec);
    if (ec) {
        return Error{ErrorKind::Sandbox, "failed to remove instance " + instance_id
                                             + ": " + ec.message()};
    }
    if (auto removed = tokens_.remove(instance_id); !removed) {
        logger_.warn("Instance " + instance_id + " removed but token cleanup failed: "
                     + removed.error().message);
    }

    logger_.debug("Destroyed local sandbox " + instance_id);
    return {};
}

Result<std::vector<InstanceInfo>> LocalProvider::list() {
    std::vector<InstanceInfo> instances;
    std::error_code ec;
    if (!std::filesystem::is_directory(root_, ec)) {
        return instances;
    }

    auto cached = tokens_.list();
    if (!cached) return cached.error();

    for (const auto& entry : std::filesystem::directory_iterator(root_, ec)) {
        std::error_code entry_ec;
        if (!entry.is_directory(entry_ec)) continue;
        InstanceInfo info;
        info.id = entry.path().filename().string();
        try {
            auto meta = toml::parse_file((entry.path() / kMetadataFile).string());
            info.tool = meta["tool"].value_or(std::string{});
            info.created_at = meta["created_at"].value_or(std::string{});
        } catch (const toml::parse_error&) {
            continue;  // not one of ours
        }
        info.has_token = std::find(cached->begin(), cached->end(), info.id) != cached->end();
        instances.push_back(std::move(info));
    }
    if (ec) {
        return Error{ErrorKind::Io, "cannot list " + root_.string() + ": " + ec.message()};
    }

    std::sort(instances.begin(), instances.end(),
              [](const InstanceInfo& a, const InstanceInfo& b) { return a.created_at < b.created_at; });
    return instances;
}

}  // namespace sandbox_runner
