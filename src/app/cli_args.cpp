/**
 * @file cli_args.cpp
 * @brief Two-phase parsing: read raw strings, then validate and convert.
 */

#include "app/cli_args.hpp"
#include "core/logger.hpp"

#include <charconv>
#include <system_error>

namespace sandbox_runner::cli {

namespace {

/**
 * @brief Walks the argument list, splitting "--flag=value" on demand.
 */
class ArgCursor {
public:
    explicit ArgCursor(std::vector<std::string> args) : args_(std::move(args)) {}

    [[nodiscard]] bool done() const noexcept { return pos_ >= args_.size(); }
    [[nodiscard]] const std::string& peek() const { return args_[pos_]; }

    /// Consume the next token as a flag name, remembering any inline value.
    std::string take_flag() {
        std::string token = args_[pos_++];
        inline_value_.reset();
        if (token.rfind("--", 0) == 0) {
            if (auto eq = token.find('='); eq != std::string::npos) {
                inline_value_ = token.substr(eq + 1);
                token.resize(eq);
            }
        }
        return token;
    }

    std::string take() { return args_[pos_++]; }

    Result<std::string> value_for(const std::string& flag) {
        if (inline_value_) {
            auto value = std::move(*inline_value_);
            inline_value_.reset();
            return value;
        }
        if (done()) {
            return Error{ErrorKind::Usage, "missing value for " + flag};
        }
        return args_[pos_++];
    }

    [[nodiscard]] bool has_inline_value() const noexcept { return inline_value_.has_value(); }

private:
    std::vector<std::string> args_;
    size_t pos_{0};
    std::optional<std::string> inline_value_;
};

template <typename T>
Result<T> parse_number(const std::string& flag, const std::string& text) {
    T value{};
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end) {
        return Error{ErrorKind::Usage, "invalid number for " + flag + ": " + text};
    }
    return value;
}

enum class FlagMatch { NotGlobal, Consumed };

/// Global flags may appear before or after the command.
Result<FlagMatch> parse_global_flag(const std::string& flag, ArgCursor& cursor, GlobalFlags& global) {
    if (flag == "--config") {
        auto value = cursor.value_for(flag);
        if (!value) return value.error();
        global.config_path = std::filesystem::path{*value};
    } else if (flag == "--backend") {
        auto value = cursor.value_for(flag);
        if (!value) return value.error();
        global.backend = *value;
    } else if (flag == "-o" || flag == "--output") {
        auto value = cursor.value_for(flag);
        if (!value) return value.error();
        auto format = parse_output_format(*value);
        if (!format) return Error{ErrorKind::Usage, format.error().message};
        global.format = *format;
    } else if (flag == "--log-level") {
        auto value = cursor.value_for(flag);
        if (!value) return value.error();
        if (auto level = parse_log_level(*value); !level) {
            return Error{ErrorKind::Usage, level.error().message};
        }
        global.log_level = *value;
    } else if (flag == "--verbose" || flag == "-v") {
        global.verbose = true;
    } else {
        return FlagMatch::NotGlobal;
    }
    return FlagMatch::Consumed;
}

Error unknown_flag(const std::string& flag) {
    return Error{ErrorKind::Usage, "unknown flag: " + flag};
}

Result<void> parse_run(ArgCursor& cursor, CliArgs& args) {
    auto& run = args.run;
    while (!cursor.done()) {
        if (cursor.peek().empty() || cursor.peek().front() != '-') {
            return Error{ErrorKind::Usage, "unexpected argument: " + cursor.peek()};
        }
        const std::string flag = cursor.take_flag();

        auto global = parse_global_flag(flag, cursor, args.global);
        if (!global) return global.error();
        if (*global == FlagMatch::Consumed) continue;

        if (flag == "-c" || flag == "--code") {
            auto value = cursor.value_for(flag);
            if (!value) return value.error();
            run.code = *value;
        } else if (flag == "-f" || flag == "--file") {
            auto value = cursor.value_for(flag);
            if (!value) return value.error();
            run.files.emplace_back(*value);
        } else if (flag == "-i" || flag == "--instance") {
            auto value = cursor.value_for(flag);
            if (!value) return value.error();
            run.instance = *value;
        } else if (flag == "-t" || flag == "--tool" || flag == "--tool-name") {
            auto value = cursor.value_for(flag);
            if (!value) return value.error();
            run.tool = *value;
        } else if (flag == "-l" || flag == "--language") {
            auto value = cursor.value_for(flag);
            if (!value) return value.error();
            run.language = *value;
        } else if (flag == "--keep-alive") {
            run.keep_alive = true;
        } else if (flag == "-s" || flag == "--stream") {
            run.stream = true;
        } else if (flag == "--time") {
            run.time = true;
        } else if (flag == "-n" || flag == "--repeat") {
            auto value = cursor.value_for(flag);
            if (!value) return value.error();
            auto repeat = parse_number<int64_t>(flag, *value);
            if (!repeat) return repeat.error();
            run.repeat = *repeat;
        } else if (flag == "-p" || flag == "--parallel") {
            run.parallel = true;
        } else if (flag == "--max-parallel") {
            auto value = cursor.value_for(flag);
            if (!value) return value.error();
            auto limit = parse_number<int>(flag, *value);
            if (!limit) return limit.error();
            run.max_parallel = *limit;
        } else {
            return unknown_flag(flag);
        }
    }
    return {};
}

Result<void> parse_exec(ArgCursor& cursor, CliArgs& args) {
    auto& exec = args.exec;
    // Flags are read until the first positional word; the rest is the command.
    while (!cursor.done()) {
        const std::string& next = cursor.peek();
        if (next == "--") {
            cursor.take();
            break;
        }
        if (next.empty() || next.front() != '-') break;

        const std::string flag = cursor.take_flag();
        auto global = parse_global_flag(flag, cursor, args.global);
        if (!global) return global.error();
        if (*global == FlagMatch::Consumed) continue;

        if (flag == "-i" || flag == "--instance") {
            auto value = cursor.value_for(flag);
            if (!value) return value.error();
            exec.instance = *value;
        } else if (flag == "-t" || flag == "--tool" || flag == "--tool-name") {
            auto value = cursor.value_for(flag);
            if (!value) return value.error();
            exec.tool = *value;
        } else if (flag == "--keep-alive") {
            exec.keep_alive = true;
        } else if (flag == "--time") {
            exec.time = true;
        } else if (flag == "-s" || flag == "--stream") {
            exec.stream = true;
        } else if (flag == "--cwd") {
            auto value = cursor.value_for(flag);
            if (!value) return value.error();
            exec.cwd = *value;
        } else if (flag == "--env") {
            auto value = cursor.value_for(flag);
            if (!value) return value.error();
            exec.env.push_back(*value);
        } else {
            return unknown_flag(flag);
        }
    }
    while (!cursor.done()) {
        exec.command.push_back(cursor.take());
    }
    if (exec.command.empty()) {
        return Error{ErrorKind::Usage, "exec requires a command"};
    }
    return {};
}

Result<void> parse_instance(ArgCursor& cursor, CliArgs& args) {
    if (cursor.done()) {
        return Error{ErrorKind::Usage, "instance requires a subcommand: create, list or delete"};
    }
    const std::string sub = cursor.take();
    if (sub == "create") {
        args.command = Command::InstanceCreate;
    } else if (sub == "list" || sub == "ls") {
        args.command = Command::InstanceList;
    } else if (sub == "delete" || sub == "rm") {
        args.command = Command::InstanceDelete;
    } else {
        return Error{ErrorKind::Usage, "unknown instance subcommand: " + sub};
    }

    auto& instance = args.instance;
    while (!cursor.done()) {
        const std::string& next = cursor.peek();
        if (!next.empty() && next.front() != '-') {
            if (args.command != Command::InstanceDelete) {
                return Error{ErrorKind::Usage, "unexpected argument: " + next};
            }
            instance.ids.push_back(cursor.take());
            continue;
        }

        const std::string flag = cursor.take_flag();
        auto global = parse_global_flag(flag, cursor, args.global);
        if (!global) return global.error();
        if (*global == FlagMatch::Consumed) continue;

        if (args.command == Command::InstanceCreate && (flag == "-t" || flag == "--tool" || flag == "--tool-name")) {
            auto value = cursor.value_for(flag);
            if (!value) return value.error();
            instance.tool = *value;
        } else if (args.command == Command::InstanceCreate && flag == "--timeout") {
            auto value = cursor.value_for(flag);
            if (!value) return value.error();
            auto seconds = parse_number<uint32_t>(flag, *value);
            if (!seconds) return seconds.error();
            instance.timeout_seconds = *seconds;
        } else {
            return unknown_flag(flag);
        }
    }

    if (args.command == Command::InstanceDelete && instance.ids.empty()) {
        return Error{ErrorKind::Usage, "instance delete requires at least one instance id"};
    }
    return {};
}

}  // namespace

Result<CliArgs> parse_args(int argc, const char* const argv[]) {
    std::vector<std::string> tokens;
    for (int i = 1; i < argc; ++i) {
        tokens.emplace_back(argv[i]);
    }
    ArgCursor cursor{std::move(tokens)};
    CliArgs args;

    // Global flags before the command word.
    while (!cursor.done() && !cursor.peek().empty() && cursor.peek().front() == '-') {
        const std::string flag = cursor.take_flag();
        if (flag == "-h" || flag == "--help") {
            args.command = Command::Help;
            return args;
        }
        if (flag == "--version") {
            args.command = Command::Version;
            return args;
        }
        auto global = parse_global_flag(flag, cursor, args.global);
        if (!global) return global.error();
        if (*global == FlagMatch::NotGlobal) return unknown_flag(flag);
    }

    if (cursor.done()) {
        return Error{ErrorKind::Usage, "no command provided"};
    }

    const std::string command = cursor.take();
    Result<void> parsed;
    if (command == "run" || command == "r") {
        args.command = Command::Run;
        parsed = parse_run(cursor, args);
    } else if (command == "exec" || command == "x") {
        args.command = Command::Exec;
        parsed = parse_exec(cursor, args);
    } else if (command == "instance" || command == "i") {
        parsed = parse_instance(cursor, args);
    } else if (command == "help") {
        args.command = Command::Help;
    } else if (command == "version") {
        args.command = Command::Version;
    } else {
        return Error{ErrorKind::Usage, "unknown command: " + command};
    }

    if (!parsed) return parsed.error();
    return args;
}

std::string usage_text() {
    return R"(Usage: sandbox_runner [global flags] <command> [flags]

Global flags:
  --config PATH          Configuration file (default: ~/.sandbox_runner/config.toml)
  --backend NAME         Sandbox backend: local or mock
  -o, --output FORMAT    Output format: text or json
  --log-level LEVEL      debug, info, warn or error
  -v, --verbose          Log to stderr at debug level

Commands:
  run        Execute code in a sandbox
    -c, --code CODE        Code to execute
    -f, --file PATH        File to execute (repeatable)
    -i, --instance ID      Use an existing instance
    -t, --tool NAME        Tool for temporary instances
    -l, --language LANG    python, javascript, typescript, bash, r or java
    --keep-alive           Keep created instances alive
    -s, --stream           Stream output as it is produced
    --time                 Print elapsed time
    -n, --repeat N         Run each source N times (1 to 10000)
    -p, --parallel         Run tasks in parallel, one sandbox each
    --max-parallel N       Limit concurrent tasks (0 = no limit)

  exec       Execute a shell command in a sandbox
    -i, --instance ID      Use an existing instance
    -t, --tool NAME        Tool for a temporary instance
    --keep-alive           Keep the temporary instance alive
    -s, --stream           Stream output as it is produced
    --time                 Print elapsed time
    --cwd DIR              Working directory
    --env KEY=VALUE        Environment variable (repeatable)

  instance create [-t TOOL] [--timeout SECONDS]
  instance list
  instance delete ID [ID...]
)";
}

Result<void> apply_global_overrides(const GlobalFlags& flags, Config& config) {
    if (flags.backend) {
        if (*flags.backend != "local" && *flags.backend != "mock") {
            return Error{ErrorKind::Usage, "unknown backend: " + *flags.backend};
        }
        config.sandbox.backend = *flags.backend;
    }
    if (flags.format) {
        config.output.format = *flags.format;
    }
    if (flags.log_level) {
        config.log.level = *flags.log_level;
    }
    return {};
}

RunRequest make_run_request(const CliArgs& args, const Config& config) {
    const auto& run = args.run;
    RunRequest request;

    request.input.code = run.code;
    request.input.files = run.files;
    request.input.repeat = run.repeat;
    request.input.language = run.language.value_or(config.sandbox.language);

    auto& options = request.options;
    options.instance_id = run.instance;
    // A configured default tool must not collide with --instance.
    options.tool = run.tool.value_or(run.instance ? std::string{kDefaultTool} : config.sandbox.tool);
    options.language = request.input.language;
    options.keep_alive = run.keep_alive;
    options.stream = run.stream || config.run.stream;
    options.time = run.time || config.run.time;
    options.parallel = run.parallel;
    options.max_parallel = run.max_parallel.value_or(static_cast<int>(config.run.max_parallel));
    options.format = config.output.format;
    options.timeout = std::chrono::seconds{config.sandbox.timeout_seconds};
    return request;
}

ExecRequest make_exec_request(const CliArgs& args, const Config& config) {
    const auto& exec = args.exec;
    ExecRequest request;
    request.command = exec.command;
    request.instance_id = exec.instance;
    request.tool = exec.tool.value_or(exec.instance ? std::string{kDefaultTool} : config.sandbox.tool);
    request.keep_alive = exec.keep_alive;
    request.stream = exec.stream || config.run.stream;
    request.time = exec.time || config.run.time;
    request.cwd = exec.cwd;
    request.env = exec.env;
    request.timeout = std::chrono::seconds{config.sandbox.timeout_seconds};
    return request;
}

}  // namespace sandbox_runner::cli
