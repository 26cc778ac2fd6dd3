/**
 * @file test_cli_args.cpp
 * @brief Unit tests for argument parsing and flag folding.
 */

#include "app/cli_args.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace sandbox_runner;
using namespace sandbox_runner::cli;

namespace {

Result<CliArgs> parse_tokens(const std::vector<std::string>& tokens) {
    std::vector<const char*> argv;
    argv.reserve(tokens.size() + 1);
    argv.push_back("sandbox_runner");
    for (const auto& token : tokens) {
        argv.push_back(token.c_str());
    }
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

}  // namespace

TEST(CliArgsTest, FailsWhenCommandMissing) {
    auto args = parse_tokens({});
    ASSERT_FALSE(args.has_value());
    EXPECT_EQ(args.error().kind, ErrorKind::Usage);
    EXPECT_EQ(args.error().message, "no command provided");
}

TEST(CliArgsTest, FailsWhenCommandUnknown) {
    auto args = parse_tokens({"status"});
    ASSERT_FALSE(args.has_value());
    EXPECT_EQ(args.error().message, "unknown command: status");
}

TEST(CliArgsTest, HelpAndVersion) {
    EXPECT_EQ(parse_tokens({"--help"})->command, Command::Help);
    EXPECT_EQ(parse_tokens({"help"})->command, Command::Help);
    EXPECT_EQ(parse_tokens({"--version"})->command, Command::Version);
}

TEST(CliArgsTest, RunFlags) {
    auto args = parse_tokens({"run", "-c", "print(1)", "-n", "4", "--parallel",
                              "--max-parallel=2", "--time", "-l", "javascript"});
    ASSERT_TRUE(args.has_value());
    EXPECT_EQ(args->command, Command::Run);
    EXPECT_EQ(args->run.code, "print(1)");
    EXPECT_EQ(args->run.repeat, 4);
    EXPECT_TRUE(args->run.parallel);
    EXPECT_EQ(args->run.max_parallel, 2);
    EXPECT_TRUE(args->run.time);
    EXPECT_EQ(args->run.language, "javascript");
}

TEST(CliArgsTest, RepeatableFilesAndAlias) {
    auto args = parse_tokens({"r", "-f", "a.py", "--file", "b.py"});
    ASSERT_TRUE(args.has_value());
    EXPECT_EQ(args->command, Command::Run);
    ASSERT_EQ(args->run.files.size(), 2u);
    EXPECT_EQ(args->run.files[1], std::filesystem::path{"b.py"});
}

TEST(CliArgsTest, FailsWhenNumberInvalid) {
    auto args = parse_tokens({"run", "-c", "x", "--repeat", "three"});
    ASSERT_FALSE(args.has_value());
    EXPECT_EQ(args.error().message, "invalid number for --repeat: three");
}

TEST(CliArgsTest, FailsWhenValueMissing) {
    auto args = parse_tokens({"run", "-c"});
    ASSERT_FALSE(args.has_value());
    EXPECT_EQ(args.error().message, "missing value for -c");
}

TEST(CliArgsTest, FailsOnUnknownFlag) {
    auto args = parse_tokens({"run", "--turbo"});
    ASSERT_FALSE(args.has_value());
    EXPECT_EQ(args.error().message, "unknown flag: --turbo");
}

TEST(CliArgsTest, GlobalFlagsAnywhere) {
    auto args = parse_tokens({"--backend", "mock", "run", "-c", "x", "-o", "json", "--verbose"});
    ASSERT_TRUE(args.has_value());
    EXPECT_EQ(args->global.backend, "mock");
    EXPECT_EQ(args->global.format, OutputFormat::Json);
    EXPECT_TRUE(args->global.verbose);

    EXPECT_FALSE(parse_tokens({"run", "-o", "yaml"}).has_value());
    EXPECT_FALSE(parse_tokens({"run", "--log-level", "loud"}).has_value());
}

TEST(CliArgsTest, ExecStopsAtFirstWord) {
    auto args = parse_tokens({"exec", "--env", "A=1", "--cwd", "/tmp", "ls", "-la", "--color"});
    ASSERT_TRUE(args.has_value());
    EXPECT_EQ(args->command, Command::Exec);
    EXPECT_EQ(args->exec.env, (std::vector<std::string>{"A=1"}));
    EXPECT_EQ(args->exec.cwd, "/tmp");
    EXPECT_EQ(args->exec.command, (std::vector<std::string>{"ls", "-la", "--color"}));
}

TEST(CliArgsTest, ExecDoubleDash) {
    auto args = parse_tokens({"x", "--", "-weird", "arg"});
    ASSERT_TRUE(args.has_value());
    EXPECT_EQ(args->exec.command, (std::vector<std::string>{"-weird", "arg"}));

    auto empty = parse_tokens({"exec", "--stream"});
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().message, "exec requires a command");
}

TEST(CliArgsTest, InstanceSubcommands) {
    auto create = parse_tokens({"instance", "create", "-t", "custom", "--timeout", "60"});
    ASSERT_TRUE(create.has_value());
    EXPECT_EQ(create->command, Command::InstanceCreate);
    EXPECT_EQ(create->instance.tool, "custom");
    EXPECT_EQ(create->instance.timeout_seconds, 60u);

    EXPECT_EQ(parse_tokens({"i", "ls"})->command, Command::InstanceList);

    auto del = parse_tokens({"instance", "rm", "sbx-1", "sbx-2"});
    ASSERT_TRUE(del.has_value());
    EXPECT_EQ(del->instance.ids, (std::vector<std::string>{"sbx-1", "sbx-2"}));

    EXPECT_FALSE(parse_tokens({"instance", "delete"}).has_value());
    EXPECT_FALSE(parse_tokens({"instance", "list", "extra"}).has_value());
    EXPECT_FALSE(parse_tokens({"instance"}).has_value());
}

TEST(CliArgsTest, GlobalOverridesConfig) {
    Config config = default_config();
    GlobalFlags flags;
    flags.backend = "mock";
    flags.format = OutputFormat::Json;
    flags.log_level = "debug";

    ASSERT_TRUE(apply_global_overrides(flags, config).has_value());
    EXPECT_EQ(config.sandbox.backend, "mock");
    EXPECT_EQ(config.output.format, OutputFormat::Json);
    EXPECT_EQ(config.log.level, "debug");

    flags.backend = "cloud";
    EXPECT_FALSE(apply_global_overrides(flags, config).has_value());
}

TEST(CliArgsTest, RunRequestFoldsConfig) {
    Config config = default_config();
    config.sandbox.tool = "team-tool";
    config.run.stream = true;
    config.run.max_parallel = 3;

    auto args = parse_tokens({"run", "-c", "x"});
    ASSERT_TRUE(args.has_value());
    auto request = make_run_request(*args, config);
    EXPECT_EQ(request.options.tool, "team-tool");
    EXPECT_TRUE(request.options.stream);
    EXPECT_EQ(request.options.max_parallel, 3);

    auto on_instance = parse_tokens({"run", "-c", "x", "-i", "sbx-1"});
    ASSERT_TRUE(on_instance.has_value());
    auto connect = make_run_request(*on_instance, config);
    EXPECT_EQ(connect.options.tool, kDefaultTool);
    EXPECT_TRUE(validate_run(connect).has_value());
}

TEST(CliArgsTest, ExecRequestFoldsConfig) {
    Config config = default_config();
    config.sandbox.timeout_seconds = 45;

    auto args = parse_tokens({"exec", "-i", "sbx-1", "pwd"});
    ASSERT_TRUE(args.has_value());
    auto request = make_exec_request(*args, config);
    EXPECT_EQ(request.instance_id, "sbx-1");
    EXPECT_EQ(request.tool, kDefaultTool);
    EXPECT_EQ(request.timeout, std::chrono::seconds(45));
    EXPECT_EQ(request.command, (std::vector<std::string>{"pwd"}));
}
