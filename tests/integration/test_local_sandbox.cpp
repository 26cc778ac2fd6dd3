/**
 * @file test_local_sandbox.cpp
 * @brief Integration tests for the local directory-backed provider.
 */

#include "runner/parallel_runner.hpp"
#include "runner/result_aggregator.hpp"
#include "sandbox/local_provider.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <random>
#include <stop_token>
#include <thread>

using namespace sandbox_runner;

class LocalSandboxTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        root_ = std::filesystem::temp_directory_path()
              / ("sandbox_runner_local_" + std::to_string(rd()));
        std::filesystem::create_directories(root_);
        tokens_ = std::make_unique<TokenCache>(root_ / "tokens.toml");
        provider_ = std::make_unique<LocalProvider>(root_ / "instances", *tokens_, logger_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    SandboxPtr create(std::chrono::seconds timeout = std::chrono::seconds(30)) {
        auto sandbox = provider_->create(std::string{kDefaultTool}, CreateOptions{.timeout = timeout});
        EXPECT_TRUE(sandbox.has_value());
        return sandbox.has_value() ? *sandbox : nullptr;
    }

    static RunCodeOptions bash() { return RunCodeOptions{.language = "bash"}; }

    std::filesystem::path root_;
    Logger logger_{std::make_unique<NullSink>(), LogLevel::Debug};
    std::unique_ptr<TokenCache> tokens_;
    std::unique_ptr<LocalProvider> provider_;
};

TEST_F(LocalSandboxTest, RunsCodeInItsDirectory) {
    auto sandbox = create();
    ASSERT_NE(sandbox, nullptr);

    auto result = sandbox->run_code("echo hi; echo note >&2", bash(), nullptr, {});

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->stdout_chunks, (std::vector<std::string>{"hi\n"}));
    EXPECT_EQ(result->stderr_chunks, (std::vector<std::string>{"note\n"}));
    EXPECT_FALSE(result->error.has_value());
    EXPECT_TRUE(std::filesystem::exists(root_ / "instances" / sandbox->id() / LocalProvider::kMetadataFile));
}

TEST_F(LocalSandboxTest, StateSurvivesBetweenRuns) {
    auto sandbox = create();
    ASSERT_NE(sandbox, nullptr);

    ASSERT_TRUE(sandbox->run_code("echo saved > state.txt", bash(), nullptr, {}).has_value());
    auto result = sandbox->run_code("cat state.txt", bash(), nullptr, {});

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->stdout_chunks, (std::vector<std::string>{"saved\n"}));
}

TEST_F(LocalSandboxTest, NonZeroExitIsAnExecutionError) {
    auto sandbox = create();
    ASSERT_NE(sandbox, nullptr);

    auto result = sandbox->run_code("exit 4", bash(), nullptr, {});

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->exit_code, 4);
    ASSERT_TRUE(result->error.has_value());
    EXPECT_EQ(result->error->name, "ExitError");
    EXPECT_EQ(result->error->value, "exit status 4");
}

TEST_F(LocalSandboxTest, TimeoutIsReported) {
    auto sandbox = create(std::chrono::seconds(1));
    ASSERT_NE(sandbox, nullptr);

    auto result = sandbox->run_code("sleep 10", bash(), nullptr, {});

    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->error.has_value());
    EXPECT_EQ(result->error->name, "TimeoutError");
}

TEST_F(LocalSandboxTest, UnsupportedLanguage) {
    auto sandbox = create();
    ASSERT_NE(sandbox, nullptr);

    auto result = sandbox->run_code("x", RunCodeOptions{.language = "cobol"}, nullptr, {});

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().message, "unsupported language: cobol");
}

TEST_F(LocalSandboxTest, StopRequestedBeforeStart) {
    auto sandbox = create();
    ASSERT_NE(sandbox, nullptr);
    std::stop_source source;
    source.request_stop();

    auto result = sandbox->run_code("echo never", bash(), nullptr, source.get_token());

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Cancelled);
}

TEST_F(LocalSandboxTest, CommandWithCwdAndEnv) {
    auto sandbox = create();
    ASSERT_NE(sandbox, nullptr);
    ASSERT_TRUE(sandbox->run_code("mkdir -p work", bash(), nullptr, {}).has_value());

    CommandOptions options{.cwd = "work", .env = {{"NAME", "box"}}};
    auto result = sandbox->run_command("basename \"$PWD\"; echo \"$NAME\"", options, nullptr, {});

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->stdout_text, "work\nbox\n");
    EXPECT_EQ(result->exit_code, 0);
    EXPECT_FALSE(result->error.has_value());
}

TEST_F(LocalSandboxTest, StreamingCallbacks) {
    auto sandbox = create();
    ASSERT_NE(sandbox, nullptr);
    std::vector<std::string> lines;
    OutputCallbacks callbacks{
        .on_stdout = [&lines](std::string_view chunk) { lines.emplace_back(chunk); },
        .on_stderr = {},
    };

    auto result = sandbox->run_command("echo a; echo b", CommandOptions{}, &callbacks, {});

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(lines, (std::vector<std::string>{"a\n", "b\n"}));
}

TEST_F(LocalSandboxTest, ConnectNeedsCachedToken) {
    auto sandbox = create();
    ASSERT_NE(sandbox, nullptr);
    const auto id = sandbox->id();

    auto connected = provider_->connect(id);
    ASSERT_TRUE(connected.has_value());
    EXPECT_EQ((*connected)->id(), id);

    ASSERT_TRUE(tokens_->remove(id).has_value());
    auto refused = provider_->connect(id);
    ASSERT_FALSE(refused.has_value());
    EXPECT_NE(refused.error().message.find("access token not found"), std::string::npos);
}

TEST_F(LocalSandboxTest, DestroyRemovesDirectoryAndToken) {
    auto sandbox = create();
    ASSERT_NE(sandbox, nullptr);
    const auto id = sandbox->id();

    ASSERT_TRUE(provider_->destroy(id).has_value());

    EXPECT_FALSE(std::filesystem::exists(root_ / "instances" / id));
    EXPECT_FALSE(tokens_->get(id).has_value());
    EXPECT_FALSE(provider_->destroy(id).has_value());
}

TEST_F(LocalSandboxTest, DestroyRejectsPathOutsideRoot) {
    auto sandbox = create();
    ASSERT_NE(sandbox, nullptr);
    auto sibling = root_ / "keepme";
    std::filesystem::create_directories(sibling);

    const std::vector<std::string> ids = {"..", ".", "", root_.string(), sibling.string(),
                                          "../keepme", "sbx-../../keep", sandbox->id() + "/.."};
    for (const auto& id : ids) {
        auto destroyed = provider_->destroy(id);
        EXPECT_FALSE(destroyed.has_value()) << "id: " << id;
    }

    EXPECT_TRUE(std::filesystem::exists(sibling));
    EXPECT_TRUE(std::filesystem::exists(root_ / "tokens.toml"));
    EXPECT_TRUE(std::filesystem::exists(root_ / "instances" / sandbox->id()));
}

TEST_F(LocalSandboxTest, DestroyIgnoresDirectoriesWithoutMetadata) {
    auto stray = root_ / "instances" / "sbx-0123456789ab";
    std::filesystem::create_directories(stray);

    auto destroyed = provider_->destroy("sbx-0123456789ab");

    ASSERT_FALSE(destroyed.has_value());
    EXPECT_EQ(destroyed.error().message, "instance sbx-0123456789ab not found");
    EXPECT_TRUE(std::filesystem::exists(stray));
}

TEST_F(LocalSandboxTest, ConnectRejectsPathOutsideRoot) {
    ASSERT_TRUE(tokens_->set("..", "token").has_value());

    auto connected = provider_->connect("..");

    ASSERT_FALSE(connected.has_value());
    EXPECT_EQ(connected.error().message, "invalid instance id: ..");
}

TEST_F(LocalSandboxTest, StopRequestCancelsRunningCode) {
    auto sandbox = create();
    ASSERT_NE(sandbox, nullptr);
    std::stop_source source;
    std::jthread stopper([&source] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        source.request_stop();
    });

    auto result = sandbox->run_code("sleep 6; echo done", bash(), nullptr, source.get_token());

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Cancelled);
}

TEST_F(LocalSandboxTest, ListShowsCreatedInstances) {
    auto first = create();
    auto second = create();
    ASSERT_NE(first, nullptr);
    ASSERT_NE(second, nullptr);

    auto instances = provider_->list();

    ASSERT_TRUE(instances.has_value());
    ASSERT_EQ(instances->size(), 2u);
    for (const auto& info : *instances) {
        EXPECT_EQ(info.tool, kDefaultTool);
        EXPECT_TRUE(info.has_token);
        EXPECT_FALSE(info.created_at.empty());
    }
}

TEST_F(LocalSandboxTest, ParallelRunCleansUpEverySandbox) {
    std::vector<ExecutionTask> tasks;
    for (TaskId id = 1; id <= 4; ++id) {
        tasks.push_back(ExecutionTask{.id = id, .code = "echo task", .source = "<code>",
                                      .instance_number = id, .total_instances = 4});
    }
    RunOptions options;
    options.language = "bash";
    options.parallel = true;
    options.max_parallel = 2;

    auto results = run_parallel(tasks, options, *provider_, logger_, nullptr, {});

    EXPECT_EQ(exit_code(summarize(results)), 0);
    auto remaining = provider_->list();
    ASSERT_TRUE(remaining.has_value());
    EXPECT_TRUE(remaining->empty());
}

TEST(InstanceIdTest, OnlyGeneratedShapeIsAccepted) {
    EXPECT_TRUE(is_instance_id("sbx-0123456789ab"));
    EXPECT_FALSE(is_instance_id("sbx-0123456789AB"));
    EXPECT_FALSE(is_instance_id("sbx-0123456789a"));
    EXPECT_FALSE(is_instance_id("sbx-0123456789abc"));
    EXPECT_FALSE(is_instance_id("abc-0123456789ab"));
    EXPECT_FALSE(is_instance_id("sbx-../../../etc"));
    EXPECT_FALSE(is_instance_id(".."));
    EXPECT_FALSE(is_instance_id(""));
}

TEST(PythonTracebackTest, ExtractsExceptionLine) {
    std::vector<std::string> stderr_chunks = {
        "Traceback (most recent call last):\n",
        "  File \"cell-1.py\", line 1, in <module>\n",
        "ZeroDivisionError: division by zero\n",
    };

    auto error = parse_python_traceback(stderr_chunks);

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->name, "ZeroDivisionError");
    EXPECT_EQ(error->value, "division by zero");
    EXPECT_FALSE(parse_python_traceback({"plain warning\n"}).has_value());
}
